// =============================================================================
// omix - Sample Alignment Tests
// =============================================================================
//
// Intersection semantics: only identifiers present in every modality are
// kept, in the order of the first modality of the concatenation order.
//
// =============================================================================

#include "test.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace omix::test;

namespace {

ResultView run(const std::vector<ModalityData>& mods,
               const std::vector<const char*>& order = {},
               omix_index_t default_components = 2) {
    Integrator it;
    check(omix_integrator_create(it.ptr()), "omix_integrator_create");
    for (const auto& m : mods) {
        check(add_to(it.get(), m), "add_to");
    }
    check(omix_integrator_set_default_components(it.get(), default_components),
          "omix_integrator_set_default_components");
    if (!order.empty()) {
        check(omix_integrator_set_order(it.get(), order.data(), order.size()),
              "omix_integrator_set_order");
    }

    Result res;
    check(omix_integrator_run(it.get(), res.ptr()), "omix_integrator_run");
    return read_result(res.get());
}

ModalityData labelled(const std::string& name, std::vector<std::string> ids,
                      omix_index_t cols, uint64_t seed) {
    Random rng(seed);
    return random_modality(name, std::move(ids), cols, rng);
}

} // namespace

OMIX_TEST_BEGIN

OMIX_TEST_UNIT(keeps_only_shared_ids) {
    const auto a = labelled("a", {"p1", "p2", "p3", "p4", "p5"}, 6, 1);
    const auto b = labelled("b", {"p5", "p3", "p9", "p1", "p7"}, 4, 2);

    const auto res = run({a, b});
    const std::vector<std::string> expected = {"p1", "p3", "p5"};
    OMIX_ASSERT_EQ(res.sample_ids, expected);
    OMIX_ASSERT_EQ(res.embedding.rows(), static_cast<Eigen::Index>(3));
}

OMIX_TEST_UNIT(order_follows_first_modality_in_order) {
    const auto a = labelled("a", {"p1", "p2", "p3", "p4", "p5"}, 6, 1);
    const auto b = labelled("b", {"p5", "p3", "p9", "p1", "p7"}, 4, 2);

    const auto res = run({a, b}, {"b", "a"});
    const std::vector<std::string> expected = {"p5", "p3", "p1"};
    OMIX_ASSERT_EQ(res.sample_ids, expected);
}

OMIX_TEST_UNIT(matches_reference_intersection) {
    Random rng(99);
    std::vector<ModalityData> mods;
    for (int m = 0; m < 3; ++m) {
        std::vector<std::string> ids;
        for (int i = 0; i < 40; ++i) {
            if (rng.uniform() < 0.8) {
                ids.push_back("id" + std::to_string(i));
            }
        }
        // Shuffle so modalities disagree on order
        std::shuffle(ids.begin(), ids.end(), rng.engine());
        mods.push_back(random_modality("m" + std::to_string(m), ids, 5 + m, rng));
    }

    const auto expected = oracle::intersect(mods);
    OMIX_ASSERT_GE(expected.size(), static_cast<std::size_t>(3));

    const auto res = run(mods);
    OMIX_ASSERT_EQ(res.sample_ids, expected);
    OMIX_ASSERT_EQ(static_cast<std::size_t>(res.embedding.rows()), expected.size());
}

OMIX_TEST_UNIT(identical_samples_drop_nothing) {
    Random rng(4);
    const auto ids = sequential_ids(12);
    const auto a = random_modality("a", ids, 7, rng);
    const auto b = random_modality("b", ids, 9, rng);
    const auto c = random_modality("c", ids, 3, rng);

    const auto res = run({a, b, c});
    OMIX_ASSERT_EQ(res.sample_ids, ids);
    OMIX_ASSERT_EQ(res.embedding.rows(), static_cast<Eigen::Index>(12));
}

OMIX_TEST_UNIT(disjoint_ids_empty_intersection) {
    const auto a = labelled("a", {"x1", "x2", "x3"}, 4, 1);
    const auto b = labelled("b", {"y1", "y2", "y3"}, 4, 2);

    Integrator it;
    OMIX_ASSERT_EQ(omix_integrator_create(it.ptr()), OMIX_OK);
    OMIX_ASSERT_EQ(add_to(it.get(), a), OMIX_OK);
    OMIX_ASSERT_EQ(add_to(it.get(), b), OMIX_OK);

    Result res;
    OMIX_ASSERT_EQ(omix_integrator_run(it.get(), res.ptr()), OMIX_ERROR_EMPTY_INTERSECTION);
    OMIX_ASSERT_FALSE(res.valid());
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "'a'");
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "'b'");
}

OMIX_TEST_UNIT(single_shared_sample_insufficient_rank) {
    const auto a = labelled("a", {"x1", "x2", "x3"}, 4, 1);
    const auto b = labelled("b", {"x3", "y2", "y3"}, 4, 2);

    Integrator it;
    OMIX_ASSERT_EQ(omix_integrator_create(it.ptr()), OMIX_OK);
    OMIX_ASSERT_EQ(add_to(it.get(), a), OMIX_OK);
    OMIX_ASSERT_EQ(add_to(it.get(), b), OMIX_OK);

    Result res;
    OMIX_ASSERT_EQ(omix_integrator_run(it.get(), res.ptr()), OMIX_ERROR_INSUFFICIENT_RANK);
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "'joint'");
}

OMIX_TEST_UNIT(rows_follow_their_ids) {
    // Same data, rows permuted: each retained id must land on the same
    // joint coordinates regardless of input row order
    Random rng(55);
    const auto ids = sequential_ids(10);
    const auto a = random_modality("a", ids, 6, rng);
    const auto b = random_modality("b", ids, 5, rng);

    ModalityData b_rev = b;
    for (omix_index_t r = 0; r < b.rows; ++r) {
        const omix_index_t src = b.rows - 1 - r;
        b_rev.ids[static_cast<std::size_t>(r)] = b.ids[static_cast<std::size_t>(src)];
        for (omix_index_t c = 0; c < b.cols; ++c) {
            b_rev.values[static_cast<std::size_t>(r * b.cols + c)] = b.at(src, c);
        }
    }

    const auto forward = run({a, b}, {}, 3);
    const auto reversed = run({a, b_rev}, {}, 3);

    OMIX_ASSERT_EQ(forward.sample_ids, reversed.sample_ids);
    OMIX_ASSERT_TRUE(matrices_equal(forward.embedding, reversed.embedding, 1e-9, 1e-10));
}

OMIX_TEST_END

OMIX_TEST_MAIN()
