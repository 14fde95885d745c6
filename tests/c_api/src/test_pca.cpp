// =============================================================================
// omix - PCA Tests
// =============================================================================
//
// Thin-SVD PCA checked against a covariance eigen-decomposition reference.
//
// =============================================================================

#include "test.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace omix::test;

namespace {

struct Fitted {
    PcaModel model;
    EigenDense scores;
    EigenDense components;
    std::vector<omix_real_t> ratio;
};

Fitted fit(const ModalityData& m, omix_index_t k, bool scale = false) {
    Fitted out;
    std::vector<omix_real_t> scores(static_cast<std::size_t>(m.rows * k));
    check(omix_pca_fit(m.values.data(), m.rows, m.cols, k, scale ? OMIX_TRUE : OMIX_FALSE,
                       out.model.ptr(), scores.data(), scores.size()), "omix_pca_fit");
    out.scores = Eigen::Map<const EigenDense>(scores.data(), m.rows, k);

    std::vector<omix_real_t> comps(static_cast<std::size_t>(k * m.cols));
    check(omix_pca_components(out.model.get(), comps.data(), comps.size()), "omix_pca_components");
    out.components = Eigen::Map<const EigenDense>(comps.data(), k, m.cols);

    out.ratio.resize(static_cast<std::size_t>(k));
    check(omix_pca_explained_variance_ratio(out.model.get(), out.ratio.data(), out.ratio.size()),
          "omix_pca_explained_variance_ratio");
    return out;
}

} // namespace

OMIX_TEST_BEGIN

// =============================================================================
// Agreement with Reference
// =============================================================================

OMIX_TEST_SUITE(reference)

OMIX_TEST_CASE(matches_eigen_reference_tall) {
    Random rng(7);
    const auto m = random_modality("x", sequential_ids(40), 12, rng);

    const auto got = fit(m, 5);
    const auto ref = oracle::pca(m.to_eigen(), 5);

    OMIX_ASSERT_TRUE(matrices_equal(got.components, ref.components, 1e-7, 1e-8));
    OMIX_ASSERT_TRUE(matrices_equal(got.scores, ref.scores, 1e-7, 1e-8));
    for (omix_index_t j = 0; j < 5; ++j) {
        OMIX_ASSERT_TRUE(precision::approx_equal(got.ratio[static_cast<std::size_t>(j)],
                                                 ref.explained_variance_ratio(j),
                                                 precision::Tolerance::decomposition()));
    }
}

OMIX_TEST_CASE(matches_eigen_reference_wide) {
    Random rng(11);
    const auto m = random_modality("x", sequential_ids(15), 60, rng);

    const auto got = fit(m, 14);
    const auto ref = oracle::pca(m.to_eigen(), 14);

    OMIX_ASSERT_TRUE(matrices_equal(got.scores, ref.scores, 1e-6, 1e-7));
}

OMIX_TEST_CASE(matches_eigen_reference_scaled) {
    Random rng(3);
    auto m = random_modality("x", sequential_ids(30), 8, rng);
    // Put columns on very different scales
    for (omix_index_t i = 0; i < m.rows; ++i) {
        for (omix_index_t c = 0; c < m.cols; ++c) {
            m.values[static_cast<std::size_t>(i * m.cols + c)] *= std::pow(10.0, static_cast<double>(c % 4));
        }
    }

    const auto got = fit(m, 3, true);
    const auto ref = oracle::pca(m.to_eigen(), 3, true);

    OMIX_ASSERT_TRUE(matrices_equal(got.scores, ref.scores, 1e-7, 1e-8));
}

OMIX_TEST_SUITE_END

// =============================================================================
// Orientation and Ordering
// =============================================================================

OMIX_TEST_SUITE(orientation)

OMIX_TEST_CASE(largest_loading_positive) {
    Random rng(21);
    const auto m = random_modality("x", sequential_ids(25), 9, rng);
    const auto got = fit(m, 6);

    for (Eigen::Index j = 0; j < got.components.rows(); ++j) {
        Eigen::Index best = 0;
        for (Eigen::Index c = 1; c < got.components.cols(); ++c) {
            if (std::abs(got.components(j, c)) > std::abs(got.components(j, best))) {
                best = c;
            }
        }
        OMIX_ASSERT_GT(got.components(j, best), 0.0);
    }
}

OMIX_TEST_CASE(variance_ratio_descending) {
    Random rng(5);
    const auto m = random_modality("x", sequential_ids(30), 10, rng);
    const auto got = fit(m, 9);

    double total = 0.0;
    for (std::size_t j = 0; j < got.ratio.size(); ++j) {
        total += got.ratio[j];
        if (j > 0) {
            OMIX_ASSERT_LE(got.ratio[j], got.ratio[j - 1]);
        }
    }
    OMIX_ASSERT_LE(total, 1.0 + 1e-12);
    OMIX_ASSERT_GT(total, 0.9);
}

OMIX_TEST_CASE(scores_are_centred) {
    Random rng(8);
    const auto m = random_modality("x", sequential_ids(20), 7, rng);
    const auto got = fit(m, 4);

    for (Eigen::Index j = 0; j < got.scores.cols(); ++j) {
        OMIX_ASSERT_NEAR(got.scores.col(j).sum(), 0.0, 1e-10);
    }
}

OMIX_TEST_CASE(repeated_fits_identical) {
    Random rng(13);
    const auto m = random_modality("x", sequential_ids(35), 20, rng);

    const auto a = fit(m, 5);
    const auto b = fit(m, 5);
    OMIX_ASSERT_TRUE(matrices_identical(a.scores, b.scores));
    OMIX_ASSERT_TRUE(matrices_identical(a.components, b.components));
}

OMIX_TEST_SUITE_END

// =============================================================================
// Transform
// =============================================================================

OMIX_TEST_SUITE(transform)

OMIX_TEST_CASE(transform_training_data_reproduces_scores) {
    Random rng(17);
    const auto m = random_modality("x", sequential_ids(30), 11, rng);
    const auto got = fit(m, 4);

    std::vector<omix_real_t> out(static_cast<std::size_t>(m.rows * 4));
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), m.values.data(), m.rows, m.cols,
                                      out.data(), out.size()),
                   OMIX_OK);
    const EigenDense projected = Eigen::Map<const EigenDense>(out.data(), m.rows, 4);

    OMIX_ASSERT_TRUE(matrices_equal(projected, got.scores, 1e-9, 1e-10));
}

OMIX_TEST_CASE(transform_scaled_model) {
    Random rng(19);
    const auto m = random_modality("x", sequential_ids(25), 6, rng);
    const auto got = fit(m, 3, true);

    std::vector<omix_real_t> out(static_cast<std::size_t>(m.rows * 3));
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), m.values.data(), m.rows, m.cols,
                                      out.data(), out.size()),
                   OMIX_OK);
    const EigenDense projected = Eigen::Map<const EigenDense>(out.data(), m.rows, 3);

    OMIX_ASSERT_TRUE(matrices_equal(projected, got.scores, 1e-9, 1e-10));
}

OMIX_TEST_CASE(transform_new_samples_uses_training_mean) {
    Random rng(23);
    const auto m = random_modality("x", sequential_ids(20), 5, rng);
    const auto got = fit(m, 2);

    std::vector<omix_real_t> mean(5);
    OMIX_ASSERT_EQ(omix_pca_mean(got.model.get(), mean.data(), mean.size()), OMIX_OK);

    // The training mean projects to the origin
    std::vector<omix_real_t> out(2);
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), mean.data(), 1, 5, out.data(), out.size()),
                   OMIX_OK);
    OMIX_ASSERT_NEAR(out[0], 0.0, 1e-12);
    OMIX_ASSERT_NEAR(out[1], 0.0, 1e-12);
}

OMIX_TEST_CASE(transform_feature_mismatch) {
    Random rng(29);
    const auto m = random_modality("x", sequential_ids(10), 5, rng);
    const auto got = fit(m, 2);

    std::vector<omix_real_t> row(4, 0.0);
    std::vector<omix_real_t> out(2);
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), row.data(), 1, 4, out.data(), out.size()),
                   OMIX_ERROR_DIMENSION_MISMATCH);
}

OMIX_TEST_SUITE_END

// =============================================================================
// Rank Limits
// =============================================================================

OMIX_TEST_SUITE(rank)

OMIX_TEST_CASE(single_sample_insufficient_rank) {
    const omix_real_t data[] = {1.0, 2.0, 3.0};
    PcaModel model;
    OMIX_ASSERT_EQ(omix_pca_fit(data, 1, 3, 1, OMIX_FALSE, model.ptr(), nullptr, 0),
                   OMIX_ERROR_INSUFFICIENT_RANK);
    OMIX_ASSERT_FALSE(model.valid());
}

OMIX_TEST_CASE(single_feature_insufficient_rank) {
    const omix_real_t data[] = {1.0, 2.0, 3.0, 4.0};
    PcaModel model;
    OMIX_ASSERT_EQ(omix_pca_fit(data, 4, 1, 1, OMIX_FALSE, model.ptr(), nullptr, 0),
                   OMIX_ERROR_INSUFFICIENT_RANK);
}

OMIX_TEST_CASE(components_above_ceiling_rejected) {
    Random rng(31);
    const auto m = random_modality("x", sequential_ids(6), 10, rng);
    PcaModel model;
    OMIX_ASSERT_EQ(omix_pca_fit(m.values.data(), m.rows, m.cols, 6, OMIX_FALSE, model.ptr(), nullptr, 0),
                   OMIX_ERROR_RANGE_ERROR);
}

OMIX_TEST_CASE(constant_column_scaled) {
    // Column 1 is constant; scaling must leave it at zero instead of dividing by 0
    const omix_real_t data[] = {
        1.0, 5.0, 2.0,
        2.0, 5.0, 0.0,
        4.0, 5.0, 1.0,
        3.0, 5.0, 3.0,
    };
    PcaModel model;
    OMIX_ASSERT_EQ(omix_pca_fit(data, 4, 3, 2, OMIX_TRUE, model.ptr(), nullptr, 0), OMIX_OK);

    std::vector<omix_real_t> comps(6);
    OMIX_ASSERT_EQ(omix_pca_components(model.get(), comps.data(), comps.size()), OMIX_OK);
    for (auto v : comps) {
        OMIX_ASSERT_TRUE(std::isfinite(v));
    }
    OMIX_ASSERT_NEAR(comps[1], 0.0, 1e-12);
    OMIX_ASSERT_NEAR(comps[4], 0.0, 1e-12);
}

OMIX_TEST_CASE(constant_column_inexact_mean_scaled) {
    // 0.7 has no exact binary form: the column mean lands an ulp off and the
    // stddev is rounding noise, which must not be treated as a real scale
    const omix_real_t data[] = {
        1.0, 0.7, 3.0,
        2.0, 0.7, 0.0,
        4.0, 0.7, 1.0,
    };
    PcaModel model;
    std::vector<omix_real_t> scores(6);
    OMIX_ASSERT_EQ(omix_pca_fit(data, 3, 3, 2, OMIX_TRUE, model.ptr(), scores.data(), scores.size()),
                   OMIX_OK);

    std::vector<omix_real_t> comps(6);
    OMIX_ASSERT_EQ(omix_pca_components(model.get(), comps.data(), comps.size()), OMIX_OK);
    OMIX_ASSERT_NEAR(comps[1], 0.0, 1e-8);
    OMIX_ASSERT_NEAR(comps[4], 0.0, 1e-8);

    // A centred 3-row matrix has two non-zero singular values, both kept
    std::vector<omix_real_t> ratio(2);
    OMIX_ASSERT_EQ(omix_pca_explained_variance_ratio(model.get(), ratio.data(), ratio.size()), OMIX_OK);
    OMIX_ASSERT_NEAR(ratio[0] + ratio[1], 1.0, 1e-9);

    // Scores of a centred fit are centred
    for (std::size_t j = 0; j < 2; ++j) {
        OMIX_ASSERT_NEAR(scores[j] + scores[2 + j] + scores[4 + j], 0.0, 1e-9);
    }
}

OMIX_TEST_SUITE_END

// =============================================================================
// Input Checks
// =============================================================================

OMIX_TEST_SUITE(input)

OMIX_TEST_CASE(fit_rejects_nan) {
    Random rng(37);
    auto m = random_modality("x", sequential_ids(6), 4, rng);
    m.values[5] = std::numeric_limits<omix_real_t>::quiet_NaN();

    PcaModel model;
    OMIX_ASSERT_EQ(omix_pca_fit(m.values.data(), m.rows, m.cols, 2, OMIX_FALSE, model.ptr(), nullptr, 0),
                   OMIX_ERROR_DOMAIN_ERROR);
    OMIX_ASSERT_FALSE(model.valid());
    OMIX_ASSERT_STR_CONTAINS(omix_get_last_error(), "row 1, column 1");
}

OMIX_TEST_CASE(transform_rejects_inf) {
    Random rng(41);
    const auto m = random_modality("x", sequential_ids(8), 3, rng);
    const auto got = fit(m, 2);

    std::vector<omix_real_t> row = {0.5, std::numeric_limits<omix_real_t>::infinity(), 1.0};
    std::vector<omix_real_t> out(2, -7.0);
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), row.data(), 1, 3, out.data(), out.size()),
                   OMIX_ERROR_DOMAIN_ERROR);
    OMIX_ASSERT_EQ(out[0], -7.0);
}

OMIX_TEST_CASE(fit_scores_buffer_too_small) {
    Random rng(43);
    const auto m = random_modality("x", sequential_ids(6), 4, rng);

    PcaModel model;
    std::vector<omix_real_t> scores(11);  // needs 6 x 2
    OMIX_ASSERT_EQ(omix_pca_fit(m.values.data(), m.rows, m.cols, 2, OMIX_FALSE, model.ptr(),
                                scores.data(), scores.size()),
                   OMIX_ERROR_DIMENSION_MISMATCH);
    OMIX_ASSERT_FALSE(model.valid());
}

OMIX_TEST_CASE(transform_buffer_too_small) {
    Random rng(47);
    const auto m = random_modality("x", sequential_ids(9), 5, rng);
    const auto got = fit(m, 3);

    std::vector<omix_real_t> out(static_cast<std::size_t>(m.rows * 3 - 1));
    OMIX_ASSERT_EQ(omix_pca_transform(got.model.get(), m.values.data(), m.rows, m.cols,
                                      out.data(), out.size()),
                   OMIX_ERROR_DIMENSION_MISMATCH);
}

OMIX_TEST_SUITE_END

OMIX_TEST_END

OMIX_TEST_MAIN()
