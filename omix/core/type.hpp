#pragma once

#include "omix/config.hpp"
#include "omix/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>

// =============================================================================
// FILE: omix/core/type.hpp
// BRIEF: Basic numeric types and zero-overhead array views
// =============================================================================

namespace omix {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(OMIX_USE_FLOAT32)
    using Real = float;
#elif defined(OMIX_USE_FLOAT64)
    using Real = double;
#else
    #error "omix: No precision macro defined."
#endif

#if defined(OMIX_USE_INT32)
    using Index = std::int32_t;
#elif defined(OMIX_USE_INT64)
    using Index = std::int64_t;
#else
    #error "omix: No index precision selected."
#endif

using Size = std::size_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using size_type = Size;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    OMIX_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] OMIX_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] OMIX_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] OMIX_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] OMIX_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] OMIX_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

// =============================================================================
// SECTION 3: Dense Matrix Tag
// =============================================================================

struct TagDense {};

template <typename M>
concept DenseLike = requires(const M& m, Index r, Index c) {
    typename M::ValueType;
    requires std::same_as<typename M::Tag, TagDense>;
    { m.rows } -> std::convertible_to<Index>;
    { m.cols } -> std::convertible_to<Index>;
    { m(r, c) } -> std::convertible_to<const typename M::ValueType&>;
};

} // namespace omix
