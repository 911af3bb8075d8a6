#pragma once

#include "stmap/config.hpp"
#include "stmap/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <cassert>
#include <span>

// =============================================================================
// FILE: stmap/core/type.hpp
// BRIEF: Real/Index scalars and the non-owning Array view
// =============================================================================

namespace stmap {

// Expression values, mapping probabilities and logits all share Real
#if defined(STMAP_USE_FLOAT32)
    using Real = float;
#elif defined(STMAP_USE_FLOAT64)
    using Real = double;
#else
    #error "stmap: STMAP_PRECISION did not select a Real type."
#endif

// Row/column counts and sparse indices
#if defined(STMAP_USE_INT16)
    using Index = std::int16_t;
#elif defined(STMAP_USE_INT32)
    using Index = std::int32_t;
#elif defined(STMAP_USE_INT64)
    using Index = std::int64_t;
#else
    #error "stmap: STMAP_INDEX_PRECISION did not select an Index type."
#endif

using Size = std::size_t;

// Contiguous run of T owned elsewhere (a matrix row, a buffer, a vector)
template <typename T>
struct Array {
    using value_type = T;
    using iterator = T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size n) noexcept : ptr(p), len(n) {}

    // Array<Real> -> Array<const Real>
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    template <std::size_t Extent = std::dynamic_extent>
    constexpr Array(std::span<T, Extent> s) noexcept
        : ptr(s.data()), len(static_cast<Size>(s.size())) {}

    STMAP_FORCE_INLINE constexpr T& operator[](Index i) const noexcept {
        assert(i >= 0 && static_cast<Size>(i) < len && "Array: index out of range");
        return ptr[i];
    }

    STMAP_NODISCARD constexpr T* data() const noexcept { return ptr; }
    STMAP_NODISCARD constexpr Size size() const noexcept { return len; }
    STMAP_NODISCARD constexpr bool empty() const noexcept { return len == 0; }

    constexpr T* begin() const noexcept { return ptr; }
    constexpr T* end() const noexcept { return ptr + len; }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);

} // namespace stmap
