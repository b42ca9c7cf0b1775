#pragma once
/*
===============================================================================
NAMING — Generated names for variables and constraints
===============================================================================

OVERVIEW
--------
Builds symbolic names for model elements created in bulk (Model::addVars)
and for diagnostic output. Two flavours are offered:

• make_name::  honours the build configuration; returns "" unless MIP_DEBUG
               (or _DEBUG) is defined, so release builds pay nothing
• force_name:: always produces the name (export, logging, error messages)

Both support the index style "x_3_5" and the math style "x[3,5]".

CONFIGURATION
-------------
    -DMIP_DEBUG   human-readable names for bulk-created variables
    (default)     unnamed; rendering falls back to "var(idx)"

USAGE EXAMPLES
--------------
    make_name::index("x", 3, 5);     // "x_3_5" in debug builds, "" otherwise
    force_name::math("cap", 1, 2);   // "cap[1,2]" always
    force_name::index("y", idxVec);  // vector of indices

EXCEPTION SAFETY
----------------
• Empty base name with indices: std::invalid_argument (debug builds for
  make_name::, always for force_name::)

===============================================================================
*/

#include <concepts>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(MIP_DEBUG) || defined(_DEBUG)
inline constexpr bool MIP_DEBUG_NAMES = true;
#else
inline constexpr bool MIP_DEBUG_NAMES = false;
#endif

namespace mip {

    /// @brief True when generated names are enabled by the build
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return MIP_DEBUG_NAMES;
    }

} // namespace mip

namespace naming_detail {

    template<typename T>
    concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

    template<typename R>
    concept IndexRange =
        std::ranges::input_range<R> &&
        Integral<std::ranges::range_value_t<R>>;

    inline void check_base(std::string_view base, bool has_indices) {
        if (has_indices && base.empty()) {
            throw std::invalid_argument(
                "naming: base name cannot be empty when indices are present");
        }
    }

    /// Appends sep-separated indices between open and close
    template<IndexRange R>
    std::string join(std::string_view base, const R& indices,
        std::string_view open, std::string_view sep, std::string_view close)
    {
        const bool has_indices = std::ranges::begin(indices) != std::ranges::end(indices);
        check_base(base, has_indices);

        std::string result(base);
        if (!has_indices) {
            return result;
        }

        result.append(open);
        bool first = true;
        for (const auto& i : indices) {
            if (!first) result.append(sep);
            first = false;
            result.append(std::to_string(static_cast<long long>(i)));
        }
        result.append(close);
        return result;
    }

    template<Integral... Indices>
    std::string index_impl(std::string_view base, Indices... idx) {
        const long long values[] = { static_cast<long long>(idx)..., 0 };
        return join(base, std::views::counted(values, sizeof...(idx)), "_", "_", "");
    }

    template<Integral... Indices>
    std::string math_impl(std::string_view base, Indices... idx) {
        const long long values[] = { static_cast<long long>(idx)..., 0 };
        return join(base, std::views::counted(values, sizeof...(idx)), "[", ",", "]");
    }

} // namespace naming_detail

// ============================================================================
// make_name — build-dependent
// ============================================================================
namespace make_name {

    template<naming_detail::Integral... Indices>
    std::string index(std::string_view base, Indices... idx) {
        if constexpr (mip::naming_enabled()) {
            return naming_detail::index_impl(base, idx...);
        }
        else {
            return {};
        }
    }

    template<naming_detail::IndexRange R>
    std::string index(std::string_view base, const R& indices) {
        if constexpr (mip::naming_enabled()) {
            return naming_detail::join(base, indices, "_", "_", "");
        }
        else {
            return {};
        }
    }

    template<naming_detail::Integral... Indices>
    std::string math(std::string_view base, Indices... idx) {
        if constexpr (mip::naming_enabled()) {
            return naming_detail::math_impl(base, idx...);
        }
        else {
            return {};
        }
    }

} // namespace make_name

// ============================================================================
// force_name — always on
// ============================================================================
namespace force_name {

    template<naming_detail::Integral... Indices>
    std::string index(std::string_view base, Indices... idx) {
        return naming_detail::index_impl(base, idx...);
    }

    template<naming_detail::IndexRange R>
    std::string index(std::string_view base, const R& indices) {
        return naming_detail::join(base, indices, "_", "_", "");
    }

    template<naming_detail::Integral... Indices>
    std::string math(std::string_view base, Indices... idx) {
        return naming_detail::math_impl(base, idx...);
    }

    template<naming_detail::IndexRange R>
    std::string math(std::string_view base, const R& indices) {
        return naming_detail::join(base, indices, "[", ",", "]");
    }

} // namespace force_name
