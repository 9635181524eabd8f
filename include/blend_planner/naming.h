#pragma once
/*
===============================================================================
NAMING — Debug-aware element names for variables and constraints
===============================================================================

OVERVIEW
--------
Every variable and constraint declared in a LinearModel belongs to a family
("Buy", "Balance", ...) and carries an index tuple. Families are always
recorded. Element names such as "Buy[VEG1,3]" are only useful when a human
reads an exported LP file or a violation report, so they are produced in
debug builds and skipped in release builds.

KEY COMPONENTS
--------------
• naming_enabled() / naming_disabled() — Compile-time switch (BLEND_DEBUG/_DEBUG)
• make_name::math(base, parts...)      — "Base[p1,p2]" when naming is enabled
• make_name::index(base, parts...)     — "Base_p1_p2" when naming is enabled
• force_name::math / force_name::index — Same formats, ignoring the switch

make_name::math also accepts a std::vector<int> index tuple, which is how
the variable and constraint factories hold indices.

Index parts may be any streamable value: oil ids are strings, periods are
integers, and both appear in the same name.

USAGE EXAMPLES
--------------
    make_name::math("Buy", "VEG1", 3);     // "Buy[VEG1,3]" (debug) or ""
    force_name::math("Stock", "OIL2", 6);  // always "Stock[OIL2,6]"
    force_name::index("x", 1, 2);          // always "x_1_2"

EXCEPTION SAFETY
----------------
• An empty base with index parts throws std::invalid_argument (debug only)
• Formatting propagates std::bad_alloc

===============================================================================
*/

#include <concepts>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(BLEND_DEBUG) || defined(_DEBUG)
inline constexpr bool BLEND_DEBUG_NAMES = true;
#else
inline constexpr bool BLEND_DEBUG_NAMES = false;
#endif

namespace blend {

    /// @brief Returns true in debug builds, where element names are generated
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return BLEND_DEBUG_NAMES;
    }

    /// @brief Returns true in release builds, where element names are empty
    [[nodiscard]] constexpr bool naming_disabled() noexcept {
        return !BLEND_DEBUG_NAMES;
    }

    namespace naming_detail {

        /**
         * @concept Streamable
         * @brief True if the value can be written to std::ostream
         */
        template<typename T>
        concept Streamable = requires(std::ostream & os, T && value) {
            { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
        };

        inline void check_base_name(std::string_view base, bool has_parts) {
            if (has_parts && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when index parts are present");
            }
        }

        template<Streamable... Parts>
        std::string join(std::string_view base, std::string_view open,
            std::string_view sep, std::string_view close, Parts&&... parts)
        {
            constexpr std::size_t N = sizeof...(parts);
            check_base_name(base, N > 0);

            std::ostringstream oss;
            oss << base;
            if constexpr (N > 0) {
                oss << open;
                bool first = true;
                ((oss << (first ? (first = false, std::string_view{}) : sep)
                      << std::forward<Parts>(parts)), ...);
                oss << close;
            }
            return oss.str();
        }

        inline std::string join_vector(std::string_view base, std::string_view open,
            std::string_view sep, std::string_view close, const std::vector<int>& parts)
        {
            check_base_name(base, !parts.empty());

            std::ostringstream oss;
            oss << base;
            if (!parts.empty()) {
                oss << open;
                for (std::size_t i = 0; i < parts.size(); ++i) {
                    if (i > 0) oss << sep;
                    oss << parts[i];
                }
                oss << close;
            }
            return oss.str();
        }

    } // namespace naming_detail

    // ============================================================================
    // make_name — honours the build switch
    // ============================================================================
    namespace make_name {

        /// @brief "base[p1,p2,...]" in debug builds, empty otherwise
        template<naming_detail::Streamable... Parts>
        std::string math(std::string_view base, Parts&&... parts) {
            if constexpr (naming_disabled()) {
                return {};
            }
            else {
                return naming_detail::join(base, "[", ",", "]",
                    std::forward<Parts>(parts)...);
            }
        }

        /// @brief "base_p1_p2" in debug builds, empty otherwise
        template<naming_detail::Streamable... Parts>
        std::string index(std::string_view base, Parts&&... parts) {
            if constexpr (naming_disabled()) {
                return {};
            }
            else {
                return naming_detail::join(base, "_", "_", "",
                    std::forward<Parts>(parts)...);
            }
        }

        /// @brief "base[i,j,...]" from an index tuple, empty in release builds
        inline std::string math(std::string_view base, const std::vector<int>& idx) {
            if constexpr (naming_disabled()) {
                return {};
            }
            else {
                return naming_detail::join_vector(base, "[", ",", "]", idx);
            }
        }

    } // namespace make_name

    // ============================================================================
    // force_name — always produces a name
    // ============================================================================
    namespace force_name {

        template<naming_detail::Streamable... Parts>
        std::string math(std::string_view base, Parts&&... parts) {
            return naming_detail::join(base, "[", ",", "]",
                std::forward<Parts>(parts)...);
        }

        template<naming_detail::Streamable... Parts>
        std::string index(std::string_view base, Parts&&... parts) {
            return naming_detail::join(base, "_", "_", "",
                std::forward<Parts>(parts)...);
        }

    } // namespace force_name

} // namespace blend
