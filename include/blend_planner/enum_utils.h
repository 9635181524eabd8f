#pragma once
/*
===============================================================================
ENUM UTILS — Named, counted enumerations for variable and constraint families
===============================================================================

OVERVIEW
--------
Variable and constraint families are keyed by enum classes. The tables that
hold them need the number of enumerators at compile time, and diagnostics need
the family name as text ("Balance", "HardnessMin") when reporting a violated
row. DECLARE_ENUM_WITH_COUNT provides both from a single declaration.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT(Name, ...) — enum class + Name_COUNT + enum_name()
• enum_size<E>                       — Compile-time enumerator count
• is_valid_enum_value(e)             — Range check excluding the COUNT sentinel
• for_each_enum<E>(fn)               — Visit every enumerator in order

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Flow, Inbound, Outbound);

    static_assert(Flow_COUNT == 2);
    enum_name(Flow::Outbound);                 // "Outbound"
    blend::for_each_enum<Flow>([](Flow f) { ... });

RESTRICTIONS
------------
• Enumerators must not carry explicit values (names are recovered by position)
• Do not declare COUNT yourself; it is appended as the last enumerator

===============================================================================
*/

#include <array>
#include <cstddef>
#include <string_view>

namespace blend::enum_detail {

    /// @brief Split the stringized enumerator list "A, B, C" into N names
    template<std::size_t N>
    constexpr std::array<std::string_view, N> split_names(std::string_view list) noexcept {
        std::array<std::string_view, N> out{};
        std::size_t pos = 0;
        for (std::size_t i = 0; i < N; ++i) {
            while (pos < list.size() && (list[pos] == ' ' || list[pos] == ','))
                ++pos;
            std::size_t end = pos;
            while (end < list.size() && list[end] != ',' && list[end] != ' ')
                ++end;
            out[i] = list.substr(pos, end - pos);
            pos = end;
        }
        return out;
    }

} // namespace blend::enum_detail

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a COUNT sentinel and a name lookup
 *
 * @details Expands to:
 *   enum class Name { A, B, COUNT };
 *   static constexpr std::size_t Name_COUNT = 2;
 *   constexpr std::string_view enum_name(Name) noexcept;
 *
 * enum_name() is found by argument-dependent lookup and returns "COUNT" for
 * the sentinel or any out-of-range value.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                        \
    enum class Name { __VA_ARGS__, COUNT };                                       \
    static constexpr std::size_t Name##_COUNT =                                   \
        static_cast<std::size_t>(Name::COUNT);                                    \
    [[maybe_unused]] constexpr std::string_view enum_name(Name value) noexcept {  \
        constexpr auto names =                                                    \
            ::blend::enum_detail::split_names<Name##_COUNT>(#__VA_ARGS__);        \
        const auto i = static_cast<std::size_t>(value);                           \
        return i < Name##_COUNT ? names[i] : std::string_view{ "COUNT" };         \
    }                                                                             \
    static_assert(Name##_COUNT > 0, #Name " must declare at least one enumerator")

namespace blend {

    /// @brief Number of user enumerators of an enum declared with a COUNT sentinel
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief True if value names a user enumerator (not COUNT, not out of range)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size<Enum>::value;
    }

    /// @brief Calls fn(e) for every enumerator in declaration order
    template<typename Enum, typename Fn>
    constexpr void for_each_enum(Fn&& fn) {
        for (std::size_t i = 0; i < enum_size<Enum>::value; ++i) {
            fn(static_cast<Enum>(i));
        }
    }

} // namespace blend
