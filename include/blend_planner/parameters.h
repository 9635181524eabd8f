#pragma once
/*
===============================================================================
PARAMETERS — Type-erased key/value store for scalar model data
===============================================================================

OVERVIEW
--------
Scalar inputs of a planning scenario (sales price, storage cost, capacities,
hardness bounds, discrete-mode thresholds, dependency pairs) arrive as a flat
key -> value map. Value wraps std::any; ParameterSet adds the validating
lookups the model builder needs, so a missing key or a value of the wrong
type is reported once, with the key name, before any variable is declared.

KEY COMPONENTS
--------------
• Value                    — std::any wrapper with is<T>(), get<T>(), get_or()
• DataStore                — std::unordered_map<std::string, Value>
• ParameterSet             — DataStore plus requireNumber/requireInt/require<T>
• DependencyPair / List    — (dependent oil id, prerequisite oil id)

USAGE EXAMPLES
--------------
    ParameterSet p;
    p["product_sales_price"] = 150.0;
    p["max_ingredients_per_month"] = 3;

    double price = p.requireNumber("product_sales_price");   // 150.0
    int k = p.requireInt("max_ingredients_per_month");        // 3
    p.requireNumber("storage_cost_per_ton");                  // throws ValidationError

NUMERIC LOOKUPS
---------------
requireNumber accepts int and double. requireInt accepts int, and a double
only when it holds an integral value.

EXCEPTION SAFETY
----------------
• Value::get<T>(): throws std::bad_any_cast on type mismatch
• Value::get_or<T>(): no-throw (returns the default on mismatch)
• ParameterSet::require*(): throws ValidationError naming the key

===============================================================================
*/

#include <any>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.h"

namespace blend {

    // ============================================================================
    // VALUE
    // ============================================================================
    /**
     * @class Value
     * @brief Type-erased container with safe access methods
     *
     * @example
     *     Value v = 42;
     *     int x = v.get<int>();           // 42
     *     double y = v.get_or<double>(0); // 0.0 (stored type is int)
     */
    class Value {
        std::any storage;

    public:
        Value() = default;

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value(T&& v)
            : storage(std::forward<T>(v))
        {
        }

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage = std::forward<T>(v);
            return *this;
        }

        bool has_value() const noexcept { return storage.has_value(); }

        const std::type_info& type() const noexcept { return storage.type(); }

        template <typename T>
        bool is() const noexcept { return storage.type() == typeid(T); }

        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(std::any_cast<const T&>(storage));
        }

        /// @throws std::bad_any_cast on type mismatch
        template <typename T>
        T& get() { return std::any_cast<T&>(storage); }

        template <typename T>
        const T& get() const { return std::any_cast<const T&>(storage); }

        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        void reset() noexcept { storage.reset(); }
    };

    using DataStore = std::unordered_map<std::string, Value>;

    using DependencyPair = std::pair<std::string, std::string>;
    using DependencyList = std::vector<DependencyPair>;

    // ============================================================================
    // PARAMETER SET
    // ============================================================================
    class ParameterSet {
    private:
        DataStore values_;

        const Value& lookup(const std::string& key) const {
            auto it = values_.find(key);
            if (it == values_.end() || !it->second.has_value()) {
                throw ValidationError(std::format("missing parameter '{}'", key));
            }
            return it->second;
        }

    public:
        ParameterSet() = default;

        ParameterSet(std::initializer_list<std::pair<const std::string, Value>> init)
            : values_(init)
        {
        }

        Value& operator[](const std::string& key) { return values_[key]; }

        void set(const std::string& key, Value v) { values_[key] = std::move(v); }

        std::size_t erase(const std::string& key) { return values_.erase(key); }

        [[nodiscard]] bool contains(const std::string& key) const {
            auto it = values_.find(key);
            return it != values_.end() && it->second.has_value();
        }

        [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

        auto begin() const noexcept { return values_.begin(); }
        auto end() const noexcept { return values_.end(); }

        /// @brief int or double value as double
        /// @throws ValidationError if missing or not numeric
        double requireNumber(const std::string& key) const {
            const Value& v = lookup(key);
            if (v.is<double>()) return v.get<double>();
            if (v.is<int>()) return static_cast<double>(v.get<int>());
            throw ValidationError(std::format(
                "parameter '{}' must be numeric (int or double)", key));
        }

        /// @throws ValidationError if missing, not numeric, or not integral
        int requireInt(const std::string& key) const {
            const Value& v = lookup(key);
            if (v.is<int>()) return v.get<int>();
            if (v.is<double>()) {
                double d = v.get<double>();
                if (std::isfinite(d) && std::floor(d) == d
                    && d >= std::numeric_limits<int>::min() && d <= std::numeric_limits<int>::max())
                    return static_cast<int>(d);
                throw ValidationError(std::format(
                    "parameter '{}' must be an integer, got {}", key, d));
            }
            throw ValidationError(std::format("parameter '{}' must be an integer", key));
        }

        /// @brief Exact-type lookup
        /// @throws ValidationError if missing or of another type
        template <typename T>
        const T& require(const std::string& key) const {
            const Value& v = lookup(key);
            if (!v.is<T>()) {
                throw ValidationError(std::format(
                    "parameter '{}' has the wrong type (got {})", key, v.type().name()));
            }
            return v.get<T>();
        }
    };

} // namespace blend
