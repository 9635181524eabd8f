#pragma once
/*
===============================================================================
VARIABLES — Indexed variable families and their enum-keyed registry
===============================================================================

OVERVIEW
--------
A variable family ("Buy", "Stock", ...) is one column per element of an index
domain. VariableFactory declares the columns in a LinearModel in domain order
and returns a VariableSet that maps each index tuple back to its Var handle.
VariableTable files the sets under an enum key so a builder and its result
extractor share one registry.

KEY COMPONENTS
--------------
• VariableSet        — Index tuple -> Var, in declaration order
• VariableFactory    — addScalar() and addIndexed() over any index domain
• VariableTable<E>   — Fixed array of VariableSets keyed by enum E
• value(...)         — Reads a column's value from a flat solution vector

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Vars, Flow, Open);

    LinearModel m;
    VariableTable<Vars> vt;
    vt.set(Vars::Flow, VariableFactory::addIndexed(m, VarDomain::Continuous,
        0.0, 100.0, "Flow", range(0, 3) * range(1, 5)));

    Var f = vt.var(Vars::Flow, 2, 4);

NAMING
------
Element names come from make_name::math(family, idx) unless a namer callable
is passed; with naming disabled the default namer yields empty names.

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "expressions.h"
#include "linear_model.h"
#include "naming.h"

namespace blend {

    namespace index_detail {

        /// @brief Lookup key "i_j_k" for an index tuple
        inline std::string key_of(const std::vector<int>& idx) {
            std::ostringstream oss;
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0) oss << '_';
                oss << idx[k];
            }
            return oss.str();
        }

        /// @brief Converts an int or a tuple of ints into std::vector<int>
        template<typename Idx>
        std::vector<int> to_vector(const Idx& idx) {
            if constexpr (expr_detail::is_tuple_like_v<Idx>) {
                return std::apply([](auto... i) {
                    static_assert((std::is_integral_v<decltype(i)> && ...),
                        "index_detail::to_vector: tuple elements must be integral");
                    return std::vector<int>{ static_cast<int>(i)... };
                }, idx);
            }
            else {
                static_assert(std::is_integral_v<Idx>,
                    "index_detail::to_vector: index must be int or tuple");
                return std::vector<int>{ static_cast<int>(idx) };
            }
        }

        inline std::string describe(const std::vector<int>& idx) {
            return "[" + key_of(idx) + "]";
        }

    } // namespace index_detail

    // ============================================================================
    // VARIABLE SET
    // ============================================================================
    /**
     * @class VariableSet
     * @brief Var handles of one family, keyed by index tuple
     *
     * @details Entries keep declaration order, which is the order of the index
     *          domain the set was built from. Lookup is O(1) average.
     */
    class VariableSet {
    public:
        struct Entry {
            Var              var;
            std::vector<int> index;
        };

    private:
        std::string                                  family_;
        std::vector<Entry>                           entries_;
        std::unordered_map<std::string, std::size_t> lookup_;

    public:
        VariableSet() = default;
        explicit VariableSet(std::string family) : family_(std::move(family)) {}

        /// @throws std::invalid_argument if the index tuple is already present
        void add(Var v, std::vector<int> idx) {
            auto [it, inserted] = lookup_.emplace(index_detail::key_of(idx), entries_.size());
            if (!inserted) {
                throw std::invalid_argument(std::format(
                    "VariableSet::add: duplicate index {} in family {}",
                    index_detail::describe(idx), family_));
            }
            entries_.push_back(Entry{ v, std::move(idx) });
        }

        [[nodiscard]] const std::string& family() const noexcept { return family_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        /// @throws std::out_of_range if the index is not part of the family
        Var at(const std::vector<int>& idx) const {
            auto it = lookup_.find(index_detail::key_of(idx));
            if (it == lookup_.end()) {
                throw std::out_of_range(std::format(
                    "VariableSet::at: index {} not found in family {}",
                    index_detail::describe(idx), family_.empty() ? "?" : family_));
            }
            return entries_[it->second].var;
        }

        template<typename... I>
        Var at(I... idx) const {
            static_assert(sizeof...(I) > 0, "VariableSet::at: at least one index required");
            static_assert((std::is_integral_v<I> && ...),
                "VariableSet::at: indices must be integral");
            return at(std::vector<int>{ static_cast<int>(idx)... });
        }

        template<typename... I>
        Var operator()(I... idx) const { return at(idx...); }

        /// @brief Var handle or nullptr-equivalent (invalid Var) when absent
        Var find(const std::vector<int>& idx) const {
            auto it = lookup_.find(index_detail::key_of(idx));
            return it == lookup_.end() ? Var{} : entries_[it->second].var;
        }

        bool contains(const std::vector<int>& idx) const {
            return lookup_.find(index_detail::key_of(idx)) != lookup_.end();
        }
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    class VariableFactory {
    public:
        using Namer = std::function<std::string(const std::vector<int>&)>;

        /// @brief Declares a single unindexed column, stored under the empty index
        static VariableSet addScalar(LinearModel& model, VarDomain domain,
            double lb, double ub, const std::string& family)
        {
            VariableSet out(family);
            Var v = model.addVar(domain, lb, ub, family, {}, make_name::math(family));
            out.add(v, {});
            return out;
        }

        /**
         * @brief Declares one column per element of domain
         *
         * @param namer Optional element namer; defaults to make_name::math(family, idx)
         * @throws std::invalid_argument on a repeated domain element
         *
         * @example
         *     auto Use = VariableFactory::addIndexed(m, VarDomain::Continuous,
         *         0.0, kInfinity, "Use", O * T);
         */
        template<typename Domain>
        static VariableSet addIndexed(LinearModel& model, VarDomain domain,
            double lb, double ub, const std::string& family,
            const Domain& dom, const Namer& namer = {})
        {
            VariableSet out(family);
            for (auto&& raw : dom) {
                auto idx = index_detail::to_vector(raw);
                std::string name = namer ? namer(idx) : make_name::math(family, idx);
                Var v = model.addVar(domain, lb, ub, family, idx, std::move(name));
                out.add(v, std::move(idx));
            }
            return out;
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of VariableSets
     *
     * @tparam EnumT Enum class declared with DECLARE_ENUM_WITH_COUNT
     */
    template<typename EnumT, std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class VariableTable {
    private:
        std::array<VariableSet, MAX> table_;
        std::array<bool, MAX>        present_{};

        static std::size_t slot(EnumT key, const char* op) {
            auto idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("VariableTable::{}: key {} >= {}", op, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, VariableSet&& vs) {
            auto k = slot(key, "set");
            table_[k] = std::move(vs);
            present_[k] = true;
        }

        /// @throws std::runtime_error if nothing was registered under key
        const VariableSet& get(EnumT key) const {
            auto k = slot(key, "get");
            if (!present_[k]) {
                throw std::runtime_error(std::format(
                    "VariableTable::get: family {} was never declared", enum_name(key)));
            }
            return table_[k];
        }

        const VariableSet& operator()(EnumT key) const { return get(key); }

        template<typename... I>
        Var var(EnumT key, I... idx) const {
            return get(key).at(idx...);
        }

        [[nodiscard]] bool has(EnumT key) const {
            return present_[slot(key, "has")];
        }

        void clear() {
            table_ = {};
            present_ = {};
        }
    };

    // ============================================================================
    // SOLUTION VALUES
    // ============================================================================
    /// @brief Value of v in a flat solution vector
    /// @throws std::out_of_range if values has no entry for v
    inline double value(const std::vector<double>& values, Var v) {
        if (!v.valid() || v.id() >= values.size()) {
            throw std::out_of_range(std::format(
                "value: variable {} has no value ({} given)", v.id(), values.size()));
        }
        return values[v.id()];
    }

    /// @brief (index, value) pairs for a whole family, in declaration order
    inline std::vector<std::pair<std::vector<int>, double>>
        valuesWithIndex(const std::vector<double>& values, const VariableSet& vs)
    {
        std::vector<std::pair<std::vector<int>, double>> out;
        out.reserve(vs.size());
        for (const auto& e : vs)
            out.emplace_back(e.index, value(values, e.var));
        return out;
    }

} // namespace blend
