#pragma once
/*
===============================================================================
CONSTRAINTS — Indexed constraint families and their enum-keyed registry
===============================================================================

OVERVIEW
--------
Mirrors the variable system. A constraint family ("Balance", "Capacity", ...)
is one row per element of an index domain; the generator callable receives
the unpacked index and returns a TempConstr. Rows are added to the
LinearModel in domain order and a ConstraintSet remembers which row each
index produced.

KEY COMPONENTS
--------------
• ConstraintSet        — Index tuple -> row position, in declaration order
• ConstraintFactory    — addScalar() and addIndexed() over any index domain
• ConstraintTable<E>   — Fixed array of ConstraintSets keyed by enum E

USAGE EXAMPLES
--------------
    // Generator signature: TempConstr(int o, int t), one arg per dimension
    auto bal = ConstraintFactory::addIndexed(m, "Balance", O * T,
        [&](int o, int t) {
            return Stock(o, t) == prev(o, t) + Buy(o, t) - Use(o, t);
        });
    std::size_t row = bal.at(2, 4);

EMPTY DOMAINS AND EMPTY ROWS
----------------------------
An empty domain produces an empty set. A generator that returns a row with
no terms (0 <= cap) still adds the row; rows are never dropped.

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "expressions.h"
#include "linear_model.h"
#include "naming.h"
#include "variables.h"

namespace blend {

    // ============================================================================
    // CONSTRAINT SET
    // ============================================================================
    class ConstraintSet {
    public:
        struct Entry {
            std::size_t      row;
            std::vector<int> index;
        };

    private:
        std::string                                  family_;
        std::vector<Entry>                           entries_;
        std::unordered_map<std::string, std::size_t> lookup_;

    public:
        ConstraintSet() = default;
        explicit ConstraintSet(std::string family) : family_(std::move(family)) {}

        /// @throws std::invalid_argument if the index tuple is already present
        void add(std::size_t row, std::vector<int> idx) {
            auto [it, inserted] = lookup_.emplace(index_detail::key_of(idx), entries_.size());
            if (!inserted) {
                throw std::invalid_argument(std::format(
                    "ConstraintSet::add: duplicate index {} in family {}",
                    index_detail::describe(idx), family_));
            }
            entries_.push_back(Entry{ row, std::move(idx) });
        }

        [[nodiscard]] const std::string& family() const noexcept { return family_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        /// @throws std::out_of_range if the index is not part of the family
        std::size_t at(const std::vector<int>& idx) const {
            auto it = lookup_.find(index_detail::key_of(idx));
            if (it == lookup_.end()) {
                throw std::out_of_range(std::format(
                    "ConstraintSet::at: index {} not found in family {}",
                    index_detail::describe(idx), family_.empty() ? "?" : family_));
            }
            return entries_[it->second].row;
        }

        template<typename... I>
        std::size_t at(I... idx) const {
            static_assert(sizeof...(I) > 0, "ConstraintSet::at: at least one index required");
            return at(std::vector<int>{ static_cast<int>(idx)... });
        }

        template<typename... I>
        std::size_t operator()(I... idx) const { return at(idx...); }

        bool contains(const std::vector<int>& idx) const {
            return lookup_.find(index_detail::key_of(idx)) != lookup_.end();
        }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
    public:
        using Namer = std::function<std::string(const std::vector<int>&)>;

        /// @brief Adds a single unindexed row, stored under the empty index
        static ConstraintSet addScalar(LinearModel& model, const std::string& family,
            const TempConstr& c)
        {
            ConstraintSet out(family);
            out.add(model.addConstr(c, family, {}, make_name::math(family)), {});
            return out;
        }

        /**
         * @brief Adds one row per element of dom
         *
         * @param gen   Callable taking the unpacked index and returning a TempConstr
         * @param namer Optional element namer; defaults to make_name::math(family, idx)
         */
        template<typename Domain, typename Gen>
        static ConstraintSet addIndexed(LinearModel& model, const std::string& family,
            const Domain& dom, Gen&& gen, const Namer& namer = {})
        {
            ConstraintSet out(family);
            for (auto&& raw : dom) {
                TempConstr c = expr_detail::invoke_on_index(gen, raw);
                auto idx = index_detail::to_vector(raw);
                std::string name = namer ? namer(idx) : make_name::math(family, idx);
                std::size_t row = model.addConstr(c, family, idx, std::move(name));
                out.add(row, std::move(idx));
            }
            return out;
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    template<typename EnumT, std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class ConstraintTable {
    private:
        std::array<ConstraintSet, MAX> table_;
        std::array<bool, MAX>          present_{};

        static std::size_t slot(EnumT key, const char* op) {
            auto idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("ConstraintTable::{}: key {} >= {}", op, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, ConstraintSet&& cs) {
            auto k = slot(key, "set");
            table_[k] = std::move(cs);
            present_[k] = true;
        }

        /// @throws std::runtime_error if nothing was registered under key
        const ConstraintSet& get(EnumT key) const {
            auto k = slot(key, "get");
            if (!present_[k]) {
                throw std::runtime_error(std::format(
                    "ConstraintTable::get: family {} was never added", enum_name(key)));
            }
            return table_[k];
        }

        const ConstraintSet& operator()(EnumT key) const { return get(key); }

        template<typename... I>
        std::size_t row(EnumT key, I... idx) const {
            return get(key).at(idx...);
        }

        [[nodiscard]] bool has(EnumT key) const {
            return present_[slot(key, "has")];
        }

        /// @brief Total rows across every registered family
        [[nodiscard]] std::size_t totalRows() const noexcept {
            std::size_t n = 0;
            for (std::size_t k = 0; k < MAX; ++k)
                if (present_[k]) n += table_[k].size();
            return n;
        }

        void clear() {
            table_ = {};
            present_ = {};
        }
    };

} // namespace blend
