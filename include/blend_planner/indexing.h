#pragma once
/*
===============================================================================
INDEXING — Ordered index sets and Cartesian products for model families
===============================================================================

OVERVIEW
--------
Model families are declared over small, ordered integer sets: oil positions
in the catalog (0..n-1), planning periods (1..N), oil categories, and
dependency pairs. This header provides those sets and their products with a
stable, predictable iteration order, so that two builds from the same data
declare their rows in the same order.

KEY COMPONENTS
--------------
• IndexList           — Materialized ordered list of integers
• range(begin, end)   — IndexList for the half-open range [begin, end)
• Cartesian<Sets...>  — Lexicographic product yielding std::tuple<int, ...>
• operator*           — IndexList * IndexList, Cartesian * IndexList
• operator<<          — Compact printing for logs and test failures

ORDERING
--------
• IndexList keeps insertion order
• Cartesian iterates in lexicographic ("odometer") order, last factor fastest

USAGE EXAMPLES
--------------
    auto O = blend::range(0, 5);     // oil positions {0,1,2,3,4}
    auto T = blend::range(1, 7);     // periods {1,...,6}
    for (auto [o, t] : O * T) { ... }

LIFETIME
--------
A Cartesian stores copies of its factor sets, so a product built from
temporaries (range(0, n) * range(1, m + 1)) stays valid.

===============================================================================
*/

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace blend {

    // ============================================================================
    // INDEX LIST
    // ============================================================================
    /**
     * @class IndexList
     * @brief Ordered list of integer indices
     */
    class IndexList {
    private:
        std::vector<int> data_;

    public:
        IndexList() = default;

        IndexList(std::initializer_list<int> init)
            : data_(init)
        {
        }

        explicit IndexList(std::vector<int>&& v)
            : data_(std::move(v))
        {
        }

        void push_back(int v) { data_.push_back(v); }
        void reserve(std::size_t n) { data_.reserve(n); }

        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
        [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

        [[nodiscard]] bool contains(int value) const noexcept {
            return std::find(data_.begin(), data_.end(), value) != data_.end();
        }

        /// @brief First element; throws std::out_of_range on an empty list
        [[nodiscard]] int first() const {
            if (data_.empty())
                throw std::out_of_range("IndexList::first: list is empty");
            return data_.front();
        }

        /// @brief Last element; throws std::out_of_range on an empty list
        [[nodiscard]] int last() const {
            if (data_.empty())
                throw std::out_of_range("IndexList::last: list is empty");
            return data_.back();
        }

        int operator[](std::size_t i) const { return data_[i]; }

        const std::vector<int>& raw() const noexcept { return data_; }

        bool operator==(const IndexList&) const = default;
    };

    /// @brief IndexList for the half-open range [begin, end); empty when end <= begin
    inline IndexList range(int begin, int end) {
        std::vector<int> v;
        v.reserve(end > begin ? static_cast<std::size_t>(end - begin) : 0u);
        for (int i = begin; i < end; ++i)
            v.push_back(i);
        return IndexList(std::move(v));
    }

    // ============================================================================
    // CARTESIAN PRODUCT
    // ============================================================================
    /**
     * @class Cartesian
     * @brief Lexicographic product of N IndexLists, yielding std::tuple<int, ...>
     *
     * @note If any factor is empty the product is empty.
     */
    template<std::size_t N>
    class Cartesian {
        static_assert(N >= 2, "Cartesian: a product needs at least two factors");

    private:
        std::array<IndexList, N> sets_;

        template<std::size_t... Is>
        static auto make_tuple(const std::array<IndexList, N>& sets,
            const std::array<std::size_t, N>& pos,
            std::index_sequence<Is...>)
        {
            return std::make_tuple(sets[Is][pos[Is]]...);
        }

    public:
        class iterator {
            const std::array<IndexList, N>* sets_ = nullptr;
            std::array<std::size_t, N>       pos_{};

        public:
            iterator() = default;

            iterator(const std::array<IndexList, N>* sets, bool is_end)
                : sets_(sets)
            {
                pos_.fill(0);
                bool any_empty = std::any_of(sets_->begin(), sets_->end(),
                    [](const IndexList& s) { return s.empty(); });
                if (is_end || any_empty)
                    pos_[0] = (*sets_)[0].size();
            }

            auto operator*() const {
                return Cartesian::make_tuple(*sets_, pos_, std::make_index_sequence<N>{});
            }

            iterator& operator++() {
                for (std::size_t d = N; d-- > 0;) {
                    if (++pos_[d] < (*sets_)[d].size())
                        return *this;
                    pos_[d] = 0;
                }
                pos_[0] = (*sets_)[0].size();
                return *this;
            }

            bool operator==(const iterator& other) const noexcept {
                return pos_ == other.pos_;
            }
            bool operator!=(const iterator& other) const noexcept {
                return !(*this == other);
            }
        };

        explicit Cartesian(std::array<IndexList, N> sets)
            : sets_(std::move(sets))
        {
        }

        iterator begin() const { return iterator(&sets_, false); }
        iterator end() const { return iterator(&sets_, true); }

        [[nodiscard]] std::size_t size() const {
            std::size_t total = 1;
            for (const auto& s : sets_)
                total *= s.size();
            return total;
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

        const std::array<IndexList, N>& factors() const noexcept { return sets_; }
    };

    inline Cartesian<2> operator*(const IndexList& A, const IndexList& B) {
        return Cartesian<2>({ A, B });
    }

    template<std::size_t N>
    Cartesian<N + 1> operator*(const Cartesian<N>& P, const IndexList& S) {
        std::array<IndexList, N + 1> sets;
        std::copy(P.factors().begin(), P.factors().end(), sets.begin());
        sets[N] = S;
        return Cartesian<N + 1>(std::move(sets));
    }

    // ============================================================================
    // PRINTING
    // ============================================================================
    inline std::ostream& operator<<(std::ostream& os, const IndexList& I) {
        os << "{";
        for (std::size_t i = 0; i < I.size(); ++i) {
            if (i > 0) os << ", ";
            os << I[i];
        }
        return os << "}";
    }

    template<std::size_t N>
    std::ostream& operator<<(std::ostream& os, const Cartesian<N>& C) {
        for (std::size_t i = 0; i < N; ++i) {
            if (i > 0) os << " x ";
            os << C.factors()[i];
        }
        return os;
    }

} // namespace blend
