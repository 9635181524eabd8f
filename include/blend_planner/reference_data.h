#pragma once
/*
===============================================================================
REFERENCE DATA — Oil catalog, purchase price table and the scenario bundle
===============================================================================

OVERVIEW
--------
The inputs of a blending plan:

• Oil          — id, category, hardness
• OilCatalog   — ordered oils with unique ids; groups oil positions by
                 category once, at construction
• PriceTable   — (oil id, period) -> purchase price per ton
• BlendData    — catalog + prices + ParameterSet, what a builder consumes
• param_keys   — the parameter names the model reads

Positions, not ids, index the model: oil o is catalog()[o], and families are
declared over range(0, n) in catalog order.

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "indexing.h"
#include "parameters.h"

namespace blend {

    DECLARE_ENUM_WITH_COUNT(OilCategory, Vegetable, NonVegetable);

    // ============================================================================
    // PARAMETER KEYS
    // ============================================================================
    namespace param_keys {
        inline constexpr const char* kStorageCost       = "storage_cost_per_ton";
        inline constexpr const char* kSalesPrice        = "product_sales_price";
        inline constexpr const char* kMaxVegRefine      = "max_veg_refine_per_month";
        inline constexpr const char* kMaxNonVegRefine   = "max_nonveg_refine_per_month";
        inline constexpr const char* kStorageCapacity   = "storage_capacity_per_oil";
        inline constexpr const char* kInitialStock      = "initial_stock";
        inline constexpr const char* kTargetFinalStock  = "target_final_stock";
        inline constexpr const char* kMinHardness       = "min_hardness";
        inline constexpr const char* kMaxHardness       = "max_hardness";

        // Discrete mode only
        inline constexpr const char* kMinUsageIfUsed    = "min_usage_if_used";
        inline constexpr const char* kMaxIngredients    = "max_ingredients_per_month";
        inline constexpr const char* kDependencies      = "logical_dependencies";
    } // namespace param_keys

    /// @brief Parameter key holding the monthly refining cap of a category
    constexpr const char* capacityKey(OilCategory c) noexcept {
        return c == OilCategory::Vegetable
            ? param_keys::kMaxVegRefine
            : param_keys::kMaxNonVegRefine;
    }

    // ============================================================================
    // OIL
    // ============================================================================
    struct Oil {
        std::string id;
        OilCategory category = OilCategory::Vegetable;
        double      hardness = 0.0;

        bool operator==(const Oil&) const = default;
    };

    // ============================================================================
    // OIL CATALOG
    // ============================================================================
    /**
     * @class OilCatalog
     * @brief Ordered, id-unique list of oils with a precomputed category grouping
     *
     * @throws ValidationError on construction if two oils share an id
     */
    class OilCatalog {
    private:
        std::vector<Oil>                                    oils_;
        std::unordered_map<std::string, int>                position_;
        std::array<std::vector<int>, OilCategory_COUNT>     byCategory_;

    public:
        OilCatalog() = default;

        explicit OilCatalog(std::vector<Oil> oils)
            : oils_(std::move(oils))
        {
            for (std::size_t i = 0; i < oils_.size(); ++i) {
                const Oil& oil = oils_[i];
                if (!position_.emplace(oil.id, static_cast<int>(i)).second) {
                    throw ValidationError(std::format("duplicate oil id '{}'", oil.id));
                }
                if (!is_valid_enum_value(oil.category)) {
                    throw ValidationError(std::format("oil '{}' has no valid category", oil.id));
                }
                byCategory_[static_cast<std::size_t>(oil.category)].push_back(static_cast<int>(i));
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return oils_.size(); }
        [[nodiscard]] bool empty() const noexcept { return oils_.empty(); }

        auto begin() const noexcept { return oils_.begin(); }
        auto end() const noexcept { return oils_.end(); }

        /// @throws std::out_of_range for a position outside the catalog
        const Oil& operator[](int pos) const {
            if (pos < 0 || static_cast<std::size_t>(pos) >= oils_.size()) {
                throw std::out_of_range(std::format(
                    "OilCatalog: position {} out of range ({} oils)", pos, oils_.size()));
            }
            return oils_[static_cast<std::size_t>(pos)];
        }

        [[nodiscard]] bool contains(const std::string& id) const {
            return position_.find(id) != position_.end();
        }

        /// @throws std::out_of_range for an unknown id
        int position(const std::string& id) const {
            auto it = position_.find(id);
            if (it == position_.end()) {
                throw std::out_of_range(std::format("OilCatalog: unknown oil id '{}'", id));
            }
            return it->second;
        }

        /// @brief Oil positions of category c, in catalog order; may be empty
        const std::vector<int>& members(OilCategory c) const {
            return byCategory_.at(static_cast<std::size_t>(c));
        }

        /// @brief range(0, size())
        IndexList positions() const {
            return range(0, static_cast<int>(oils_.size()));
        }

        const std::vector<Oil>& oils() const noexcept { return oils_; }
    };

    // ============================================================================
    // PRICE TABLE
    // ============================================================================
    /**
     * @class PriceTable
     * @brief Purchase price per ton for each (oil id, period)
     */
    class PriceTable {
    private:
        std::map<std::pair<std::string, int>, double> prices_;

    public:
        PriceTable() = default;

        void set(const std::string& oil, int period, double price) {
            prices_[{ oil, period }] = price;
        }

        /// @brief Sets prices for periods 1..series.size()
        void setSeries(const std::string& oil, const std::vector<double>& series) {
            for (std::size_t i = 0; i < series.size(); ++i)
                set(oil, static_cast<int>(i) + 1, series[i]);
        }

        std::optional<double> find(const std::string& oil, int period) const {
            auto it = prices_.find({ oil, period });
            if (it == prices_.end())
                return std::nullopt;
            return it->second;
        }

        /// @throws std::out_of_range if no price is recorded
        double at(const std::string& oil, int period) const {
            auto p = find(oil, period);
            if (!p) {
                throw std::out_of_range(std::format(
                    "PriceTable: no price for oil '{}' in period {}", oil, period));
            }
            return *p;
        }

        /// @brief Distinct periods that carry at least one price, ascending
        IndexList periods() const {
            std::set<int> seen;
            for (const auto& [key, price] : prices_)
                seen.insert(key.second);
            return IndexList(std::vector<int>(seen.begin(), seen.end()));
        }

        [[nodiscard]] std::size_t size() const noexcept { return prices_.size(); }
        [[nodiscard]] bool empty() const noexcept { return prices_.empty(); }

        auto begin() const noexcept { return prices_.begin(); }
        auto end() const noexcept { return prices_.end(); }

        void erase(const std::string& oil, int period) { prices_.erase({ oil, period }); }
    };

    // ============================================================================
    // SCENARIO BUNDLE
    // ============================================================================
    struct BlendData {
        OilCatalog   oils;
        PriceTable   prices;
        ParameterSet params;
    };

} // namespace blend
