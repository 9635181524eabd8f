#pragma once
/*
===============================================================================
VALIDATION — Fail-fast checks on blending inputs
===============================================================================

validateBlendData() runs before a single variable is declared and throws
ValidationError on the first problem it finds:

• empty catalog, negative hardness
• no prices, periods not forming 1..N, a missing or non-positive price
• a missing or non-numeric parameter required by the mode
• min hardness above max hardness, negative capacities or stocks
• discrete mode: non-integral ingredient limit, dependency list missing or
  naming an unknown oil

Duplicate oil ids are already rejected when the OilCatalog is constructed.
A target stock above the storage capacity is not an input error; the model
is built and the solver reports it infeasible.

===============================================================================
*/

#include <cmath>
#include <format>
#include <initializer_list>
#include <string>

#include "errors.h"
#include "parameters.h"
#include "reference_data.h"

namespace blend {

    enum class BlendMode { Continuous, Discrete };

    constexpr const char* modeName(BlendMode m) noexcept {
        return m == BlendMode::Continuous ? "continuous" : "discrete";
    }

    namespace validation_detail {

        inline double nonNegative(const ParameterSet& p, const char* key) {
            double v = p.requireNumber(key);
            if (!std::isfinite(v) || v < 0.0) {
                throw ValidationError(std::format(
                    "parameter '{}' must be a finite non-negative number, got {}", key, v));
            }
            return v;
        }

        inline void checkCatalog(const OilCatalog& oils) {
            if (oils.empty())
                throw ValidationError("oil catalog is empty");
            for (const auto& oil : oils) {
                if (!std::isfinite(oil.hardness) || oil.hardness < 0.0) {
                    throw ValidationError(std::format(
                        "oil '{}' has invalid hardness {}", oil.id, oil.hardness));
                }
            }
        }

        inline void checkPrices(const OilCatalog& oils, const PriceTable& prices) {
            IndexList periods = prices.periods();
            if (periods.empty())
                throw ValidationError("price table is empty");

            for (std::size_t i = 0; i < periods.size(); ++i) {
                if (periods[i] != static_cast<int>(i) + 1) {
                    throw ValidationError(std::format(
                        "periods must be the contiguous range 1..{}, found period {}",
                        periods.size(), periods[i]));
                }
            }

            for (const auto& [key, price] : prices) {
                if (!oils.contains(key.first)) {
                    throw ValidationError(std::format(
                        "price table names unknown oil '{}'", key.first));
                }
            }

            for (const auto& oil : oils) {
                for (int t : periods) {
                    auto price = prices.find(oil.id, t);
                    if (!price) {
                        throw ValidationError(std::format(
                            "missing price for oil '{}' in period {}", oil.id, t));
                    }
                    if (!std::isfinite(*price) || *price <= 0.0) {
                        throw ValidationError(std::format(
                            "price for oil '{}' in period {} must be positive, got {}",
                            oil.id, t, *price));
                    }
                }
            }
        }

        inline void checkCoreParameters(const ParameterSet& p) {
            using namespace param_keys;
            double salesPrice = p.requireNumber(kSalesPrice);
            if (!std::isfinite(salesPrice)) {
                throw ValidationError(std::format(
                    "parameter '{}' must be finite, got {}", kSalesPrice, salesPrice));
            }
            nonNegative(p, kStorageCost);
            nonNegative(p, kMaxVegRefine);
            nonNegative(p, kMaxNonVegRefine);
            nonNegative(p, kStorageCapacity);
            nonNegative(p, kInitialStock);
            nonNegative(p, kTargetFinalStock);
            double hmin = nonNegative(p, kMinHardness);
            double hmax = nonNegative(p, kMaxHardness);

            if (hmin > hmax) {
                throw ValidationError(std::format(
                    "min hardness {} exceeds max hardness {}", hmin, hmax));
            }
        }

        inline void checkDiscreteParameters(const OilCatalog& oils, const ParameterSet& p) {
            using namespace param_keys;
            nonNegative(p, kMinUsageIfUsed);
            int k = p.requireInt(kMaxIngredients);
            if (k < 0) {
                throw ValidationError(std::format(
                    "parameter '{}' must be non-negative, got {}", kMaxIngredients, k));
            }
            const auto& deps = p.require<DependencyList>(kDependencies);
            for (const auto& [dependent, prerequisite] : deps) {
                for (const auto* id : { &dependent, &prerequisite }) {
                    if (!oils.contains(*id)) {
                        throw ValidationError(std::format(
                            "dependency ({} -> {}) names unknown oil '{}'",
                            dependent, prerequisite, *id));
                    }
                }
            }
        }

    } // namespace validation_detail

    /**
     * @brief Checks every input the selected mode reads
     * @throws ValidationError describing the first problem found
     */
    inline void validateBlendData(const BlendData& data, BlendMode mode) {
        validation_detail::checkCatalog(data.oils);
        validation_detail::checkPrices(data.oils, data.prices);
        validation_detail::checkCoreParameters(data.params);
        if (mode == BlendMode::Discrete)
            validation_detail::checkDiscreteParameters(data.oils, data.params);
    }

} // namespace blend
