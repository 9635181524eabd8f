#pragma once
/*
===============================================================================
REFERENCE SCENARIO — The five-oil, six-month food manufacture dataset
===============================================================================

H. P. Williams, "Model Building in Mathematical Programming", problems 12.1
(continuous) and 12.2 (with used/not-used logic). Prices are per ton for
months 1..6 (January to June).

    Oil    Category      Hardness
    VEG1   Vegetable     8.8
    VEG2   Vegetable     6.1
    OIL1   NonVegetable  2.0
    OIL2   NonVegetable  4.2
    OIL3   NonVegetable  5.0

===============================================================================
*/

#include <string>
#include <utility>
#include <vector>

#include "parameters.h"
#include "reference_data.h"

namespace blend::reference {

    inline OilCatalog oils() {
        return OilCatalog({
            { "VEG1", OilCategory::Vegetable,    8.8 },
            { "VEG2", OilCategory::Vegetable,    6.1 },
            { "OIL1", OilCategory::NonVegetable, 2.0 },
            { "OIL2", OilCategory::NonVegetable, 4.2 },
            { "OIL3", OilCategory::NonVegetable, 5.0 },
        });
    }

    inline PriceTable prices() {
        PriceTable p;
        p.setSeries("VEG1", { 110, 130, 110, 120, 100,  90 });
        p.setSeries("VEG2", { 120, 130, 140, 110, 120, 100 });
        p.setSeries("OIL1", { 130, 110, 130, 120, 150, 140 });
        p.setSeries("OIL2", { 110,  90, 100, 120, 110,  80 });
        p.setSeries("OIL3", { 115, 115,  95, 125, 105, 135 });
        return p;
    }

    inline ParameterSet parameters() {
        using namespace param_keys;
        ParameterSet p;
        p[kStorageCost]      = 5.0;
        p[kSalesPrice]       = 150.0;
        p[kMaxVegRefine]     = 200.0;
        p[kMaxNonVegRefine]  = 250.0;
        p[kStorageCapacity]  = 1000.0;
        p[kInitialStock]     = 500.0;
        p[kTargetFinalStock] = 500.0;
        p[kMinHardness]      = 3.0;
        p[kMaxHardness]      = 6.0;
        p[kMinUsageIfUsed]   = 20.0;
        p[kMaxIngredients]   = 3;
        // Using VEG1 or VEG2 in a month requires OIL3 in the same month
        p[kDependencies]     = DependencyList{ { "VEG1", "OIL3" }, { "VEG2", "OIL3" } };
        return p;
    }

    inline BlendData scenario() {
        return BlendData{ oils(), prices(), parameters() };
    }

    /// @brief Known optimum of the continuous variant
    inline constexpr double kContinuousProfit = 107842.59;

    /// @brief Known optimum of the discrete variant
    inline constexpr double kDiscreteProfit = 100278.70;

} // namespace blend::reference
