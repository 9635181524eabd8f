#pragma once
/*
===============================================================================
PLAN REPORT — Plain-text pivot tables of a blending plan
===============================================================================

printScenario() writes, for one ScenarioResult:

    --- LP Results (Food Manufacture 1) ---
    Status: OPTIMAL
    Total Profit: 107842.59

    Refining Plan (Tons Used):
     Month      VEG1      VEG2      OIL1      OIL2      OIL3
         1     159.3      40.7       0.0     250.0       0.0
    ...

The pivot is month x oil, columns in the order oils first appear in the
records (catalog order), values rounded to one decimal.

===============================================================================
*/

#include <algorithm>
#include <functional>
#include <iomanip>
#include <ios>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "diagnostics.h"
#include "plan_extractor.h"
#include "scenario.h"

namespace blend {

    namespace report_detail {

        /// Restores the flags and precision of a stream on scope exit
        class FormatGuard {
        private:
            std::ostream&           os_;
            std::ios_base::fmtflags flags_;
            std::streamsize         precision_;

        public:
            explicit FormatGuard(std::ostream& os)
                : os_(os), flags_(os.flags()), precision_(os.precision())
            {
            }

            ~FormatGuard() {
                os_.flags(flags_);
                os_.precision(precision_);
            }

            FormatGuard(const FormatGuard&) = delete;
            FormatGuard& operator=(const FormatGuard&) = delete;
        };

        inline std::vector<std::string> oilColumns(const std::vector<PlanRecord>& records) {
            std::vector<std::string> cols;
            for (const auto& r : records)
                if (std::find(cols.begin(), cols.end(), r.oil) == cols.end())
                    cols.push_back(r.oil);
            return cols;
        }

    } // namespace report_detail

    /**
     * @brief Prints a month x oil table of one record field
     * @param field Selects the value, e.g. &PlanRecord::use
     */
    inline void printPivot(std::ostream& os, const std::string& title,
        const std::vector<PlanRecord>& records, double PlanRecord::* field)
    {
        report_detail::FormatGuard guard(os);
        const auto cols = report_detail::oilColumns(records);
        std::map<int, std::map<std::string, double>> table;
        for (const auto& r : records)
            table[r.period][r.oil] = r.*field;

        os << "\n" << title << "\n";
        os << std::setw(6) << "Month";
        for (const auto& c : cols)
            os << std::setw(10) << c;
        os << "\n" << std::string(6 + 10 * cols.size(), '-') << "\n";

        os << std::fixed << std::setprecision(1);
        for (const auto& [period, row] : table) {
            os << std::setw(6) << period;
            for (const auto& c : cols) {
                auto it = row.find(c);
                if (it == row.end())
                    os << std::setw(10) << "-";
                else
                    os << std::setw(10) << it->second;
            }
            os << "\n";
        }
    }

    inline void printScenario(std::ostream& os, const std::string& title, const ScenarioResult& result) {
        os << "\n--- " << title << " ---\n";
        os << "Status: " << statusString(result.status) << "\n";
        os << "Model: " << modelSummary(result.statistics) << "\n";

        if (!result.isOptimal()) {
            if (!result.message.empty())
                os << "Message: " << result.message << "\n";
            return;
        }

        report_detail::FormatGuard guard(os);
        os << std::fixed << std::setprecision(2);
        os << "Total Profit: " << result.objective << "\n";

        printPivot(os, "Refining Plan (Tons Used):", result.records, &PlanRecord::use);
        printPivot(os, "Buying Plan (Tons Bought):", result.records, &PlanRecord::buy);
    }

} // namespace blend
