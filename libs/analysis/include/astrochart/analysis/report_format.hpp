/**
 * @file report_format.hpp
 * @brief Plain key=value serialization of analysis results.
 * @author Watosn
 */
#pragma once

#include <string>

#include "astrochart/analysis/report.hpp"

namespace astrochart::analysis {

/**
 * @brief One `key=value` line per field, keys dotted by section (`planet.moon.sign=Taurus`).
 */
[[nodiscard]] std::string format_report(const ChartReport& report);

/**
 * @brief `status=` line, the warnings and, for an Ok result, the report.
 */
[[nodiscard]] std::string format_result(const AnalysisResult& result);

}  // namespace astrochart::analysis
