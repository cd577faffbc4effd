#pragma once

#include <string>
#include <rapidjson/document.h>
#include "DcaPerformanceService.h"
#include "DiagnosticSelector.h"
#include "OptimizationReport.h"

namespace dcasweep
{
namespace reporting
{

/**
 * @brief Converts simulation and sweep results to JSON for the reporting layer
 *
 * Money amounts and percentages are rounded to two decimals; fractional
 * returns (timeWeightedReturn, returnPerInvestedDollar) keep six. Dates are
 * written as YYYY-MM-DD. Values that are not finite are written as null.
 */
class ResultSerializer
{
public:
    static std::string toJson(const DcaPerformanceReport& report);

    static std::string toJson(const mkc_dca::OptimizationReport& report);

    /**
     * @brief Write a JSON document to a file
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const std::string& json, const std::string& filePath);

    static constexpr int DisplayPlaces = 2;
    static constexpr int FractionPlaces = 6;

private:
    typedef rapidjson::Document::AllocatorType Allocator;

    static rapidjson::Value serializeWeekRecord(const mkc_dca::WeekRecord& week, Allocator& allocator);
    static rapidjson::Value serializeEquityCurvePoint(const mkc_dca::EquityCurvePoint& point,
                                                      Allocator& allocator);
    static rapidjson::Value serializeMetrics(const mkc_dca::PerformanceMetrics& metrics,
                                             Allocator& allocator);
    static rapidjson::Value serializeCandidate(const mkc_dca::SweepCandidate& candidate,
                                               Allocator& allocator);
    static rapidjson::Value serializeSummary(const mkc_dca::OptimizationSummary& summary,
                                             Allocator& allocator);
    static rapidjson::Value serializeWorstWeek(const mkc_dca::WorstWeekDiagnostic& diagnostic,
                                               Allocator& allocator);

    static rapidjson::Value number(double value, int places);
    static rapidjson::Value dateString(const boost::gregorian::date& d, Allocator& allocator);
    static std::string writePretty(const rapidjson::Document& doc);
};

} // namespace reporting
} // namespace dcasweep
