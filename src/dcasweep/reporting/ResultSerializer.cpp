#include "ResultSerializer.h"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "DisplayRounding.h"
#include "SweepParameters.h"
#include "utils/TimeUtils.h"

using namespace rapidjson;
using namespace mkc_dca;

namespace dcasweep
{
namespace reporting
{

constexpr int ResultSerializer::DisplayPlaces;
constexpr int ResultSerializer::FractionPlaces;

Value ResultSerializer::number(double value, int places)
{
    if (!std::isfinite(value))
        return Value(kNullType);

    return Value(roundForDisplay(value, places));
}

Value ResultSerializer::dateString(const boost::gregorian::date& d, Allocator& allocator)
{
    return Value(utils::toIsoDateString(d).c_str(), allocator);
}

std::string ResultSerializer::writePretty(const Document& doc)
{
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

std::string ResultSerializer::toJson(const DcaPerformanceReport& report)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    doc.AddMember("symbol", Value(report.symbol.c_str(), allocator), allocator);
    doc.AddMember("weeklyAmount", number(report.weeklyAmount, DisplayPlaces), allocator);
    doc.AddMember("startDate", dateString(report.startDate, allocator), allocator);
    doc.AddMember("endDate", dateString(report.endDate, allocator), allocator);
    doc.AddMember("totalWeeks", static_cast<uint64_t>(report.totalWeeks), allocator);
    doc.AddMember("totalInvested", number(report.totalInvested, DisplayPlaces), allocator);
    doc.AddMember("currentValue", number(report.currentValue, DisplayPlaces), allocator);
    doc.AddMember("totalReturn", number(report.totalReturnPct, DisplayPlaces), allocator);
    doc.AddMember("totalContracts", report.totalContracts, allocator);
    doc.AddMember("cumulativeFees", number(report.result.getCumulativeFees(), DisplayPlaces), allocator);
    doc.AddMember("performanceMetrics", serializeMetrics(report.metrics, allocator), allocator);

    Value breakdown(kArrayType);
    for (auto it = report.result.beginWeeks(); it != report.result.endWeeks(); ++it)
        breakdown.PushBack(serializeWeekRecord(*it, allocator), allocator);
    doc.AddMember("weeklyBreakdown", breakdown, allocator);

    Value curve(kArrayType);
    for (const auto& point : report.equityCurve)
        curve.PushBack(serializeEquityCurvePoint(point, allocator), allocator);
    doc.AddMember("equityCurve", curve, allocator);

    auto worst = DiagnosticSelector::findWorstWeek(report.result);
    if (worst)
        doc.AddMember("worstWeek",
                      serializeWorstWeek(DiagnosticSelector::makeNarrativeRequest(*worst), allocator),
                      allocator);
    else
        doc.AddMember("worstWeek", Value(kNullType), allocator);

    return writePretty(doc);
}

std::string ResultSerializer::toJson(const OptimizationReport& report)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("success", true, allocator);
    doc.AddMember("summary", serializeSummary(report.getSummary(), allocator), allocator);

    Value grid(kArrayType);
    for (double amount : report.getTestedGrid())
        grid.PushBack(number(amount, DisplayPlaces), allocator);
    doc.AddMember("testedGrid", grid, allocator);

    Value byObjective(kArrayType);
    for (const auto& candidate : report.getTopByObjective())
        byObjective.PushBack(serializeCandidate(candidate, allocator), allocator);
    doc.AddMember("topByPercentage", byObjective, allocator);

    Value byDollars(kArrayType);
    for (const auto& candidate : report.getTopByDollarProfit())
        byDollars.PushBack(serializeCandidate(candidate, allocator), allocator);
    doc.AddMember("topByDollarProfit", byDollars, allocator);

    return writePretty(doc);
}

void ResultSerializer::saveToFile(const std::string& json, const std::string& filePath)
{
    std::ofstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("ResultSerializer::saveToFile - cannot open file for writing: " + filePath);

    file << json << std::endl;
    if (!file)
        throw std::runtime_error("ResultSerializer::saveToFile - error writing " + filePath);
}

Value ResultSerializer::serializeWeekRecord(const WeekRecord& week, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("week", week.weekIndex, allocator);
    obj.AddMember("date", dateString(week.date, allocator), allocator);
    obj.AddMember("price", number(week.price, DisplayPlaces), allocator);
    obj.AddMember("investment", number(week.contributionAmount, DisplayPlaces), allocator);
    obj.AddMember("contractsBought", week.contractsAdded, allocator);
    obj.AddMember("contractsLiquidated", week.contractsLiquidated, allocator);
    obj.AddMember("totalContracts", week.totalContracts, allocator);
    obj.AddMember("totalInvested", number(week.totalInvested, DisplayPlaces), allocator);
    obj.AddMember("currentValue", number(week.equity, DisplayPlaces), allocator);
    obj.AddMember("positionValue", number(week.positionNotional, DisplayPlaces), allocator);
    obj.AddMember("cashBalance", number(week.cashBalance, DisplayPlaces), allocator);
    obj.AddMember("requiredMargin", number(week.requiredMaintenanceMargin, DisplayPlaces), allocator);
    obj.AddMember("feesPaid", number(week.feesPaid, DisplayPlaces), allocator);
    obj.AddMember("pnl", number(week.pnl, DisplayPlaces), allocator);
    obj.AddMember("returnPct", number(week.returnPct, DisplayPlaces), allocator);
    obj.AddMember("timeWeightedReturn", number(week.timeWeightedReturn, FractionPlaces), allocator);
    return obj;
}

Value ResultSerializer::serializeEquityCurvePoint(const EquityCurvePoint& point, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("date", dateString(point.date, allocator), allocator);
    obj.AddMember("equity", number(point.equity, DisplayPlaces), allocator);
    obj.AddMember("positionValue", number(point.positionNotional, DisplayPlaces), allocator);
    obj.AddMember("cashBalance", number(point.cashBalance, DisplayPlaces), allocator);
    obj.AddMember("invested", number(point.invested, DisplayPlaces), allocator);
    obj.AddMember("pnl", number(point.pnl, DisplayPlaces), allocator);
    obj.AddMember("timeWeightedReturn", number(point.timeWeightedReturn, FractionPlaces), allocator);
    obj.AddMember("prevEquity", number(point.previousEquity, DisplayPlaces), allocator);
    return obj;
}

Value ResultSerializer::serializeMetrics(const PerformanceMetrics& metrics, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("totalReturn", number(metrics.totalReturnPct, DisplayPlaces), allocator);
    obj.AddMember("cagr", number(metrics.cagr, DisplayPlaces), allocator);
    obj.AddMember("volatility", number(metrics.volatilityAnnualized, DisplayPlaces), allocator);
    obj.AddMember("sharpeRatio", number(metrics.sharpeRatio, DisplayPlaces), allocator);
    obj.AddMember("maxDrawdown", number(metrics.maxDrawdownPct, DisplayPlaces), allocator);
    obj.AddMember("profitFactor", number(metrics.profitFactor, DisplayPlaces), allocator);
    obj.AddMember("winRate", number(metrics.winRatePct, DisplayPlaces), allocator);
    return obj;
}

Value ResultSerializer::serializeCandidate(const SweepCandidate& candidate, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("weeklyAmount", number(candidate.weeklyAmount, DisplayPlaces), allocator);
    obj.AddMember("totalInvested", number(candidate.result.getTotalInvested(), DisplayPlaces), allocator);
    obj.AddMember("finalEquity", number(candidate.result.getFinalEquity(), DisplayPlaces), allocator);
    obj.AddMember("totalContracts", candidate.result.getTotalContracts(), allocator);
    obj.AddMember("dollarProfit", number(candidate.dollarProfit, DisplayPlaces), allocator);
    obj.AddMember("returnPerInvestedDollar",
                  number(candidate.returnPerInvestedDollar, FractionPlaces), allocator);
    obj.AddMember("metrics", serializeMetrics(candidate.metrics, allocator), allocator);
    return obj;
}

Value ResultSerializer::serializeSummary(const OptimizationSummary& summary, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("candidatesTested", static_cast<uint64_t>(summary.candidatesTested), allocator);
    obj.AddMember("candidatesSucceeded", static_cast<uint64_t>(summary.candidatesSucceeded), allocator);
    obj.AddMember("candidatesFailed", static_cast<uint64_t>(summary.candidatesFailed), allocator);
    obj.AddMember("candidatesSkipped", static_cast<uint64_t>(summary.candidatesSkipped), allocator);
    obj.AddMember("effectiveStepSize", number(summary.effectiveStepSize, DisplayPlaces), allocator);
    obj.AddMember("sortKey", Value(sortKeyToString(summary.sortKey).c_str(), allocator), allocator);
    obj.AddMember("descending", summary.descending, allocator);
    obj.AddMember("cancelled", summary.cancelled, allocator);
    obj.AddMember("weeksSimulated", static_cast<uint64_t>(summary.weeksSimulated), allocator);
    return obj;
}

Value ResultSerializer::serializeWorstWeek(const WorstWeekDiagnostic& diagnostic, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("date", dateString(diagnostic.date, allocator), allocator);
    obj.AddMember("returnPct", number(diagnostic.returnPct, DisplayPlaces), allocator);
    return obj;
}

} // namespace reporting
} // namespace dcasweep
