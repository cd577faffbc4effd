#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "DcaPerformanceService.h"
#include "DiagnosticSelector.h"
#include "OptimizationReport.h"

namespace dcasweep
{
namespace reporting
{

/**
 * @brief Plain text reports printed by the dcasweep command line tool
 */
class SweepReporter
{
public:
    static void writeSimulationSummary(std::ostream& os, const DcaPerformanceReport& report);

    static void writeWeeklyBreakdown(std::ostream& os, const mkc_dca::SimulationResult& result);

    static void writeOptimizationReport(std::ostream& os, const mkc_dca::OptimizationReport& report);

    static void writeWorstWeek(std::ostream& os, const mkc_dca::WorstWeekDiagnostic& diagnostic);

private:
    static void writeCandidateTable(std::ostream& os,
                                    const std::vector<mkc_dca::SweepCandidate>& candidates);
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace dcasweep
