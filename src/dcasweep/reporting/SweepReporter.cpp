#include "SweepReporter.h"
#include <iomanip>
#include "SweepParameters.h"
#include "utils/TimeUtils.h"

using namespace mkc_dca;

namespace dcasweep
{
namespace reporting
{

void SweepReporter::writeSimulationSummary(std::ostream& os, const DcaPerformanceReport& report)
{
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(2);

    writeSectionHeader(os, report.symbol + " Weekly DCA Performance");

    os << "Period: " << utils::toIsoDateString(report.startDate) << " to "
       << utils::toIsoDateString(report.endDate) << std::endl;
    os << "Weekly Amount: " << report.weeklyAmount << std::endl;
    os << "Total Weeks: " << report.totalWeeks << std::endl;
    os << "Total Invested: " << report.totalInvested << std::endl;
    os << "Current Value: " << report.currentValue << std::endl;
    os << "Total Contracts: " << report.totalContracts << std::endl;
    os << "Cumulative Fees: " << report.result.getCumulativeFees() << std::endl;
    os << "Total Return: " << report.metrics.totalReturnPct << "%" << std::endl;
    os << "CAGR: " << report.metrics.cagr << "%" << std::endl;
    os << "Annualized Volatility: " << report.metrics.volatilityAnnualized << "%" << std::endl;
    os << "Sharpe Ratio: " << report.metrics.sharpeRatio << std::endl;
    os << "Max Drawdown: " << report.metrics.maxDrawdownPct << "%" << std::endl;
    os << "Profit Factor: " << report.metrics.profitFactor << std::endl;
    os << "Win Rate: " << report.metrics.winRatePct << "%" << std::endl;

    writeSectionFooter(os);

    os.flags(flags);
    os.precision(precision);
}

void SweepReporter::writeWeeklyBreakdown(std::ostream& os, const SimulationResult& result)
{
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(2);

    writeSectionHeader(os, "Weekly Breakdown");

    os << std::setw(5) << "Week" << std::setw(12) << "Date" << std::setw(12) << "Price"
       << std::setw(6) << "Add" << std::setw(6) << "Liq" << std::setw(6) << "Held"
       << std::setw(14) << "Invested" << std::setw(14) << "Equity"
       << std::setw(12) << "Return%" << std::endl;

    for (auto it = result.beginWeeks(); it != result.endWeeks(); ++it)
    {
        os << std::setw(5) << it->weekIndex
           << std::setw(12) << utils::toIsoDateString(it->date)
           << std::setw(12) << it->price
           << std::setw(6) << it->contractsAdded
           << std::setw(6) << it->contractsLiquidated
           << std::setw(6) << it->totalContracts
           << std::setw(14) << it->totalInvested
           << std::setw(14) << it->equity
           << std::setw(12) << it->returnPct << std::endl;
    }

    writeSectionFooter(os);

    os.flags(flags);
    os.precision(precision);
}

void SweepReporter::writeOptimizationReport(std::ostream& os, const OptimizationReport& report)
{
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(2);

    const OptimizationSummary& summary = report.getSummary();

    writeSectionHeader(os, "Weekly Amount Sweep");
    os << "Grid Size: " << report.getTestedGrid().size() << std::endl;
    os << "Effective Step Size: " << summary.effectiveStepSize << std::endl;
    os << "Weeks Simulated: " << summary.weeksSimulated << std::endl;
    os << "Candidates Tested: " << summary.candidatesTested << std::endl;
    os << "Candidates Succeeded: " << summary.candidatesSucceeded << std::endl;
    os << "Candidates Failed: " << summary.candidatesFailed << std::endl;
    if (summary.cancelled)
        os << "Sweep cancelled, candidates skipped: " << summary.candidatesSkipped << std::endl;
    writeSectionFooter(os);
    os << std::endl;

    writeSectionHeader(os, "Top by " + sortKeyToString(summary.sortKey)
                       + (summary.descending ? " (descending)" : " (ascending)"));
    writeCandidateTable(os, report.getTopByObjective());
    writeSectionFooter(os);
    os << std::endl;

    writeSectionHeader(os, "Top by Dollar Profit");
    writeCandidateTable(os, report.getTopByDollarProfit());
    writeSectionFooter(os);

    os.flags(flags);
    os.precision(precision);
}

void SweepReporter::writeWorstWeek(std::ostream& os, const WorstWeekDiagnostic& diagnostic)
{
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();

    os << "Worst Week: " << utils::toIsoDateString(diagnostic.date) << " ("
       << std::fixed << std::setprecision(2) << diagnostic.returnPct << "%)" << std::endl;

    os.flags(flags);
    os.precision(precision);
}

void SweepReporter::writeCandidateTable(std::ostream& os, const std::vector<SweepCandidate>& candidates)
{
    os << std::setw(12) << "Amount" << std::setw(14) << "Profit" << std::setw(10) << "Return%"
       << std::setw(9) << "Sharpe" << std::setw(9) << "Vol%" << std::setw(9) << "MaxDD%"
       << std::setw(8) << "PF" << std::setw(10) << "$/Inv" << std::endl;

    for (const auto& c : candidates)
    {
        os << std::setw(12) << c.weeklyAmount
           << std::setw(14) << c.dollarProfit
           << std::setw(10) << c.metrics.totalReturnPct
           << std::setw(9) << c.metrics.sharpeRatio
           << std::setw(9) << c.metrics.volatilityAnnualized
           << std::setw(9) << c.metrics.maxDrawdownPct
           << std::setw(8) << c.metrics.profitFactor
           << std::setw(10) << std::setprecision(4) << c.returnPerInvestedDollar
           << std::setprecision(2) << std::endl;
    }
}

void SweepReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void SweepReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace dcasweep
