#pragma once

#include <cstdio>
#include <stdexcept>
#include <fstream>
#include <string>
#include <utility>
#include <unistd.h>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"
#include "SimulationConfig.h"

// First Friday of 2024; used as the first weekly close in synthetic series
inline boost::gregorian::date firstTestFriday()
{
  return boost::gregorian::date(2024, boost::gregorian::Jan, 5);
}

// Weekly series dated on consecutive Fridays starting at firstTestFriday()
inline mkc_dca::PriceSeries makeWeeklySeries(const std::vector<double>& closes)
{
  std::vector<mkc_dca::PricePoint> points;
  boost::gregorian::date d = firstTestFriday();
  for (double c : closes)
    {
      points.emplace_back(d, c);
      d += boost::gregorian::weeks(1);
    }
  return mkc_dca::PriceSeries(std::move(points));
}

// Daily (Mon-Fri) series starting on Monday 2024-01-01
inline mkc_dca::PriceSeries makeWeekdaySeries(const std::vector<double>& closes)
{
  std::vector<mkc_dca::PricePoint> points;
  boost::gregorian::date d(2024, boost::gregorian::Jan, 1);
  for (double c : closes)
    {
      while (d.day_of_week() == boost::gregorian::Saturday || d.day_of_week() == boost::gregorian::Sunday)
	d += boost::gregorian::days(1);
      points.emplace_back(d, c);
      d += boost::gregorian::days(1);
    }
  return mkc_dca::PriceSeries(std::move(points));
}

// The configuration used by the flat-price scenario: fee of 3.50 per contract
inline mkc_dca::SimulationConfig makeScenarioConfig(int maxAdds = 1, double minEquityToNotional = 0.10)
{
  return mkc_dca::SimulationConfig(2.0, 1000.0, 800.0, 2.5, 1.0, 100, minEquityToNotional, maxAdds);
}

// Writes @p contents to a unique file under /tmp and removes it on destruction
class TempFile
{
public:
  explicit TempFile(const std::string& contents)
  {
    char tmpl[] = "/tmp/dcasweep-XXXXXX";
    int fd = mkstemp(tmpl);
    if (fd < 0)
      throw std::runtime_error("TempFile: mkstemp failed");
    ::close(fd);
    mFileName = tmpl;

    std::ofstream out(mFileName);
    out << contents;
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  ~TempFile()
  {
    std::remove(mFileName.c_str());
  }

  const std::string& getFileName() const
  {
    return mFileName;
  }

private:
  std::string mFileName;
};
