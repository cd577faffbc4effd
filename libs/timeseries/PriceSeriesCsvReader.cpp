// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <vector>
#include <boost/algorithm/string.hpp>
#include "csv.h"
#include "PriceSeriesCsvReader.h"

namespace mkc_dca
{
  boost::gregorian::date parseBarDate(const std::string& dateStamp)
  {
    std::string stamp = boost::algorithm::trim_copy(dateStamp);

    try
      {
	if (stamp.find('-') != std::string::npos)
	  return boost::gregorian::from_simple_string(stamp.substr(0, 10));

	return boost::gregorian::from_undelimited_string(stamp);
      }
    catch (const std::exception& e)
      {
	throw PriceDataFormatException("parseBarDate - cannot parse date '" + dateStamp + "': " + e.what());
      }
  }

  PriceSeriesCsvReader::PriceSeriesCsvReader(const std::string& fileName)
    : mFileName(fileName),
      mSeries(),
      mUsedAdjustedClose(false)
  {}

  void PriceSeriesCsvReader::readFile()
  {
    std::vector<PricePoint> points;

    try
      {
	io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvFile(mFileName.c_str());
	csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			    "Date", "Close", "Adj Close");

	if (!csvFile.has_column("Date") || !csvFile.has_column("Close"))
	  throw PriceDataFormatException("PriceSeriesCsvReader::readFile - " + mFileName
					 + " must contain Date and Close columns");

	mUsedAdjustedClose = csvFile.has_column("Adj Close");

	std::string dateStamp, closeString, adjustedCloseString;
	while (csvFile.read_row(dateStamp, closeString, adjustedCloseString))
	  {
	    const std::string& priceString = mUsedAdjustedClose ? adjustedCloseString : closeString;
	    if (boost::algorithm::trim_copy(priceString).empty())
	      continue;

	    points.emplace_back(parseBarDate(dateStamp), std::stod(priceString));
	  }
      }
    catch (const PriceSeriesException&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw PriceDataFormatException("PriceSeriesCsvReader::readFile - error reading "
				       + mFileName + ": " + e.what());
      }

    mSeries = PriceSeries(std::move(points));
  }
} // namespace mkc_dca
