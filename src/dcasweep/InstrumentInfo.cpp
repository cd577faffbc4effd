// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "InstrumentInfo.h"

namespace dcasweep
{
  InstrumentInfo getMicroNasdaqInstrumentInfo()
  {
    return InstrumentInfo{ "MNQ=F",
			   "Micro E-mini NASDAQ-100 Futures",
			   2.0,
			   2.0,
			   "Approx. $1,000 initial / $800 maintenance per contract (varies)",
			   "Sun 6:00 PM - Fri 5:00 PM ET (with daily 5-6 PM pause)",
			   "Micro E-mini NASDAQ-100 futures contract, $2 per index point." };
  }

  void printInstrumentInfo(std::ostream& os, const InstrumentInfo& info)
  {
    os << "Symbol:              " << info.symbol << std::endl;
    os << "Name:                " << info.name << std::endl;
    os << "Contract multiplier: " << info.contractMultiplier << std::endl;
    os << "Point value (USD):   " << info.pointValueUsd << std::endl;
    os << "Margin model:        " << info.marginModel << std::endl;
    os << "Trading hours:       " << info.tradingHours << std::endl;
    os << "Description:         " << info.description << std::endl;
  }
}
