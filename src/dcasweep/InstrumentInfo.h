// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <ostream>
#include <string>

namespace dcasweep
{
  // Static description of the traded futures contract
  struct InstrumentInfo
  {
    std::string symbol;
    std::string name;
    double contractMultiplier;
    double pointValueUsd;
    std::string marginModel;
    std::string tradingHours;
    std::string description;
  };

  InstrumentInfo getMicroNasdaqInstrumentInfo();

  void printInstrumentInfo(std::ostream& os, const InstrumentInfo& info);
}
