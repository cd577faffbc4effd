// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_EXCEPTIONS_H
#define __MKC_DCA_EXCEPTIONS_H 1

#include <stdexcept>
#include <string>

namespace mkc_dca
{
  class DcaException : public std::runtime_error
  {
  public:
    DcaException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~DcaException() = default;
  };

  // Fewer price points than a simulation needs
  class InsufficientDataError : public DcaException
  {
  public:
    explicit InsufficientDataError(const std::string& msg)
      : DcaException(msg) {}
  };

  // A configuration or sweep parameter violates its positivity/ordering rule
  class InvalidConfigError : public DcaException
  {
  public:
    explicit InvalidConfigError(const std::string& msg)
      : DcaException(msg) {}
  };

  // Every candidate of a parameter sweep failed
  class NoValidCandidatesError : public DcaException
  {
  public:
    explicit NoValidCandidatesError(const std::string& msg)
      : DcaException(msg) {}
  };
} // namespace mkc_dca

#endif // __MKC_DCA_EXCEPTIONS_H
