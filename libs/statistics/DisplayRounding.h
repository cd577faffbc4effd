// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_DCA_DISPLAY_ROUNDING_H
#define __MKC_DCA_DISPLAY_ROUNDING_H 1

#include <cmath>

namespace mkc_dca
{
  /**
   * @brief Round @p value to @p places decimal places, halves away from zero.
   *
   * Only used where a value leaves the library (metrics returned to callers,
   * serialized reports). Non-finite values are returned unchanged.
   */
  inline double roundForDisplay(double value, int places = 2)
  {
    if (!std::isfinite(value))
      return value;

    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
  }
} // namespace mkc_dca

#endif // __MKC_DCA_DISPLAY_ROUNDING_H
