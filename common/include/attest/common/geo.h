/**
 * @file geo.h
 * @brief Geographic coordinate formatting for EXIF assertions
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_GEO_H
#define ATTEST_GEO_H

#include <string>

namespace attest {

/**
 * @brief Convert decimal degrees to an EXIF degrees/decimal-minutes string
 *
 * Output pattern is "<degrees>,<minutes to 3 decimals><hemisphere>",
 * e.g. 39.3517 latitude -> "39,21.102N". Zero is treated as N/E.
 *
 * Magnitudes are not range checked; whole degrees are printed in full
 * (1e30 -> "1000000000000000019884624838656,0.000N").
 *
 * @param degrees Signed decimal degrees, must be finite
 * @param is_latitude true for N/S hemisphere letters, false for E/W
 * @throws std::invalid_argument if @p degrees is NaN or infinite
 */
std::string DecimalToExifDms(double degrees, bool is_latitude);

} // namespace attest

#endif // ATTEST_GEO_H
