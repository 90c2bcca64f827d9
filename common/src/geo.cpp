/**
 * @file geo.cpp
 * @brief EXIF GPS coordinate formatting
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/common/geo.h"
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace attest {

std::string DecimalToExifDms(double degrees, bool is_latitude) {
    if (!std::isfinite(degrees)) {
        throw std::invalid_argument("coordinate is not a finite number");
    }

    const double abs_degrees = std::fabs(degrees);
    const double whole = std::floor(abs_degrees);
    const double minutes = (abs_degrees - whole) * 60.0;

    char hemisphere;
    if (is_latitude) {
        hemisphere = degrees >= 0.0 ? 'N' : 'S';
    } else {
        hemisphere = degrees >= 0.0 ? 'E' : 'W';
    }

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed
       << std::setprecision(0) << whole << ','
       << std::setprecision(3) << minutes
       << hemisphere;
    return ss.str();
}

} // namespace attest
