/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_DATE_HPP
#define DEVALUE_DEVALUE_DATE_HPP

#include <string>
#include <string_view>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace devalue {
    // Always in UTC
    using date = boost::posix_time::ptime;

    // Accepts the forms produced by Date.prototype.toISOString and the common ISO-8601 variants:
    // a date alone, minutes or seconds precision, up to nine fractional digits, and a Z or +-HH:MM suffix.
    // Fractional digits beyond microseconds are truncated.
    extern date date_from_iso(std::string_view s);
    extern std::string date_to_iso(const date &d);
}

#endif // !DEVALUE_DEVALUE_DATE_HPP
