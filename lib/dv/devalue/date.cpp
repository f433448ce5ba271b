/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/regex.hpp>
#include <dv/devalue/date.hpp>
#include <dv/devalue/error.hpp>

namespace devalue {
    namespace {
        int to_int(const boost::ssub_match &m)
        {
            int v = 0;
            const auto *first = &*m.first;
            const auto *last = first + m.length();
            // the sign is accepted only for the extended year notation
            if (first != last && *first == '+')
                ++first;
            if (const auto [ptr, ec] = std::from_chars(first, last, v); ec != std::errc {} || ptr != last)
                throw invalid_input(fmt::format("invalid numeric field in a date: '{}'", m.str()));
            return v;
        }
    }

    date date_from_iso(const std::string_view s)
    {
        static const boost::regex iso_re {
            R"(^([+-]\d{6}|\d{4})-(\d{2})-(\d{2}))"
            R"((?:[Tt ](\d{2}):(\d{2})(?::(\d{2})(?:[.,](\d{1,9}))?)?)?)"
            R"(([Zz]|[+-]\d{2}(?::?\d{2})?)?$)"
        };
        const std::string str { s };
        boost::smatch m {};
        if (!boost::regex_match(str, m, iso_re))
            throw invalid_input(fmt::format("not an ISO-8601 date: '{}'", s));
        try {
            const boost::gregorian::date day {
                static_cast<unsigned short>(to_int(m[1])),
                static_cast<unsigned short>(to_int(m[2])),
                static_cast<unsigned short>(to_int(m[3]))
            };
            boost::posix_time::time_duration tod {};
            if (m[4].matched) {
                const auto hours = to_int(m[4]);
                const auto minutes = to_int(m[5]);
                const auto seconds = m[6].matched ? to_int(m[6]) : 0;
                if (hours > 24 || minutes > 59 || seconds > 59 || (hours == 24 && (minutes || seconds)))
                    throw invalid_input(fmt::format("time of day is out of range: '{}'", s));
                int64_t micros = 0;
                if (m[7].matched) {
                    auto frac = m[7].str();
                    frac.resize(6, '0');
                    micros = std::stoll(frac);
                }
                tod = boost::posix_time::hours(hours) + boost::posix_time::minutes(minutes)
                    + boost::posix_time::seconds(seconds) + boost::posix_time::microseconds(micros);
            }
            date res { day, tod };
            if (m[8].matched && m[8].str() != "Z" && m[8].str() != "z") {
                const auto off = m[8].str();
                const int sign = off[0] == '-' ? -1 : 1;
                const int off_h = std::stoi(off.substr(1, 2));
                int off_m = 0;
                if (off.size() > 3)
                    off_m = std::stoi(off.substr(off.size() - 2));
                if (off_h > 23 || off_m > 59)
                    throw invalid_input(fmt::format("UTC offset is out of range: '{}'", s));
                res -= (boost::posix_time::hours(off_h) + boost::posix_time::minutes(off_m)) * sign;
            }
            return res;
        } catch (const invalid_input &) {
            throw;
        } catch (const std::exception &ex) {
            throw invalid_input(fmt::format("invalid date: '{}'", s), ex);
        }
    }

    std::string date_to_iso(const date &d)
    {
        if (d.is_special())
            throw error("cannot format a special date value!");
        const auto day = d.date();
        const auto tod = d.time_of_day();
        const auto frac = tod.total_microseconds() % 1'000'000;
        if (frac % 1000 == 0)
            return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                static_cast<int>(day.year()), static_cast<int>(day.month()), static_cast<int>(day.day()),
                tod.hours(), tod.minutes(), tod.seconds(), frac / 1000);
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
            static_cast<int>(day.year()), static_cast<int>(day.month()), static_cast<int>(day.day()),
            tod.hours(), tod.minutes(), tod.seconds(), frac);
    }
}
