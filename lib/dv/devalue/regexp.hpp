/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_REGEXP_HPP
#define DEVALUE_DEVALUE_REGEXP_HPP

#include <string>
#include <boost/regex.hpp>

namespace devalue {
    struct regexp {
        static regexp compile(std::string_view source, std::string_view flags={});

        const std::string &source() const noexcept
        {
            return _source;
        }

        // The flags as received, including those without an effect on the compiled pattern
        const std::string &flags() const noexcept
        {
            return _flags;
        }

        const boost::regex &re() const noexcept
        {
            return _re;
        }

        bool has_flag(const char f) const noexcept
        {
            return _flags.find(f) != std::string::npos;
        }

        bool search(const std::string_view s) const
        {
            return boost::regex_search(s.begin(), s.end(), _re);
        }

        bool operator==(const regexp &o) const noexcept
        {
            return _source == o._source && _flags == o._flags;
        }
    private:
        std::string _source;
        std::string _flags;
        boost::regex _re;

        regexp(std::string_view source, std::string_view flags, boost::regex &&re);
    };
}

#endif // !DEVALUE_DEVALUE_REGEXP_HPP
