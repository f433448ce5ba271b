/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_BIG_INT_HPP
#define DEVALUE_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <sstream>
#include <boost/multiprecision/cpp_int.hpp>
#include <dv/common/format.hpp>

namespace devalue {
    using boost::multiprecision::cpp_int;

    // corresponds to 8192 bytes of a binary representation
    static constexpr size_t big_int_max_digits = 19730;

    inline cpp_int big_int_from_decimal(const std::string_view s)
    {
        if (s.empty())
            throw error("a big int must have at least one digit!");
        const size_t start = s.front() == '-' ? 1 : 0;
        if (start == s.size())
            throw error(fmt::format("a big int must have at least one digit but got: '{}'", s));
        if (s.size() - start > big_int_max_digits)
            throw error(fmt::format("big ints with more than {} digits are not supported but got: {}!", big_int_max_digits, s.size() - start));
        cpp_int val = 0;
        for (size_t i = start; i < s.size(); ++i) {
            const char c = s[i];
            if (c < '0' || c > '9') [[unlikely]]
                throw error(fmt::format("invalid character '{}' at position {} of a big int literal", c, i));
            val *= 10;
            val += c - '0';
        }
        if (start)
            val *= -1;
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !DEVALUE_BIG_INT_HPP
