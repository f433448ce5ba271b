/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/common/test.hpp>
#include <dv/devalue/error.hpp>
#include <dv/devalue/regexp.hpp>

using namespace devalue;

suite devalue_regexp_suite = [] {
    "devalue::regexp"_test = [] {
        "case-insensitive"_test = [] {
            const auto re = regexp::compile("potato", "i");
            expect(re.search("POTATO"));
            expect(re.search("hot potatoes"));
            expect(!re.search("tomato"));
        };
        "case-sensitive by default"_test = [] {
            const auto re = regexp::compile("potato");
            expect(re.search("potato"));
            expect(!re.search("Potato"));
        };
        "multiline"_test = [] {
            expect(!regexp::compile("^b$").search("a\nb\nc"));
            expect(regexp::compile("^b$", "m").search("a\nb\nc"));
        };
        "dot-all"_test = [] {
            expect(!regexp::compile("a.c").search("a\nc"));
            expect(regexp::compile("a.c", "s").search("a\nc"));
        };
        "flags without an effect on matching"_test = [] {
            const auto re = regexp::compile("\\d+", "gyu");
            test_same(std::string { "gyu" }, re.flags());
            expect(re.has_flag('g'));
            expect(!re.has_flag('i'));
            expect(re.search("abc123"));
        };
        "source and flags are preserved"_test = [] {
            const auto re = regexp::compile("[a-z]+\\/x", "mi");
            test_same(std::string { "[a-z]+\\/x" }, re.source());
            test_same(std::string { "mi" }, re.flags());
        };
        "equality"_test = [] {
            expect(regexp::compile("a+", "i") == regexp::compile("a+", "i"));
            expect(!(regexp::compile("a+", "i") == regexp::compile("a+", "")));
            expect(!(regexp::compile("a+") == regexp::compile("a*")));
        };
        "invalid patterns"_test = [] {
            expect(throws<invalid_input>([] { regexp::compile("("); }));
            expect(throws<invalid_input>([] { regexp::compile("[a-"); }));
            expect_throws_msg<invalid_input>([] { regexp::compile("(", "i"); }, "invalid regular expression /(/i");
        };
        "invalid flags"_test = [] {
            expect(throws<invalid_input>([] { regexp::compile("a", "x"); }));
            expect(throws<invalid_input>([] { regexp::compile("a", "ii"); }));
            expect_throws_msg<invalid_input>([] { regexp::compile("a", "gg"); }, "duplicate regular expression flag 'g'");
        };
    };
};
