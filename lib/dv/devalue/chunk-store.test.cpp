/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/common/test.hpp>
#include <dv/devalue/chunk-store.hpp>
#include <dv/devalue/error.hpp>

using namespace devalue;

suite devalue_chunk_store_suite = [] {
    "devalue::chunk_store"_test = [] {
        "chunk array"_test = [] {
            const auto payload = json::parse(R"([[1],"a"])");
            const chunk_store store { payload, {} };
            expect(store.size() == 2_u);
            expect(!store.standalone());
            test_same(std::string { "a" }, std::string { json::as_string_view(store.at(1).as_string()) });
        };
        "standalone integer"_test = [] {
            const json::value payload(-3);
            const chunk_store store { payload, {} };
            expect(static_cast<bool>(store.standalone()));
            expect(*store.standalone() == int64_t { -3 });
        };
        "out of range access"_test = [] {
            const auto payload = json::parse(R"([1,2])");
            const chunk_store store { payload, {} };
            expect(throws<index_out_of_range>([&] { store.at(2); }));
            expect_throws_msg<index_out_of_range>([&] { store.at(5); }, "chunk index 5 is out of range");
        };
        "invalid payloads"_test = [] {
            expect(throws<invalid_input>([] { chunk_store { json::value(json::array()), {} }; }));
            expect(throws<invalid_input>([] { chunk_store { json::value(json::object()), {} }; }));
            expect(throws<invalid_input>([] { chunk_store { json::value("str"), {} }; }));
            expect(throws<invalid_input>([] { chunk_store { json::value(1.5), {} }; }));
            expect(throws<invalid_input>([] { chunk_store { json::value(18446744073709551615ULL), {} }; }));
        };
        "chunk limit"_test = [] {
            const auto payload = json::parse("[1,2,3]");
            expect(nothrow([&] { chunk_store { payload, decode_options { .max_chunks = 3 } }; }));
            expect(throws<resource_limit>([&] { chunk_store { payload, decode_options { .max_chunks = 2 } }; }));
        };
    };
};
