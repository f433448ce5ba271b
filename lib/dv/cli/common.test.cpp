/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <dv/common/test.hpp>
#include <dv/cli/common.hpp>

using namespace devalue;
using namespace devalue::cli;

suite cli_common_suite = [] {
    "cli::common"_test = [] {
        "decode_opts defaults"_test = [] {
            const auto opts = common::decode_opts({});
            expect(opts.max_depth == decode_options::default_max_depth);
            expect(opts.max_chunks == decode_options::default_max_chunks);
        };
        "explicit limits override the config file"_test = [] {
            file::tmp t { "dv-cli-common-config.json" };
            file::write(t.path(), R"({"maxDepth":8,"maxChunks":64})");
            const auto from_file = common::decode_opts({ { "config", t.path() } });
            expect(from_file.max_depth == 8_u);
            expect(from_file.max_chunks == 64_u);
            const auto overridden = common::decode_opts({ { "config", t.path() }, { "max-depth", "3" } });
            expect(overridden.max_depth == 3_u);
            expect(overridden.max_chunks == 64_u);
        };
        "limit validation"_test = [] {
            cli::config cfg {};
            common::add_opts(cfg);
            const auto &validator = *cfg.opts.at("max-depth").validator;
            expect(!validator(std::string { "10" }));
            expect(static_cast<bool>(validator(std::string { "0" })));
            expect(static_cast<bool>(validator(std::string { "-1" })));
            expect(static_cast<bool>(validator(std::string { "10x" })));
            expect(static_cast<bool>(validator(std::optional<std::string> {})));
        };
        "print inspect"_test = [] {
            std::ostringstream os {};
            common::print(os, parse(R"([{"a":1},["Set",2],3])"), {});
            test_same(std::string { "{\"a\": Set(1) {3}}\n" }, os.str());
        };
        "print json"_test = [] {
            std::ostringstream os {};
            common::print(os, parse(R"([{"a":1},["Set",2],3])"), { { "json", std::optional<std::string> {} } });
            test_same(std::string { "{\n  \"a\": [\n    3\n  ]\n}\n" }, os.str());
        };
        "print a long shared chain"_test = [] {
            // the root refers to every link of a 2000-long chain, so each link hydrates shallowly
            static constexpr size_t n = 2000;
            std::string s { "[[" };
            for (size_t k = n; k >= 1; --k)
                s += fmt::format("{}{}", k, k > 1 ? "," : "]");
            for (size_t k = 1; k < n; ++k)
                s += fmt::format(",[{}]", k + 1);
            s += ",[]]";
            const auto doc = parse(s);
            std::ostringstream os {};
            common::print(os, doc, {});
            expect(os.str().find("[Array]") != std::string::npos);
            std::ostringstream js {};
            expect(throws<resource_limit>([&] { common::print(js, doc, { { "json", std::optional<std::string> {} } }); }));
        };
    };
    "cli commands"_test = [] {
        "parse"_test = [] {
            const char *argv[] { "dv", "parse", R"([{"a":1},"x"])" };
            test_same(0, cli::run(3, argv));
        };
        "parse --json"_test = [] {
            const char *argv[] { "dv", "parse", R"([["Map",1,2],"k",-4])", "--json" };
            test_same(0, cli::run(4, argv));
        };
        "parse failure"_test = [] {
            const char *argv[] { "dv", "parse", R"([["Frobnicate",1],2])" };
            test_same(1, cli::run(3, argv));
        };
        "parse limits"_test = [] {
            const char *argv[] { "dv", "parse", "[[1],[]]", "--max-depth=1" };
            test_same(1, cli::run(4, argv));
        };
        "parse-file"_test = [] {
            file::tmp t { "dv-cli-parse-file.txt" };
            file::write(t.path(), R"([{"when":1},["Date","2023-03-20T09:15:38.137Z"]])");
            const auto path = t.path();
            const char *argv[] { "dv", "parse-file", path.c_str() };
            test_same(0, cli::run(3, argv));
        };
        "parse-file missing"_test = [] {
            const char *argv[] { "dv", "parse-file", "./dv-cli-missing-input.txt" };
            test_same(1, cli::run(3, argv));
        };
    };
};
