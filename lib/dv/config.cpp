/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/config.hpp>
#include <dv/logger.hpp>

namespace devalue {
    static json::object parse_config(const std::string &path)
    {
        auto raw = file::read(path);
        boost::system::error_code ec {};
        auto jv = json::parse(raw, ec);
        if (ec)
            throw error(fmt::format("configuration file {} is not a valid JSON: {}", path, ec.message()));
        if (!jv.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        return std::move(jv.as_object());
    }

    const json::value &config_json::_at_impl(const std::string_view &name) const
    {
        const auto it = _json.find(name);
        if (it == _json.end())
            throw error(fmt::format("Config does not have the requested {} element!", name));
        return it->value();
    }

    config_file::config_file(const std::string &path)
            : _path { path }, _parsed { parse_config(path) }
    {
        logger::debug("loaded configuration file {}", _path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }
}
