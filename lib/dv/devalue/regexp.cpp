/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/devalue/error.hpp>
#include <dv/devalue/regexp.hpp>

namespace devalue {
    regexp regexp::compile(const std::string_view source, const std::string_view flags)
    {
        using boost::regex_constants::syntax_option_type;
        syntax_option_type opts = boost::regex::ECMAScript;
        bool multiline = false;
        bool dot_all = false;
        std::string seen {};
        for (const char f: flags) {
            if (seen.find(f) != std::string::npos)
                throw invalid_input(fmt::format("duplicate regular expression flag '{}' in '{}'", f, flags));
            seen += f;
            switch (f) {
                case 'i': opts |= boost::regex::icase; break;
                case 'm': multiline = true; break;
                case 's': dot_all = true; break;
                // global, sticky, unicode, and indices change how a pattern is applied, not what it matches
                case 'g':
                case 'y':
                case 'u':
                case 'v':
                case 'd':
                    break;
                default:
                    throw invalid_input(fmt::format("unsupported regular expression flag '{}' in '{}'", f, flags));
            }
        }
        if (!multiline)
            opts |= boost::regex::no_mod_m;
        if (!dot_all)
            opts |= boost::regex::no_mod_s;
        try {
            return regexp { source, flags, boost::regex { source.begin(), source.end(), opts } };
        } catch (const boost::regex_error &ex) {
            throw invalid_input(fmt::format("invalid regular expression /{}/{}", source, flags), ex);
        }
    }

    regexp::regexp(const std::string_view source, const std::string_view flags, boost::regex &&re):
        _source { source }, _flags { flags }, _re { std::move(re) }
    {
    }
}
