/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_INSPECT_HPP
#define DEVALUE_DEVALUE_INSPECT_HPP

#include <string>
#include <dv/json.hpp>
#include <dv/devalue/value.hpp>

namespace devalue {
    // Shared references are expanded every time they are reached, so rendering is bounded
    // independently of the decoding limits.
    struct render_limits {
        static constexpr size_t default_max_depth = 256;
        static constexpr size_t default_max_items = 1 << 22;

        size_t max_depth = default_max_depth;
        size_t max_items = default_max_items;
    };

    // A human-readable rendering in the spirit of a JavaScript console.
    // A reference to a container that is still being printed is shown as [Circular *<node-id>].
    // Containers nested deeper than max_depth are shown as [Array], [Object], [Set] or [Map].
    // Throws resource_limit when more than max_items values would be printed.
    extern std::string inspect(const document &doc, const value &v, const render_limits &limits={});

    inline std::string inspect(const document &doc)
    {
        return inspect(doc, doc.root());
    }

    // Converts an acyclic value into plain JSON; throws error on a cycle
    // and resource_limit when max_depth or max_items is exceeded
    extern json::value to_json(const document &doc, const value &v, const render_limits &limits={});

    inline json::value to_json(const document &doc)
    {
        return to_json(doc, doc.root());
    }
}

#endif // !DEVALUE_DEVALUE_INSPECT_HPP
