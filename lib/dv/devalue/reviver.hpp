/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_REVIVER_HPP
#define DEVALUE_DEVALUE_REVIVER_HPP

#include <functional>
#include <map>
#include <string>
#include <dv/devalue/value.hpp>

namespace devalue {
    // Receives the already hydrated payload. The document gives access to the payload's containers
    // and allows the reviver to allocate new ones.
    using reviver = std::function<value(document &doc, const value &payload)>;
    // Revivers are consulted before the built-in tags, so they can override them
    using reviver_map = std::map<std::string, reviver, std::less<>>;
}

#endif // !DEVALUE_DEVALUE_REVIVER_HPP
