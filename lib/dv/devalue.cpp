/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/devalue.hpp>
#include <dv/timer.hpp>
#include <dv/devalue/chunk-store.hpp>
#include <dv/devalue/hydrator.hpp>

namespace devalue {
    document parse(const std::string_view serialized, const reviver_map &revivers, const decode_options &opts)
    {
        timer t { "devalue::parse" };
        boost::system::error_code ec {};
        const auto payload = json::parse(serialized, ec);
        if (ec)
            throw invalid_input(fmt::format("invalid input: not a valid JSON: {}", ec.message()));
        return unflatten(payload, revivers, opts);
    }

    document unflatten(const json::value &payload, const reviver_map &revivers, const decode_options &opts)
    {
        const chunk_store store { payload, opts };
        document doc {};
        hydrator h { store, doc, revivers, opts };
        doc.root(h.decode());
        logger::trace("decoded {} chunks into {} containers", store.size(), doc.num_nodes());
        return doc;
    }
}
