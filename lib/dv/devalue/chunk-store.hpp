/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_CHUNK_STORE_HPP
#define DEVALUE_DEVALUE_CHUNK_STORE_HPP

#include <optional>
#include <dv/json.hpp>
#include <dv/devalue/options.hpp>

namespace devalue {
    // A read-only view over a parsed payload: either a bare integer or a non-empty array of chunks
    // with the root at index 0. The JSON value must outlive the store.
    struct chunk_store {
        explicit chunk_store(const json::value &payload, const decode_options &opts={});

        // set when the whole payload is a bare integer
        const std::optional<int64_t> &standalone() const noexcept
        {
            return _standalone;
        }

        size_t size() const noexcept
        {
            return _chunks ? _chunks->size() : 0;
        }

        const json::value &at(uint64_t idx) const;
    private:
        const json::array *_chunks = nullptr;
        std::optional<int64_t> _standalone {};
    };
}

#endif // !DEVALUE_DEVALUE_CHUNK_STORE_HPP
