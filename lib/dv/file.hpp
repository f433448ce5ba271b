/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_FILE_HPP
#define DEVALUE_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace devalue::file {
    extern std::string read(const std::string &path);
    extern void write(const std::string &path, std::string_view data);

    // Removes the file when going out of scope
    struct tmp {
        explicit tmp(const std::string_view &name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !DEVALUE_FILE_HPP
