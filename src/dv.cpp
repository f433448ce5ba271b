/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace devalue;
    return cli::run(argc, argv);
}
