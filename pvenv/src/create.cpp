// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pvenv/api/create.hpp"

#include "pvenv.hpp"

using namespace pvenv;  // NOLINT(build/namespaces)

void
set_create_command(CLI::App* subcom, Configuration& config, int& status)
{
    // Every argument, `--help` included, is interpreted by the creation itself.
    subcom->set_help_flag();
    subcom->prefix_command();
    subcom->footer(create_usage());

    subcom->callback([subcom, &config, &status]
                     { status = pvenv::create(config, subcom->remaining()); });
}
