// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>
#include <string>

#include "pvenv/api/deactivate.hpp"

#include "pvenv.hpp"

using namespace pvenv;  // NOLINT(build/namespaces)

void
set_deactivate_command(CLI::App* subcom, Configuration& config)
{
    static std::optional<std::string> shell;
    subcom->add_option("-s,--shell", shell, "Shell to print the code for")
        ->check(CLI::IsMember({ "bash", "zsh", "ksh", "sh", "fish" }));

    subcom->callback([&config] { pvenv::deactivate(config, shell); });
}
