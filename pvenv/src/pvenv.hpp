// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CLI_PVENV_HPP
#define PVENV_CLI_PVENV_HPP

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace pvenv
{
    class Configuration;
}

void
init_general_options(CLI::App* subcom, pvenv::Configuration& config);

void
set_create_command(CLI::App* subcom, pvenv::Configuration& config, int& status);

void
set_deactivate_command(CLI::App* subcom, pvenv::Configuration& config);

void
set_pvenv_command(CLI::App* com, pvenv::Configuration& config, int& status);

// Arguments of the equivalent `pvenv` call when run under a pyenv command name.
std::vector<std::string>
multi_call_arguments(const std::vector<std::string>& args);

#endif
