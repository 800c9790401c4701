// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <cstdlib>
#include <iostream>

#include "pvenv/api/configuration.hpp"
#include "pvenv/core/context.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/version.hpp"

#include "pvenv.hpp"

using namespace pvenv;  // NOLINT(build/namespaces)

void
init_general_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Global options";

    subcom
        ->add_option_function<std::vector<std::string>>(
            "--rc-file",
            [&config](const std::vector<std::string>& files)
            { config.at("rc_files").set_cli_value(std::vector<fs::path>(files.begin(), files.end())); },
            config.at("rc_files").description()
        )
        ->option_text("FILE1 FILE2...")
        ->group(cli_group);

    subcom
        ->add_option_function<std::string>(
            "-r,--root-prefix",
            [&config](const std::string& root)
            { config.at("root_prefix").set_cli_value(fs::path(root)); },
            config.at("root_prefix").description()
        )
        ->option_text("PATH")
        ->group(cli_group);

    subcom
        ->add_flag_function(
            "-v,--verbose",
            [&config](std::int64_t count)
            { config.at("verbose").set_cli_value(static_cast<int>(count)); },
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->group(cli_group);

    subcom
        ->add_option_function<std::string>(
            "--log-level",
            [&config](const std::string& name)
            {
                auto level = log_level_from_name(name);
                if (!level)
                {
                    throw CLI::ValidationError("--log-level", "unknown level '" + name + "'");
                }
                config.at("log_level").set_cli_value(*level);
            },
            config.at("log_level").description()
        )
        ->group(cli_group);

    subcom
        ->add_flag_function(
            "--debug",
            [&config](std::int64_t /*count*/) { config.at("debug").set_cli_value(true); },
            "Debug mode"
        )
        ->group("");
}

void
set_pvenv_command(CLI::App* com, Configuration& config, int& status)
{
    init_general_options(com, config);

    auto print_version = [](std::int64_t /*count*/)
    {
        std::cout << pvenv::version() << std::endl;
        exit(0);
    };
    com->add_flag_function("--version", print_version);

    CLI::App* create_subcom = com->add_subcommand(
        "create",
        "Create a virtual environment as a pyenv version"
    );
    set_create_command(create_subcom, config, status);

    CLI::App* deactivate_subcom = com->add_subcommand(
        "deactivate",
        "Print the shell code deactivating the current environment"
    );
    set_deactivate_command(deactivate_subcom, config);

    com->require_subcommand(/* min */ 0, /* max */ 1);
}

std::vector<std::string>
multi_call_arguments(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        return args;
    }

    const auto called_as = fs::path(args.front()).filename().string();
    std::string subcommand;
    if (called_as == "pyenv-virtualenv")
    {
        subcommand = "create";
    }
    else if (called_as == "pyenv-sh-deactivate")
    {
        subcommand = "deactivate";
    }
    else
    {
        return args;
    }

    std::vector<std::string> result = { args.front(), subcommand };
    result.insert(result.end(), args.begin() + 1, args.end());
    return result;
}
