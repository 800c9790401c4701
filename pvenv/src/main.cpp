// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "pvenv/api/configuration.hpp"
#include "pvenv/api/create.hpp"
#include "pvenv/core/context.hpp"
#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/output.hpp"
#include "pvenv/util/string.hpp"
#include "pvenv/version.hpp"

#include "pvenv.hpp"

using namespace pvenv;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    pvenv::Context ctx{ {
        /* .enable_logging = */ true,
        /* .enable_signal_handling = */ true,
    } };
    pvenv::Console console{ ctx };
    pvenv::Configuration config{ ctx };

    int status = 0;
    CLI::App app{ "Version: " + version() + "\n" };
    set_pvenv_command(&app, config, status);

    auto args = multi_call_arguments(std::vector<std::string>(argv, argv + argc));
    ctx.command_params.current_command = util::join(" ", args);

    // CLI11 expects the arguments in reverse order, without the program name.
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    reversed.pop_back();

    try
    {
        try
        {
            app.parse(std::move(reversed));
        }
        catch (const CLI::ParseError& e)
        {
            return app.exit(e);
        }

        if (app.get_subcommands().empty())
        {
            Console::instance().print(app.help());
        }
    }
    catch (const pvenv_error& e)
    {
        switch (e.error_code())
        {
            case pvenv_error_code::incorrect_usage:
            case pvenv_error_code::version_not_found:
                LOG_CRITICAL << e.what();
                std::cerr << create_usage() << std::endl;
                return 1;
            case pvenv_error_code::user_interrupted:
                LOG_WARNING << e.what();
                return 1;
            default:
                LOG_CRITICAL << e.what();
                return 1;
        }
    }
    catch (const std::exception& e)
    {
        LOG_CRITICAL << e.what();
        return 1;
    }

    return status;
}
