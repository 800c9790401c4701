// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <tuple>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <reproc++/run.hpp>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    auto resolve_program(const std::string& name, const RunOptions& options) -> fs::path
    {
        if (util::contains(name, '/'))
        {
            return name;
        }
        if (options.env)
        {
            if (auto it = options.env->find("PATH"); it != options.env->end())
            {
                return util::which_in_path_list(name, it->second);
            }
        }
        return util::which(name);
    }

    auto run_command(const command_args& args, const RunOptions& options)
        -> expected_t<CommandResult>
    {
        if (args.empty())
        {
            return make_unexpected("Empty command", pvenv_error_code::internal_failure);
        }

        auto wrapped_args = args;
        const auto program = resolve_program(args.front(), options);
        if (program.empty())
        {
            return make_unexpected(
                fmt::format("Could not find executable '{}'", args.front()),
                pvenv_error_code::subprocess_failure
            );
        }
        wrapped_args.front() = program.string();

        reproc::options opt;
        if (options.env)
        {
            opt.env.behavior = reproc::env::empty;
            opt.env.extra = reproc::env(*options.env);
        }

        const auto cwd = options.working_directory.value_or(fs::path()).string();
        if (!cwd.empty())
        {
            opt.working_directory = cwd.c_str();
        }

        LOG_DEBUG << fmt::format("Running command: {}", fmt::join(wrapped_args, " "))
                  << (cwd.empty() ? "" : fmt::format("\n  in: {}", cwd));

        CommandResult result;
        int status = 0;
        std::error_code ec;
        if (options.capture_output)
        {
            std::tie(status, ec) = reproc::run(
                wrapped_args,
                opt,
                reproc::sink::string(result.out),
                reproc::sink::string(result.err)
            );
        }
        else
        {
            opt.redirect.parent = true;
            std::tie(status, ec) = reproc::run(wrapped_args, opt);
        }

        if (ec)
        {
            return make_unexpected(
                fmt::format(
                    "Subprocess call failed: {}\n  command ran: {}",
                    ec.message(),
                    fmt::join(wrapped_args, " ")
                ),
                pvenv_error_code::subprocess_failure
            );
        }

        result.status = status;
        LOG_DEBUG << fmt::format("Command '{}' exited with status {}", args.front(), status);
        return result;
    }
}
