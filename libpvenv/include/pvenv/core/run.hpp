// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_RUN_HPP
#define PVENV_CORE_RUN_HPP

#include <optional>
#include <string>
#include <vector>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    using command_args = std::vector<std::string>;

    struct CommandResult
    {
        int status = 0;
        std::string out;
        std::string err;
    };

    struct RunOptions
    {
        /// Complete environment of the child, the current process environment if not set.
        std::optional<util::environment_map> env;
        std::optional<fs::path> working_directory;
        /// Capture stdout and stderr instead of forwarding them to the terminal.
        bool capture_output = false;
    };

    /**
     * Resolve a program name against the PATH of the given environment.
     *
     * Names containing a `/` are returned untouched, unknown names resolve to an empty path.
     */
    [[nodiscard]] auto resolve_program(const std::string& name, const RunOptions& options)
        -> fs::path;

    /**
     * Run a command to completion.
     *
     * A child exiting with a non-zero status is not an error, the status is returned in the
     * result. An error is returned only when the command could not be run at all.
     */
    [[nodiscard]] auto run_command(const command_args& args, const RunOptions& options = {})
        -> expected_t<CommandResult>;
}

#endif
