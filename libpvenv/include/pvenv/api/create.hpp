// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_API_CREATE_HPP
#define PVENV_API_CREATE_HPP

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "pvenv/core/backend.hpp"
#include "pvenv/core/hooks.hpp"
#include "pvenv/core/options.hpp"
#include "pvenv/core/run_context.hpp"

namespace pvenv
{
    class Configuration;
    class Context;
    class PackageManager;
    class VersionManager;

    /**
     * Collaborators of the environment creation.
     */
    struct CreateServices
    {
        using backend_factory = std::function<std::unique_ptr<Backend>(BackendKind)>;

        VersionManager& version_manager;
        PackageManager& package_manager;
        backend_factory make_backend;
        /// Hooks registered from C++, run after the shell hooks of the same kind.
        HookList extra_hooks = {};
        /// Answers to the confirmation prompt, `std::cin` if null.
        std::istream* input = nullptr;
    };

    std::string create_usage();

    /**
     * Create a virtual environment from the raw arguments of `pyenv virtualenv`.
     *
     * Loads the configuration then runs `create_virtualenv` with the pyenv, pip and
     * backend implementations.
     *
     * @return The exit status of the command.
     */
    int create(Configuration& config, const std::vector<std::string>& raw_args);

    /**
     * Run the creation pipeline.
     *
     * Throws a `pvenv_error` with `incorrect_usage` for invalid arguments, `version_not_found`
     * for an unknown source version and `user_interrupted` when the confirmation is declined
     * or SIGINT is received between two stages.
     *
     * @return `0` on success, the status of the failing tool or hook otherwise.
     */
    int create_virtualenv(
        const Context& ctx,
        const std::vector<std::string>& raw_args,
        CreateServices& services
    );

    namespace detail
    {
        /// Interpret the flags and positional arguments, resolving the source version.
        RunContext init_run_context(
            const Context& ctx,
            const ParsedOptions& options,
            const VersionManager& version_manager
        );
    }
}

#endif
