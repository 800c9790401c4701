// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_RUN_CONTEXT_HPP
#define PVENV_CORE_RUN_CONTEXT_HPP

#include <optional>
#include <string>

#include "pvenv/core/backend.hpp"
#include "pvenv/core/migration.hpp"
#include "pvenv/core/options.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    /**
     * State of one environment creation, passed from stage to stage.
     *
     * Hooks receive it by reference and may modify it.
     */
    struct RunContext
    {
        ParsedOptions options;

        bool force = false;
        bool upgrade = false;
        bool quiet = false;
        bool verbose = false;

        /// Options forwarded to the backend tool.
        command_args backend_options;

        std::string source_version;
        std::string env_name;
        fs::path target_path;

        BackendKind backend = BackendKind::virtualenv;
        /// The backend handles `--upgrade` itself, the packages are not migrated.
        bool native_upgrade = false;

        /// Whether the target existed before anything was modified.
        bool prefix_existed = false;
        std::optional<UpgradeSnapshot> snapshot;

        /// Environment of every child process and hook.
        util::environment_map environment;

        int status = 0;

        /// Set `VIRTUALENV_NAME`, `VIRTUALENV_PATH` and `VERSION_NAME` in the environment.
        void export_variables();

        auto run_options(const fs::path& working_directory = {}) const -> RunOptions;
    };

    /// Remove the variables changing the behavior of pip and pyenv in the children.
    void sanitize_environment(util::environment_map& env);
}

#endif
