// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/run_context.hpp"

namespace pvenv
{
    void RunContext::export_variables()
    {
        environment["VIRTUALENV_NAME"] = env_name;
        environment["VIRTUALENV_PATH"] = target_path.string();
        environment["VERSION_NAME"] = source_version;
    }

    auto RunContext::run_options(const fs::path& working_directory) const -> RunOptions
    {
        RunOptions options;
        options.env = environment;
        if (!working_directory.empty())
        {
            options.working_directory = working_directory;
        }
        return options;
    }

    void sanitize_environment(util::environment_map& env)
    {
        static constexpr std::array<const char*, 3> unset_vars = {
            "PIP_REQUIRE_VENV",
            "PIP_REQUIRE_VIRTUALENV",
            "PYENV_VERSION",
        };
        for (const auto* name : unset_vars)
        {
            if (env.erase(name) > 0)
            {
                LOG_DEBUG << "Unsetting " << name << " for the child processes";
            }
        }
    }
}
