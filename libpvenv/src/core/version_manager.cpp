// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/version_manager.hpp"
#include "pvenv/util/environment.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    auto VersionManager::locate(const std::string& version, std::string_view command) const
        -> fs::path
    {
        const auto maybe_prefix = prefix(version);
        if (!maybe_prefix)
        {
            LOG_DEBUG << fmt::format(
                "Cannot look for '{}' in version '{}': {}",
                command,
                version,
                maybe_prefix.error().what()
            );
            return {};
        }
        return util::which_in(command, maybe_prefix.value() / "bin");
    }

    PyenvVersionManager::PyenvVersionManager(std::string pyenv_exe, fs::path root_prefix)
        : m_pyenv_exe(std::move(pyenv_exe))
        , m_root_prefix(std::move(root_prefix))
    {
    }

    auto PyenvVersionManager::with_root(util::environment_map env) const -> util::environment_map
    {
        if (!m_root_prefix.empty())
        {
            env["PYENV_ROOT"] = m_root_prefix.string();
        }
        return env;
    }

    auto PyenvVersionManager::query(const command_args& args) const -> expected_t<CommandResult>
    {
        command_args full_args = { m_pyenv_exe };
        full_args.insert(full_args.end(), args.begin(), args.end());

        RunOptions options;
        options.env = with_root(util::get_env_map());
        options.capture_output = true;
        return run_command(full_args, options);
    }

    auto PyenvVersionManager::current_version() const -> expected_t<std::string>
    {
        auto result = query({ "version-name" });
        if (!result)
        {
            return forward_error(result);
        }
        if (result->status != 0)
        {
            return make_unexpected(
                fmt::format("pyenv: {}", util::strip(result->err)),
                pvenv_error_code::version_not_found
            );
        }
        return std::string(util::strip(result->out));
    }

    auto PyenvVersionManager::prefix(const std::string& version) const -> expected_t<fs::path>
    {
        auto result = query({ "prefix", version });
        if (!result)
        {
            return forward_error(result);
        }
        const auto out = util::strip(result->out);
        if (result->status != 0 || out.empty())
        {
            return make_unexpected(
                fmt::format("pyenv: version '{}' not installed", version),
                pvenv_error_code::version_not_found
            );
        }
        // Several prefixes are printed for multiple versions, only the first one is relevant.
        return fs::path(util::split(out, ":").front());
    }

    auto PyenvVersionManager::hooks(const std::string& command) const -> std::vector<fs::path>
    {
        std::vector<fs::path> scripts;
        auto result = query({ "hooks", command });
        if (!result)
        {
            LOG_WARNING << "Could not list the hooks: " << result.error().what();
            return scripts;
        }
        if (result->status != 0)
        {
            LOG_WARNING << fmt::format("'pyenv hooks {}' failed: {}", command, util::strip(result->err));
            return scripts;
        }
        for (const auto& line : util::split_lines(result->out))
        {
            if (!util::strip(line).empty())
            {
                scripts.emplace_back(std::string(util::strip(line)));
            }
        }
        return scripts;
    }

    auto PyenvVersionManager::exec(
        const std::string& version,
        const command_args& args,
        const RunOptions& options
    ) const -> expected_t<CommandResult>
    {
        command_args full_args = { m_pyenv_exe, "exec" };
        full_args.insert(full_args.end(), args.begin(), args.end());

        auto exec_options = options;
        auto env = with_root(options.env.value_or(util::get_env_map()));
        env["PYENV_VERSION"] = version;
        exec_options.env = std::move(env);

        LOG_INFO << fmt::format("Running '{}' with Python '{}'", fmt::join(args, " "), version);
        return run_command(full_args, exec_options);
    }

    auto PyenvVersionManager::rehash() const -> int
    {
        RunOptions options;
        options.env = with_root(util::get_env_map());
        auto result = run_command({ m_pyenv_exe, "rehash" }, options);
        if (!result)
        {
            LOG_ERROR << result.error().what();
            return 1;
        }
        return result->status;
    }

    auto PyenvVersionManager::installed_versions() const -> std::vector<std::string>
    {
        auto result = query({ "versions", "--bare" });
        if (!result || result->status != 0)
        {
            return {};
        }
        return util::split_lines(result->out);
    }
}
