// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/package_manager.hpp"
#include "pvenv/core/version_manager.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    auto pip_install_args(const PackageInstallRequest& request) -> command_args
    {
        command_args args = { "install" };
        if (request.quiet)
        {
            args.push_back("--quiet");
        }
        if (request.verbose)
        {
            args.push_back("--verbose");
        }
        if (!request.requirement_file.empty())
        {
            args.push_back("--requirement");
            args.push_back(request.requirement_file.string());
        }
        args.insert(args.end(), request.specs.begin(), request.specs.end());
        return args;
    }

    PipPackageManager::PipPackageManager(const VersionManager& version_manager)
        : m_version_manager(version_manager)
    {
    }

    auto PipPackageManager::freeze(const std::string& version, const RunOptions& options)
        -> expected_t<std::vector<std::string>>
    {
        auto freeze_options = options;
        freeze_options.capture_output = true;

        auto result = m_version_manager.exec(version, { "pip", "freeze" }, freeze_options);
        if (!result)
        {
            return forward_error(result);
        }
        if (result->status != 0)
        {
            return make_unexpected(
                fmt::format(
                    "pip freeze failed in '{}' with status {}:\n{}",
                    version,
                    result->status,
                    util::strip(result->err)
                ),
                pvenv_error_code::subprocess_failure
            );
        }

        std::vector<std::string> packages;
        for (const auto& line : util::split_lines(result->out))
        {
            const auto requirement = util::strip(line);
            if (!requirement.empty() && !util::starts_with(requirement, '#'))
            {
                packages.emplace_back(requirement);
            }
        }
        return packages;
    }

    auto PipPackageManager::install(
        const std::string& version,
        const PackageInstallRequest& request,
        const RunOptions& options
    ) -> expected_t<int>
    {
        command_args args = { "pip" };
        const auto install_args = pip_install_args(request);
        args.insert(args.end(), install_args.begin(), install_args.end());

        auto result = m_version_manager.exec(version, args, options);
        if (!result)
        {
            return forward_error(result);
        }
        return result->status;
    }
}
