// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <chrono>
#include <ctime>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <unistd.h>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/migration.hpp"
#include "pvenv/core/package_manager.hpp"
#include "pvenv/core/util.hpp"
#include "pvenv/core/util_scope.hpp"

namespace pvenv
{
    auto make_upgrade_seed() -> std::string
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_time = {};
        ::localtime_r(&now, &local_time);
        return fmt::format("{:%Y%m%d%H%M%S}.{}", local_time, ::getpid());
    }

    auto upgrade_manifest_path(const std::string& seed) -> fs::path
    {
        return fs::temp_directory_path() / fmt::format("requirements.{}.txt", seed);
    }

    auto upgrade_renamed_path(const fs::path& env_path, const std::string& seed) -> fs::path
    {
        return env_path.parent_path()
               / fmt::format(".{}.upgrade.{}", env_path.filename().string(), seed);
    }

    auto snapshot_environment(
        PackageManager& package_manager,
        const std::string& env_name,
        const fs::path& env_path,
        const std::string& seed,
        const RunOptions& options
    ) -> expected_t<UpgradeSnapshot>
    {
        auto packages = package_manager.freeze(env_name, options);
        if (!packages)
        {
            return make_unexpected(
                fmt::format("Could not list the packages of '{}': {}", env_name, packages.error().what()),
                pvenv_error_code::upgrade_failure
            );
        }

        UpgradeSnapshot snapshot;
        snapshot.manifest = upgrade_manifest_path(seed);
        snapshot.original_path = env_path;
        snapshot.renamed_path = upgrade_renamed_path(env_path, seed);
        snapshot.packages = std::move(packages).value();

        bool keep_manifest = false;
        on_scope_exit drop_manifest{ [&]
                                     {
                                         if (!keep_manifest)
                                         {
                                             std::error_code rm_ec;
                                             fs::remove(snapshot.manifest, rm_ec);
                                         }
                                     } };

        {
            auto manifest = open_ofstream(snapshot.manifest, std::ios::out | std::ios::trunc);
            for (const auto& package : snapshot.packages)
            {
                manifest << package << '\n';
            }
            if (!manifest)
            {
                return make_unexpected(
                    fmt::format("Could not write '{}'", snapshot.manifest.string()),
                    pvenv_error_code::io_failure
                );
            }
        }

        std::error_code ec;
        fs::rename(env_path, snapshot.renamed_path, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format(
                    "Could not move '{}' to '{}': {}",
                    env_path.string(),
                    snapshot.renamed_path.string(),
                    ec.message()
                ),
                pvenv_error_code::io_failure
            );
        }

        keep_manifest = true;
        LOG_INFO << fmt::format(
            "Saved {} package(s) of '{}' to '{}'",
            snapshot.packages.size(),
            env_name,
            snapshot.manifest.string()
        );
        return snapshot;
    }

    void report_kept_snapshot(const UpgradeSnapshot& snapshot)
    {
        std::string message = fmt::format(
            "UPGRADE FAILED\n"
            "The previous environment was kept in '{}'.\n"
            "The packages it contained are listed in '{}':",
            snapshot.renamed_path.string(),
            snapshot.manifest.string()
        );
        for (const auto& package : snapshot.packages)
        {
            message += fmt::format("\n  * {}", package);
        }
        LOG_ERROR << message;
    }

    auto replay_snapshot(
        PackageManager& package_manager,
        const std::string& env_name,
        const UpgradeSnapshot& snapshot,
        bool quiet,
        bool verbose,
        const RunOptions& options
    ) -> expected_t<int>
    {
        PackageInstallRequest request;
        request.requirement_file = snapshot.manifest;
        request.quiet = quiet;
        request.verbose = verbose;

        auto status = package_manager.install(env_name, request, options);
        if (!status || status.value() != 0)
        {
            report_kept_snapshot(snapshot);
            return status;
        }

        std::error_code ec;
        fs::remove(snapshot.manifest, ec);
        remove_all_logged(snapshot.renamed_path);
        LOG_INFO << fmt::format("Restored {} package(s) in '{}'", snapshot.packages.size(), env_name);
        return status;
    }
}
