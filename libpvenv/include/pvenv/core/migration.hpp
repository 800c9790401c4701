// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_MIGRATION_HPP
#define PVENV_CORE_MIGRATION_HPP

#include <string>
#include <vector>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    class PackageManager;

    /**
     * Packages of an environment put aside before it is created again.
     *
     * Both files are removed once the packages are installed in the new environment
     * and kept otherwise, for the user to recover them.
     */
    struct UpgradeSnapshot
    {
        /// Output of the package freeze, `<tmp>/requirements.<seed>.txt`.
        fs::path manifest;
        /// Location of the environment being upgraded.
        fs::path original_path;
        /// Where the old environment was moved, `<parent>/.<name>.upgrade.<seed>`.
        fs::path renamed_path;
        std::vector<std::string> packages;
    };

    /// Unique suffix of the snapshot files, `<YYYYmmddHHMMSS>.<pid>`.
    auto make_upgrade_seed() -> std::string;

    auto upgrade_manifest_path(const std::string& seed) -> fs::path;
    auto upgrade_renamed_path(const fs::path& env_path, const std::string& seed) -> fs::path;

    /**
     * Freeze the packages of the environment then move it aside.
     *
     * @param env_name Version name of the environment to freeze.
     */
    auto snapshot_environment(
        PackageManager& package_manager,
        const std::string& env_name,
        const fs::path& env_path,
        const std::string& seed,
        const RunOptions& options
    ) -> expected_t<UpgradeSnapshot>;

    /**
     * Install the frozen packages in the new environment.
     *
     * On success the snapshot files are removed, on failure they are kept and reported.
     *
     * @return The status of the installer.
     */
    auto replay_snapshot(
        PackageManager& package_manager,
        const std::string& env_name,
        const UpgradeSnapshot& snapshot,
        bool quiet,
        bool verbose,
        const RunOptions& options
    ) -> expected_t<int>;

    /// Log where the snapshot files are kept and which packages they hold.
    void report_kept_snapshot(const UpgradeSnapshot& snapshot);
}

#endif
