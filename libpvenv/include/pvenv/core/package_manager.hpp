// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_PACKAGE_MANAGER_HPP
#define PVENV_CORE_PACKAGE_MANAGER_HPP

#include <string>
#include <vector>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    class VersionManager;

    struct PackageInstallRequest
    {
        /// Requirement specifiers, such as `virtualenv==20.0.0`.
        std::vector<std::string> specs;
        /// Requirement file to install from, ignored if empty.
        fs::path requirement_file;
        bool quiet = false;
        bool verbose = false;
    };

    class PackageManager
    {
    public:

        virtual ~PackageManager() = default;

        /// Pinned requirements of every package installed in a version.
        virtual auto freeze(const std::string& version, const RunOptions& options)
            -> expected_t<std::vector<std::string>> = 0;

        /// Install packages in a version, returns the status of the installer.
        virtual auto
        install(const std::string& version, const PackageInstallRequest& request, const RunOptions& options)
            -> expected_t<int> = 0;
    };

    /**
     * `PackageManager` running the `pip` of a version through its version manager.
     */
    class PipPackageManager : public PackageManager
    {
    public:

        explicit PipPackageManager(const VersionManager& version_manager);

        auto freeze(const std::string& version, const RunOptions& options)
            -> expected_t<std::vector<std::string>> override;

        auto
        install(const std::string& version, const PackageInstallRequest& request, const RunOptions& options)
            -> expected_t<int> override;

    private:

        const VersionManager& m_version_manager;
    };

    /// Arguments passed to `pip` for an install request, without the `pip` program name.
    auto pip_install_args(const PackageInstallRequest& request) -> command_args;
}

#endif
