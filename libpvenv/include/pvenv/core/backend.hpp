// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_BACKEND_HPP
#define PVENV_CORE_BACKEND_HPP

#include <memory>
#include <string>
#include <string_view>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    class PackageManager;
    class VersionManager;

    enum class BackendKind
    {
        virtualenv,
        pyvenv
    };

    /// Name of the tool, also the name of its executable.
    constexpr auto name_of(BackendKind kind) noexcept -> const char*
    {
        return (kind == BackendKind::pyvenv) ? "pyvenv" : "virtualenv";
    }

    struct BackendRequest
    {
        /// Version providing the tool and the base interpreter.
        std::string version;
        /// Options passed through to the tool, before the target path.
        command_args options;
        fs::path target;
        RunOptions run_options;
    };

    /**
     * Third-party tool creating the environments.
     */
    class Backend
    {
    public:

        virtual ~Backend() = default;

        virtual auto kind() const -> BackendKind = 0;

        /// Whether the long option `--<flag>` is understood by the tool.
        virtual auto supports_option(std::string_view flag) const -> bool = 0;

        /// Create the environment, returns the status of the tool.
        virtual auto create(const BackendRequest& request) -> expected_t<int> = 0;

        /// Complete a successful creation, returns a status.
        virtual auto finalize(const BackendRequest& request) -> expected_t<int>;

        auto name() const -> std::string;
    };

    class VirtualenvBackend : public Backend
    {
    public:

        explicit VirtualenvBackend(const VersionManager& version_manager);

        auto kind() const -> BackendKind override;
        auto supports_option(std::string_view flag) const -> bool override;
        auto create(const BackendRequest& request) -> expected_t<int> override;

    private:

        const VersionManager& m_version_manager;
    };

    class PyvenvBackend : public Backend
    {
    public:

        explicit PyvenvBackend(const VersionManager& version_manager);

        auto kind() const -> BackendKind override;
        auto supports_option(std::string_view flag) const -> bool override;
        auto create(const BackendRequest& request) -> expected_t<int> override;

        /// Bootstrap `pip` with `ensurepip` if the tool did not install it.
        auto finalize(const BackendRequest& request) -> expected_t<int> override;

    private:

        const VersionManager& m_version_manager;
    };

    struct BackendProbe
    {
        bool virtualenv_present = false;
        bool pyvenv_present = false;

        auto present(BackendKind kind) const -> bool;
    };

    auto probe_backends(const VersionManager& version_manager, const std::string& version)
        -> BackendProbe;

    /// `pyvenv` is only chosen when it is the only tool available.
    auto select_backend(const BackendProbe& probe) -> BackendKind;

    auto make_backend(BackendKind kind, const VersionManager& version_manager)
        -> std::unique_ptr<Backend>;

    /**
     * Install `virtualenv` in a version with its package manager.
     *
     * @param pin Exact version to install, the latest one if empty.
     * @return The status of the installer.
     */
    auto install_backend(
        PackageManager& package_manager,
        const std::string& version,
        const std::string& pin,
        bool quiet,
        bool verbose,
        const RunOptions& options
    ) -> expected_t<int>;
}

#endif
