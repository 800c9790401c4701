// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_VERSION_MANAGER_HPP
#define PVENV_CORE_VERSION_MANAGER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    /**
     * Host Python version manager.
     *
     * Environments created by pvenv are versions of the manager in their own right, their
     * name can be used wherever a version name is expected.
     */
    class VersionManager
    {
    public:

        virtual ~VersionManager() = default;

        /// Name of the version active in the current directory.
        virtual auto current_version() const -> expected_t<std::string> = 0;

        /// Installation prefix of a version, `version_not_found` error if it is unknown.
        virtual auto prefix(const std::string& version) const -> expected_t<fs::path> = 0;

        /// Paths of the hook scripts contributed by plugins for a command.
        virtual auto hooks(const std::string& command) const -> std::vector<fs::path> = 0;

        /// Run a command of a version, with the version forced through `PYENV_VERSION`.
        virtual auto
        exec(const std::string& version, const command_args& args, const RunOptions& options) const
            -> expected_t<CommandResult> = 0;

        /// Rebuild the shims, returns the status of the operation.
        virtual auto rehash() const -> int = 0;

        virtual auto installed_versions() const -> std::vector<std::string> = 0;

        /**
         * Full path of an executable provided by a version, empty if absent.
         *
         * Only `<prefix>/bin` is searched, the PATH is never looked up.
         */
        auto locate(const std::string& version, std::string_view command) const -> fs::path;
    };

    /**
     * `VersionManager` driving the `pyenv` executable.
     */
    class PyenvVersionManager : public VersionManager
    {
    public:

        /**
         * @param pyenv_exe Name or path of the `pyenv` executable.
         * @param root_prefix Exported as `PYENV_ROOT` to every `pyenv` call if not empty.
         */
        PyenvVersionManager(std::string pyenv_exe, fs::path root_prefix);

        auto current_version() const -> expected_t<std::string> override;
        auto prefix(const std::string& version) const -> expected_t<fs::path> override;
        auto hooks(const std::string& command) const -> std::vector<fs::path> override;
        auto
        exec(const std::string& version, const command_args& args, const RunOptions& options) const
            -> expected_t<CommandResult> override;
        auto rehash() const -> int override;
        auto installed_versions() const -> std::vector<std::string> override;

    private:

        auto query(const command_args& args) const -> expected_t<CommandResult>;
        auto with_root(util::environment_map env) const -> util::environment_map;

        std::string m_pyenv_exe;
        fs::path m_root_prefix;
    };
}

#endif
