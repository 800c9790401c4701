// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_UTIL_ENVIRONMENT_HPP
#define PVENV_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pvenv/fs/filesystem.hpp"

namespace pvenv::util
{
    /**
     * Get an environment variable of the current process.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Set an environment variable of the current process.
     */
    void set_env(const std::string& key, const std::string& value);

    /**
     * Unset an environment variable of the current process.
     */
    void unset_env(const std::string& key);

    using environment_map = std::unordered_map<std::string, std::string>;

    /**
     * Return a map of all environment variables of the current process.
     *
     * The map is a snapshot, child processes are started from copies of such maps.
     */
    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Set the environment to be exactly the map given.
     */
    void set_env_map(const environment_map& env);

    /**
     * Parse the output of `env -0`, a sequence of NUL-terminated `NAME=value` entries.
     */
    [[nodiscard]] auto parse_env_block(std::string_view block) -> environment_map;

    /*
     * Return the current user home directory.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Return the current user config directory, honoring XDG_CONFIG_HOME.
     */
    [[nodiscard]] auto user_config_dir() -> std::string;

    /**
     * Return `true` if the path is a regular file the current user may execute.
     */
    [[nodiscard]] auto is_executable(const fs::path& path) -> bool;

    /**
     * Return the full path of an executable found in one directory, or an empty path.
     */
    [[nodiscard]] auto which_in(std::string_view exe, const fs::path& dir) -> fs::path;

    /**
     * Return the full path of an executable found in a `:` separated list of directories.
     */
    [[nodiscard]] auto which_in_path_list(std::string_view exe, std::string_view paths)
        -> fs::path;

    /**
     * Return the full path of a program from its name, searching the PATH.
     */
    [[nodiscard]] auto which(std::string_view exe) -> fs::path;
}
#endif
