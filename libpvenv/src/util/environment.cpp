// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

#include "pvenv/util/environment.hpp"
#include "pvenv/util/string.hpp"

extern "C"
{
    extern char** environ;  // Unix defined
}

namespace pvenv::util
{
    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        if (const char* val = std::getenv(key.c_str()))
        {
            return val;
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        if (::setenv(key.c_str(), value.c_str(), 1) != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        if (::unsetenv(key.c_str()) != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key));
        }
    }

    namespace
    {
        void insert_entry(environment_map& env, std::string_view expr)
        {
            const auto pos = expr.find('=');
            if (pos == 0 || expr.empty())
            {
                return;
            }
            env.insert_or_assign(
                std::string(expr.substr(0, pos)),
                (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : ""
            );
        }
    }

    auto get_env_map() -> environment_map
    {
        auto env = environment_map();
        for (std::size_t i = 0; environ[i]; ++i)
        {
            insert_entry(env, environ[i]);
        }
        return env;
    }

    void set_env_map(const environment_map& env)
    {
        for (const auto& [name, val] : get_env_map())
        {
            if (env.find(name) == env.end())
            {
                unset_env(name);
            }
        }
        for (const auto& [name, val] : env)
        {
            set_env(name, val);
        }
    }

    auto parse_env_block(std::string_view block) -> environment_map
    {
        auto env = environment_map();
        for (const auto& entry : split(block, std::string_view("\0", 1)))
        {
            insert_entry(env, entry);
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env("HOME").value_or(""); !maybe_home.empty())
        {
            return maybe_home;
        }
        if (const auto* user = ::getpwuid(::getuid()))
        {
            if (const char* maybe_home = user->pw_dir)
            {
                return maybe_home;
            }
        }
        throw std::runtime_error("HOME not set.");
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = get_env("XDG_CONFIG_HOME").value_or(""); !maybe_dir.empty())
        {
            return maybe_dir;
        }
        return (fs::path(user_home_dir()) / ".config").string();
    }

    auto is_executable(const fs::path& path) -> bool
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && (::access(path.c_str(), X_OK) == 0);
    }

    auto which_in(std::string_view exe, const fs::path& dir) -> fs::path
    {
        if (dir.empty())
        {
            return {};
        }
        auto candidate = dir / exe;
        if (is_executable(candidate))
        {
            return candidate;
        }
        return {};
    }

    auto which_in_path_list(std::string_view exe, std::string_view paths) -> fs::path
    {
        for (const auto& dir : split(paths, ":"))
        {
            if (auto p = which_in(exe, dir); !p.empty())
            {
                return p;
            }
        }
        return {};
    }

    auto which(std::string_view exe) -> fs::path
    {
        if (auto paths = get_env("PATH"))
        {
            return which_in_path_list(exe, paths.value());
        }
        const auto n = ::confstr(_CS_PATH, nullptr, static_cast<std::size_t>(0));
        auto pathbuf = std::vector<char>(n, '\0');
        ::confstr(_CS_PATH, pathbuf.data(), n);
        return which_in_path_list(exe, std::string_view(pathbuf.data()));
    }
}
