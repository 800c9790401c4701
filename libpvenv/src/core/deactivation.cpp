// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "pvenv/core/deactivation.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    std::string Deactivator::script() const
    {
        return fmt::format("{}\npyenv shell --unset", guard_line());
    }

    PosixDeactivator::PosixDeactivator(std::string shell_name)
        : m_shell(std::move(shell_name))
    {
    }

    std::string PosixDeactivator::shell() const
    {
        return m_shell;
    }

    std::string PosixDeactivator::guard_line() const
    {
        return "declare -f deactivate 1>/dev/null 2>&1 && deactivate";
    }

    std::string FishDeactivator::shell() const
    {
        return "fish";
    }

    std::string FishDeactivator::guard_line() const
    {
        return "functions -q deactivate; and deactivate";
    }

    std::string
    guess_shell(const std::optional<std::string>& explicit_shell, const util::environment_map& env)
    {
        if (explicit_shell && !explicit_shell->empty())
        {
            return *explicit_shell;
        }
        if (auto it = env.find("PYENV_SHELL"); it != env.end() && !it->second.empty())
        {
            return it->second;
        }
        if (auto it = env.find("SHELL"); it != env.end() && !it->second.empty())
        {
            // Login shells are reported as `-bash`.
            const auto name = fs::path(it->second).filename().string();
            return std::string(util::remove_prefix(name, '-'));
        }
        return "bash";
    }

    std::unique_ptr<Deactivator> make_deactivator(const std::string& shell)
    {
        LOG_DEBUG << "Emitting deactivation code for " << shell;
        if (shell == "fish")
        {
            return std::make_unique<FishDeactivator>();
        }
        return std::make_unique<PosixDeactivator>(shell);
    }
}
