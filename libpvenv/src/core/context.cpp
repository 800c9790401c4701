// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>

#include "pvenv/core/context.hpp"
#include "pvenv/core/interruption.hpp"
#include "pvenv/core/logging_spdlog.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    namespace
    {
        auto default_root_prefix() -> fs::path
        {
            if (auto root = util::get_env("PYENV_ROOT"); root && !root->empty())
            {
                return *root;
            }
            return fs::path(util::user_home_dir()) / ".pyenv";
        }
    }

    log_level log_level_from_verbosity(int verbosity)
    {
        switch (verbosity)
        {
            case -3:
                return log_level::off;
            case -2:
                return log_level::critical;
            case -1:
                return log_level::err;
            case 0:
                return log_level::warn;
            case 1:
                return log_level::info;
            case 2:
                return log_level::debug;
            default:
                return (verbosity < -3) ? log_level::off : log_level::trace;
        }
    }

    Context::Context(const ContextOptions& options)
    {
        prefix_params.root_prefix = default_root_prefix();

        if (options.enable_signal_handling)
        {
            set_default_signal_handler();
            m_owns_signal_handling = true;
        }

        if (options.enable_logging)
        {
            logging::set_logging_params(LoggingParams{
                .logging_level = output_params.logging_level,
                .log_backtrace = output_params.log_backtrace,
                .log_pattern = output_params.log_pattern,
            });
            logging::set_log_handler(std::make_unique<logging::spdlogimpl::LogHandler_spdlog>());
            m_owns_logging = true;
        }
    }

    Context::~Context()
    {
        if (m_owns_logging)
        {
            logging::flush_logs();
            logging::stop_logging();
        }
        if (m_owns_signal_handling)
        {
            restore_previous_signal_handler();
        }
    }

    fs::path Context::versions_dir() const
    {
        return prefix_params.root_prefix / "versions";
    }

    fs::path Context::cache_dir() const
    {
        if (prefix_params.cache_dir.empty())
        {
            return prefix_params.root_prefix / "cache";
        }
        return prefix_params.cache_dir;
    }
}
