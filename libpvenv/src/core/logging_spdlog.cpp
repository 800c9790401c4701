// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "pvenv/core/logging_spdlog.hpp"

namespace pvenv::logging::spdlogimpl
{
    namespace
    {
        auto make_logger(const LogHandler_spdlog_Options& options, const std::string& pattern)
            -> std::shared_ptr<spdlog::logger>
        {
            spdlog::sink_ptr sink;
            if (options.redirect_to_null_sink)
            {
                sink = std::make_shared<spdlog::sinks::null_sink_mt>();
            }
            else
            {
                sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            }

            auto logger = std::make_shared<spdlog::logger>(options.logger_name, std::move(sink));
            logger->set_formatter(
                std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::local)
            );
            return logger;
        }
    }

    LogHandler_spdlog::LogHandler_spdlog(LogHandler_spdlog_Options options)
        : m_options(std::move(options))
    {
    }

    LogHandler_spdlog::~LogHandler_spdlog() = default;

    void LogHandler_spdlog::start_log_handling(const LoggingParams& params)
    {
        spdlog::set_default_logger(make_logger(m_options, params.log_pattern));
        spdlog::set_level(to_spdlog(params.logging_level));
        if (params.log_backtrace > 0)
        {
            spdlog::enable_backtrace(params.log_backtrace);
        }
        m_is_active = true;
    }

    void LogHandler_spdlog::stop_log_handling()
    {
        if (!m_is_active)
        {
            return;
        }
        if (auto logger = spdlog::default_logger())
        {
            logger->flush();
        }
        m_is_active = false;
    }

    void LogHandler_spdlog::set_log_level(log_level new_level)
    {
        spdlog::set_level(to_spdlog(new_level));
    }

    void LogHandler_spdlog::log(const LogRecord& record)
    {
        if (!m_is_active)
        {
            return;
        }
        spdlog::default_logger_raw()->log(
            spdlog::source_loc{
                record.location.file_name(),
                static_cast<int>(record.location.line()),
                record.location.function_name(),
            },
            to_spdlog(record.level),
            record.message
        );
    }

    void LogHandler_spdlog::enable_backtrace(std::size_t record_buffer_size)
    {
        if (record_buffer_size > 0)
        {
            spdlog::enable_backtrace(record_buffer_size);
        }
        else
        {
            spdlog::disable_backtrace();
        }
    }

    void LogHandler_spdlog::log_backtrace()
    {
        if (m_is_active)
        {
            spdlog::dump_backtrace();
        }
    }

    void LogHandler_spdlog::flush()
    {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
    }

    bool LogHandler_spdlog::is_started() const
    {
        return m_is_active;
    }
}
