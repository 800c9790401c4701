// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include "pvenv/core/logging.hpp"
#include "pvenv/core/util.hpp"

namespace pvenv::logging
{
    namespace
    {
        LoggingParams current_params = {};
        std::unique_ptr<LogHandler> current_log_handler = nullptr;
    }

    auto set_log_handler(std::unique_ptr<LogHandler> handler) -> std::unique_ptr<LogHandler>
    {
        if (current_log_handler)
        {
            current_log_handler->stop_log_handling();
        }

        auto previous_handler = std::exchange(current_log_handler, std::move(handler));

        if (current_log_handler)
        {
            current_log_handler->start_log_handling(current_params);
        }
        return previous_handler;
    }

    auto stop_logging() -> std::unique_ptr<LogHandler>
    {
        return set_log_handler(nullptr);
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        const auto previous_level = std::exchange(current_params.logging_level, new_level);
        if (current_log_handler)
        {
            current_log_handler->set_log_level(new_level);
        }
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        return current_params.logging_level;
    }

    auto set_logging_params(LoggingParams new_params) -> LoggingParams
    {
        auto previous_params = std::exchange(current_params, std::move(new_params));
        if (current_log_handler)
        {
            current_log_handler->set_log_level(current_params.logging_level);
            current_log_handler->enable_backtrace(current_params.log_backtrace);
        }
        return previous_params;
    }

    auto get_logging_params() -> LoggingParams
    {
        return current_params;
    }

    void log(const LogRecord& record)
    {
        if (current_log_handler)
        {
            current_log_handler->log(record);
        }
    }

    void log_backtrace()
    {
        if (current_log_handler)
        {
            current_log_handler->log_backtrace();
        }
    }

    void flush_logs()
    {
        if (current_log_handler)
        {
            current_log_handler->flush();
        }
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        LogRecord record{
            .message = prepend(m_stream.str(), "", std::string(4, ' ').c_str()),
            .level = m_level,
            .location = std::move(m_location),
        };
        log(record);

        if (record.level == log_level::critical && get_log_level() != log_level::off)
        {
            log_backtrace();
        }
    }
}
