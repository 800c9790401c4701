// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_LOGGING_HPP
#define PVENV_CORE_LOGGING_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   pvenv::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(pvenv::log_level::trace)
#define LOG_DEBUG       LOG(pvenv::log_level::debug)
#define LOG_INFO        LOG(pvenv::log_level::info)
#define LOG_WARNING     LOG(pvenv::log_level::warn)
#define LOG_ERROR       LOG(pvenv::log_level::err)
#define LOG_CRITICAL    LOG(pvenv::log_level::critical)
// clang-format on

namespace pvenv
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `pvenv::LoggingParams`
        @see `pvenv::logging::set_log_level`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug", "info", "warning", "error", "critical", "off" };
        return names.at(static_cast<std::size_t>(level));
    }

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /** Number of log records to keep in the backtrace history.
            The backtrace feature will be enabled only if the value
            is different from `0`.
        */
        std::size_t log_backtrace{ 0 };

        /// Formatting pattern to use in formatted logs.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
    };

    namespace logging
    {
        /** All the information about a log.

            @see `pvenv::logging::log`
            @see The `LOG_...` macros
         */
        struct LogRecord
        {
            std::string message;
            log_level level = log_level::off;
            std::source_location location = {};
        };

        /** Interface of the objects actually writing log records somewhere.

            Only one handler is registered at a time, @see `pvenv::logging::set_log_handler`.
            The handler is responsible for filtering records below the current level.
        */
        class LogHandler
        {
        public:

            virtual ~LogHandler() = default;

            virtual void start_log_handling(const LoggingParams& params) = 0;
            virtual void stop_log_handling() = 0;
            virtual void set_log_level(log_level new_level) = 0;
            virtual void log(const LogRecord& record) = 0;
            virtual void enable_backtrace(std::size_t record_buffer_size) = 0;
            virtual void log_backtrace() = 0;
            virtual void flush() = 0;
        };

        /** Registers the handler to use, or none if `nullptr`.

            The previous handler, if any, is stopped then returned.
            The new handler is started with the current logging parameters.
            All the other logging operations are no-op while no handler is registered.
        */
        auto set_log_handler(std::unique_ptr<LogHandler> handler) -> std::unique_ptr<LogHandler>;

        /// Unregisters and returns the current log handler.
        auto stop_logging() -> std::unique_ptr<LogHandler>;

        auto set_log_level(log_level new_level) -> log_level;
        auto get_log_level() -> log_level;

        auto set_logging_params(LoggingParams new_params) -> LoggingParams;
        auto get_logging_params() -> LoggingParams;

        void log(const LogRecord& record);
        void log_backtrace();
        void flush_logs();

        class MessageLogger
        {
        public:

            explicit MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };
    }
}

#endif
