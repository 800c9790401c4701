// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_LOGGING_SPDLOG_HPP
#define PVENV_CORE_LOGGING_SPDLOG_HPP

#include <string>

#include <spdlog/common.h>

#include "pvenv/core/logging.hpp"

namespace pvenv::logging::spdlogimpl
{
    /** @returns The provided `log_level` value converted to the equivalent value for `spdlog`. */
    constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(
            static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::level_enum::off)
        );
        return static_cast<spdlog::level::level_enum>(level);
    }

    struct LogHandler_spdlog_Options
    {
        /// Name of the logger, printed in front of every record.
        std::string logger_name = "pvenv";

        /** Route every record to a null sink.

            Mostly useful in tests.
        */
        bool redirect_to_null_sink = false;
    };

    /** `LogHandler` implementation using `spdlog` library.

        Translates the calls to `pvenv::logging::LogHandler` into calls to `spdlog`'s API.
        The logger is owned by the `spdlog` registry and installed as its default logger.
    */
    class LogHandler_spdlog : public LogHandler
    {
    public:

        explicit LogHandler_spdlog(LogHandler_spdlog_Options options = LogHandler_spdlog_Options{});
        ~LogHandler_spdlog() override;

        LogHandler_spdlog(const LogHandler_spdlog&) = delete;
        LogHandler_spdlog& operator=(const LogHandler_spdlog&) = delete;

        void start_log_handling(const LoggingParams& params) override;
        void stop_log_handling() override;
        void set_log_level(log_level new_level) override;
        void log(const LogRecord& record) override;
        void enable_backtrace(std::size_t record_buffer_size) override;
        void log_backtrace() override;
        void flush() override;

        /// @returns `true` between `start_log_handling` and `stop_log_handling`.
        [[nodiscard]] bool is_started() const;

    private:

        LogHandler_spdlog_Options m_options;
        bool m_is_active = false;
    };
}

#endif
