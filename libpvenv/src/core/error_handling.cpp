// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/logging.hpp"

namespace pvenv
{
    namespace
    {
        void maybe_dump_backtrace(pvenv_error_code ec)
        {
            if (ec == pvenv_error_code::internal_failure)
            {
                logging::log_backtrace();
            }
        }
    }

    pvenv_error::pvenv_error(const std::string& msg, pvenv_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_dump_backtrace(m_error_code);
    }

    pvenv_error::pvenv_error(const char* msg, pvenv_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_dump_backtrace(m_error_code);
    }

    pvenv_error_code pvenv_error::error_code() const noexcept
    {
        return m_error_code;
    }

    constexpr const char* pvenv_aggregated_error::m_base_message;

    pvenv_aggregated_error::pvenv_aggregated_error(error_list_t&& error_list)
        : base_type(pvenv_aggregated_error::m_base_message, pvenv_error_code::aggregated)
        , m_error_list(std::move(error_list))
        , m_aggregated_message()
    {
    }

    const char* pvenv_aggregated_error::what() const noexcept
    {
        if (m_aggregated_message.empty())
        {
            m_aggregated_message = m_base_message;

            for (const pvenv_error& er : m_error_list)
            {
                m_aggregated_message += er.what();
                m_aggregated_message += "\n";
            }
        }
        return m_aggregated_message.c_str();
    }

    tl::unexpected<pvenv_error> make_unexpected(const char* msg, pvenv_error_code ec)
    {
        return tl::make_unexpected(pvenv_error(msg, ec));
    }

    tl::unexpected<pvenv_error> make_unexpected(const std::string& msg, pvenv_error_code ec)
    {
        return tl::make_unexpected(pvenv_error(msg, ec));
    }

    tl::unexpected<pvenv_aggregated_error> make_unexpected(std::vector<pvenv_error>&& error_list)
    {
        return tl::make_unexpected(pvenv_aggregated_error(std::move(error_list)));
    }
}
