// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <utility>

#include <fmt/format.h>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/interruption.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/util.hpp"

namespace pvenv
{
    namespace
    {
        volatile std::sig_atomic_t sig_interrupted = 0;
        std::atomic<signal_handler_t> previous_handler = SIG_DFL;

        void on_sigint(int /*signum*/)
        {
            sig_interrupted = 1;
        }
    }

    void set_default_signal_handler()
    {
        const auto previous = std::signal(SIGINT, on_sigint);
        if (previous != SIG_ERR && previous != on_sigint)
        {
            previous_handler = previous;
        }
    }

    void restore_previous_signal_handler()
    {
        std::signal(SIGINT, previous_handler.exchange(SIG_DFL));
    }

    bool is_sig_interrupted() noexcept
    {
        return sig_interrupted != 0;
    }

    void set_sig_interrupted() noexcept
    {
        sig_interrupted = 1;
    }

    void reset_sig_interrupted() noexcept
    {
        sig_interrupted = 0;
    }

    void interruption_point()
    {
        if (is_sig_interrupted())
        {
            throw pvenv_error("Interrupted by user", pvenv_error_code::user_interrupted);
        }
    }

    /*******************
     * PendingCreation *
     *******************/

    PendingCreation::PendingCreation(fs::path target, bool pre_existing)
        : m_target(std::move(target))
        , m_pre_existing(pre_existing)
    {
    }

    PendingCreation::~PendingCreation()
    {
        if (m_released || m_pre_existing)
        {
            return;
        }
        std::error_code ec;
        if (fs::exists(m_target, ec))
        {
            LOG_INFO << fmt::format("Removing incomplete environment '{}'", m_target.string());
            remove_all_logged(m_target);
        }
    }

    void PendingCreation::release() noexcept
    {
        m_released = true;
    }

    const fs::path& PendingCreation::target() const
    {
        return m_target;
    }

    bool PendingCreation::pre_existing() const
    {
        return m_pre_existing;
    }

    bool PendingCreation::released() const
    {
        return m_released;
    }
}
