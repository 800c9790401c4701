// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_INTERRUPTION_HPP
#define PVENV_CORE_INTERRUPTION_HPP

#include <csignal>

#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    /************************
     * signal interruption  *
     ************************/

    using signal_handler_t = void (*)(int);

    // SIGINT only raises a flag, the pipeline polls it between its stages.
    void set_default_signal_handler();
    void restore_previous_signal_handler();
    bool is_sig_interrupted() noexcept;
    void set_sig_interrupted() noexcept;
    void reset_sig_interrupted() noexcept;

    // Throws a `pvenv_error` with `user_interrupted` if SIGINT was received.
    void interruption_point();

    /*******************
     * PendingCreation *
     *******************/

    // Owns a target directory while it is being created.
    // Unless released, the directory is removed on destruction, including during stack
    // unwinding, when it did not exist before the creation started.
    class PendingCreation
    {
    public:

        PendingCreation(fs::path target, bool pre_existing);
        ~PendingCreation();

        PendingCreation(const PendingCreation&) = delete;
        PendingCreation& operator=(const PendingCreation&) = delete;
        PendingCreation(PendingCreation&&) = delete;
        PendingCreation& operator=(PendingCreation&&) = delete;

        // Keep the directory: the creation succeeded.
        void release() noexcept;

        const fs::path& target() const;
        bool pre_existing() const;
        bool released() const;

    private:

        fs::path m_target;
        bool m_pre_existing;
        bool m_released = false;
    };
}

#endif
