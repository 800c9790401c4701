// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_DEACTIVATION_HPP
#define PVENV_CORE_DEACTIVATION_HPP

#include <memory>
#include <optional>
#include <string>

#include "pvenv/util/environment.hpp"

namespace pvenv
{
    /**
     * Shell code deactivating the virtual environment active in the calling shell.
     *
     * The code is meant to be evaluated by the shell, as done by `pyenv sh-deactivate`.
     */
    class Deactivator
    {
    public:

        virtual ~Deactivator() = default;

        Deactivator(const Deactivator&) = delete;
        Deactivator& operator=(const Deactivator&) = delete;
        Deactivator(Deactivator&&) = delete;
        Deactivator& operator=(Deactivator&&) = delete;

        virtual std::string shell() const = 0;

        /// Line calling the `deactivate` function of the environment if it is defined.
        virtual std::string guard_line() const = 0;

        std::string script() const;

    protected:

        Deactivator() = default;
    };

    class PosixDeactivator : public Deactivator
    {
    public:

        PosixDeactivator() = default;
        explicit PosixDeactivator(std::string shell_name);

        std::string shell() const override;
        std::string guard_line() const override;

    private:

        std::string m_shell = "bash";
    };

    class FishDeactivator : public Deactivator
    {
    public:

        FishDeactivator() = default;

        std::string shell() const override;
        std::string guard_line() const override;
    };

    /**
     * Name of the shell to emit code for.
     *
     * By priority: the explicit name, `PYENV_SHELL`, the basename of `SHELL`, `bash`.
     */
    std::string
    guess_shell(const std::optional<std::string>& explicit_shell, const util::environment_map& env);

    std::unique_ptr<Deactivator> make_deactivator(const std::string& shell);
}

#endif
