// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_HOOKS_HPP
#define PVENV_CORE_HOOKS_HPP

#include <functional>
#include <string>
#include <vector>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    struct RunContext;

    /**
     * Code run before or after the environment creation.
     *
     * The callback has full access to the run context and returns a status, `0` on success.
     */
    struct Hook
    {
        std::string description;
        std::function<int(RunContext&)> callback;
    };

    struct HookList
    {
        std::vector<Hook> before;
        std::vector<Hook> after;

        void append(const HookList& other);
        [[nodiscard]] bool empty() const;
    };

    /**
     * Run the hooks in order.
     *
     * @param stop_on_failure Stop at the first hook returning a non-zero status.
     * @return The first non-zero status, `0` if every hook succeeded.
     */
    auto run_hooks(const std::vector<Hook>& hooks, RunContext& context, bool stop_on_failure)
        -> int;

    /**
     * Hook evaluating a shell fragment with `bash`.
     *
     * The script registering the fragment is sourced first so that the functions it
     * defines are available. The environment left by the fragment replaces the
     * environment of the run context.
     */
    auto make_shell_hook(fs::path script, std::string fragment) -> Hook;

    /**
     * Source hook scripts with `bash` and collect the fragments they register by calling
     * `before_virtualenv <fragment>` and `after_virtualenv <fragment>`.
     */
    auto load_shell_hooks(const std::vector<fs::path>& scripts, const util::environment_map& env)
        -> expected_t<HookList>;
}

#endif
