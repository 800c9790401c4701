// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <string_view>

#include <fmt/format.h>

#include "pvenv/core/hooks.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/run.hpp"
#include "pvenv/core/run_context.hpp"
#include "pvenv/core/util.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    namespace
    {
        constexpr std::string_view hook_loader_script = R"(
before_virtualenv() {
  printf '%s\0%s\0%s\0' before "$PVENV_HOOK_SCRIPT" "$1" >> "$PVENV_HOOK_REGISTRY"
}
after_virtualenv() {
  printf '%s\0%s\0%s\0' after "$PVENV_HOOK_SCRIPT" "$1" >> "$PVENV_HOOK_REGISTRY"
}
for PVENV_HOOK_SCRIPT in "$@"; do
  source "$PVENV_HOOK_SCRIPT"
done
)";

        constexpr std::string_view hook_runner_script = R"(
before_virtualenv() { :; }
after_virtualenv() { :; }
source "$1"
trap 'env -0 > "$PVENV_HOOK_ENV"' EXIT
eval "$2"
)";

        // Variables owned by the shell running the hook rather than by the hook itself.
        constexpr std::array<const char*, 5> shell_variables = {
            "_", "SHLVL", "PWD", "OLDPWD", "PVENV_HOOK_ENV",
        };

        auto find_bash(const util::environment_map& env) -> expected_t<fs::path>
        {
            RunOptions options;
            options.env = env;
            auto bash = resolve_program("bash", options);
            if (bash.empty())
            {
                return make_unexpected("bash is required to run the hooks", pvenv_error_code::hook_failure);
            }
            return bash;
        }

        void merge_hook_environment(util::environment_map& target, util::environment_map updated)
        {
            for (const auto* name : shell_variables)
            {
                if (auto it = target.find(name); it != target.end())
                {
                    updated[name] = it->second;
                }
                else
                {
                    updated.erase(name);
                }
            }
            target = std::move(updated);
        }

        auto run_shell_hook(const fs::path& script, const std::string& fragment, RunContext& context)
            -> int
        {
            const auto bash = find_bash(context.environment);
            if (!bash)
            {
                throw bash.error();
            }

            TemporaryFile env_dump("pvenv-hook-env");
            auto options = context.run_options();
            (*options.env)["PVENV_HOOK_ENV"] = env_dump.path().string();

            auto result = run_command(
                { bash->string(),
                  "-c",
                  std::string(hook_runner_script),
                  "pvenv-hook",
                  script.string(),
                  fragment },
                options
            );
            if (!result)
            {
                throw pvenv_error(
                    fmt::format("Could not run hook '{}': {}", fragment, result.error().what()),
                    pvenv_error_code::hook_failure
                );
            }

            const auto dumped = read_contents(env_dump.path());
            if (!dumped.empty())
            {
                merge_hook_environment(context.environment, util::parse_env_block(dumped));
            }
            return result->status;
        }
    }

    void HookList::append(const HookList& other)
    {
        before.insert(before.end(), other.before.begin(), other.before.end());
        after.insert(after.end(), other.after.begin(), other.after.end());
    }

    bool HookList::empty() const
    {
        return before.empty() && after.empty();
    }

    auto run_hooks(const std::vector<Hook>& hooks, RunContext& context, bool stop_on_failure)
        -> int
    {
        int first_failure = 0;
        for (const auto& hook : hooks)
        {
            LOG_DEBUG << "Running hook: " << hook.description;
            const int status = hook.callback(context);
            if (status == 0)
            {
                continue;
            }

            LOG_WARNING << fmt::format("Hook '{}' failed with status {}", hook.description, status);
            if (first_failure == 0)
            {
                first_failure = status;
            }
            if (stop_on_failure)
            {
                break;
            }
        }
        return first_failure;
    }

    auto make_shell_hook(fs::path script, std::string fragment) -> Hook
    {
        auto description = fmt::format("{} ({})", fragment, script.filename().string());
        return Hook{
            std::move(description),
            [script = std::move(script), fragment = std::move(fragment)](RunContext& context)
            { return run_shell_hook(script, fragment, context); },
        };
    }

    auto load_shell_hooks(const std::vector<fs::path>& scripts, const util::environment_map& env)
        -> expected_t<HookList>
    {
        HookList hooks;
        if (scripts.empty())
        {
            return hooks;
        }

        const auto bash = find_bash(env);
        if (!bash)
        {
            return forward_error(bash);
        }

        TemporaryFile registry("pvenv-hooks");
        RunOptions options;
        options.env = env;
        (*options.env)["PVENV_HOOK_REGISTRY"] = registry.path().string();

        command_args args = { bash->string(), "-c", std::string(hook_loader_script), "pvenv-hooks" };
        for (const auto& script : scripts)
        {
            LOG_DEBUG << "Loading hook script " << script.string();
            args.push_back(script.string());
        }

        auto result = run_command(args, options);
        if (!result)
        {
            return make_unexpected(
                fmt::format("Could not load the hook scripts: {}", result.error().what()),
                pvenv_error_code::hook_failure
            );
        }
        if (result->status != 0)
        {
            LOG_WARNING << fmt::format("Sourcing the hook scripts returned status {}", result->status);
        }

        // Records are triplets of NUL-terminated fields: kind, script, fragment.
        const auto fields = util::split(read_contents(registry.path()), std::string_view("\0", 1));
        for (std::size_t i = 0; i + 2 < fields.size(); i += 3)
        {
            auto hook = make_shell_hook(fields[i + 1], fields[i + 2]);
            if (fields[i] == "before")
            {
                hooks.before.push_back(std::move(hook));
            }
            else
            {
                hooks.after.push_back(std::move(hook));
            }
        }

        LOG_DEBUG << fmt::format(
            "Loaded {} before hook(s) and {} after hook(s)",
            hooks.before.size(),
            hooks.after.size()
        );
        return hooks;
    }
}
