// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pvenv/core/deactivation.hpp"
#include "pvenv/util/string.hpp"

using namespace pvenv;

namespace
{
    TEST_CASE("guess_shell")
    {
        util::environment_map env;

        SECTION("Defaults to bash")
        {
            REQUIRE(guess_shell(std::nullopt, env) == "bash");
        }

        SECTION("Login shell name from SHELL")
        {
            env["SHELL"] = "-zsh";
            REQUIRE(guess_shell(std::nullopt, env) == "zsh");
            env["SHELL"] = "/usr/local/bin/fish";
            REQUIRE(guess_shell(std::nullopt, env) == "fish");
        }

        SECTION("PYENV_SHELL takes precedence over SHELL")
        {
            env["SHELL"] = "/bin/zsh";
            env["PYENV_SHELL"] = "fish";
            REQUIRE(guess_shell(std::nullopt, env) == "fish");
        }

        SECTION("Explicit shell takes precedence over everything")
        {
            env["SHELL"] = "/bin/zsh";
            env["PYENV_SHELL"] = "fish";
            REQUIRE(guess_shell("ksh", env) == "ksh");
        }
    }

    TEST_CASE("Deactivation script")
    {
        const auto shells = std::vector<std::string>{ "bash", "zsh", "ksh", "sh", "fish" };
        const auto reference = util::split_lines(make_deactivator("bash")->script());
        REQUIRE(reference.size() == 2);

        for (const auto& shell : shells)
        {
            CAPTURE(shell);
            const auto deactivator = make_deactivator(shell);
            const auto lines = util::split_lines(deactivator->script());

            REQUIRE(lines.size() == 2);
            REQUIRE(lines[0] == deactivator->guard_line());
            REQUIRE(lines[1] == "pyenv shell --unset");
            if (shell == "fish")
            {
                REQUIRE(lines[0] == "functions -q deactivate; and deactivate");
                REQUIRE(lines[0] != reference[0]);
            }
            else
            {
                REQUIRE(lines[0] == "declare -f deactivate 1>/dev/null 2>&1 && deactivate");
            }
        }
    }
}
