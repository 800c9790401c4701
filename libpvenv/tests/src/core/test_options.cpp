// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pvenv/core/options.hpp"

using namespace pvenv;

namespace
{
    using V = std::vector<std::string>;

    TEST_CASE("parse_options")
    {
        SECTION("Empty input")
        {
            const auto options = parse_options({});
            REQUIRE(options.flags.empty());
            REQUIRE(options.arguments.empty());
        }

        SECTION("Grouped short flags")
        {
            const auto options = parse_options({ "-xyz" });
            REQUIRE(options.flags == V{ "x", "y", "z" });
            REQUIRE(options.arguments.empty());
        }

        SECTION("Long flags keep their value")
        {
            const auto options = parse_options({ "--clear", "--python=python3.12" });
            REQUIRE(options.flags == V{ "clear", "python=python3.12" });
        }

        SECTION("Mixed flags and positionals keep their order")
        {
            const auto options = parse_options({ "-f", "3.12.1", "--upgrade", "-", "dir/venv" });
            REQUIRE(options.flags == V{ "f", "upgrade" });
            REQUIRE(options.arguments == V{ "3.12.1", "-", "dir/venv" });
        }
    }

    TEST_CASE("ParsedOptions::has_flag")
    {
        const auto options = parse_options({ "-fu", "--verbose", "name" });
        REQUIRE(options.has_flag("f"));
        REQUIRE(options.has_flag("u"));
        REQUIRE(options.has_flag("verbose"));
        REQUIRE_FALSE(options.has_flag("name"));
        REQUIRE_FALSE(options.has_flag("fu"));
    }
}
