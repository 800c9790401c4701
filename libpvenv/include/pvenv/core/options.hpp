// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_OPTIONS_HPP
#define PVENV_CORE_OPTIONS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pvenv
{
    /**
     * Raw command line split in flags and positional arguments, both in order of appearance.
     */
    struct ParsedOptions
    {
        std::vector<std::string> flags;
        std::vector<std::string> arguments;

        [[nodiscard]] bool has_flag(std::string_view name) const;
    };

    /**
     * Split a raw argument list.
     *
     * - `-abc` gives the flags `a`, `b` and `c`;
     * - `--name` and `--name=value` give a single flag with the dashes removed;
     * - everything else, including a lone `-`, is a positional argument.
     *
     * No validation is performed.
     */
    [[nodiscard]] auto parse_options(const std::vector<std::string>& raw_args) -> ParsedOptions;
}

#endif
