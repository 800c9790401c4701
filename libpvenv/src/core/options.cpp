// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "pvenv/core/options.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    bool ParsedOptions::has_flag(std::string_view name) const
    {
        return std::find(flags.cbegin(), flags.cend(), name) != flags.cend();
    }

    auto parse_options(const std::vector<std::string>& raw_args) -> ParsedOptions
    {
        ParsedOptions options;
        for (const auto& arg : raw_args)
        {
            if (util::starts_with(arg, "--"))
            {
                options.flags.push_back(arg.substr(2));
            }
            else if (util::starts_with(arg, '-') && arg.size() > 1)
            {
                for (const char c : std::string_view(arg).substr(1))
                {
                    options.flags.emplace_back(1, c);
                }
            }
            else
            {
                options.arguments.push_back(arg);
            }
        }
        return options;
    }
}
