// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "pvenv/util/string.hpp"

namespace pvenv::util
{
    namespace
    {
        constexpr std::string_view WHITESPACES = " \r\n\t\f\v";
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string(str);
        std::transform(
            out.begin(),
            out.end(),
            out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
        );
        return out;
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string_view::npos;
    }

    auto contains(std::string_view str, char c) -> bool
    {
        return str.find(c) != std::string_view::npos;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto starts_with(std::string_view str, char c) -> bool
    {
        return !str.empty() && (str.front() == c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return (str.size() >= suffix.size())
               && (str.substr(str.size() - suffix.size()) == suffix);
    }

    auto ends_with(std::string_view str, char c) -> bool
    {
        return !str.empty() && (str.back() == c);
    }

    auto remove_prefix(std::string_view str, std::string_view prefix) -> std::string_view
    {
        if (starts_with(str, prefix))
        {
            return str.substr(prefix.size());
        }
        return str;
    }

    auto remove_prefix(std::string_view str, char c) -> std::string_view
    {
        return remove_prefix(str, std::string_view(&c, 1));
    }

    auto lstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto start = input.find_first_not_of(chars);
        return (start == std::string_view::npos) ? std::string_view() : input.substr(start);
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip(input, WHITESPACES);
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto end = input.find_last_not_of(chars);
        return (end == std::string_view::npos) ? std::string_view() : input.substr(0, end + 1);
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip(input, WHITESPACES);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        return rstrip(lstrip(input, chars), chars);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, WHITESPACES);
    }

    auto split(std::string_view input, std::string_view sep) -> std::vector<std::string>
    {
        auto result = std::vector<std::string>();
        if (sep.empty())
        {
            result.emplace_back(input);
            return result;
        }

        std::size_t pos = 0;
        while (true)
        {
            const auto next = input.find(sep, pos);
            if (next == std::string_view::npos)
            {
                result.emplace_back(input.substr(pos));
                break;
            }
            result.emplace_back(input.substr(pos, next - pos));
            pos = next + sep.size();
        }
        return result;
    }

    auto split_lines(std::string_view input) -> std::vector<std::string>
    {
        auto lines = split(input, "\n");
        for (auto& line : lines)
        {
            if (ends_with(line, '\r'))
            {
                line.pop_back();
            }
        }
        if (!lines.empty() && lines.back().empty())
        {
            lines.pop_back();
        }
        return lines;
    }
}
