// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_UTIL_STRING_HPP
#define PVENV_UTIL_STRING_HPP

#include <string>
#include <string_view>
#include <vector>

namespace pvenv::util
{
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;
    [[nodiscard]] auto contains(std::string_view str, char c) -> bool;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, char c) -> bool;

    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, char c) -> bool;

    /**
     * Return a view to the input without the prefix if present.
     */
    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view prefix)
        -> std::string_view;
    [[nodiscard]] auto remove_prefix(std::string_view str, char c) -> std::string_view;

    [[nodiscard]] auto lstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the input on every occurrence of the separator.
     *
     * An empty input yields a single empty element, consecutive separators yield empty elements.
     */
    [[nodiscard]] auto split(std::string_view input, std::string_view sep)
        -> std::vector<std::string>;

    /**
     * Split the input in lines, dropping the line terminators and the trailing empty line.
     */
    [[nodiscard]] auto split_lines(std::string_view input) -> std::vector<std::string>;

    /**
     * Concatenate the elements of the container @p container by placing the
     * separator @p sep between them.
     */
    template <typename Range>
    [[nodiscard]] auto join(std::string_view sep, const Range& container) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    template <typename Range>
    auto join(std::string_view sep, const Range& container) -> std::string
    {
        auto out = std::string();
        bool first = true;
        for (const auto& elem : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += elem;
            first = false;
        }
        return out;
    }
}
#endif
