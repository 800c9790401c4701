// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_UTIL_HPP
#define PVENV_CORE_UTIL_HPP

#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    // Reads the file, one element per non-empty line with surrounding whitespace removed.
    std::vector<std::string> read_lines(const fs::path& path);

    std::string read_contents(const fs::path& path);

    // Throws a `pvenv_error` with `io_failure` if the file cannot be opened.
    std::ofstream
    open_ofstream(const fs::path& path, std::ios::openmode mode = std::ios::out | std::ios::binary);

    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const;

    private:

        fs::path m_path;
    };

    class TemporaryFile
    {
    public:

        explicit TemporaryFile(std::string_view prefix = "pvenvf", std::string_view suffix = "");
        ~TemporaryFile();

        TemporaryFile(const TemporaryFile&) = delete;
        TemporaryFile& operator=(const TemporaryFile&) = delete;

        const fs::path& path() const;

    private:

        fs::path m_path;
    };

    std::string prepend(const std::string& p, const char* start, const char* newline = "");

    /**
     * Remove a directory tree, logging instead of throwing on failure.
     *
     * @return `true` if nothing is left at @p path.
     */
    bool remove_all_logged(const fs::path& path);
}

#endif
