// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fmt/format.h>
#include <unistd.h>

#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/util.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    std::vector<std::string> read_lines(const fs::path& file_path)
    {
        std::ifstream file_stream(file_path, std::ios_base::in | std::ios_base::binary);
        if (file_stream.fail())
        {
            throw std::system_error(
                errno,
                std::system_category(),
                "failed to open " + file_path.string()
            );
        }

        std::vector<std::string> output;
        std::string line;
        while (std::getline(file_stream, line))
        {
            auto stripped = util::strip(line);
            if (stripped.empty())
            {
                continue;
            }
            output.emplace_back(stripped);
        }
        return output;
    }

    std::string read_contents(const fs::path& file_path)
    {
        std::ifstream in(file_path, std::ios::in | std::ios::binary);
        if (!in)
        {
            throw std::system_error(
                errno,
                std::system_category(),
                "failed to open " + file_path.string()
            );
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::ofstream open_ofstream(const fs::path& path, std::ios::openmode mode)
    {
        std::ofstream outfile(path, mode);
        if (!outfile.good())
        {
            throw pvenv_error(
                fmt::format("Error opening for writing {}: {}", path.string(), std::strerror(errno)),
                pvenv_error_code::io_failure
            );
        }
        return outfile;
    }

    TemporaryDirectory::TemporaryDirectory()
    {
        std::string template_path = fs::temp_directory_path() / "pvenvdXXXXXX";
        char* pth = ::mkdtemp(template_path.data());
        if (pth == nullptr)
        {
            throw pvenv_error("Could not create temporary directory!", pvenv_error_code::io_failure);
        }
        m_path = pth;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryFile::TemporaryFile(std::string_view prefix, std::string_view suffix)
    {
        std::string template_path = fs::temp_directory_path()
                                    / fmt::format("{}XXXXXX{}", prefix, suffix);
        const int fd = ::mkstemps(template_path.data(), static_cast<int>(suffix.size()));
        if (fd == -1)
        {
            throw pvenv_error("Could not create temporary file!", pvenv_error_code::io_failure);
        }
        ::close(fd);
        m_path = template_path;
    }

    TemporaryFile::~TemporaryFile()
    {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    const fs::path& TemporaryFile::path() const
    {
        return m_path;
    }

    std::string prepend(const std::string& p, const char* start, const char* newline)
    {
        std::string result = start;
        for (const char c : p)
        {
            result += c;
            if (c == '\n')
            {
                result += newline;
            }
        }
        return result;
    }

    bool remove_all_logged(const fs::path& path)
    {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec)
        {
            LOG_ERROR << fmt::format("Could not remove '{}': {}", path.string(), ec.message());
            return false;
        }
        return true;
    }
}
