// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_CONTEXT_HPP
#define PVENV_CORE_CONTEXT_HPP

#include <string>

#include "pvenv/core/logging.hpp"
#include "pvenv/fs/filesystem.hpp"

namespace pvenv
{
    // Logging level matching a verbosity, `0` being the default and each `-v` adding one.
    log_level log_level_from_verbosity(int verbosity);

    struct ContextOptions
    {
        bool enable_logging = false;
        bool enable_signal_handling = false;
    };

    struct CommandParams
    {
        std::string current_command{ "pvenv" };
    };

    struct PrefixParams
    {
        /// Root of the version manager, environments live in `<root_prefix>/versions`.
        fs::path root_prefix;
        /// Working directory of the backend tools, `<root_prefix>/cache` if empty.
        fs::path cache_dir;
    };

    struct BackendParams
    {
        /// Version pin used when installing `virtualenv`, none if empty.
        std::string virtualenv_version;
        /// Executable of the version manager, looked up in the PATH if not absolute.
        std::string pyenv_exe{ "pyenv" };
    };

    // Context class, one instance per process
    class Context
    {
    public:

        struct OutputParams
        {
            int verbosity{ 0 };
            log_level logging_level{ log_level::warn };

            bool quiet{ false };

            std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
            std::size_t log_backtrace{ 0 };
        };

        // Configurable
        bool debug = false;

        OutputParams output_params;
        PrefixParams prefix_params;
        BackendParams backend_params;
        CommandParams command_params;

        explicit Context(const ContextOptions& options = ContextOptions{});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        fs::path versions_dir() const;
        fs::path cache_dir() const;

    private:

        bool m_owns_logging = false;
        bool m_owns_signal_handling = false;
    };
}

#endif
