// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <string>

#include "pvenv/core/context.hpp"
#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/output.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    /*****************
     * ConsoleStream *
     *****************/

    ConsoleStream::~ConsoleStream()
    {
        if (Console::is_available())
        {
            Console::instance().print(str());
        }
    }

    /***********
     * Console *
     ***********/

    namespace
    {
        Console* main_console = nullptr;
    }

    Console::Console(const Context& context)
        : Console(context, std::cout, std::cerr)
    {
    }

    Console::Console(const Context& context, std::ostream& out, std::ostream& err)
        : m_context(context)
        , m_out(out)
        , m_err(err)
    {
        set_singleton(*this);
    }

    Console::~Console()
    {
        clear_singleton();
    }

    void Console::set_singleton(Console& console)
    {
        if (main_console != nullptr)
        {
            throw pvenv_error(
                "attempt to create a second Console",
                pvenv_error_code::internal_failure
            );
        }
        main_console = &console;
    }

    void Console::clear_singleton()
    {
        main_console = nullptr;
    }

    Console& Console::instance()
    {
        if (main_console == nullptr)
        {
            throw pvenv_error(
                "attempt to use Console before it was created",
                pvenv_error_code::internal_failure
            );
        }
        return *main_console;
    }

    bool Console::is_available()
    {
        return main_console != nullptr;
    }

    const Context& Console::context() const
    {
        return m_context;
    }

    ConsoleStream Console::stream()
    {
        return ConsoleStream();
    }

    void Console::print(std::string_view str, bool force_print)
    {
        if (force_print || !context().output_params.quiet)
        {
            m_out << str << std::endl;
        }
    }

    void Console::print_error(std::string_view str)
    {
        m_err << str << std::endl;
    }

    // We use an overload instead of a default argument to avoid exposing std::cin
    // in the header (this would require to include iostream)
    bool Console::prompt(std::string_view message, char fallback)
    {
        return Console::prompt(message, fallback, std::cin);
    }

    bool Console::prompt(std::string_view message, char fallback, std::istream& input_stream)
    {
        auto& out = is_available() ? instance().m_err : std::cerr;
        out << message << ' ' << ((fallback == 'y') ? "(Y/n)" : "(y/N)") << ' ' << std::flush;

        std::string response;
        if (!std::getline(input_stream, response))
        {
            out << '\n';
            return false;
        }

        const auto answer = util::strip(response);
        if (answer.empty())
        {
            return fallback == 'y';
        }
        return util::starts_with(answer, 'y') || util::starts_with(answer, 'Y');
    }
}
