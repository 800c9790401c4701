// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_OUTPUT_HPP
#define PVENV_CORE_OUTPUT_HPP

#include <iosfwd>
#include <sstream>
#include <string_view>

namespace pvenv
{
    class Context;

    // Prints its content as one message of the console when destroyed.
    class ConsoleStream : public std::stringstream
    {
    public:

        ConsoleStream() = default;
        ~ConsoleStream();
    };

    class Console
    {
    public:

        Console(const Console&) = delete;
        Console& operator=(const Console&) = delete;

        Console(Console&&) = delete;
        Console& operator=(Console&&) = delete;

        static Console& instance();
        static bool is_available();
        static ConsoleStream stream();

        /**
         * Ask a yes/no question on the error stream, reading one line of the input.
         *
         * Only answers starting with `y` or `Y` are a yes, an empty answer is the fallback.
         */
        static bool prompt(std::string_view message, char fallback = 'n');
        static bool prompt(std::string_view message, char fallback, std::istream& input_stream);

        // Prints the message followed by a new line, unless `quiet` is set.
        void print(std::string_view str, bool force_print = false);
        // Prints a notice for the user on the error stream, even when `quiet` is set.
        void print_error(std::string_view str);

        const Context& context() const;

        explicit Console(const Context& context);
        Console(const Context& context, std::ostream& out, std::ostream& err);
        ~Console();

    private:

        const Context& m_context;
        std::ostream& m_out;
        std::ostream& m_err;

        static void set_singleton(Console& console);
        static void clear_singleton();
    };
}

#endif
