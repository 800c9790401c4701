// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_CORE_ERROR_HANDLING_HPP
#define PVENV_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace pvenv
{

    /********************
     * pvenv exceptions *
     ********************/

    enum class pvenv_error_code
    {
        unknown,
        aggregated,
        internal_failure,
        incorrect_usage,
        version_not_found,
        user_interrupted,
        subprocess_failure,
        hook_failure,
        backend_install_failure,
        upgrade_failure,
        configuration_failure,
        io_failure
    };

    class pvenv_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        pvenv_error(const std::string& msg, pvenv_error_code ec);
        pvenv_error(const char* msg, pvenv_error_code ec);

        pvenv_error_code error_code() const noexcept;

    private:

        pvenv_error_code m_error_code;
    };

    class pvenv_aggregated_error : public pvenv_error
    {
    public:

        using base_type = pvenv_error;
        using error_list_t = std::vector<pvenv_error>;

        explicit pvenv_aggregated_error(error_list_t&& error_list);

        const char* what() const noexcept override;

    private:

        error_list_t m_error_list;
        mutable std::string m_aggregated_message;
        static constexpr const char* m_base_message = "Multiple errors occurred:\n";
    };

    /*******************************
     * helpers around tl::expected *
     *******************************/

    template <class T, class E = pvenv_error>
    using expected_t = tl::expected<T, E>;

    tl::unexpected<pvenv_error> make_unexpected(const char* msg, pvenv_error_code ec);

    tl::unexpected<pvenv_error> make_unexpected(const std::string& msg, pvenv_error_code ec);

    tl::unexpected<pvenv_aggregated_error> make_unexpected(std::vector<pvenv_error>&& error_list);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }

}

#endif
