// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_API_CONFIGURATION_HPP
#define PVENV_API_CONFIGURATION_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "pvenv/core/context.hpp"
#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/fs/filesystem.hpp"
#include "pvenv/util/environment.hpp"
#include "pvenv/util/string.hpp"

namespace pvenv
{
    class Configuration;

    enum class ConfigurationLevel
    {
        kCli = 0,
        kEnvVar = 1,
        kFile = 2,
        kDefault = 3
    };

    // Parses a level name as found in rc files and environment variables.
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>;
}

namespace YAML
{
    template <>
    struct convert<pvenv::fs::path>
    {
        static Node encode(const pvenv::fs::path& rhs)
        {
            return Node(rhs.string());
        }

        static bool decode(const Node& node, pvenv::fs::path& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }
            rhs = pvenv::fs::path(node.as<std::string>());
            return true;
        }
    };

    template <>
    struct convert<pvenv::log_level>
    {
        static Node encode(const pvenv::log_level& rhs)
        {
            return Node(pvenv::name_of(rhs));
        }

        static bool decode(const Node& node, pvenv::log_level& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }
            if (auto level = pvenv::log_level_from_name(node.as<std::string>()))
            {
                rhs = *level;
                return true;
            }
            return false;
        }
    };
}

namespace pvenv
{
    namespace detail
    {
        // Conversion of raw environment variable values.
        template <class T>
        struct Source
        {
            static T deserialize(const std::string& value)
            {
                return YAML::Load(value).as<T>();
            }
        };

        template <>
        struct Source<std::string>
        {
            static std::string deserialize(const std::string& value)
            {
                return value;
            }
        };

        // Any non-empty value enables the flag, except explicit negatives.
        template <>
        struct Source<bool>
        {
            static bool deserialize(const std::string& value)
            {
                const auto lowered = util::to_lower(util::strip(value));
                return !lowered.empty() && (lowered != "0") && (lowered != "false")
                       && (lowered != "no") && (lowered != "off");
            }
        };

        template <>
        struct Source<fs::path>
        {
            static fs::path deserialize(const std::string& value)
            {
                return fs::path(value);
            }
        };

        template <>
        struct Source<std::vector<fs::path>>
        {
            static std::vector<fs::path> deserialize(const std::string& value)
            {
                std::vector<fs::path> paths;
                for (const auto& elem : util::split(value, ":"))
                {
                    if (!elem.empty())
                    {
                        paths.emplace_back(elem);
                    }
                }
                return paths;
            }
        };

        struct ConfigurableImplBase
        {
            virtual ~ConfigurableImplBase() = default;

            virtual bool cli_configured() const = 0;
            virtual void clear_rc_value() = 0;
            virtual void set_rc_yaml_value(const YAML::Node& value, const std::string& source) = 0;
            virtual void compute(const ConfigurationLevel& level) = 0;

            bool rc_configured() const
            {
                return !m_rc_source.empty();
            }

            std::string m_name;
            std::string m_description = "No description provided";
            std::vector<std::string> m_env_var_names = {};
            bool m_rc_configurable = false;

            std::string m_rc_source;
            std::string m_source = "default";
        };

        template <class T>
        struct ConfigurableImpl : ConfigurableImplBase
        {
            bool cli_configured() const override
            {
                return m_cli_value.has_value();
            }

            void clear_rc_value() override
            {
                m_rc_value.reset();
                m_rc_source.clear();
            }

            void set_rc_yaml_value(const YAML::Node& value, const std::string& source) override;
            void compute(const ConfigurationLevel& level) override;

            using value_hook_type = std::function<T()>;
            using post_merge_hook_type = std::function<void(T&)>;

            std::optional<T> m_cli_value;
            std::optional<T> m_rc_value;
            T m_value = {};
            T m_default_value = {};
            T* p_context = nullptr;

            value_hook_type p_default_value_hook;
            post_merge_hook_type p_post_merge_hook;
        };
    }

    /****************
     * Configurable *
     ****************/

    class Configurable
    {
    public:

        template <class T>
        Configurable(const std::string& name, T* context);

        template <class T>
        Configurable(const std::string& name, const T& init);

        const std::string& name() const;

        const std::string& description() const;
        Configurable&& description(const std::string& desc);

        // Where the current value comes from: "CLI", an environment variable name,
        // an rc file path or "default".
        const std::string& source() const;

        bool rc_configurable() const;
        Configurable&& set_rc_configurable();

        const std::vector<std::string>& env_var_names() const;
        Configurable&& set_env_var_names(const std::vector<std::string>& names);

        bool rc_configured() const;
        bool cli_configured() const;
        bool configured() const;

        template <class T>
        const T& value() const;

        template <class T>
        Configurable&& set_cli_value(const T& value);

        template <class T>
        using value_hook_type = typename detail::ConfigurableImpl<T>::value_hook_type;
        template <class T>
        using post_merge_hook_type = typename detail::ConfigurableImpl<T>::post_merge_hook_type;

        template <class T>
        Configurable&& set_default_value_hook(value_hook_type<T> hook);
        template <class T>
        Configurable&& set_post_merge_hook(post_merge_hook_type<T> hook);

        Configurable&& set_rc_yaml_value(const YAML::Node& value, const std::string& source);
        Configurable&& clear_rc_value();

        Configurable&& compute(const ConfigurationLevel& level = ConfigurationLevel::kDefault);

    private:

        template <class T>
        detail::ConfigurableImpl<T>& get_wrapped();

        template <class T>
        const detail::ConfigurableImpl<T>& get_wrapped() const;

        std::unique_ptr<detail::ConfigurableImplBase> p_impl;
    };

    /*****************
     * Configuration *
     *****************/

    class Configuration
    {
    public:

        explicit Configuration(Context& ctx);
        ~Configuration();

        Configuration(const Configuration&) = delete;
        Configuration& operator=(const Configuration&) = delete;
        Configuration(Configuration&&) = delete;
        Configuration& operator=(Configuration&&) = delete;

        std::map<std::string, Configurable>& config();
        const std::map<std::string, Configurable>& config() const;

        Configurable& at(const std::string& name);
        const Configurable& at(const std::string& name) const;

        Configurable& insert(Configurable configurable);

        // The rc files read by the last `load`, by increasing priority.
        const std::vector<fs::path>& valid_sources() const;

        Context& context()
        {
            return m_context;
        }

        const Context& context() const
        {
            return m_context;
        }

        /**
         * Compute every configurable from its sources and update the context.
         *
         * Throws a `pvenv_error` with `configuration_failure` on unreadable rc files
         * or invalid values.
         */
        void load();

        static YAML::Node load_rc_file(const fs::path& file);
        static std::vector<fs::path> compute_default_rc_sources();

    protected:

        void set_configurables();
        void set_rc_values(const std::vector<fs::path>& rc_files);

        Context& m_context;

        std::vector<fs::path> m_valid_sources;
        std::map<std::string, Configurable> m_config;
        std::vector<std::string> m_config_order;
    };

    /***********************************
     * ConfigurableImpl implementation *
     ***********************************/

    namespace detail
    {
        template <class T>
        void ConfigurableImpl<T>::set_rc_yaml_value(const YAML::Node& value, const std::string& source)
        {
            try
            {
                m_rc_value = value.as<T>();
                m_rc_source = source;
            }
            catch (const YAML::Exception& e)
            {
                throw pvenv_error(
                    "Bad conversion of configurable '" + m_name + "' from rc file '" + source
                        + "': " + e.what(),
                    pvenv_error_code::configuration_failure
                );
            }
        }

        template <class T>
        void ConfigurableImpl<T>::compute(const ConfigurationLevel& level)
        {
            LOG_TRACE << "Compute configurable '" << m_name << "'";

            std::optional<T> env_value;
            std::string env_source;
            if (level >= ConfigurationLevel::kEnvVar)
            {
                for (const auto& env_var : m_env_var_names)
                {
                    auto env_var_value = util::get_env(env_var);
                    if (!env_var_value)
                    {
                        continue;
                    }
                    try
                    {
                        env_value = Source<T>::deserialize(env_var_value.value());
                        env_source = env_var;
                        break;
                    }
                    catch (const YAML::Exception& e)
                    {
                        throw pvenv_error(
                            "Bad conversion of configurable '" + m_name
                                + "' from environment variable '" + env_var + "' with value '"
                                + env_var_value.value() + "': " + e.what(),
                            pvenv_error_code::configuration_failure
                        );
                    }
                }
            }

            if (m_cli_value && (level >= ConfigurationLevel::kCli))
            {
                m_value = *m_cli_value;
                m_source = "CLI";
            }
            else if (env_value)
            {
                m_value = std::move(*env_value);
                m_source = env_source;
            }
            else if (m_rc_value && (level >= ConfigurationLevel::kFile))
            {
                m_value = *m_rc_value;
                m_source = m_rc_source;
            }
            else
            {
                m_value = p_default_value_hook ? p_default_value_hook() : m_default_value;
                m_source = "default";
            }

            if (p_post_merge_hook)
            {
                p_post_merge_hook(m_value);
            }

            if (p_context != nullptr)
            {
                *p_context = m_value;
            }
        }
    }

    /*******************************
     * Configurable implementation *
     *******************************/

    template <class T>
    Configurable::Configurable(const std::string& name, T* context)
        : p_impl(std::make_unique<detail::ConfigurableImpl<T>>())
    {
        auto& wrapped = get_wrapped<T>();
        wrapped.m_name = name;
        wrapped.m_value = *context;
        wrapped.m_default_value = *context;
        wrapped.p_context = context;
    }

    template <class T>
    Configurable::Configurable(const std::string& name, const T& init)
        : p_impl(std::make_unique<detail::ConfigurableImpl<T>>())
    {
        auto& wrapped = get_wrapped<T>();
        wrapped.m_name = name;
        wrapped.m_value = init;
        wrapped.m_default_value = init;
    }

    template <class T>
    detail::ConfigurableImpl<T>& Configurable::get_wrapped()
    {
        try
        {
            return dynamic_cast<detail::ConfigurableImpl<T>&>(*p_impl);
        }
        catch (const std::bad_cast&)
        {
            throw pvenv_error(
                "Bad cast of configurable '" + name() + "'",
                pvenv_error_code::internal_failure
            );
        }
    }

    template <class T>
    const detail::ConfigurableImpl<T>& Configurable::get_wrapped() const
    {
        try
        {
            return dynamic_cast<const detail::ConfigurableImpl<T>&>(*p_impl);
        }
        catch (const std::bad_cast&)
        {
            throw pvenv_error(
                "Bad cast of configurable '" + name() + "'",
                pvenv_error_code::internal_failure
            );
        }
    }

    template <class T>
    const T& Configurable::value() const
    {
        return get_wrapped<T>().m_value;
    }

    template <class T>
    Configurable&& Configurable::set_cli_value(const T& value)
    {
        get_wrapped<T>().m_cli_value = value;
        return std::move(*this);
    }

    template <class T>
    Configurable&& Configurable::set_default_value_hook(value_hook_type<T> hook)
    {
        get_wrapped<T>().p_default_value_hook = std::move(hook);
        return std::move(*this);
    }

    template <class T>
    Configurable&& Configurable::set_post_merge_hook(post_merge_hook_type<T> hook)
    {
        get_wrapped<T>().p_post_merge_hook = std::move(hook);
        return std::move(*this);
    }
}

#endif
