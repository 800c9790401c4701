// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "pvenv/api/configuration.hpp"

namespace pvenv
{
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>
    {
        const auto lowered = util::to_lower(util::strip(name));
        if (lowered == "warn")
        {
            return log_level::warn;
        }
        if (lowered == "err")
        {
            return log_level::err;
        }
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lowered == name_of(level))
            {
                return level;
            }
        }
        return std::nullopt;
    }

    /*******************************
     * Configurable implementation *
     *******************************/

    const std::string& Configurable::name() const
    {
        return p_impl->m_name;
    }

    const std::string& Configurable::description() const
    {
        return p_impl->m_description;
    }

    Configurable&& Configurable::description(const std::string& desc)
    {
        p_impl->m_description = desc;
        return std::move(*this);
    }

    const std::string& Configurable::source() const
    {
        return p_impl->m_source;
    }

    bool Configurable::rc_configurable() const
    {
        return p_impl->m_rc_configurable;
    }

    Configurable&& Configurable::set_rc_configurable()
    {
        p_impl->m_rc_configurable = true;
        return std::move(*this);
    }

    const std::vector<std::string>& Configurable::env_var_names() const
    {
        return p_impl->m_env_var_names;
    }

    Configurable&& Configurable::set_env_var_names(const std::vector<std::string>& names)
    {
        p_impl->m_env_var_names = names;
        return std::move(*this);
    }

    bool Configurable::rc_configured() const
    {
        return p_impl->rc_configured();
    }

    bool Configurable::cli_configured() const
    {
        return p_impl->cli_configured();
    }

    bool Configurable::configured() const
    {
        return p_impl->m_source != "default";
    }

    Configurable&& Configurable::set_rc_yaml_value(const YAML::Node& value, const std::string& source)
    {
        p_impl->set_rc_yaml_value(value, source);
        return std::move(*this);
    }

    Configurable&& Configurable::clear_rc_value()
    {
        p_impl->clear_rc_value();
        return std::move(*this);
    }

    Configurable&& Configurable::compute(const ConfigurationLevel& level)
    {
        p_impl->compute(level);
        return std::move(*this);
    }

    /********************************
     * Configuration implementation *
     ********************************/

    namespace
    {
        void expand_user_path(fs::path& path)
        {
            const auto str = path.string();
            if (str == "~" || util::starts_with(str, "~/"))
            {
                const auto relative = util::remove_prefix(util::remove_prefix(str, '~'), '/');
                path = fs::path(util::user_home_dir()) / relative;
            }
        }

        void absolute_path_hook(fs::path& path)
        {
            if (path.empty())
            {
                return;
            }
            expand_user_path(path);
            path = fs::absolute(path).lexically_normal();
        }

        void root_prefix_hook(fs::path& path)
        {
            if (path.empty())
            {
                throw pvenv_error(
                    "The root prefix cannot be empty",
                    pvenv_error_code::configuration_failure
                );
            }
            absolute_path_hook(path);
        }
    }

    Configuration::Configuration(Context& ctx)
        : m_context(ctx)
    {
        set_configurables();
    }

    Configuration::~Configuration() = default;

    void Configuration::set_configurables()
    {
        insert(Configurable("rc_files", std::vector<fs::path>{})
                   .description("Paths to the configuration files to use")
                   .set_default_value_hook<std::vector<fs::path>>(
                       [] { return compute_default_rc_sources(); }
                   ));

        insert(Configurable("root_prefix", &m_context.prefix_params.root_prefix)
                   .set_env_var_names({ "PYENV_ROOT" })
                   .set_rc_configurable()
                   .description("Root of the pyenv installation holding the 'versions' directory")
                   .set_post_merge_hook<fs::path>(root_prefix_hook));

        insert(Configurable("cache_dir", &m_context.prefix_params.cache_dir)
                   .set_env_var_names({ "PYENV_VIRTUALENV_CACHE_PATH" })
                   .set_rc_configurable()
                   .description("Working directory of the environment creation tools")
                   .set_post_merge_hook<fs::path>(absolute_path_hook));

        insert(Configurable("debug", &m_context.debug)
                   .set_env_var_names({ "PYENV_DEBUG" })
                   .set_rc_configurable()
                   .description("Log everything, including the commands being run"));

        insert(Configurable("verbose", &m_context.output_params.verbosity)
                   .description("Verbosity of the logs, each -v raising it by one"));

        insert(Configurable("quiet", &m_context.output_params.quiet)
                   .set_rc_configurable()
                   .description("Only print what the command is asked for"));

        insert(Configurable("virtualenv_version", &m_context.backend_params.virtualenv_version)
                   .set_env_var_names({ "VIRTUALENV_VERSION" })
                   .set_rc_configurable()
                   .description("Version of virtualenv to install when it is missing"));

        insert(Configurable("pyenv_exe", &m_context.backend_params.pyenv_exe)
                   .set_env_var_names({ "PVENV_PYENV_EXE" })
                   .set_rc_configurable()
                   .description("The pyenv executable to drive"));

        insert(Configurable("log_level", &m_context.output_params.logging_level)
                   .set_env_var_names({ "PVENV_LOG_LEVEL" })
                   .set_rc_configurable()
                   .description("Minimum level of the log messages to display")
                   .set_default_value_hook<log_level>(
                       [this]
                       {
                           return m_context.debug
                                      ? log_level::trace
                                      : log_level_from_verbosity(m_context.output_params.verbosity);
                       }
                   ));

        insert(Configurable("log_backtrace", &m_context.output_params.log_backtrace)
                   .set_env_var_names({ "PVENV_LOG_BACKTRACE" })
                   .set_rc_configurable()
                   .description("Number of filtered out log records replayed on a critical error"));
    }

    std::map<std::string, Configurable>& Configuration::config()
    {
        return m_config;
    }

    const std::map<std::string, Configurable>& Configuration::config() const
    {
        return m_config;
    }

    Configurable& Configuration::at(const std::string& name)
    {
        try
        {
            return m_config.at(name);
        }
        catch (const std::out_of_range&)
        {
            throw pvenv_error(
                fmt::format("Configurable '{}' does not exist", name),
                pvenv_error_code::internal_failure
            );
        }
    }

    const Configurable& Configuration::at(const std::string& name) const
    {
        try
        {
            return m_config.at(name);
        }
        catch (const std::out_of_range&)
        {
            throw pvenv_error(
                fmt::format("Configurable '{}' does not exist", name),
                pvenv_error_code::internal_failure
            );
        }
    }

    Configurable& Configuration::insert(Configurable configurable)
    {
        std::string name = configurable.name();
        if (m_config.count(name) != 0)
        {
            throw pvenv_error(
                fmt::format("Redefinition of configurable '{}' not allowed", name),
                pvenv_error_code::internal_failure
            );
        }
        m_config_order.push_back(name);
        return m_config.insert({ name, std::move(configurable) }).first->second;
    }

    const std::vector<fs::path>& Configuration::valid_sources() const
    {
        return m_valid_sources;
    }

    std::vector<fs::path> Configuration::compute_default_rc_sources()
    {
        return {
            fs::path(util::user_home_dir()) / ".pvenvrc",
            fs::path(util::user_config_dir()) / "pvenv" / "pvenvrc",
        };
    }

    YAML::Node Configuration::load_rc_file(const fs::path& file)
    {
        YAML::Node config;
        try
        {
            config = YAML::LoadFile(file.string());
        }
        catch (const YAML::Exception& ex)
        {
            throw pvenv_error(
                fmt::format("Error in file '{}': {}", file.string(), ex.what()),
                pvenv_error_code::configuration_failure
            );
        }
        if (!config.IsNull() && !config.IsMap())
        {
            throw pvenv_error(
                fmt::format("Error in file '{}': expected a mapping of settings", file.string()),
                pvenv_error_code::configuration_failure
            );
        }
        return config;
    }

    void Configuration::set_rc_values(const std::vector<fs::path>& rc_files)
    {
        const bool explicit_sources = at("rc_files").configured();

        m_valid_sources.clear();
        for (auto& [name, c] : m_config)
        {
            c.clear_rc_value();
        }

        std::vector<pvenv_error> errors;
        for (const auto& file : rc_files)
        {
            std::error_code ec;
            if (!fs::is_regular_file(file, ec))
            {
                if (explicit_sources)
                {
                    errors.emplace_back(
                        fmt::format("Configuration file '{}' does not exist", file.string()),
                        pvenv_error_code::configuration_failure
                    );
                }
                continue;
            }

            try
            {
                const auto node = load_rc_file(file);
                // Later files override earlier ones.
                for (const auto& entry : node)
                {
                    const auto key = entry.first.as<std::string>();
                    auto it = m_config.find(key);
                    if (it == m_config.end() || !it->second.rc_configurable())
                    {
                        LOG_WARNING << fmt::format(
                            "Unknown setting '{}' in configuration file '{}'",
                            key,
                            file.string()
                        );
                        continue;
                    }
                    it->second.set_rc_yaml_value(entry.second, file.string());
                }
                m_valid_sources.push_back(file);
            }
            catch (const pvenv_error& e)
            {
                errors.push_back(e);
            }
        }

        if (errors.size() == 1)
        {
            throw errors.front();
        }
        if (!errors.empty())
        {
            throw pvenv_aggregated_error(std::move(errors));
        }
    }

    void Configuration::load()
    {
        LOG_DEBUG << fmt::format(
            "Loading configuration for '{}'",
            m_context.command_params.current_command
        );

        at("rc_files").compute();
        set_rc_values(at("rc_files").value<std::vector<fs::path>>());

        for (const auto& name : m_config_order)
        {
            if (name != "rc_files")
            {
                at(name).compute();
            }
        }

        logging::set_logging_params(LoggingParams{
            .logging_level = m_context.output_params.logging_level,
            .log_backtrace = m_context.output_params.log_backtrace,
            .log_pattern = m_context.output_params.log_pattern,
        });

        LOG_DEBUG << m_config.size() << " configurables computed";
        for (const auto& name : m_config_order)
        {
            LOG_TRACE << fmt::format("  {} set from {}", name, at(name).source());
        }
    }
}
