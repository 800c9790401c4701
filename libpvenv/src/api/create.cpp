// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "pvenv/api/configuration.hpp"
#include "pvenv/api/create.hpp"
#include "pvenv/core/context.hpp"
#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/interruption.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/migration.hpp"
#include "pvenv/core/output.hpp"
#include "pvenv/core/package_manager.hpp"
#include "pvenv/core/util_scope.hpp"
#include "pvenv/core/version_manager.hpp"
#include "pvenv/util/environment.hpp"
#include "pvenv/version.hpp"

namespace pvenv
{
    std::string create_usage()
    {
        return "Usage: pyenv virtualenv [-f|--force] [VIRTUALENV_OPTIONS] [version] <virtualenv-name>\n"
               "       pyenv virtualenv --version\n"
               "       pyenv virtualenv --help\n"
               "\n"
               "  -u/--upgrade     Imitate the behavior of pyvenv --upgrade\n"
               "  -f/--force       Install even if the version appears to be installed already\n"
               "  -q/--quiet       Forwarded to the environment creation tool when supported\n"
               "  -v/--verbose     Forwarded to the environment creation tool when supported\n"
               "  -p/--python      Interpreter to base the environment on, the first argument";
    }

    namespace detail
    {
        RunContext init_run_context(
            const Context& ctx,
            const ParsedOptions& options,
            const VersionManager& version_manager
        )
        {
            RunContext run;
            run.options = options;

            auto arguments = options.arguments;
            for (const auto& flag : options.flags)
            {
                if (flag == "f" || flag == "force")
                {
                    run.force = true;
                }
                else if (flag == "u" || flag == "upgrade")
                {
                    run.upgrade = true;
                }
                else if (flag == "q" || flag == "quiet")
                {
                    run.quiet = true;
                }
                else if (flag == "v" || flag == "verbose")
                {
                    run.verbose = true;
                }
                else if (flag == "p" || flag == "python")
                {
                    if (arguments.empty())
                    {
                        throw pvenv_error(
                            "option '-p' requires the path of an interpreter",
                            pvenv_error_code::incorrect_usage
                        );
                    }
                    run.backend_options.push_back("--python=" + arguments.front());
                    arguments.erase(arguments.begin());
                }
                else if (flag == "h" || flag == "help" || flag == "version")
                {
                    continue;
                }
                else
                {
                    run.backend_options.push_back("--" + flag);
                }
            }

            if (arguments.empty())
            {
                throw pvenv_error("no virtualenv name given", pvenv_error_code::incorrect_usage);
            }

            if (arguments.size() == 1)
            {
                auto current = version_manager.current_version();
                if (!current)
                {
                    throw pvenv_error(current.error().what(), pvenv_error_code::version_not_found);
                }
                run.source_version = std::move(current).value();
            }
            else
            {
                run.source_version = arguments.front();
            }

            run.env_name = fs::path(arguments.back()).filename().string();
            if (run.env_name.empty() || run.env_name == "." || run.env_name == "..")
            {
                throw pvenv_error(
                    fmt::format("invalid virtualenv name '{}'", arguments.back()),
                    pvenv_error_code::incorrect_usage
                );
            }
            run.target_path = ctx.versions_dir() / run.env_name;
            return run;
        }
    }

    namespace
    {
        // The source version must be installed, the children never see a forced version.
        void resolve_version(RunContext& run, const VersionManager& version_manager)
        {
            auto prefix = version_manager.prefix(run.source_version);
            if (!prefix)
            {
                throw pvenv_error(
                    fmt::format("'{}' is not installed in pyenv", run.source_version),
                    pvenv_error_code::version_not_found
                );
            }
            LOG_DEBUG << fmt::format("Using '{}' from '{}'", run.source_version, prefix->string());

            run.environment = util::get_env_map();
            sanitize_environment(run.environment);
        }

        // Select the backend, installing virtualenv if needed, and complete its options.
        // Returns the status of a failed installation, `0` otherwise.
        int prepare_backend(
            const Context& ctx,
            RunContext& run,
            CreateServices& services,
            std::unique_ptr<Backend>& backend
        )
        {
            auto probe = probe_backends(services.version_manager, run.source_version);
            run.backend = select_backend(probe);

            if (run.backend == BackendKind::virtualenv && !probe.virtualenv_present)
            {
                auto status = install_backend(
                    services.package_manager,
                    run.source_version,
                    ctx.backend_params.virtualenv_version,
                    run.quiet,
                    run.verbose,
                    run.run_options()
                );
                if (!status)
                {
                    throw pvenv_error(status.error().what(), pvenv_error_code::backend_install_failure);
                }
                if (status.value() != 0)
                {
                    LOG_ERROR << fmt::format(
                        "Failed to install virtualenv in '{}' (status {})",
                        run.source_version,
                        status.value()
                    );
                    return status.value();
                }
                probe = probe_backends(services.version_manager, run.source_version);
                run.backend = select_backend(probe);
            }

            backend = services.make_backend(run.backend);
            if (!backend)
            {
                throw pvenv_error(
                    fmt::format("no implementation of the '{}' backend", name_of(run.backend)),
                    pvenv_error_code::internal_failure
                );
            }

            if (run.quiet && backend->supports_option("quiet"))
            {
                run.backend_options.push_back("--quiet");
            }
            if (run.verbose && backend->supports_option("verbose"))
            {
                run.backend_options.push_back("--verbose");
            }
            if (run.upgrade && backend->supports_option("upgrade"))
            {
                run.backend_options.push_back("--upgrade");
                run.native_upgrade = true;
            }

            LOG_INFO << fmt::format(
                "Creating '{}' with {} {}",
                run.env_name,
                backend->name(),
                fmt::join(run.backend_options, " ")
            );
            return 0;
        }

        // Ask before installing over an existing environment, an upgrade implies `--force`.
        void confirm(RunContext& run, std::istream& input)
        {
            std::error_code ec;
            run.prefix_existed = fs::exists(run.target_path, ec);

            if (fs::is_directory(run.target_path / "bin", ec) && !run.force && !run.upgrade)
            {
                Console::instance().print_error(fmt::format("{} already exists", run.target_path.string()));
                if (!Console::prompt("continue with installation?", 'n', input))
                {
                    throw pvenv_error("Aborted.", pvenv_error_code::user_interrupted);
                }
            }
        }

        // Only an environment with a `bin` directory has packages to carry over.
        void take_snapshot(RunContext& run, CreateServices& services)
        {
            std::error_code ec;
            if (!run.upgrade || run.native_upgrade || !fs::is_directory(run.target_path / "bin", ec))
            {
                return;
            }
            auto snapshot = snapshot_environment(
                services.package_manager,
                run.env_name,
                run.target_path,
                make_upgrade_seed(),
                run.run_options()
            );
            if (!snapshot)
            {
                throw snapshot.error();
            }
            run.snapshot = std::move(snapshot).value();
        }

        int invoke(const Context& ctx, RunContext& run, Backend& backend)
        {
            const auto cache_dir = ctx.cache_dir();
            std::error_code ec;
            fs::create_directories(cache_dir, ec);
            if (ec)
            {
                throw pvenv_error(
                    fmt::format("Could not create '{}': {}", cache_dir.string(), ec.message()),
                    pvenv_error_code::io_failure
                );
            }

            BackendRequest request{
                .version = run.source_version,
                .options = run.backend_options,
                .target = run.target_path,
                .run_options = run.run_options(cache_dir),
            };

            auto status = backend.create(request);
            if (!status)
            {
                LOG_ERROR << status.error().what();
                return 1;
            }
            int result = status.value();

            if (is_sig_interrupted())
            {
                LOG_WARNING << "Interrupted by user";
                return (result == 0) ? 130 : result;
            }

            if (result == 0)
            {
                auto finalized = backend.finalize(request);
                if (!finalized)
                {
                    LOG_ERROR << finalized.error().what();
                    return 1;
                }
                result = finalized.value();
            }
            return result;
        }

        int migrate(RunContext& run, CreateServices& services)
        {
            if (!run.snapshot)
            {
                return run.status;
            }
            if (run.status != 0)
            {
                report_kept_snapshot(*run.snapshot);
                return run.status;
            }

            auto status = replay_snapshot(
                services.package_manager,
                run.env_name,
                *run.snapshot,
                run.quiet,
                run.verbose,
                run.run_options()
            );
            if (!status)
            {
                LOG_ERROR << status.error().what();
                return 1;
            }
            return status.value();
        }
    }

    int create_virtualenv(
        const Context& ctx,
        const std::vector<std::string>& raw_args,
        CreateServices& services
    )
    {
        if (!raw_args.empty() && raw_args.front() == "--complete")
        {
            for (const auto& version : services.version_manager.installed_versions())
            {
                Console::instance().print(version, true);
            }
            return 0;
        }

        const auto options = parse_options(raw_args);
        if (options.has_flag("h") || options.has_flag("help"))
        {
            Console::instance().print(create_usage(), true);
            return 0;
        }
        if (options.has_flag("version"))
        {
            Console::instance().print(fmt::format("pyenv-virtualenv {}", version()), true);
            return 0;
        }

        RunContext run = detail::init_run_context(ctx, options, services.version_manager);
        if (run.verbose && logging::get_log_level() > log_level::info)
        {
            logging::set_log_level(log_level::info);
        }

        resolve_version(run, services.version_manager);

        std::unique_ptr<Backend> backend;
        if (int status = prepare_backend(ctx, run, services, backend); status != 0)
        {
            return status;
        }
        interruption_point();

        confirm(run, services.input ? *services.input : std::cin);
        interruption_point();

        PendingCreation pending(run.target_path, run.prefix_existed);
        take_snapshot(run, services);

        // Any exit before the migration leaves the previous environment aside.
        bool migration_done = false;
        on_scope_exit report_snapshot{ [&]
                                       {
                                           if (run.snapshot && !migration_done)
                                           {
                                               report_kept_snapshot(*run.snapshot);
                                           }
                                       } };

        run.export_variables();

        HookList hooks;
        auto shell_hooks = load_shell_hooks(
            services.version_manager.hooks("virtualenv"),
            run.environment
        );
        if (!shell_hooks)
        {
            throw shell_hooks.error();
        }
        hooks.append(shell_hooks.value());
        hooks.append(services.extra_hooks);

        if (int status = run_hooks(hooks.before, run, true); status != 0)
        {
            LOG_ERROR << "Aborting: a before_virtualenv hook failed";
            return status;
        }
        interruption_point();

        run.status = invoke(ctx, run, *backend);
        if (!is_sig_interrupted())
        {
            run.status = migrate(run, services);
            migration_done = true;

            run.environment["STATUS"] = std::to_string(run.status);
            if (int status = run_hooks(hooks.after, run, false); status != 0 && run.status == 0)
            {
                run.status = status;
            }
        }

        if (run.status == 0)
        {
            pending.release();
            if (int rehashed = services.version_manager.rehash(); rehashed != 0)
            {
                LOG_WARNING << fmt::format("pyenv rehash failed with status {}", rehashed);
            }
        }
        else if (!run.prefix_existed)
        {
            LOG_ERROR << fmt::format(
                "Creation of '{}' failed with status {}",
                run.env_name,
                run.status
            );
        }
        return run.status;
    }

    int create(Configuration& config, const std::vector<std::string>& raw_args)
    {
        config.load();
        const auto& ctx = config.context();

        PyenvVersionManager version_manager(
            ctx.backend_params.pyenv_exe,
            ctx.prefix_params.root_prefix
        );
        PipPackageManager package_manager(version_manager);

        CreateServices services{
            .version_manager = version_manager,
            .package_manager = package_manager,
            .make_backend = [&version_manager](BackendKind kind)
            { return make_backend(kind, version_manager); },
        };
        return create_virtualenv(ctx, raw_args, services);
    }
}
