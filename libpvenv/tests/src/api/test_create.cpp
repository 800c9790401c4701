// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>

#include <catch2/catch_all.hpp>

#include "pvenv/api/create.hpp"
#include "pvenv/core/context.hpp"
#include "pvenv/core/error_handling.hpp"
#include "pvenv/core/interruption.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/migration.hpp"
#include "pvenv/core/util.hpp"
#include "pvenv/util/environment.hpp"

#include "pvenvtests.hpp"

namespace pvenv
{
    namespace
    {
        using V = std::vector<std::string>;

        class CreateFixture
        {
        public:

            CreateFixture()
                : vm(root.versions_dir())
            {
                vm.add_version("3.12.1");
                vm.add_executable("3.12.1", "virtualenv");
                vm.add_version("3.11.7");
                vm.current = "3.12.1";
            }

            ~CreateFixture()
            {
                reset_sig_interrupted();
                logging::set_logging_params(LoggingParams{});
            }

        protected:

            int run(const std::vector<std::string>& args, const std::string& answers = "")
            {
                input.str(answers);
                input.clear();
                return create_virtualenv(pvenvtests::context(), args, services);
            }

            fs::path target(const std::string& name) const
            {
                return root.versions_dir() / name;
            }

            // Simulates an environment left by a previous run.
            void make_existing(const std::string& name)
            {
                pvenvtests::write_file(target(name) / "bin" / "marker", "previous");
            }

            // Previous environments moved aside by an upgrade.
            std::vector<fs::path> kept_upgrades(const std::string& name) const
            {
                const auto prefix = "." + name + ".upgrade.";
                std::vector<fs::path> kept;
                for (const auto& entry : fs::directory_iterator(root.versions_dir()))
                {
                    if (util::starts_with(entry.path().filename().string(), prefix))
                    {
                        kept.push_back(entry.path());
                    }
                }
                return kept;
            }

            static auto manifest_of(const fs::path& kept, const std::string& name) -> fs::path
            {
                const auto filename = kept.filename().string();
                const auto seed = util::remove_prefix(filename, "." + name + ".upgrade.");
                return upgrade_manifest_path(std::string(seed));
            }

            static auto error_code_of(const std::function<void()>& func) -> pvenv_error_code
            {
                try
                {
                    func();
                }
                catch (const pvenv_error& e)
                {
                    return e.error_code();
                }
                return pvenv_error_code::unknown;
            }

            const pvenvtests::EnvironmentCleaner restore{ pvenvtests::CleanPvenvEnv() };
            pvenvtests::TemporaryRoot root;
            pvenvtests::StubVersionManager vm;
            pvenvtests::StubPackageManager pm;
            pvenvtests::StubBackendState state;
            std::istringstream input;
            CreateServices services{
                vm,
                pm,
                [this](BackendKind kind) -> std::unique_ptr<Backend>
                { return std::make_unique<pvenvtests::StubBackend>(kind, state); },
                {},
                &input,
            };
        };

        TEST_CASE_METHOD(CreateFixture, "init_run_context")
        {
            const auto& ctx = pvenvtests::context();

            SECTION("Single positional uses the current version")
            {
                const auto run = detail::init_run_context(ctx, parse_options({ "venv" }), vm);
                REQUIRE(run.source_version == "3.12.1");
                REQUIRE(run.env_name == "venv");
                REQUIRE(run.target_path == target("venv"));
            }

            SECTION("Explicit version and name without its path")
            {
                const auto run = detail::init_run_context(
                    ctx,
                    parse_options({ "3.11.7", "ignored", "a/b/venv" }),
                    vm
                );
                REQUIRE(run.source_version == "3.11.7");
                REQUIRE(run.env_name == "venv");
            }

            SECTION("Flags")
            {
                const auto run = detail::init_run_context(
                    ctx,
                    parse_options({ "-fuq", "--verbose", "--clear", "-x", "venv" }),
                    vm
                );
                REQUIRE(run.force);
                REQUIRE(run.upgrade);
                REQUIRE(run.quiet);
                REQUIRE(run.verbose);
                REQUIRE(run.backend_options == V{ "--clear", "--x" });
            }

            SECTION("Python option consumes the first positional")
            {
                const auto run = detail::init_run_context(
                    ctx,
                    parse_options({ "-p", "/usr/bin/python3", "3.11.7", "venv" }),
                    vm
                );
                REQUIRE(run.backend_options == V{ "--python=/usr/bin/python3" });
                REQUIRE(run.source_version == "3.11.7");
                REQUIRE(run.env_name == "venv");

                const auto inline_value = detail::init_run_context(
                    ctx,
                    parse_options({ "--python=python3.11", "venv" }),
                    vm
                );
                REQUIRE(inline_value.backend_options == V{ "--python=python3.11" });
            }

            SECTION("Usage errors")
            {
                const auto usage_error = [&](const V& args)
                {
                    return error_code_of([&] { detail::init_run_context(ctx, parse_options(args), vm); });
                };
                REQUIRE(usage_error({}) == pvenv_error_code::incorrect_usage);
                REQUIRE(usage_error({ "-f" }) == pvenv_error_code::incorrect_usage);
                REQUIRE(usage_error({ "3.12.1", "" }) == pvenv_error_code::incorrect_usage);
                REQUIRE(usage_error({ "3.12.1", "dir/" }) == pvenv_error_code::incorrect_usage);
                REQUIRE(usage_error({ "-p" }) == pvenv_error_code::incorrect_usage);
            }

            SECTION("No current version")
            {
                vm.current.clear();
                REQUIRE(
                    error_code_of([&] { detail::init_run_context(ctx, parse_options({ "venv" }), vm); })
                    == pvenv_error_code::version_not_found
                );
            }
        }

        TEST_CASE_METHOD(CreateFixture, "Informational modes")
        {
            REQUIRE(run({ "--help" }) == 0);
            REQUIRE(run({ "-h", "3.12.1", "venv" }) == 0);
            REQUIRE(run({ "--version" }) == 0);
            REQUIRE(run({ "--complete" }) == 0);
            REQUIRE(state.requests.empty());
            REQUIRE_FALSE(fs::exists(target("venv")));
        }

        TEST_CASE_METHOD(CreateFixture, "Unknown source version")
        {
            REQUIRE(error_code_of([&] { run({ "2.7.18", "venv" }); }) == pvenv_error_code::version_not_found);
            REQUIRE(state.requests.empty());
        }

        TEST_CASE_METHOD(CreateFixture, "Successful creation")
        {
            util::set_env("PYENV_VERSION", "3.11.7");
            util::set_env("PIP_REQUIRE_VIRTUALENV", "true");

            // No directory yet: the negative answer is never read.
            REQUIRE(run({ "-q", "--clear", "venv" }, "n\n") == 0);

            REQUIRE(fs::is_directory(target("venv") / "bin"));
            REQUIRE(state.requests.size() == 1);
            const auto& request = state.requests.front();
            REQUIRE(request.version == "3.12.1");
            REQUIRE(request.target == target("venv"));
            REQUIRE(request.options == V{ "--clear", "--quiet" });
            REQUIRE(request.run_options.working_directory == root.root() / "cache");
            REQUIRE(fs::is_directory(root.root() / "cache"));

            const auto& env = request.run_options.env.value();
            REQUIRE(env.count("PYENV_VERSION") == 0);
            REQUIRE(env.count("PIP_REQUIRE_VIRTUALENV") == 0);
            REQUIRE(env.at("VIRTUALENV_NAME") == "venv");
            REQUIRE(env.at("VIRTUALENV_PATH") == target("venv").string());
            REQUIRE(env.at("VERSION_NAME") == "3.12.1");

            REQUIRE(vm.rehash_count == 1);
            REQUIRE(pm.installs.empty());
        }

        TEST_CASE_METHOD(CreateFixture, "Rehash failure does not fail the creation")
        {
            vm.rehash_status = 1;
            REQUIRE(run({ "venv" }) == 0);
            REQUIRE(fs::exists(target("venv")));
        }

        TEST_CASE_METHOD(CreateFixture, "Existing environment")
        {
            make_existing("venv");

            SECTION("Declined confirmation leaves the directory untouched")
            {
                REQUIRE(error_code_of([&] { run({ "venv" }, "n\n"); }) == pvenv_error_code::user_interrupted);
                REQUIRE(error_code_of([&] { run({ "venv" }, "\n"); }) == pvenv_error_code::user_interrupted);
                REQUIRE(state.requests.empty());
                REQUIRE(read_contents(target("venv") / "bin" / "marker") == "previous");
            }

            SECTION("Accepted confirmation")
            {
                pvenvtests::take_console_output();
                REQUIRE(run({ "venv" }, "Yes\n") == 0);
                REQUIRE(state.requests.size() == 1);

                const auto [out, err] = pvenvtests::take_console_output();
                REQUIRE(err.find(target("venv").string() + " already exists") != std::string::npos);
                REQUIRE(err.find("continue with installation? (y/N)") != std::string::npos);
                REQUIRE(out.find("already exists") == std::string::npos);
            }

            SECTION("Force skips the confirmation")
            {
                REQUIRE(run({ "-f", "venv" }, "n\n") == 0);
                REQUIRE(state.requests.size() == 1);
            }

            SECTION("Failure keeps a directory that existed before")
            {
                state.status = 4;
                REQUIRE(run({ "--force", "venv" }) == 4);
                REQUIRE(fs::exists(target("venv") / "bin" / "marker"));
                REQUIRE(vm.rehash_count == 0);
            }
        }

        TEST_CASE_METHOD(CreateFixture, "Failed creation is cleaned up")
        {
            state.status = 5;
            REQUIRE(run({ "venv" }) == 5);
            REQUIRE_FALSE(fs::exists(target("venv")));
            REQUIRE(vm.rehash_count == 0);
        }

        TEST_CASE_METHOD(CreateFixture, "Directory without bin is not confirmed")
        {
            fs::create_directories(target("venv"));
            REQUIRE(run({ "venv" }, "n\n") == 0);
            REQUIRE(state.requests.size() == 1);
        }

        TEST_CASE_METHOD(CreateFixture, "Backend installation")
        {
            SECTION("virtualenv installed when missing")
            {
                pm.on_install = [this](const std::string& version, const PackageInstallRequest&)
                { vm.add_executable(version, "virtualenv"); };

                REQUIRE(run({ "-v", "3.11.7", "venv" }) == 0);
                REQUIRE(pm.installs.size() == 1);
                REQUIRE(pm.installs[0].first == "3.11.7");
                REQUIRE(pm.installs[0].second.specs == V{ "virtualenv" });
                REQUIRE(pm.installs[0].second.verbose);
                REQUIRE(state.requests.size() == 1);
                REQUIRE(state.requests[0].options == V{ "--verbose" });
            }

            SECTION("Pinned version")
            {
                auto& ctx = pvenvtests::context();
                const auto saved = ctx.backend_params.virtualenv_version;
                ctx.backend_params.virtualenv_version = "20.25.0";
                REQUIRE(run({ "3.11.7", "venv" }) == 0);
                ctx.backend_params.virtualenv_version = saved;
                REQUIRE(pm.installs.at(0).second.specs == V{ "virtualenv==20.25.0" });
            }

            SECTION("Installer failure aborts before anything is created")
            {
                pm.install_status = 3;
                REQUIRE(run({ "3.11.7", "venv" }) == 3);
                REQUIRE(state.requests.empty());
                REQUIRE_FALSE(fs::exists(target("venv")));
            }
        }

        TEST_CASE_METHOD(CreateFixture, "pyvenv backend")
        {
            vm.add_executable("3.11.7", "pyvenv");
            state.supported_options = { "upgrade" };
            make_existing("venv");
            pm.packages["venv"] = { "six==1.16.0" };

            REQUIRE(run({ "-u", "-q", "3.11.7", "venv" }) == 0);
            REQUIRE(pm.installs.empty());
            REQUIRE(state.requests.size() == 1);
            REQUIRE(state.requests[0].options == V{ "--upgrade" });
            // Native upgrade: the environment is updated in place.
            REQUIRE(fs::exists(target("venv") / "bin" / "marker"));
        }

        TEST_CASE_METHOD(CreateFixture, "Upgrade of an existing environment")
        {
            make_existing("venv");
            const auto packages = V{ "attrs==23.2.0", "requests==2.31.0", "six==1.16.0" };
            pm.packages["venv"] = packages;

            fs::path manifest;
            state.on_create = [&](const BackendRequest& request)
            {
                // The old environment was moved aside before the creation.
                REQUIRE_FALSE(fs::exists(request.target / "bin" / "marker"));
                pm.packages["venv"].clear();
            };

            SECTION("Packages are restored")
            {
                pvenvtests::LogRecorder log;
                REQUIRE(run({ "--upgrade", "venv" }) == 0);
                REQUIRE_FALSE(log.contains("UPGRADE FAILED"));
                REQUIRE(pm.packages["venv"] == packages);
                manifest = pm.installs.at(0).second.requirement_file;
                REQUIRE_FALSE(manifest.empty());
                REQUIRE_FALSE(fs::exists(manifest));
                for (const auto& entry : fs::directory_iterator(root.versions_dir()))
                {
                    REQUIRE_FALSE(util::starts_with(entry.path().filename().string(), ".venv.upgrade."));
                }
            }

            SECTION("Replay failure keeps the snapshot")
            {
                pm.install_status = 2;
                REQUIRE(run({ "-u", "venv" }) == 2);
                manifest = pm.installs.at(0).second.requirement_file;
                REQUIRE(read_lines(manifest) == packages);

                std::size_t kept = 0;
                for (const auto& entry : fs::directory_iterator(root.versions_dir()))
                {
                    if (util::starts_with(entry.path().filename().string(), ".venv.upgrade."))
                    {
                        REQUIRE(fs::exists(entry.path() / "bin" / "marker"));
                        ++kept;
                    }
                }
                REQUIRE(kept == 1);
                fs::remove(manifest);
            }

            SECTION("Failed creation skips the replay")
            {
                state.status = 1;
                REQUIRE(run({ "-u", "venv" }) == 1);
                REQUIRE(pm.installs.empty());
            }

            SECTION("Failing before hook reports the kept environment")
            {
                services.extra_hooks.before.push_back(Hook{ "failing", [](RunContext&) { return 9; } });
                pvenvtests::LogRecorder log;
                REQUIRE(run({ "-u", "venv" }) == 9);
                REQUIRE(state.requests.empty());

                const auto kept = kept_upgrades("venv");
                REQUIRE(kept.size() == 1);
                REQUIRE(fs::exists(kept.front() / "bin" / "marker"));
                manifest = manifest_of(kept.front(), "venv");
                REQUIRE(read_lines(manifest) == packages);

                REQUIRE(log.contains("UPGRADE FAILED"));
                REQUIRE(log.contains(kept.front().string()));
                REQUIRE(log.contains(manifest.string()));
                REQUIRE(log.contains("* requests==2.31.0"));
                fs::remove(manifest);
            }

            SECTION("Interruption before the creation reports the kept environment")
            {
                services.extra_hooks.before.push_back(Hook{ "interrupting",
                                                            [](RunContext&)
                                                            {
                                                                set_sig_interrupted();
                                                                return 0;
                                                            } });
                pvenvtests::LogRecorder log;
                REQUIRE(
                    error_code_of([&] { run({ "-u", "venv" }); }) == pvenv_error_code::user_interrupted
                );
                REQUIRE(state.requests.empty());

                const auto kept = kept_upgrades("venv");
                REQUIRE(kept.size() == 1);
                REQUIRE(log.contains("UPGRADE FAILED"));
                fs::remove(manifest_of(kept.front(), "venv"));
            }
        }

        TEST_CASE_METHOD(CreateFixture, "Upgrade of a directory without bin")
        {
            fs::create_directories(target("venv"));
            pm.packages["venv"] = { "six==1.16.0" };

            REQUIRE(run({ "-u", "venv" }) == 0);
            REQUIRE(state.requests.size() == 1);
            REQUIRE(pm.installs.empty());
            REQUIRE(kept_upgrades("venv").empty());
        }

        TEST_CASE_METHOD(CreateFixture, "Upgrade of a missing environment")
        {
            REQUIRE(run({ "-u", "venv" }) == 0);
            REQUIRE(pm.installs.empty());
            REQUIRE(fs::exists(target("venv")));
        }

        TEST_CASE_METHOD(CreateFixture, "Hooks")
        {
            V calls;
            HookList hooks;
            hooks.before.push_back(Hook{ "before",
                                         [&calls](RunContext& ctx)
                                         {
                                             calls.push_back("before " + ctx.environment.at("VIRTUALENV_NAME"));
                                             ctx.backend_options.push_back("--from-hook");
                                             return 0;
                                         } });
            hooks.after.push_back(Hook{ "after",
                                        [&calls](RunContext& ctx)
                                        {
                                            calls.push_back("after " + ctx.environment.at("STATUS"));
                                            return 0;
                                        } });
            services.extra_hooks = hooks;

            SECTION("Hooks see and change the run")
            {
                REQUIRE(run({ "venv" }) == 0);
                REQUIRE(calls == V{ "before venv", "after 0" });
                REQUIRE(state.requests.at(0).options == V{ "--from-hook" });
            }

            SECTION("After hooks see the failure")
            {
                state.status = 6;
                REQUIRE(run({ "venv" }) == 6);
                REQUIRE(calls == V{ "before venv", "after 6" });
            }

            SECTION("Failing before hook aborts")
            {
                services.extra_hooks.before.insert(
                    services.extra_hooks.before.begin(),
                    Hook{ "failing", [](RunContext&) { return 9; } }
                );
                REQUIRE(run({ "venv" }) == 9);
                REQUIRE(calls.empty());
                REQUIRE(state.requests.empty());
                REQUIRE_FALSE(fs::exists(target("venv")));
            }

            SECTION("Failing after hook fails the run")
            {
                services.extra_hooks.after.push_back(Hook{ "failing", [](RunContext&) { return 8; } });
                REQUIRE(run({ "venv" }) == 8);
                REQUIRE_FALSE(fs::exists(target("venv")));
                REQUIRE(vm.rehash_count == 0);
            }
        }

        TEST_CASE_METHOD(CreateFixture, "Shell hooks from the version manager")
        {
            if (util::which("bash").empty())
            {
                SKIP("bash is not available");
            }

            const auto script = root.root() / "plugins" / "hook.bash";
            pvenvtests::write_file(
                script,
                "after_virtualenv 'echo \"$VIRTUALENV_NAME:$STATUS\" > \"$VIRTUALENV_PATH/hook-ran\"'\n"
            );
            vm.hook_scripts = { script };

            REQUIRE(run({ "venv" }) == 0);
            REQUIRE(read_lines(target("venv") / "hook-ran") == V{ "venv:0" });
        }

        TEST_CASE_METHOD(CreateFixture, "Interruption during the creation")
        {
            bool after_ran = false;
            services.extra_hooks.after.push_back(Hook{ "after",
                                                       [&after_ran](RunContext&)
                                                       {
                                                           after_ran = true;
                                                           return 0;
                                                       } });
            state.on_create = [](const BackendRequest&) { set_sig_interrupted(); };

            REQUIRE(run({ "venv" }) == 130);
            REQUIRE_FALSE(after_ran);
            REQUIRE_FALSE(fs::exists(target("venv")));
        }
    }
}
