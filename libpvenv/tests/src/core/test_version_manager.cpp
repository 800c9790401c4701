// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pvenv/core/package_manager.hpp"
#include "pvenv/core/util.hpp"
#include "pvenv/core/version_manager.hpp"
#include "pvenv/util/environment.hpp"

#include "pvenvtests.hpp"

namespace pvenv
{
    namespace
    {
        using V = std::vector<std::string>;

        // Answers the queries the way pyenv does for a root holding 3.11.7 and 3.12.1.
        constexpr auto fake_pyenv = R"sh(#!/bin/sh
case "$1" in
  version-name)
    if [ -n "$FAKE_PYENV_CURRENT" ]; then echo "$FAKE_PYENV_CURRENT"; else echo "no version set" >&2; exit 1; fi ;;
  prefix)
    case "$2" in
      3.12.1) echo "$PYENV_ROOT/versions/3.12.1:$PYENV_ROOT/versions/3.11.7" ;;
      *) echo "pyenv: version \`$2' not installed" >&2; exit 1 ;;
    esac ;;
  hooks)
    echo "$PYENV_ROOT/plugins/$2.bash"
    echo ;;
  versions)
    printf '3.11.7\n3.12.1\n' ;;
  rehash)
    exit 4 ;;
  exec)
    shift
    echo "$PYENV_VERSION $*" >> "$PYENV_ROOT/exec.log"
    if [ "$1 $2" = "pip freeze" ]; then printf '# editable\nsix==1.16.0\n\nattrs==23.2.0\n'; fi ;;
esac
)sh";

        class PyenvFixture
        {
        public:

            PyenvFixture()
                : vm(pyenv.string(), tmp.path())
            {
                pvenvtests::write_executable(pyenv, fake_pyenv);
            }

        protected:

            auto exec_log() const -> V
            {
                return read_lines(tmp.path() / "exec.log");
            }

            const pvenvtests::EnvironmentCleaner restore{ pvenvtests::CleanPvenvEnv() };
            TemporaryDirectory tmp;
            fs::path pyenv = tmp.path() / "bin" / "pyenv";
            PyenvVersionManager vm;
        };

        TEST_CASE("pip_install_args")
        {
            PackageInstallRequest request;
            request.specs = { "virtualenv==20.25.0" };
            REQUIRE(pip_install_args(request) == V{ "install", "virtualenv==20.25.0" });

            request.quiet = true;
            request.verbose = true;
            request.requirement_file = "/tmp/requirements.txt";
            request.specs.clear();
            REQUIRE(
                pip_install_args(request)
                == V{ "install", "--quiet", "--verbose", "--requirement", "/tmp/requirements.txt" }
            );
        }

        TEST_CASE_METHOD(PyenvFixture, "PyenvVersionManager queries")
        {
            if (util::which("sh").empty())
            {
                SKIP("sh is not available");
            }

            SECTION("current_version")
            {
                REQUIRE(vm.current_version().error().error_code() == pvenv_error_code::version_not_found);
                util::set_env("FAKE_PYENV_CURRENT", "3.12.1");
                REQUIRE(vm.current_version().value() == "3.12.1");
            }

            SECTION("prefix")
            {
                REQUIRE(vm.prefix("3.12.1").value() == tmp.path() / "versions" / "3.12.1");
                REQUIRE(vm.prefix("2.7.18").error().error_code() == pvenv_error_code::version_not_found);
            }

            SECTION("hooks")
            {
                const auto expected = std::vector<fs::path>{ tmp.path() / "plugins" / "virtualenv.bash" };
                REQUIRE(vm.hooks("virtualenv") == expected);
            }

            SECTION("installed_versions")
            {
                REQUIRE(vm.installed_versions() == V{ "3.11.7", "3.12.1" });
            }

            SECTION("rehash")
            {
                REQUIRE(vm.rehash() == 4);
            }

            SECTION("locate")
            {
                const auto bin_dir = tmp.path() / "versions" / "3.12.1" / "bin";
                pvenvtests::write_executable(bin_dir / "virtualenv");
                REQUIRE(vm.locate("3.12.1", "virtualenv") == bin_dir / "virtualenv");
                REQUIRE(vm.locate("3.12.1", "pyvenv").empty());
                REQUIRE(vm.locate("2.7.18", "virtualenv").empty());
            }
        }

        TEST_CASE_METHOD(PyenvFixture, "PipPackageManager")
        {
            if (util::which("sh").empty())
            {
                SKIP("sh is not available");
            }

            util::set_env("PYENV_VERSION", "system");
            PipPackageManager pm(vm);

            SECTION("freeze")
            {
                REQUIRE(pm.freeze("venv", {}).value() == V{ "six==1.16.0", "attrs==23.2.0" });
                REQUIRE(exec_log() == V{ "venv pip freeze" });
            }

            SECTION("install")
            {
                PackageInstallRequest request;
                request.quiet = true;
                request.requirement_file = "/tmp/requirements.txt";
                REQUIRE(pm.install("venv", request, {}).value() == 0);
                REQUIRE(exec_log() == V{ "venv pip install --quiet --requirement /tmp/requirements.txt" });
            }
        }
    }
}
