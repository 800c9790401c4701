// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pvenv/core/backend.hpp"
#include "pvenv/core/util.hpp"

#include "pvenvtests.hpp"

using namespace pvenv;

namespace
{
    using V = std::vector<std::string>;

    TEST_CASE("select_backend")
    {
        BackendProbe probe;

        SECTION("Neither tool present")
        {
            REQUIRE(select_backend(probe) == BackendKind::virtualenv);
        }

        SECTION("Only virtualenv")
        {
            probe.virtualenv_present = true;
            REQUIRE(select_backend(probe) == BackendKind::virtualenv);
        }

        SECTION("Both tools")
        {
            probe.virtualenv_present = true;
            probe.pyvenv_present = true;
            REQUIRE(select_backend(probe) == BackendKind::virtualenv);
        }

        SECTION("Only pyvenv")
        {
            probe.pyvenv_present = true;
            REQUIRE(select_backend(probe) == BackendKind::pyvenv);
        }
    }

    TEST_CASE("probe_backends")
    {
        TemporaryDirectory tmp;
        pvenvtests::StubVersionManager vm(tmp.path());
        vm.add_version("3.12.1");

        SECTION("Empty prefix")
        {
            const auto probe = probe_backends(vm, "3.12.1");
            REQUIRE_FALSE(probe.present(BackendKind::virtualenv));
            REQUIRE_FALSE(probe.present(BackendKind::pyvenv));
        }

        SECTION("Executables in the prefix")
        {
            vm.add_executable("3.12.1", "pyvenv");
            const auto probe = probe_backends(vm, "3.12.1");
            REQUIRE_FALSE(probe.virtualenv_present);
            REQUIRE(probe.pyvenv_present);
        }

        SECTION("Non executable files are ignored")
        {
            pvenvtests::write_file(tmp.path() / "3.12.1" / "bin" / "virtualenv", "");
            REQUIRE_FALSE(probe_backends(vm, "3.12.1").virtualenv_present);
        }

        SECTION("Unknown version")
        {
            const auto probe = probe_backends(vm, "2.7.18");
            REQUIRE_FALSE(probe.virtualenv_present);
            REQUIRE_FALSE(probe.pyvenv_present);
        }
    }

    TEST_CASE("install_backend")
    {
        const auto& ctx = pvenvtests::context();
        pvenvtests::StubPackageManager pm;

        SECTION("Latest version")
        {
            const auto status = install_backend(pm, "3.12.1", "", false, true, {});
            REQUIRE(status.has_value());
            REQUIRE(status.value() == 0);
            REQUIRE(pm.installs.size() == 1);
            REQUIRE(pm.installs[0].first == "3.12.1");
            REQUIRE(pm.installs[0].second.specs == V{ "virtualenv" });
            REQUIRE(pm.installs[0].second.verbose);
            REQUIRE_FALSE(pm.installs[0].second.quiet);
        }

        SECTION("Pinned version")
        {
            REQUIRE(install_backend(pm, "3.12.1", "20.25.0", true, false, {}).value() == 0);
            REQUIRE(pm.installs[0].second.specs == V{ "virtualenv==20.25.0" });
            REQUIRE(pm.installs[0].second.quiet);
        }

        SECTION("Installer failure")
        {
            pm.install_status = 2;
            REQUIRE(install_backend(pm, "3.12.1", ctx.backend_params.virtualenv_version, false, false, {})
                        .value()
                    == 2);
        }
    }

    TEST_CASE("VirtualenvBackend")
    {
        TemporaryDirectory tmp;
        pvenvtests::StubVersionManager vm(tmp.path());
        vm.add_version("3.12.1");

        auto backend = make_backend(BackendKind::virtualenv, vm);
        REQUIRE(backend->kind() == BackendKind::virtualenv);
        REQUIRE(backend->name() == "virtualenv");
        REQUIRE(backend->supports_option("quiet"));
        REQUIRE(backend->supports_option("verbose"));
        REQUIRE_FALSE(backend->supports_option("upgrade"));

        BackendRequest request;
        request.version = "3.12.1";
        request.options = { "--clear", "--quiet" };
        request.target = tmp.path() / "venv";

        REQUIRE(backend->create(request).value() == 0);
        REQUIRE(vm.executed.size() == 1);
        REQUIRE(vm.executed[0].first == "3.12.1");
        REQUIRE(vm.executed[0].second == V{ "virtualenv", "--clear", "--quiet", request.target.string() });
    }

    TEST_CASE("PyvenvBackend")
    {
        TemporaryDirectory tmp;
        pvenvtests::StubVersionManager vm(tmp.path());
        vm.add_version("3.12.1");

        auto backend = make_backend(BackendKind::pyvenv, vm);
        REQUIRE(backend->kind() == BackendKind::pyvenv);
        REQUIRE(backend->supports_option("upgrade"));
        REQUIRE_FALSE(backend->supports_option("quiet"));

        BackendRequest request;
        request.version = "3.12.1";
        request.target = tmp.path() / "venv";

        REQUIRE(backend->create(request).value() == 0);
        REQUIRE(vm.executed.at(0).second == V{ "pyvenv", request.target.string() });

        SECTION("pip already present")
        {
            pvenvtests::write_executable(request.target / "bin" / "pip");
            REQUIRE(backend->finalize(request).value() == 0);
        }

        SECTION("pip bootstrapped with ensurepip")
        {
            pvenvtests::write_executable(
                request.target / "bin" / "python",
                "#!/bin/sh\n"
                "[ \"$1 $2\" = \"-m ensurepip\" ] || exit 3\n"
                "touch \"$(dirname \"$0\")/pip\"\n"
            );
            REQUIRE(backend->finalize(request).value() == 0);
            REQUIRE(fs::exists(request.target / "bin" / "pip"));
        }
    }
}
