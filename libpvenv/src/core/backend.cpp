// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "pvenv/core/backend.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/package_manager.hpp"
#include "pvenv/core/version_manager.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    namespace
    {
        auto run_tool(
            const VersionManager& version_manager,
            BackendKind kind,
            const BackendRequest& request
        ) -> expected_t<int>
        {
            command_args args = { name_of(kind) };
            args.insert(args.end(), request.options.begin(), request.options.end());
            args.push_back(request.target.string());

            auto result = version_manager.exec(request.version, args, request.run_options);
            if (!result)
            {
                return forward_error(result);
            }
            return result->status;
        }
    }

    auto Backend::finalize(const BackendRequest& /*request*/) -> expected_t<int>
    {
        return 0;
    }

    auto Backend::name() const -> std::string
    {
        return name_of(kind());
    }

    /*********************
     * VirtualenvBackend *
     *********************/

    VirtualenvBackend::VirtualenvBackend(const VersionManager& version_manager)
        : m_version_manager(version_manager)
    {
    }

    auto VirtualenvBackend::kind() const -> BackendKind
    {
        return BackendKind::virtualenv;
    }

    auto VirtualenvBackend::supports_option(std::string_view flag) const -> bool
    {
        return flag == "quiet" || flag == "verbose";
    }

    auto VirtualenvBackend::create(const BackendRequest& request) -> expected_t<int>
    {
        return run_tool(m_version_manager, kind(), request);
    }

    /*****************
     * PyvenvBackend *
     *****************/

    PyvenvBackend::PyvenvBackend(const VersionManager& version_manager)
        : m_version_manager(version_manager)
    {
    }

    auto PyvenvBackend::kind() const -> BackendKind
    {
        return BackendKind::pyvenv;
    }

    auto PyvenvBackend::supports_option(std::string_view flag) const -> bool
    {
        return flag == "upgrade";
    }

    auto PyvenvBackend::create(const BackendRequest& request) -> expected_t<int>
    {
        return run_tool(m_version_manager, kind(), request);
    }

    auto PyvenvBackend::finalize(const BackendRequest& request) -> expected_t<int>
    {
        const auto bin_dir = request.target / "bin";
        if (!util::which_in("pip", bin_dir).empty())
        {
            return 0;
        }

        LOG_INFO << fmt::format("Installing pip in '{}' with ensurepip", request.target.string());
        auto options = request.run_options;
        options.working_directory.reset();
        auto result = run_command(
            { (bin_dir / "python").string(), "-m", "ensurepip" },
            options
        );
        if (!result)
        {
            return forward_error(result);
        }
        return result->status;
    }

    /*************
     * Detection *
     *************/

    auto BackendProbe::present(BackendKind kind) const -> bool
    {
        return (kind == BackendKind::pyvenv) ? pyvenv_present : virtualenv_present;
    }

    auto probe_backends(const VersionManager& version_manager, const std::string& version)
        -> BackendProbe
    {
        BackendProbe probe;
        probe.virtualenv_present = !version_manager.locate(version, name_of(BackendKind::virtualenv))
                                        .empty();
        probe.pyvenv_present = !version_manager.locate(version, name_of(BackendKind::pyvenv)).empty();
        LOG_DEBUG << fmt::format(
            "Backends of '{}': virtualenv {}, pyvenv {}",
            version,
            probe.virtualenv_present ? "found" : "missing",
            probe.pyvenv_present ? "found" : "missing"
        );
        return probe;
    }

    auto select_backend(const BackendProbe& probe) -> BackendKind
    {
        if (probe.pyvenv_present && !probe.virtualenv_present)
        {
            return BackendKind::pyvenv;
        }
        return BackendKind::virtualenv;
    }

    auto make_backend(BackendKind kind, const VersionManager& version_manager)
        -> std::unique_ptr<Backend>
    {
        switch (kind)
        {
            case BackendKind::pyvenv:
                return std::make_unique<PyvenvBackend>(version_manager);
            case BackendKind::virtualenv:
            default:
                return std::make_unique<VirtualenvBackend>(version_manager);
        }
    }

    auto install_backend(
        PackageManager& package_manager,
        const std::string& version,
        const std::string& pin,
        bool quiet,
        bool verbose,
        const RunOptions& options
    ) -> expected_t<int>
    {
        PackageInstallRequest request;
        request.specs.push_back(
            pin.empty() ? std::string("virtualenv") : fmt::format("virtualenv=={}", pin)
        );
        request.quiet = quiet;
        request.verbose = verbose;

        LOG_INFO << fmt::format("Installing '{}' in '{}'", request.specs.front(), version);
        return package_manager.install(version, request, options);
    }
}
