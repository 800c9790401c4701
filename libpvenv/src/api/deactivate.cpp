// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pvenv/api/configuration.hpp"
#include "pvenv/api/deactivate.hpp"
#include "pvenv/core/deactivation.hpp"
#include "pvenv/core/logging.hpp"
#include "pvenv/core/output.hpp"
#include "pvenv/util/environment.hpp"

namespace pvenv
{
    void deactivate(Configuration& config, const std::optional<std::string>& shell)
    {
        config.load();

        const auto shell_name = guess_shell(shell, util::get_env_map());
        LOG_DEBUG << "Deactivation code for shell '" << shell_name << "'";

        auto deactivator = make_deactivator(shell_name);
        Console::instance().print(deactivator->script(), true);
    }
}
