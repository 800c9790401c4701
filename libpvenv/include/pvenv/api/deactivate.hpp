// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_API_DEACTIVATE_HPP
#define PVENV_API_DEACTIVATE_HPP

#include <optional>
#include <string>

namespace pvenv
{
    class Configuration;

    /**
     * Print the shell code deactivating the current environment.
     *
     * @param shell Shell to emit code for, guessed from the environment if not set.
     */
    void deactivate(Configuration& config, const std::optional<std::string>& shell);
}

#endif
