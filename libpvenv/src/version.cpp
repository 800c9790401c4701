// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pvenv/version.hpp"

namespace pvenv
{
    std::string version()
    {
        return LIBPVENV_VERSION_STRING;
    }
}
