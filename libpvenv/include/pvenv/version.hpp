// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBPVENV_VERSION_HPP
#define LIBPVENV_VERSION_HPP

#include <string>

#define LIBPVENV_VERSION_MAJOR 1
#define LIBPVENV_VERSION_MINOR 2
#define LIBPVENV_VERSION_PATCH 0

#define LIBPVENV_VERSION_STRING "1.2.0"
#define LIBPVENV_VERSION                                                                           \
    (LIBPVENV_VERSION_MAJOR * 10000 + LIBPVENV_VERSION_MINOR * 100 + LIBPVENV_VERSION_PATCH)

namespace pvenv
{
    std::string version();
}

#endif
