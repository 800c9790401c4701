// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PVENV_FS_FILESYSTEM_HPP
#define PVENV_FS_FILESYSTEM_HPP

#include <filesystem>

namespace pvenv
{
    // pyenv only runs on POSIX systems, native narrow paths are UTF-8 there.
    namespace fs = std::filesystem;
}

#endif
