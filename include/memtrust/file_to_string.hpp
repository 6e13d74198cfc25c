#ifndef MEMTRUST_FILE_TO_STRING_HPP
#define MEMTRUST_FILE_TO_STRING_HPP
#pragma once
/*
 * fileToString - read the contents of a (text) file into a string
 *
 * Copyright (C) 2021-4 Pollere LLC
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2.1 of
 *  the License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with this program; if not, see <https://www.gnu.org/licenses/>.
 *  You may contact Pollere LLC at info@pollere.net.
 */
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include "format.hpp"

namespace memtrust {

// PEM bundles of system roots run to a few hundred KB
static constexpr size_t maxFileSize = 16 * 1024 * 1024;

static inline auto fileToString(const std::filesystem::path& fname) {
    std::ifstream is(fname, std::ios::binary|std::ios::ate);
    if (! is) throw std::runtime_error(format("can't open file {}", fname.string()));
    auto sz = is.tellg();
    if (sz < 0 || size_t(sz) > maxFileSize) {
        throw std::runtime_error(format("{} file size unreasonable ({} bytes)", fname.string(), int64_t(sz)));
    }
    is.seekg(0);
    std::string buf(size_t(sz), '\0');
    if (! is.read(buf.data(), buf.size())) {
        throw std::runtime_error(format("couldn't read file {}", fname.string()));
    }
    return buf;
}

} // namespace memtrust

#endif // MEMTRUST_FILE_TO_STRING_HPP
