#ifndef MEMTRUST_FORMAT_HPP
#define MEMTRUST_FORMAT_HPP
#pragma once
/*
 * Copyright (C) 2020-4 Pollere LLC
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

// defining MEMTRUST_USE_STD_FORMAT will attempt to use the c++ standard library
// 'format' routines instead of the github.com/fmtlib/fmt equivalents.
#if MEMTRUST_USE_STD_FORMAT
#include <format>
#include <iostream>

namespace memtrust {
    using std::format;
    using std::format_to;
    using std::formatter;

template <typename... T>
inline void print(std::format_string<T...> fmt, T&&... args) {
    std::cout << format(fmt, std::forward<T>(args)...);
}

} // namespace memtrust
#else

// Download fmt from https://fmt.dev/latest/index.html or https://github.com/fmtlib/fmt

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include "fmt/format.h"
#include "fmt/ostream.h"
#include "fmt/ranges.h"
#include "fmt/chrono.h"

namespace memtrust {
    using fmt::format;
    using fmt::format_to;
    using fmt::formatter;
    using fmt::print;
} // namespace memtrust

#endif

#endif //MEMTRUST_FORMAT_HPP
