#ifndef MEMTRUST_CONSOLE_PROMPTER_HPP
#define MEMTRUST_CONSOLE_PROMPTER_HPP
#pragma once
/*
 * consolePrompter - ask about a decisionRequest on a terminal
 *
 * Copyright (C) 2024 Pollere LLC
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

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "posted_surface.hpp"

namespace memtrust {

// map a typed answer to a decision. Only an explicit 'always' or 'once'
// (or their first letter) allows the connection.
static inline decision parseChoice(std::string_view answer) {
    std::string a{};
    for (auto ch : answer) if (! std::isspace(static_cast<unsigned char>(ch))) a += char(std::tolower(ch));
    for (const auto& [d, label] : choices) {
        std::string l{label};
        std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c){ return char(std::tolower(c)); });
        if (d != decision::abort && ! a.empty() && (a == l || a == l.substr(0, 1))) return d;
    }
    return decision::abort;
}

// A prompter for postedSurface. Runs on the surface's loop so one question
// is asked at a time. End of input answers 'abort'.
static inline prompter consolePrompter(std::istream& in, std::ostream& out) {
    return [&in, &out](requestPtr req, decisionCb cb) {
        out << "\n" << decisionRequest::title << " (" << to_string(req->use) << " certificate)\n\n"
            << req->message() << "\n\n";
        for (const auto& [d, label] : choices) out << "[" << label[0] << "]" << label.substr(1) << "  ";
        out << "? " << std::flush;

        std::string line{};
        if (! std::getline(in, line)) line.clear();
        cb(parseChoice(line));
    };
}

} // namespace memtrust

#endif // MEMTRUST_CONSOLE_PROMPTER_HPP
