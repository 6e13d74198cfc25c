#ifndef MEMTRUST_ERRORS_HPP
#define MEMTRUST_ERRORS_HPP
#pragma once
/*
 * exceptions thrown by memtrust
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

#include <stdexcept>
#include <string>

extern "C" {
    #include <openssl/err.h>
};

namespace memtrust {

// a chain was not trusted. what() is the validation failure reason.
struct cert_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// the persisted trust store couldn't be read or written
struct store_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// drain the OpenSSL error queue into a string (most recent error last)
static inline std::string sslErrors() {
    std::string res{};
    while (auto e = ERR_get_error()) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (! res.empty()) res += "; ";
        res += buf;
    }
    return res.empty()? std::string{"unknown OpenSSL error"} : res;
}

} // namespace memtrust

#endif // MEMTRUST_ERRORS_HPP
