#ifndef MEMTRUST_CONFIG_HPP
#define MEMTRUST_CONFIG_HPP
#pragma once
/*
 * trustConfig - where memtrust keeps its state and what it trusts by default
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

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

extern "C" {
    #include <openssl/x509.h>
};

#include "errors.hpp"
#include "format.hpp"

namespace memtrust {

namespace fs = std::filesystem;

static constexpr std::string_view defaultStoreDir{"KeyStore"};
static constexpr std::string_view defaultStoreFile{"KeyStore.pem"};

// base directory for per-user data: $XDG_DATA_HOME, $HOME/.local/share or cwd
static inline fs::path dataHome() {
    if (auto xdg = getenv("XDG_DATA_HOME"); xdg && *xdg) return fs::path{xdg};
    if (auto home = getenv("HOME"); home && *home) return fs::path{home} / ".local" / "share";
    return fs::current_path();
}

struct trustConfig {
    fs::path storeLocation{};       // persisted trust store (PEM bundle)
    fs::path caFile{};              // platform root certs (PEM bundle)
    std::optional<std::chrono::milliseconds> decisionTimeout{}; // unset: wait until resolved or interrupted

    // defaults, overridable with MEMTRUST_STORE and MEMTRUST_CA_FILE
    static trustConfig fromEnv() {
        trustConfig c{};
        if (auto ep = getenv("MEMTRUST_STORE"); ep && *ep) c.storeLocation = ep;
        else c.storeLocation = dataHome() / "memtrust" / defaultStoreDir / defaultStoreFile;

        if (auto ep = getenv("MEMTRUST_CA_FILE"); ep && *ep) c.caFile = ep;
        else c.caFile = X509_get_default_cert_file();
        return c;
    }

    // set the store to 'file' in directory 'dir'
    trustConfig& setKeyStoreFile(const fs::path& dir, std::string_view file) {
        storeLocation = dir / file;
        return *this;
    }

    const trustConfig& check() const {
        if (storeLocation.empty()) throw config_error("trust store location not set");
        if (storeLocation.filename().empty()) throw config_error(format("trust store location {} is a directory",
                                                                        storeLocation.string()));
        if (decisionTimeout && decisionTimeout->count() <= 0) throw config_error("decision timeout must be positive");
        return *this;
    }
};

} // namespace memtrust

#endif // MEMTRUST_CONFIG_HPP
