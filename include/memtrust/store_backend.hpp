#ifndef MEMTRUST_STORE_BACKEND_HPP
#define MEMTRUST_STORE_BACKEND_HPP
#pragma once
/*
 * Persistence for the trust store
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

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <ranges>
#include <string>

extern "C" {
    #include <fcntl.h>
    #include <unistd.h>
};

#include "file_to_string.hpp"
#include "log.hpp"
#include "trust_store.hpp"

namespace memtrust {

namespace fs = std::filesystem;

/*
 * A storeBackend loads and persists a trustStore. load() of a store that
 * doesn't exist yet returns an empty store. Both throw store_error on failure.
 * persist() must leave the previously persisted version intact if it fails.
 */
struct storeBackend {
    virtual trustStore load() = 0;
    virtual void persist(const trustStore&) = 0;
    virtual std::string location() const = 0;
    virtual ~storeBackend() = default;
};

/*
 * Store kept as a PEM bundle file. The new version is written to a temp file
 * in the same directory, fsync'd, then renamed over the old one so a reader
 * (or a crash) only ever sees a complete file.
 */
struct pemFileBackend final : storeBackend {
    fs::path path_;

    explicit pemFileBackend(fs::path path) : path_{std::move(path)} {}

    std::string location() const override { return path_.string(); }

    /*
     * make the rename durable. The new version is already in place so a
     * failure here is only logged: the store in memory has to match the file.
     */
    void syncDir() const {
        auto dir = path_.parent_path();
        if (dir.empty()) dir = ".";
        int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dfd < 0) {
            memtrust::log(L_WARN)("can't open {} to sync it: {}", dir.string(), std::strerror(errno));
            return;
        }
        if (::fsync(dfd) != 0)
            memtrust::log(L_WARN)("fsync failed on {}: {}", dir.string(), std::strerror(errno));
        ::close(dfd);
    }

    trustStore load() override {
        trustStore ts{};
        std::error_code ec;
        auto st = fs::status(path_, ec);
        if (fs::status_known(st) && ! fs::exists(st)) {
            memtrust::log(L_DEBUG)("no trust store at {}, starting empty", path_.string());
            return ts;
        }
        if (ec) throw store_error(format("can't access {}: {}", path_.string(), ec.message()));
        try {
            for (const auto& c : readPemCerts(fileToString(path_))) ts.add(c);
        } catch (const std::runtime_error& e) {
            throw store_error(format("can't load trust store {}: {}", path_.string(), e.what()));
        }
        memtrust::log(L_DEBUG)("loaded {} certs from {}", ts.size(), path_.string());
        return ts;
    }

    void persist(const trustStore& ts) override {
        std::string pem;
        try {
            pem = writePemCerts(ts.certs_ | std::views::values);
        } catch (const std::runtime_error& e) {
            throw store_error(format("can't encode trust store: {}", e.what()));
        }
        std::error_code ec;
        if (auto dir = path_.parent_path(); ! dir.empty()) {
            fs::create_directories(dir, ec);
            if (ec) throw store_error(format("can't create {}: {}", dir.string(), ec.message()));
        }
        auto tmp = path_;
        tmp += format(".{}.tmp", getpid());

        auto fail = [&tmp](std::string_view what, int err) {
            std::error_code rec;
            fs::remove(tmp, rec);
            return store_error(format("{} {}: {}", what, tmp.string(), std::strerror(err)));
        };
        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (fd < 0) throw fail("can't create", errno);
        for (size_t off = 0; off < pem.size(); ) {
            auto n = ::write(fd, pem.data() + off, pem.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                auto err = errno;
                ::close(fd);
                throw fail("write failed on", err);
            }
            off += size_t(n);
        }
        if (::fsync(fd) != 0) {
            auto err = errno;
            ::close(fd);
            throw fail("fsync failed on", err);
        }
        if (::close(fd) != 0) throw fail("close failed on", errno);

        fs::rename(tmp, path_, ec);
        if (ec) throw fail("can't rename", ec.value());
        syncDir();
        memtrust::log(L_DEBUG)("persisted {} certs to {}", ts.size(), path_.string());
    }
};

/*
 * Store kept in memory as PEM text (so it goes through the same codec as the
 * file backend). For tests and for embedders that persist elsewhere.
 * 'failPersist' makes persist() fail without changing what was stored.
 */
struct memoryBackend final : storeBackend {
    mutable std::mutex mtx_{};
    std::string pem_{};
    bool exists_{false};
    std::atomic<bool> failPersist{false};
    std::atomic<size_t> persists{0};

    memoryBackend() = default;
    explicit memoryBackend(std::string pem) : pem_{std::move(pem)}, exists_{true} {}

    std::string location() const override { return "memory"; }

    trustStore load() override {
        std::lock_guard lck(mtx_);
        trustStore ts{};
        if (! exists_) return ts;
        try {
            for (const auto& c : readPemCerts(pem_)) ts.add(c);
        } catch (const std::runtime_error& e) {
            throw store_error(format("can't load memory store: {}", e.what()));
        }
        return ts;
    }

    void persist(const trustStore& ts) override {
        if (failPersist) throw store_error("memory store: persist failed (injected)");
        std::string pem;
        try {
            pem = writePemCerts(ts.certs_ | std::views::values);
        } catch (const std::runtime_error& e) {
            throw store_error(format("can't encode trust store: {}", e.what()));
        }
        std::lock_guard lck(mtx_);
        pem_ = std::move(pem);
        exists_ = true;
        ++persists;
    }

    std::string contents() const {
        std::lock_guard lck(mtx_);
        return pem_;
    }
};

} // namespace memtrust

#endif // MEMTRUST_STORE_BACKEND_HPP
