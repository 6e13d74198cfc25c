#ifndef MEMTRUST_TST_UTIL_HPP
#define MEMTRUST_TST_UTIL_HPP
#pragma once
/*
 * helpers for the tst_* programs: in-memory test certs, a surface event
 * loop and result reporting.
 *
 * Copyright (C) 2024 Pollere LLC
 *
 *  This program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License along
 *  with this program; if not, see <https://www.gnu.org/licenses/>.
 *  You may contact Pollere LLC at info@pollere.net.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

extern "C" {
    #include <openssl/evp.h>
    #include <openssl/x509v3.h>
    #include <unistd.h>
};

#include "memtrust/format.hpp"
#include "memtrust/posted_surface.hpp"

using namespace memtrust;
using namespace std::literals;

static int failures{};

static inline void check(bool ok, std::string_view what, std::source_location src = std::source_location::current()) {
    if (ok) print("  ok   {}\n", what);
    else {
        print("  FAIL {} (line {})\n", what, src.line());
        ++failures;
    }
}

static inline int done(std::string_view name) {
    if (failures) print("{}: {} check(s) failed\n", name, failures);
    else print("{}: all checks passed\n", name);
    return failures? 1 : 0;
}

// a fresh directory for this test program's files
static inline std::filesystem::path tmpDir(std::string_view name) {
    auto d = std::filesystem::temp_directory_path() / format("memtrust-{}-{}", name, getpid());
    std::filesystem::remove_all(d);
    std::filesystem::create_directories(d);
    return d;
}

/*
 * test certs: EC P-256 keys, 'ca' certs are CAs. A cert without an issuer
 * is self-signed. 'lifetime' is seconds from now to notAfter, negative for
 * a cert that has already expired.
 */
struct testCert {
    x509Cert cert;
    std::shared_ptr<EVP_PKEY> key;

    std::string subject() const { return cert.subject(); }
};

static inline void addExt(X509* x, X509* issuer, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, x, nullptr, nullptr, 0);
    auto ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (! ext) throw std::runtime_error(format("X509V3_EXT_conf_nid: {}", sslErrors()));
    X509_add_ext(x, ext, -1);
    X509_EXTENSION_free(ext);
}

static inline testCert mkCert(std::string_view cn, const testCert* issuer = nullptr, bool ca = false,
                              long lifetime = 365L * 86400L) {
    static std::atomic<long> serial{1};

    std::shared_ptr<EVP_PKEY> key{EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"), EVP_PKEY_free};
    if (! key) throw std::runtime_error(format("keygen: {}", sslErrors()));

    auto x = X509_new();
    if (! x) throw std::runtime_error(format("X509_new: {}", sslErrors()));
    x509Cert cert{x};   // owns x from here on
    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), serial++);
    X509_gmtime_adj(X509_getm_notBefore(x), lifetime > 0? -3600L : lifetime - 86400L);
    X509_gmtime_adj(X509_getm_notAfter(x), lifetime);
    X509_set_pubkey(x, key.get());

    auto name = X509_get_subject_name(x);
    std::string cns{cn};
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, (const unsigned char*)"memtrust test", -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, (const unsigned char*)cns.c_str(), -1, -1, 0);

    auto issuerX = issuer? issuer->cert.get() : x;
    X509_set_issuer_name(x, X509_get_subject_name(issuerX));
    if (ca) {
        addExt(x, issuerX, NID_basic_constraints, "critical,CA:TRUE");
        addExt(x, issuerX, NID_key_usage, "critical,keyCertSign,cRLSign");
    } else {
        addExt(x, issuerX, NID_basic_constraints, "CA:FALSE");
        addExt(x, issuerX, NID_key_usage, "critical,digitalSignature");
        addExt(x, issuerX, NID_ext_key_usage, "serverAuth,clientAuth");
    }
    if (X509_sign(x, issuer? issuer->key.get() : key.get(), EVP_sha256()) <= 0)
        throw std::runtime_error(format("X509_sign: {}", sslErrors()));
    return {std::move(cert), std::move(key)};
}

/*
 * The decision surface's side: an io_context run on its own thread.
 */
struct surfaceLoop {
    boost::asio::io_context ioc{};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work{ioc.get_executor()};
    std::thread thr{[this]{ ioc.run(); }};

    surfaceLoop() = default;
    ~surfaceLoop() {
        work.reset();
        ioc.stop();
        thr.join();
    }
    auto surface(prompter p) { return std::make_shared<postedSurface>(ioc.get_executor(), std::move(p)); }
};

// prompter that always gives the same answer
struct answering {
    decision answer;
    std::atomic<int> asked{0};

    explicit answering(decision d) : answer{d} {}
    prompter fn() { return [this](requestPtr, decisionCb cb) { ++asked; cb(answer); }; }
};

// prompter that holds requests until the test answers them
struct holding {
    std::mutex mtx{};
    std::condition_variable cv{};
    std::vector<std::pair<requestPtr,decisionCb>> pending{};

    prompter fn() {
        return [this](requestPtr r, decisionCb cb) {
            {
                std::lock_guard lck(mtx);
                pending.emplace_back(std::move(r), std::move(cb));
            }
            cv.notify_all();
        };
    }
    // wait (up to 5s) until 'n' requests have been presented
    bool waitFor(size_t n) {
        std::unique_lock lck(mtx);
        return cv.wait_for(lck, 5s, [this, n]{ return pending.size() >= n; });
    }
    // answer the request whose leaf is 'subject'
    bool answer(const std::string& subject, decision d) {
        decisionCb cb{};
        {
            std::lock_guard lck(mtx);
            for (auto& [r, c] : pending) if (r->chain.front().subject() == subject && c) cb = std::exchange(c, nullptr);
        }
        if (! cb) return false;
        cb(d);
        return true;
    }
};

#endif // MEMTRUST_TST_UTIL_HPP
