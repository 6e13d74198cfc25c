#ifndef MEMTRUST_CERT_HPP
#define MEMTRUST_CERT_HPP
#pragma once
/*
 * X.509 certificate handle and PEM bundle codec
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

/*
 * An x509Cert is a shared, immutable reference to an OpenSSL X509. Copies
 * are cheap and refer to the same certificate so a peer's chain can be
 * handed to other threads (e.g., the thread presenting a decision) without
 * copying the DER.
 *
 * A cert's store 'identity' is its subject DN in RFC 2253 form. Distinct
 * certs can have the same identity (e.g., a re-issued server cert) in which
 * case the trust store keeps the most recently accepted one.
 *
 * A cert's 'thumbprint' is the SHA256 hash of its DER encoding. It's only
 * used to show a person which cert they're deciding about.
 */

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
    #include <sodium.h>
    #include <openssl/bio.h>
    #include <openssl/pem.h>
    #include <openssl/x509.h>
};

#include "errors.hpp"
#include "format.hpp"

namespace memtrust {

using thumbPrint = std::array<uint8_t, crypto_hash_sha256_BYTES>;

namespace detail {
    using bioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

    static inline auto memBio() {
        bioPtr b{BIO_new(BIO_s_mem()), BIO_free};
        if (! b) throw std::runtime_error(format("BIO_new: {}", sslErrors()));
        return b;
    }
    static inline std::string bioString(BIO* b) {
        char* d{};
        auto n = BIO_get_mem_data(b, &d);
        return n > 0? std::string(d, size_t(n)) : std::string{};
    }
    static inline void sodiumInit() {
        static const bool ok = sodium_init() >= 0;
        if (! ok) throw std::runtime_error("libsodium initialization failed");
    }
} // namespace detail

class x509Cert {
    std::shared_ptr<X509> x_{};

  public:
    x509Cert() = default;

    // takes ownership of 'x'
    explicit x509Cert(X509* x) : x_{x, X509_free} {
        if (! x) throw std::invalid_argument("x509Cert: null certificate");
    }

    // shares 'x' with its current owner (e.g., an X509_STORE_CTX)
    static x509Cert ref(X509* x) {
        if (! x) throw std::invalid_argument("x509Cert: null certificate");
        X509_up_ref(x);
        return x509Cert{x};
    }

    X509* get() const noexcept { return x_.get(); }
    explicit operator bool() const noexcept { return x_ != nullptr; }

    bool operator==(const x509Cert& o) const {
        if (x_ == o.x_) return true;
        if (! x_ || ! o.x_) return false;
        return X509_cmp(x_.get(), o.x_.get()) == 0;
    }

    static std::string nameString(const X509_NAME* n) {
        auto b = detail::memBio();
        if (X509_NAME_print_ex(b.get(), n, 0, XN_FLAG_RFC2253) < 0)
            throw std::runtime_error(format("X509_NAME_print_ex: {}", sslErrors()));
        return detail::bioString(b.get());
    }

    // the store identity of this cert
    std::string subject() const { return nameString(X509_get_subject_name(x_.get())); }
    std::string issuer() const { return nameString(X509_get_issuer_name(x_.get())); }

    std::string notAfter() const {
        auto b = detail::memBio();
        ASN1_TIME_print(b.get(), X509_get0_notAfter(x_.get()));
        return detail::bioString(b.get());
    }

    std::vector<uint8_t> der() const {
        auto n = i2d_X509(x_.get(), nullptr);
        if (n <= 0) throw std::runtime_error(format("i2d_X509: {}", sslErrors()));
        std::vector<uint8_t> v(static_cast<size_t>(n));
        auto p = v.data();
        i2d_X509(x_.get(), &p);
        return v;
    }

    std::string pem() const {
        auto b = detail::memBio();
        if (PEM_write_bio_X509(b.get(), x_.get()) != 1)
            throw std::runtime_error(format("PEM_write_bio_X509: {}", sslErrors()));
        return detail::bioString(b.get());
    }

    thumbPrint thumbprint() const {
        detail::sodiumInit();
        auto d = der();
        thumbPrint tp{};
        crypto_hash_sha256(tp.data(), d.data(), d.size());
        return tp;
    }

    std::string thumbprintHex() const {
        auto tp = thumbprint();
        std::string hex(tp.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), tp.data(), tp.size());
        hex.pop_back();
        return hex;
    }
};

// ordered sequence of certs as presented by a peer, leaf first
using certChain = std::vector<x509Cert>;
using anchorSet = std::vector<x509Cert>;

// parse all the certs in a PEM bundle. Text outside BEGIN/END blocks is ignored.
static inline std::vector<x509Cert> readPemCerts(std::string_view pem) {
    std::vector<x509Cert> res{};
    if (pem.empty()) return res;
    detail::bioPtr b{BIO_new_mem_buf(pem.data(), int(pem.size())), BIO_free};
    if (! b) throw std::runtime_error(format("BIO_new_mem_buf: {}", sslErrors()));
    ERR_clear_error();
    while (auto x = PEM_read_bio_X509(b.get(), nullptr, nullptr, nullptr)) res.emplace_back(x);

    // reading stops with a 'no start line' error at the end of the input. Anything else is real.
    auto e = ERR_peek_last_error();
    if (e && !(ERR_GET_LIB(e) == ERR_LIB_PEM && ERR_GET_REASON(e) == PEM_R_NO_START_LINE))
        throw std::runtime_error(format("bad PEM certificate: {}", sslErrors()));
    ERR_clear_error();
    return res;
}

template<typename Certs>
static inline std::string writePemCerts(const Certs& certs) {
    std::string res{};
    for (const x509Cert& c : certs) res += c.pem();
    return res;
}

} // namespace memtrust

#endif // MEMTRUST_CERT_HPP
