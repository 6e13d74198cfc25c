#ifndef MEMTRUST_SSL_VERIFY_HPP
#define MEMTRUST_SSL_VERIFY_HPP
#pragma once
/*
 * installVerifier - make a trustManager decide which peer chains an
 * OpenSSL SSL_CTX accepts.
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
 * The callback replaces OpenSSL's own chain verification so it runs inside
 * SSL_connect/SSL_accept (or SSL_do_handshake) and may block there waiting
 * for a decision. Handshakes using the context have to be done on threads
 * that can wait, never on the thread running the decision surface.
 *
 * A server verifies its clients (purpose clientAuth), a client verifies its
 * server (purpose serverAuth).
 */

extern "C" {
    #include <openssl/ssl.h>
    #include <openssl/x509_vfy.h>
};

#include "log.hpp"
#include "trust_manager.hpp"

namespace memtrust {

// the peer's chain (leaf first) being verified by 'ctx'
static inline certChain peerChain(X509_STORE_CTX* ctx) {
    certChain chain{};
    auto leaf = X509_STORE_CTX_get0_cert(ctx);
    if (! leaf) return chain;
    chain.emplace_back(x509Cert::ref(leaf));
    // the untrusted stack normally holds the whole peer chain including the leaf
    if (auto sk = X509_STORE_CTX_get0_untrusted(ctx); sk) {
        for (int i = 0, n = sk_X509_num(sk); i < n; ++i) {
            auto c = sk_X509_value(sk, i);
            if (c != leaf && X509_cmp(c, leaf) != 0) chain.emplace_back(x509Cert::ref(c));
        }
    }
    return chain;
}

// verification purpose for 'ctx': clientAuth if it's a server's handshake
static inline purpose peerPurpose(X509_STORE_CTX* ctx) {
    auto ssl = static_cast<SSL*>(X509_STORE_CTX_get_ex_data(ctx, SSL_get_ex_data_X509_STORE_CTX_idx()));
    return (ssl && SSL_is_server(ssl))? purpose::clientAuth : purpose::serverAuth;
}

// SSL_CTX_set_cert_verify_callback callback. 'arg' is the trustManager.
static inline int verifyPeer(X509_STORE_CTX* ctx, void* arg) {
    auto& tm = *static_cast<trustManager*>(arg);
    try {
        auto chain = peerChain(ctx);
        if (chain.empty()) {
            memtrust::log(L_WARN)("peer presented no certificate");
            X509_STORE_CTX_set_error(ctx, X509_V_ERR_UNSPECIFIED);
            return 0;
        }
        tm.checkTrusted(chain, peerPurpose(ctx));
        X509_STORE_CTX_set_error(ctx, X509_V_OK);
        return 1;
    } catch (const cert_error& e) {
        memtrust::log(L_INFO)("peer chain rejected: {}", e.what());
    } catch (const std::exception& e) {
        memtrust::log(L_ERROR)("peer chain verification failed: {}", e.what());
    }
    X509_STORE_CTX_set_error(ctx, X509_V_ERR_CERT_REJECTED);
    return 0;
}

// 'tm' must outlive 'ctx' (and every SSL made from it)
static inline void installVerifier(SSL_CTX* ctx, trustManager& tm) {
    SSL_CTX_set_cert_verify_callback(ctx, verifyPeer, &tm);
    SSL_CTX_set_verify(ctx, SSL_CTX_get_verify_mode(ctx) | SSL_VERIFY_PEER, SSL_CTX_get_verify_callback(ctx));
}

} // namespace memtrust

#endif // MEMTRUST_SSL_VERIFY_HPP
