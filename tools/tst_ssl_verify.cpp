/*
 * tst_ssl_verify - the OpenSSL verify callback adapter
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
#include "memtrust/ssl_verify.hpp"
#include "tst_util.hpp"

// run verifyPeer the way libssl would for a peer that sent 'chain'
static std::pair<int,int> verify(trustManager& tm, const certChain& chain) {
    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store{X509_STORE_new(), X509_STORE_free};
    std::unique_ptr<STACK_OF(X509), void(*)(STACK_OF(X509)*)> sk{sk_X509_new_null(), [](STACK_OF(X509)* s){ sk_X509_free(s); }};
    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx{X509_STORE_CTX_new(), X509_STORE_CTX_free};
    for (const auto& c : chain) sk_X509_push(sk.get(), c.get());
    X509_STORE_CTX_init(ctx.get(), store.get(), chain.front().get(), sk.get());
    auto r = verifyPeer(ctx.get(), &tm);
    return {r, X509_STORE_CTX_get_error(ctx.get())};
}

int main() {
    try {
        auto root = mkCert("Verify Root CA", nullptr, true);
        auto leaf = mkCert("leaf.verify.example", &root);
        auto rogue = mkCert("rogue.verify.example");
        auto platform = std::make_shared<const opensslValidator>(anchorSet{root.cert});

        print("peerChain:\n");
        {
            std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store{X509_STORE_new(), X509_STORE_free};
            std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx{X509_STORE_CTX_new(), X509_STORE_CTX_free};
            auto sk = sk_X509_new_null();
            sk_X509_push(sk, leaf.cert.get());
            sk_X509_push(sk, root.cert.get());
            X509_STORE_CTX_init(ctx.get(), store.get(), leaf.cert.get(), sk);
            auto chain = peerChain(ctx.get());
            check(chain.size() == 2 && chain[0] == leaf.cert && chain[1] == root.cert, "leaf first, leaf not repeated");
            check(peerPurpose(ctx.get()) == purpose::serverAuth, "no SSL: verifying a server");
            X509_STORE_CTX_cleanup(ctx.get());
            sk_X509_free(sk);
        }

        print("verifyPeer:\n");
        answering abortAns{decision::abort};
        answering onceAns{decision::allowOnce};
        surfaceLoop loop{};
        trustManager tmAbort{trustConfig{}, platform, std::make_unique<memoryBackend>(), loop.surface(abortAns.fn())};
        trustManager tmOnce{trustConfig{}, platform, std::make_unique<memoryBackend>(), loop.surface(onceAns.fn())};

        auto [r1, e1] = verify(tmAbort, {leaf.cert, root.cert});
        check(r1 == 1 && e1 == X509_V_OK && abortAns.asked == 0, "platform chain accepted without asking");
        auto [r2, e2] = verify(tmAbort, {rogue.cert});
        check(r2 == 0 && e2 == X509_V_ERR_CERT_REJECTED && abortAns.asked == 1, "aborted chain rejected");
        auto [r3, e3] = verify(tmOnce, {rogue.cert});
        check(r3 == 1 && e3 == X509_V_OK && onceAns.asked == 1, "chain allowed once accepted");

        print("installVerifier:\n");
        std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> sctx{SSL_CTX_new(TLS_client_method()), SSL_CTX_free};
        check(sctx != nullptr, "SSL_CTX created");
        installVerifier(sctx.get(), tmOnce);
        check((SSL_CTX_get_verify_mode(sctx.get()) & SSL_VERIFY_PEER) != 0, "peer verification enabled");
    } catch (const std::runtime_error& e) {
        check(false, format("unexpected exception: {}", e.what()));
    }
    return done("tst_ssl_verify");
}
