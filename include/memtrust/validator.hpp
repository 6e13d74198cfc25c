#ifndef MEMTRUST_VALIDATOR_HPP
#define MEMTRUST_VALIDATOR_HPP
#pragma once
/*
 * Chain validation: the validation capability interface, its OpenSSL
 * implementation and the anchor-bound chainValidator used by trustManager.
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
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

extern "C" {
    #include <openssl/x509.h>
    #include <openssl/x509_vfy.h>
    #include <openssl/x509v3.h>
};

#include "cert.hpp"
#include "file_to_string.hpp"
#include "log.hpp"
#include "trust_store.hpp"

namespace memtrust {

// what the peer's chain will be used for
enum class purpose { clientAuth, serverAuth };

static constexpr std::string_view to_string(purpose p) noexcept {
    return p == purpose::clientAuth? "client" : "server";
}

// outcome of validating a chain: trusted or rejected with a reason
class validation {
    std::string reason_{};
    bool trusted_{false};

    validation(bool t, std::string r) : reason_{std::move(r)}, trusted_{t} {}
  public:
    static validation trusted() { return {true, {}}; }
    static validation rejected(std::string reason) { return {false, std::move(reason)}; }

    constexpr bool isTrusted() const noexcept { return trusted_; }
    explicit constexpr operator bool() const noexcept { return trusted_; }
    const std::string& reason() const noexcept { return reason_; }
};

/*
 * The X.509 path validation algorithm. validate() checks 'chain' (leaf
 * first) for use 'p' trusting exactly the certs in 'anchors'.
 * platformAnchors() are the roots the platform trusts by default.
 * Must be safe to call from multiple threads.
 */
struct validationCapability {
    virtual validation validate(const certChain& chain, purpose p, const anchorSet& anchors) const = 0;
    virtual anchorSet platformAnchors() const = 0;
    virtual ~validationCapability() = default;
};

/*
 * validationCapability using OpenSSL's X509_verify_cert. Any anchor can
 * terminate a chain (partial chains are allowed) so an accepted
 * intermediate or leaf cert is trusted by itself.
 */
struct opensslValidator final : validationCapability {
    anchorSet platform_{};

    explicit opensslValidator(anchorSet platform) : platform_{std::move(platform)} {}

    // platform roots from a PEM bundle (e.g., /etc/ssl/certs/ca-certificates.crt)
    explicit opensslValidator(const std::filesystem::path& caFile) {
        try {
            platform_ = readPemCerts(fileToString(caFile));
        } catch (const std::runtime_error& e) {
            memtrust::log(L_WARN)("no platform trust anchors: {}", e.what());
        }
        memtrust::log(L_DEBUG)("{} platform trust anchors from {}", platform_.size(), caFile.string());
    }

    anchorSet platformAnchors() const override { return platform_; }

    validation validate(const certChain& chain, purpose p, const anchorSet& anchors) const override {
        if (chain.empty()) return validation::rejected("empty certificate chain");

        std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store{X509_STORE_new(), X509_STORE_free};
        std::unique_ptr<STACK_OF(X509), decltype(&sk_X509_free_)> untrusted{sk_X509_new_null(), sk_X509_free_};
        std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)> ctx{X509_STORE_CTX_new(), X509_STORE_CTX_free};
        if (! store || ! untrusted || ! ctx) return validation::rejected(format("out of memory: {}", sslErrors()));

        for (const auto& a : anchors) {
            if (X509_STORE_add_cert(store.get(), a.get()) != 1)
                return validation::rejected(format("can't add trust anchor {}: {}", a.subject(), sslErrors()));
        }
        // the stack doesn't own its certs, the chain does
        for (size_t i = 1; i < chain.size(); ++i) {
            if (sk_X509_push(untrusted.get(), chain[i].get()) <= 0)
                return validation::rejected(format("out of memory: {}", sslErrors()));
        }
        if (X509_STORE_CTX_init(ctx.get(), store.get(), chain[0].get(), untrusted.get()) != 1)
            return validation::rejected(format("X509_STORE_CTX_init: {}", sslErrors()));

        X509_STORE_CTX_set_purpose(ctx.get(), p == purpose::serverAuth? X509_PURPOSE_SSL_SERVER : X509_PURPOSE_SSL_CLIENT);
        X509_STORE_CTX_set_flags(ctx.get(), X509_V_FLAG_PARTIAL_CHAIN);

        auto r = X509_verify_cert(ctx.get());
        if (r == 1) return validation::trusted();
        if (r < 0) return validation::rejected(format("X509_verify_cert: {}", sslErrors()));

        auto err = X509_STORE_CTX_get_error(ctx.get());
        std::string what{X509_verify_cert_error_string(err)};
        if (auto cur = X509_STORE_CTX_get_current_cert(ctx.get()); cur)
            return validation::rejected(format("{}: {}", what, x509Cert::nameString(X509_get_subject_name(cur))));
        return validation::rejected(std::move(what));
    }

  private:
    static void sk_X509_free_(STACK_OF(X509)* s) { sk_X509_free(s); }
};

/*
 * A validationCapability bound to a fixed set of trust anchors.
 * The 'baseline' validator trusts the platform roots and the 'memorized'
 * validator trusts the certs in a trustStore. A validator is immutable:
 * when the store changes a new memorized validator is built.
 *
 * The memorized validator trusts a leaf that is itself one of its anchors
 * outright (a person accepted that exact cert, expired or not), other chains
 * go through path validation.
 */
class chainValidator {
    std::shared_ptr<const validationCapability> cap_;
    anchorSet anchors_;
    std::string_view kind_;
    bool leafIsAnchor_;

    chainValidator(std::shared_ptr<const validationCapability> cap, anchorSet anchors, std::string_view kind,
                   bool leafIsAnchor)
        : cap_{std::move(cap)}, anchors_{std::move(anchors)}, kind_{kind}, leafIsAnchor_{leafIsAnchor} {}
  public:
    static auto baseline(std::shared_ptr<const validationCapability> cap) {
        auto a = cap->platformAnchors();
        return std::make_shared<const chainValidator>(chainValidator{std::move(cap), std::move(a), "baseline", false});
    }
    static auto memorized(std::shared_ptr<const validationCapability> cap, const trustStore& ts) {
        return std::make_shared<const chainValidator>(chainValidator{std::move(cap), ts.anchors(), "memorized", true});
    }

    validation validate(const certChain& chain, purpose p) const {
        if (anchors_.empty()) return validation::rejected(format("no {} trust anchors", kind_));
        if (leafIsAnchor_ && ! chain.empty() && std::ranges::find(anchors_, chain.front()) != anchors_.end())
            return validation::trusted();
        return cap_->validate(chain, p, anchors_);
    }

    const anchorSet& anchors() const noexcept { return anchors_; }
    std::string_view kind() const noexcept { return kind_; }
};

} // namespace memtrust

#endif // MEMTRUST_VALIDATOR_HPP
