#ifndef MEMTRUST_TRUST_MANAGER_HPP
#define MEMTRUST_TRUST_MANAGER_HPP
#pragma once
/*
 * trustManager - a certificate trust manager that asks a person about chains
 * it can't validate and memorizes their 'always' decisions.
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
 * A chain is checked against:
 *   1. the 'memorized' validator (anchors are the certs in the trust store)
 *   2. the 'baseline' validator (anchors are the platform's roots)
 * and if both reject it the baseline's rejection is escalated to the
 * decisionSurface. The validating thread blocks until the surface decides:
 *   abort       - the check fails with the baseline's rejection reason
 *   allowOnce   - the check succeeds, nothing is remembered
 *   allowAlways - the chain's certs are added to the trust store which is
 *                 persisted and a new memorized validator is built, then
 *                 the check succeeds.
 *
 * Checks run concurrently. Only changes to the trust store are serialized:
 * each one copies the current store, persists the copy and, if that worked,
 * makes the copy current and publishes a new memorized validator. If the
 * persist fails the store and validator are left as they were (so they
 * always match what was last persisted) and the check still succeeds.
 *
 * WARNING: checkTrusted blocks until a person decides, so it has to be
 * called from a thread that can wait (not the thread running the surface).
 */

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>

#include "config.hpp"
#include "decision.hpp"
#include "errors.hpp"
#include "escalation.hpp"
#include "log.hpp"
#include "store_backend.hpp"
#include "trust_store.hpp"
#include "validator.hpp"

namespace memtrust {

class trustManager {
    trustConfig cfg_;
    std::shared_ptr<const validationCapability> cap_;
    std::unique_ptr<storeBackend> backend_;
    std::shared_ptr<decisionSurface> surface_;
    std::shared_ptr<const chainValidator> baseline_;

    mutable std::mutex storeMtx_{};         // serializes store changes
    trustStore store_{};                    // last persisted (or loaded) store
    mutable std::shared_mutex memMtx_{};    // guards memorized_ (not its use)
    std::shared_ptr<const chainValidator> memorized_{};

    std::stop_source shutdown_{};

    std::shared_ptr<const chainValidator> memorizedValidator() const {
        std::shared_lock lck(memMtx_);
        return memorized_;
    }

    void remember(const certChain& chain) {
        std::lock_guard lck(storeMtx_);
        auto next = store_;
        if (next.accept(chain) == 0) {
            memtrust::log(L_DEBUG)("{} already memorized", chain.front().subject());
            return;
        }
        try {
            backend_->persist(next);
        } catch (const std::exception& e) {
            // backends should throw store_error but any failure leaves the store as it was
            memtrust::log(L_WARN)("{} allowed but not remembered: {}", chain.front().subject(), e.what());
            return;
        }
        store_ = std::move(next);
        auto v = chainValidator::memorized(cap_, store_);
        {
            std::unique_lock wlck(memMtx_);
            memorized_ = std::move(v);
        }
        memtrust::log(L_INFO)("memorized {} ({} certs in {})", chain.front().subject(), store_.size(),
                              backend_->location());
    }

  public:
    /*
     * 'seed' certs are added to the loaded store (in memory, they're persisted
     * with the next change).
     */
    trustManager(trustConfig cfg, std::shared_ptr<const validationCapability> cap,
                 std::unique_ptr<storeBackend> backend, std::shared_ptr<decisionSurface> surface,
                 const anchorSet& seed = {})
        : cfg_{std::move(cfg)}, cap_{std::move(cap)}, backend_{std::move(backend)}, surface_{std::move(surface)} {
        if (! cap_ || ! backend_ || ! surface_) throw config_error("trustManager: missing validator, store or surface");
        if (cfg_.decisionTimeout && cfg_.decisionTimeout->count() <= 0)
            throw config_error("decision timeout must be positive");

        try {
            store_ = backend_->load();
        } catch (const store_error& e) {
            memtrust::log(L_WARN)("{}: starting with an empty trust store", e.what());
            store_ = trustStore{};
        }
        for (const auto& c : seed) store_.add(c);

        baseline_ = chainValidator::baseline(cap_);
        memorized_ = chainValidator::memorized(cap_, store_);
        memtrust::log(L_INFO)("trust manager: {} memorized certs from {}, {} platform anchors",
                              store_.size(), backend_->location(), baseline_->anchors().size());
    }

    // the usual setup: OpenSSL validation against cfg.caFile and a PEM file store at cfg.storeLocation
    trustManager(const trustConfig& cfg, std::shared_ptr<decisionSurface> surface)
        : trustManager(cfg.check(), std::make_shared<const opensslValidator>(cfg.caFile),
                       std::make_unique<pemFileBackend>(cfg.storeLocation), std::move(surface)) {}

    trustManager(const trustManager&) = delete;
    trustManager& operator=(const trustManager&) = delete;

    /*
     * Returns if 'chain' is trusted for 'p', otherwise throws a cert_error
     * whose what() is the baseline validator's rejection reason. May block
     * waiting for a decision: requesting a stop on 'interrupt' makes the
     * wait end with an abort.
     */
    void checkTrusted(const certChain& chain, purpose p, std::stop_token interrupt = {}) {
        if (chain.empty()) throw cert_error("empty certificate chain");
        memtrust::log(L_DEBUG)("check{}Trusted({}, {} certs)", p == purpose::clientAuth? "Client" : "Server",
                               chain.front().subject(), chain.size());

        if (auto m = memorizedValidator()->validate(chain, p); m) return;
        auto base = baseline_->validate(chain, p);
        if (base) return;

        memtrust::log(L_INFO)("{} not trusted ({}), asking", chain.front().subject(), base.reason());
        auto req = std::make_shared<const decisionRequest>(chain, p, base.reason());
        switch (escalate(*surface_, req, interrupt, shutdown_.get_token(), cfg_.decisionTimeout)) {
            case decision::allowAlways:
                remember(chain);
                return;
            case decision::allowOnce:
                return;
            case decision::abort:
                break;
        }
        throw cert_error(base.reason());
    }

    void checkClientTrusted(const certChain& chain, std::stop_token interrupt = {}) {
        checkTrusted(chain, purpose::clientAuth, std::move(interrupt));
    }
    void checkServerTrusted(const certChain& chain, std::stop_token interrupt = {}) {
        checkTrusted(chain, purpose::serverAuth, std::move(interrupt));
    }

    // issuers a peer's cert can chain to (for cert request / negotiation)
    const anchorSet& acceptedIssuers() const noexcept { return baseline_->anchors(); }

    // a snapshot of the memorized certs
    trustStore memorized() const {
        std::lock_guard lck(storeMtx_);
        return store_;
    }

    // abort all pending and future escalations (e.g., at process shutdown)
    void shutdown() {
        memtrust::log(L_DEBUG)("trust manager shutdown");
        shutdown_.request_stop();
    }
};

} // namespace memtrust

#endif // MEMTRUST_TRUST_MANAGER_HPP
