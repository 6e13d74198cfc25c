#ifndef MEMTRUST_ESCALATION_HPP
#define MEMTRUST_ESCALATION_HPP
#pragma once
/*
 * escalate - hand a decisionRequest to a decisionSurface and block the
 * calling (validating) thread until it's decided.
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
 * Each escalation has its own pendingDecision, a result slot that goes from
 * pending to resolved exactly once. Anything can try to resolve it: the
 * surface's callback, the callback being dropped, an interrupt of the
 * waiting thread, a trustManager shutdown or a timeout. The first one wins
 * and the rest are no-ops, so once the waiter returns the request can
 * never be 'maybe still pending'.
 *
 * The surface is never called in a way that makes it wait for the
 * validating thread: present() just dispatches and the validating thread
 * then waits on the slot's condition variable.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>

#include "decision.hpp"
#include "log.hpp"

namespace memtrust {

class pendingDecision {
    mutable std::mutex mtx_{};
    std::condition_variable cv_{};
    std::optional<decision> result_{};
    std::string_view how_{};          // what resolved it

  public:
    // returns false (and changes nothing) if already resolved
    bool resolve(decision d, std::string_view how) {
        {
            std::lock_guard lck(mtx_);
            if (result_) return false;
            result_ = d;
            how_ = how;
        }
        cv_.notify_all();
        return true;
    }

    bool resolved() const {
        std::lock_guard lck(mtx_);
        return result_.has_value();
    }

    std::string_view how() const {
        std::lock_guard lck(mtx_);
        return how_;
    }

    // wait until resolved or 'deadline' passes. A timeout resolves to 'abort'.
    decision wait(std::optional<std::chrono::steady_clock::time_point> deadline = {}) {
        std::unique_lock lck(mtx_);
        auto done = [this]{ return result_.has_value(); };
        if (! deadline) {
            cv_.wait(lck, done);
        } else if (! cv_.wait_until(lck, *deadline, done)) {
            result_ = decision::abort;
            how_ = "timed out";
        }
        return *result_;
    }
};

namespace detail {
    // Shared by every copy of a surface's callback. When the last copy is
    // destroyed without having been called the decision is 'abort'.
    struct responder {
        std::shared_ptr<pendingDecision> pd_;

        explicit responder(std::shared_ptr<pendingDecision> pd) : pd_{std::move(pd)} {}
        responder(const responder&) = delete;
        responder& operator=(const responder&) = delete;
        ~responder() { pd_->resolve(decision::abort, "dismissed"); }
    };
} // namespace detail

static inline decisionCb makeDecisionCb(std::shared_ptr<pendingDecision> pd) {
    auto r = std::make_shared<detail::responder>(std::move(pd));
    return [r](decision d) { r->pd_->resolve(d, "surface"); };
}

/*
 * Ask 'surface' to decide 'req' and wait for the answer. Returns 'abort' if
 * 'interrupt' or 'shutdown' is requested, or 'timeout' expires, before the
 * surface answers. Interrupting one escalation doesn't affect any other.
 */
static inline decision escalate(decisionSurface& surface, requestPtr req, std::stop_token interrupt,
                                std::stop_token shutdown,
                                std::optional<std::chrono::milliseconds> timeout = {}) {
    auto pd = std::make_shared<pendingDecision>();

    // a callback registered on an already stopped token runs immediately
    std::stop_callback onInterrupt(interrupt, [pd]{ pd->resolve(decision::abort, "interrupted"); });
    std::stop_callback onShutdown(shutdown, [pd]{ pd->resolve(decision::abort, "shut down"); });

    std::optional<std::chrono::steady_clock::time_point> deadline{};
    if (timeout) deadline = std::chrono::steady_clock::now() + *timeout;

    if (! pd->resolved()) {
        try {
            surface.present(req, makeDecisionCb(pd));
        } catch (const std::exception& e) {
            memtrust::log(L_ERROR)("decision surface failed: {}", e.what());
            pd->resolve(decision::abort, "surface failed");
        }
    }
    auto d = pd->wait(deadline);
    memtrust::log(L_INFO)("decision for {}: {} ({})",
                          req->chain.empty()? std::string{"empty chain"} : req->chain.front().subject(),
                          to_string(d), pd->how());
    return d;
}

} // namespace memtrust

#endif // MEMTRUST_ESCALATION_HPP
