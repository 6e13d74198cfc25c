#ifndef MEMTRUST_DECISION_HPP
#define MEMTRUST_DECISION_HPP
#pragma once
/*
 * What's asked of a person when a chain can't be validated and the
 * interface to whatever asks them.
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

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "cert.hpp"
#include "validator.hpp"

namespace memtrust {

enum class decision { abort, allowOnce, allowAlways };

static constexpr std::string_view to_string(decision d) noexcept {
    switch (d) {
        case decision::allowAlways: return "always";
        case decision::allowOnce: return "once";
        case decision::abort: return "abort";
    }
    return "abort";
}

// the choices offered to a person, in presentation order
static constexpr std::array<std::pair<decision,std::string_view>,3> choices{{
    {decision::allowAlways, "Always"},
    {decision::allowOnce, "Once"},
    {decision::abort, "Abort"}
}};

/*
 * A request for a decision about a chain that neither the memorized nor
 * the baseline validator accepted. 'reason' is the baseline validator's
 * rejection reason. Requests are immutable and are shared with the
 * decision surface (which may still hold one after the requester has
 * given up waiting).
 */
struct decisionRequest {
    static constexpr std::string_view title{"Accept Invalid Certificate?"};

    const certChain chain;
    const purpose use;
    const std::string reason;

    decisionRequest(certChain c, purpose p, std::string r) : chain{std::move(c)}, use{p}, reason{std::move(r)} {}

    // the reason followed by each cert's subject, issuer and thumbprint
    std::string message() const {
        auto msg = reason;
        for (const auto& c : chain) {
            msg += format("\n\n{} ({})\nSHA-256: {}", c.subject(), c.issuer(), c.thumbprintHex());
        }
        return msg;
    }
};
using requestPtr = std::shared_ptr<const decisionRequest>;

using decisionCb = std::function<void(decision)>;

/*
 * Presents a decisionRequest to a person (or to a policy standing in for
 * one) and reports the choice via 'onResolved'.
 *
 * present() is called on a validating thread and must not wait for the
 * decision: it hands the request to the surface's own execution context
 * and returns. 'onResolved' can be called from any thread and only its
 * first call counts. A surface that drops 'onResolved' without calling it
 * (e.g., its dialog was dismissed or its event loop was shut down) aborts
 * the request.
 */
struct decisionSurface {
    virtual void present(requestPtr request, decisionCb onResolved) = 0;
    virtual ~decisionSurface() = default;
};

} // namespace memtrust

#endif // MEMTRUST_DECISION_HPP
