#ifndef MEMTRUST_TRUST_STORE_HPP
#define MEMTRUST_TRUST_STORE_HPP
#pragma once
/*
 * trustStore - the certificates a person has decided to always trust
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

#include <map>
#include <string>

#include "cert.hpp"

namespace memtrust {

using identity = std::string;

/*
 * Certs are keyed by identity (subject DN) so there's at most one cert per
 * identity. Adding a cert whose identity is already present replaces the
 * old one. The map is ordered so a persisted store is written in a stable
 * order.
 *
 * A trustStore is a plain value: it does no locking and no I/O. The
 * trustManager that owns one serializes all changes to it.
 */
struct trustStore {
    std::map<identity,x509Cert> certs_{};

    auto begin() const { return certs_.cbegin(); }
    auto end() const { return certs_.cend(); }
    auto size() const noexcept { return certs_.size(); }
    auto empty() const noexcept { return certs_.empty(); }

    auto contains(const identity& id) const { return certs_.contains(id); }
    const x509Cert& get(const identity& id) const { return certs_.at(id); }
    const auto& operator[](const identity& id) const { return get(id); }

    // add (or replace) one cert. Returns true if the store changed.
    bool add(const x509Cert& c) {
        auto id = c.subject();
        if (auto it = certs_.find(id); it != certs_.end()) {
            if (it->second == c) return false;
            it->second = c;
            return true;
        }
        certs_.emplace(std::move(id), c);
        return true;
    }

    // add every cert of 'chain' in chain order (so a later cert with the same
    // identity as an earlier one wins). Returns the number of entries changed.
    size_t accept(const certChain& chain) {
        size_t n{};
        for (const auto& c : chain) n += add(c);
        return n;
    }

    // all the certs in the store, usable as validation trust anchors
    anchorSet anchors() const {
        anchorSet a{};
        a.reserve(certs_.size());
        for (const auto& [id, c] : certs_) a.emplace_back(c);
        return a;
    }
};

} // namespace memtrust

#endif // MEMTRUST_TRUST_STORE_HPP
