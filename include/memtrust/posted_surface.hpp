#ifndef MEMTRUST_POSTED_SURFACE_HPP
#define MEMTRUST_POSTED_SURFACE_HPP
#pragma once
/*
 * postedSurface - a decisionSurface that runs its prompter on an asio executor
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
 * Whatever interacts with a person usually has an event loop of its own
 * (a UI thread, an io_context serving a control socket, ...) and requests
 * have to be run there. postedSurface posts each request to such a loop's
 * executor and returns right away. The prompter runs on that loop, shows
 * the request and calls the callback when (if ever) the person decides.
 *
 * If the loop is stopped or destroyed before a posted request runs, the
 * request's callback is destroyed unanswered which aborts the request.
 */

#include <functional>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include "decision.hpp"
#include "log.hpp"

namespace memtrust {

using prompter = std::function<void(requestPtr, decisionCb)>;

class postedSurface final : public decisionSurface {
    boost::asio::any_io_executor ex_;
    prompter prompt_;

  public:
    postedSurface(boost::asio::any_io_executor ex, prompter p) : ex_{std::move(ex)}, prompt_{std::move(p)} {}

    void present(requestPtr req, decisionCb cb) override {
        boost::asio::post(ex_, [p = prompt_, req = std::move(req), cb = std::move(cb)]() mutable {
            try {
                p(std::move(req), cb);
            } catch (const std::exception& e) {
                memtrust::log(L_ERROR)("prompter failed: {}", e.what());
                cb(decision::abort);
            }
        });
    }
};

} // namespace memtrust

#endif // MEMTRUST_POSTED_SURFACE_HPP
