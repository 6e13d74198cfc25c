/*
 * tst_escalation - the blocking decision rendezvous between a validating
 * thread and a decision surface
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
#include <future>
#include <optional>
#include <sstream>

#include "memtrust/console_prompter.hpp"
#include "memtrust/escalation.hpp"
#include "tst_util.hpp"

static requestPtr mkRequest(std::string_view cn) {
    return std::make_shared<const decisionRequest>(certChain{mkCert(cn).cert}, purpose::serverAuth, "self-signed certificate");
}

// surface that throws away every callback
struct droppingSurface final : decisionSurface {
    void present(requestPtr, decisionCb) override {}
};

// surface that can't present anything
struct brokenSurface final : decisionSurface {
    void present(requestPtr, decisionCb) override { throw std::runtime_error("no display"); }
};

// surface that counts and never answers (but keeps the callback)
struct silentSurface final : decisionSurface {
    std::atomic<int> presented{0};
    std::vector<decisionCb> kept{};
    void present(requestPtr, decisionCb cb) override { ++presented; kept.emplace_back(std::move(cb)); }
};

static void singleResolution() {
    print("pendingDecision:\n");
    pendingDecision pd{};
    check(! pd.resolved(), "starts pending");
    check(pd.resolve(decision::allowOnce, "surface"), "first resolve wins");
    check(! pd.resolve(decision::allowAlways, "surface"), "second resolve is a no-op");
    check(! pd.resolve(decision::abort, "interrupted"), "late interrupt is a no-op");
    check(pd.wait() == decision::allowOnce && pd.how() == "surface", "wait returns the first decision");

    auto pd2 = std::make_shared<pendingDecision>();
    auto cb = makeDecisionCb(pd2);
    auto cb2 = cb;
    cb = nullptr;
    check(! pd2->resolved(), "callback alive while any copy exists");
    cb2 = nullptr;
    check(pd2->resolved() && pd2->wait() == decision::abort, "dropping every copy of the callback aborts");
}

static void answered() {
    print("escalate via postedSurface:\n");
    for (auto d : {decision::abort, decision::allowOnce, decision::allowAlways}) {
        answering ans{d};
        surfaceLoop loop{};
        auto s = loop.surface(ans.fn());
        auto got = escalate(*s, mkRequest("ans.example"), {}, {});
        check(got == d && ans.asked == 1, format("surface answer '{}' is returned", to_string(d)));
    }
}

static void surfaceNonResponse() {
    print("non-responding surfaces:\n");
    droppingSurface ds{};
    check(escalate(ds, mkRequest("drop.example"), {}, {}) == decision::abort, "dismissed without a choice aborts");

    brokenSurface bs{};
    check(escalate(bs, mkRequest("broken.example"), {}, {}) == decision::abort, "surface failure aborts");

    silentSurface ss{};
    auto t0 = std::chrono::steady_clock::now();
    auto d = escalate(ss, mkRequest("slow.example"), {}, {}, 100ms);
    auto dt = std::chrono::steady_clock::now() - t0;
    check(d == decision::abort && dt >= 100ms && dt < 5s, "timeout aborts");
    ss.kept.front()(decision::allowAlways);  // too late, nothing to see

    // prompter that throws on the surface's loop
    surfaceLoop loop{};
    auto s = loop.surface([](requestPtr, decisionCb) { throw std::runtime_error("prompter broke"); });
    check(escalate(*s, mkRequest("throw.example"), {}, {}) == decision::abort, "prompter exception aborts");

    // the surface's loop goes away before running the request
    auto ioc = std::make_unique<boost::asio::io_context>();
    postedSurface ps{ioc->get_executor(), [](requestPtr, decisionCb cb) { cb(decision::allowAlways); }};
    auto pd = std::make_shared<pendingDecision>();
    ps.present(mkRequest("gone.example"), makeDecisionCb(pd));
    check(! pd->resolved(), "posted request pending while its loop exists");
    ioc.reset();
    check(pd->resolved() && pd->wait() == decision::abort, "destroyed loop aborts its pending request");
}

static void interruption() {
    print("interruption:\n");
    holding h{};
    surfaceLoop loop{};
    auto s = loop.surface(h.fn());
    auto ra = mkRequest("a.example");
    auto rb = mkRequest("b.example");
    std::stop_source sa{}, sb{}, shut{};

    auto fa = std::async(std::launch::async, [&]{ return escalate(*s, ra, sa.get_token(), shut.get_token()); });
    auto fb = std::async(std::launch::async, [&]{ return escalate(*s, rb, sb.get_token(), shut.get_token()); });
    check(h.waitFor(2), "both requests presented");

    sa.request_stop();
    check(fa.wait_for(5s) == std::future_status::ready && fa.get() == decision::abort, "interrupted waiter aborts promptly");
    check(fb.wait_for(100ms) == std::future_status::timeout, "other escalation still pending");

    h.answer(ra->chain.front().subject(), decision::allowAlways);    // too late for 'a'
    check(fb.wait_for(100ms) == std::future_status::timeout, "late answer to interrupted request doesn't resolve the other");
    check(h.answer(rb->chain.front().subject(), decision::allowOnce), "answer other request");
    check(fb.wait_for(5s) == std::future_status::ready && fb.get() == decision::allowOnce, "other escalation gets its own answer");

    std::stop_source st{};
    st.request_stop();
    silentSurface ss{};
    check(escalate(ss, mkRequest("pre.example"), st.get_token(), {}) == decision::abort && ss.presented == 0,
          "already interrupted: abort without presenting");

    auto fc = std::async(std::launch::async, [&]{ return escalate(*s, mkRequest("c.example"), {}, shut.get_token()); });
    check(h.waitFor(3), "third request presented");
    shut.request_stop();
    check(fc.wait_for(5s) == std::future_status::ready && fc.get() == decision::abort, "shutdown aborts pending escalation");
}

static void console() {
    print("consolePrompter:\n");
    check(to_string(decision::abort) == "abort" && to_string(decision::allowOnce) == "once"
          && to_string(decision::allowAlways) == "always", "decision names");
    check(parseChoice("always") == decision::allowAlways, "'always'");
    check(parseChoice(" A\n") == decision::allowAlways, "'A'");
    check(parseChoice("Once") == decision::allowOnce, "'Once'");
    check(parseChoice("o") == decision::allowOnce, "'o'");
    check(parseChoice("abort") == decision::abort, "'abort'");
    check(parseChoice("") == decision::abort, "empty answer aborts");
    check(parseChoice("yes please") == decision::abort, "anything else aborts");

    auto req = mkRequest("console.example");
    struct answerCase { const char* in; decision want; const char* label; };
    for (auto [in, want, label] : {answerCase{"once\n", decision::allowOnce, "typed once"},
                                   answerCase{"", decision::abort, "end of input"}}) {
        std::istringstream is{in};
        std::ostringstream os{};
        std::optional<decision> got{};
        consolePrompter(is, os)(req, [&got](decision d){ got = d; });
        check(got == want, format("console {} -> {}", label, to_string(want)));
        check(os.str().find(decisionRequest::title) != std::string::npos &&
              os.str().find("CN=console.example") != std::string::npos &&
              os.str().find("SHA-256: ") != std::string::npos, "prompt shows title, subject and thumbprint");
    }
}

int main() {
    try {
        singleResolution();
        answered();
        surfaceNonResponse();
        interruption();
        console();
    } catch (const std::runtime_error& e) {
        check(false, format("unexpected exception: {}", e.what()));
    }
    return done("tst_escalation");
}
