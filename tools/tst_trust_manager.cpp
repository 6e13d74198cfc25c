/*
 * tst_trust_manager - the memorizing trust manager end to end: validation
 * fallbacks, decisions, persistence and concurrency
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
#include <atomic>
#include <filesystem>
#include <system_error>
#include <fstream>
#include <future>

#include "memtrust/trust_manager.hpp"
#include "tst_util.hpp"

namespace fs = std::filesystem;

// the "platform": one root CA and a server cert it issued
static const auto root = mkCert("Test Root CA", nullptr, true);
static const auto good = mkCert("good.example", &root);
static const auto platform = std::make_shared<const opensslValidator>(anchorSet{root.cert});

static trustConfig cfgFor(const fs::path& p) {
    trustConfig c{};
    c.storeLocation = p;
    return c;
}

static auto mkManager(const fs::path& store, std::shared_ptr<decisionSurface> s, const anchorSet& seed = {}) {
    return std::make_unique<trustManager>(cfgFor(store), platform, std::make_unique<pemFileBackend>(store), std::move(s), seed);
}

// what checkTrusted threw, or "" if it returned
static std::string outcome(trustManager& tm, const certChain& chain, purpose p = purpose::serverAuth,
                           std::stop_token st = {}) {
    try {
        tm.checkTrusted(chain, p, st);
        return {};
    } catch (const cert_error& e) {
        return e.what();
    }
}

static std::string baselineReason(const certChain& chain, purpose p = purpose::serverAuth) {
    return platform->validate(chain, p, platform->platformAnchors()).reason();
}

static void fastPaths(const fs::path& dir) {
    print("validation fast paths:\n");
    answering ans{decision::abort};
    surfaceLoop loop{};
    auto tm = mkManager(dir / "fast.pem", loop.surface(ans.fn()));

    check(outcome(*tm, {good.cert}).empty(), "chain to a platform root is trusted");
    check(outcome(*tm, {good.cert, root.cert}).empty(), "full chain to a platform root is trusted");
    check(ans.asked == 0, "surface not asked for trusted chains");
    check(tm->memorized().empty(), "baseline success isn't memorized");
    check(! fs::exists(dir / "fast.pem"), "nothing persisted");
    check(tm->acceptedIssuers().size() == 1 && tm->acceptedIssuers()[0] == root.cert, "accepted issuers are the platform roots");
    check(outcome(*tm, {}) == "empty certificate chain", "empty chain rejected");

    auto seeded = mkCert("seeded.example");
    auto tm2 = mkManager(dir / "seed.pem", loop.surface(ans.fn()), {seeded.cert});
    check(outcome(*tm2, {seeded.cert}).empty() && ans.asked == 0, "pre-seeded cert trusted without asking");
}

static void abortKeepsReason(const fs::path& dir) {
    print("abort:\n");
    answering ans{decision::abort};
    surfaceLoop loop{};
    auto tm = mkManager(dir / "abort.pem", loop.surface(ans.fn()));
    auto rogue = mkCert("rogue.example");

    auto why = baselineReason({rogue.cert});
    print("    (baseline says: {})\n", why);
    check(! why.empty(), "baseline rejects a self-signed cert");
    check(outcome(*tm, {rogue.cert}) == why, "abort fails with the baseline reason");
    check(ans.asked == 1, "surface asked once");
    check(tm->memorized().empty(), "nothing memorized");

    // a chain from an unknown CA
    auto otherCA = mkCert("Other CA", nullptr, true);
    auto leaf = mkCert("leaf.other.example", &otherCA);
    check(outcome(*tm, {leaf.cert, otherCA.cert}) == baselineReason({leaf.cert, otherCA.cert}), "unknown CA: baseline reason");
}

static void allowOnce(const fs::path& dir) {
    print("allowOnce:\n");
    answering ans{decision::allowOnce};
    surfaceLoop loop{};
    auto tm = mkManager(dir / "once.pem", loop.surface(ans.fn()));
    auto rogue = mkCert("once.example");

    check(outcome(*tm, {rogue.cert}).empty() && ans.asked == 1, "allowed once");
    check(tm->memorized().empty() && ! fs::exists(dir / "once.pem"), "store unchanged");
    check(outcome(*tm, {rogue.cert}).empty() && ans.asked == 2, "next check asks again");
}

static void allowAlways(const fs::path& dir) {
    print("allowAlways:\n");
    auto path = dir / "always.pem";
    auto otherCA = mkCert("Always CA", nullptr, true);
    auto leaf = mkCert("always.example", &otherCA);
    certChain chain{leaf.cert, otherCA.cert};
    {
        answering ans{decision::allowAlways};
        surfaceLoop loop{};
        auto tm = mkManager(path, loop.surface(ans.fn()));

        check(outcome(*tm, chain).empty() && ans.asked == 1, "allowed always");
        auto ts = tm->memorized();
        check(ts.size() == 2 && ts.contains(leaf.subject()) && ts.contains(otherCA.subject()), "every chain cert memorized by identity");
        auto persisted = pemFileBackend{path}.load();
        check(persisted.size() == 2 && persisted[leaf.subject()] == leaf.cert, "persisted when the check returns");
        check(outcome(*tm, chain).empty() && ans.asked == 1, "trusted next time without asking");
        check(outcome(*tm, {leaf.cert}, purpose::clientAuth).empty() && ans.asked == 1, "leaf alone trusted for client auth too");
    }
    answering ans{decision::abort};
    surfaceLoop loop{};
    auto tm = mkManager(path, loop.surface(ans.fn()));
    check(outcome(*tm, chain).empty() && ans.asked == 0, "trusted after reload without asking");

    // a re-issued cert with the same identity replaces the memorized one
    auto reissued = mkCert("always.example");
    answering ans2{decision::allowAlways};
    auto tm2 = mkManager(path, loop.surface(ans2.fn()));
    check(outcome(*tm2, {reissued.cert}).empty() && ans2.asked == 1, "re-issued cert allowed always");
    auto ts = pemFileBackend{path}.load();
    check(ts.size() == 2 && ts[leaf.subject()] == reissued.cert, "last accepted cert wins");
}

static void alwaysExpired(const fs::path& dir) {
    print("allowAlways on an expired cert:\n");
    auto path = dir / "expired.pem";
    auto stale = mkCert("expired.example", nullptr, false, -86400L);
    auto why = baselineReason({stale.cert});
    print("    (baseline says: {})\n", why);
    {
        answering ans{decision::allowAlways};
        surfaceLoop loop{};
        auto tm = mkManager(path, loop.surface(ans.fn()));
        check(outcome(*tm, {stale.cert}).empty() && ans.asked == 1, "expired cert allowed always");
        const trustManager& ctm = *tm;
        check(ctm.memorized().contains(stale.subject()), "and memorized (snapshot through a const manager)");
        check(outcome(*tm, {stale.cert}).empty() && ans.asked == 1, "then trusted without asking again");
        check(outcome(*tm, {stale.cert}, purpose::clientAuth).empty() && ans.asked == 1, "for either purpose");
    }
    answering ans{decision::abort};
    surfaceLoop loop{};
    auto tm = mkManager(path, loop.surface(ans.fn()));
    check(outcome(*tm, {stale.cert}).empty() && ans.asked == 0, "still trusted after reload");

    // a different cert with the same identity is not the accepted one
    auto other = mkCert("expired.example", nullptr, false, -86400L);
    check(outcome(*tm, {other.cert}) == baselineReason({other.cert}) && ans.asked == 1, "same name, other cert: asked");
}

// a backend whose persist fails with something other than a store_error
struct throwingBackend final : storeBackend {
    std::atomic<int> tries{0};
    trustStore load() override { return {}; }
    void persist(const trustStore&) override {
        ++tries;
        throw fs::filesystem_error("rename", std::make_error_code(std::errc::read_only_file_system));
    }
    std::string location() const override { return "read-only"; }
};

static void persistFailure() {
    print("persist failure:\n");
    answering ans{decision::allowAlways};
    surfaceLoop loop{};
    auto mb = std::make_unique<memoryBackend>();
    auto& backend = *mb;
    backend.failPersist = true;
    trustManager tm{cfgFor("unused"), platform, std::move(mb), loop.surface(ans.fn())};
    auto rogue = mkCert("nopersist.example");

    check(outcome(tm, {rogue.cert}).empty(), "allowAlways still succeeds");
    check(tm.memorized().empty() && backend.persists == 0, "store stays as last persisted");
    check(outcome(tm, {rogue.cert}).empty() && ans.asked == 2, "memorized validator unchanged (asks again)");

    backend.failPersist = false;
    check(outcome(tm, {rogue.cert}).empty() && ans.asked == 3 && backend.persists == 1, "works once persisting works");
    check(outcome(tm, {rogue.cert}).empty() && ans.asked == 3, "then trusted without asking");

    auto tb = std::make_unique<throwingBackend>();
    auto& thrower = *tb;
    answering ans2{decision::allowAlways};
    trustManager tm2{cfgFor("unused"), platform, std::move(tb), loop.surface(ans2.fn())};
    try {
        tm2.checkTrusted({rogue.cert}, purpose::serverAuth);
        check(thrower.tries == 1, "allowAlways holds when persist throws a non-store error");
    } catch (const std::exception& e) {
        check(false, format("allowAlways holds when persist throws a non-store error ({})", e.what()));
    }
    check(tm2.memorized().empty(), "and nothing is memorized");
}

static void loading(const fs::path& dir) {
    print("loading:\n");
    answering ans{decision::abort};
    surfaceLoop loop{};
    try {
        auto tm = mkManager(dir / "does" / "not" / "exist.pem", loop.surface(ans.fn()));
        check(tm->memorized().empty(), "nonexistent store location: empty store");
    } catch (const std::exception& e) {
        check(false, format("nonexistent store location: empty store ({})", e.what()));
    }

    auto bad = dir / "corrupt.pem";
    std::ofstream(bad) << "-----BEGIN CERTIFICATE-----\n@@@@\n-----END CERTIFICATE-----\n";
    try {
        auto tm = mkManager(bad, loop.surface(ans.fn()));
        check(tm->memorized().empty(), "corrupt store: empty store");
        check(outcome(*tm, {good.cert}).empty(), "and platform chains still trusted");
    } catch (const std::exception& e) {
        check(false, format("corrupt store: empty store ({})", e.what()));
    }

    bool threw{false};
    try { trustManager{cfgFor(""), std::shared_ptr<decisionSurface>{loop.surface(ans.fn())}}; }
    catch (const config_error&) { threw = true; }
    check(threw, "empty store location is a config error");
}

static void concurrency(const fs::path& dir) {
    print("concurrency:\n");
    auto path = dir / "concurrent.pem";
    holding h{};
    surfaceLoop loop{};
    auto tm = mkManager(path, loop.surface(h.fn()));
    auto a = mkCert("a.concurrent.example");
    auto b = mkCert("b.concurrent.example");
    auto c = mkCert("c.concurrent.example");

    auto fa = std::async(std::launch::async, [&]{ return outcome(*tm, {a.cert}); });
    auto fb = std::async(std::launch::async, [&]{ return outcome(*tm, {b.cert}); });
    check(h.waitFor(2), "two escalations pending at once");
    check(outcome(*tm, {good.cert}).empty(), "fast path not blocked by pending escalations");

    // answer out of request order
    check(h.answer(b.subject(), decision::allowAlways) && h.answer(a.subject(), decision::allowAlways), "both answered always");
    check(fa.get().empty() && fb.get().empty(), "both checks succeed");
    auto ts = pemFileBackend{path}.load();
    check(ts.contains(a.subject()) && ts.contains(b.subject()), "no lost update: both persisted");

    // interrupt one waiter while another is pending
    std::stop_source sc{};
    auto d = mkCert("d.concurrent.example");
    auto fc = std::async(std::launch::async, [&]{ return outcome(*tm, {c.cert}, purpose::serverAuth, sc.get_token()); });
    auto fd = std::async(std::launch::async, [&]{ return outcome(*tm, {d.cert}); });
    check(h.waitFor(4), "two more escalations pending");
    sc.request_stop();
    check(fc.wait_for(5s) == std::future_status::ready && fc.get() == baselineReason({c.cert}),
          "interrupted check fails with the baseline reason");
    check(fd.wait_for(100ms) == std::future_status::timeout, "other check still waiting");
    check(h.answer(d.subject(), decision::allowOnce) && fd.get().empty(), "other check resolves normally");

    // shutdown aborts whatever is pending
    auto e = mkCert("e.concurrent.example");
    auto fe = std::async(std::launch::async, [&]{ return outcome(*tm, {e.cert}); });
    check(h.waitFor(5), "escalation pending before shutdown");
    tm->shutdown();
    check(fe.wait_for(5s) == std::future_status::ready && fe.get() == baselineReason({e.cert}), "shutdown fails pending check");
    check(outcome(*tm, {e.cert}) == baselineReason({e.cert}), "and later ones without asking");
    check(outcome(*tm, {a.cert}).empty(), "memorized certs still trusted after shutdown");
}

static void timeout(const fs::path& dir) {
    print("decision timeout:\n");
    holding h{};
    surfaceLoop loop{};
    auto c = cfgFor(dir / "timeout.pem");
    c.decisionTimeout = 100ms;
    trustManager tm{c, platform, std::make_unique<pemFileBackend>(c.storeLocation), loop.surface(h.fn())};
    auto rogue = mkCert("timeout.example");
    check(outcome(tm, {rogue.cert}) == baselineReason({rogue.cert}), "unanswered request times out as abort");
}

int main() {
    auto dir = tmpDir("manager");
    try {
        fastPaths(dir);
        abortKeepsReason(dir);
        allowOnce(dir);
        allowAlways(dir);
        alwaysExpired(dir);
        persistFailure();
        loading(dir);
        concurrency(dir);
        timeout(dir);
    } catch (const std::runtime_error& e) {
        check(false, format("unexpected exception: {}", e.what()));
    }
    fs::remove_all(dir);
    return done("tst_trust_manager");
}
