/*
 * tst_store - trust store, store backends and config
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
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "memtrust/config.hpp"
#include "memtrust/store_backend.hpp"
#include "tst_util.hpp"

namespace fs = std::filesystem;

static void storeContents() {
    print("trustStore:\n");
    auto a1 = mkCert("a.example");
    auto b = mkCert("b.example");
    auto a2 = mkCert("a.example");  // re-issued: same identity, different cert

    trustStore ts{};
    check(ts.empty(), "new store is empty");
    check(ts.accept({a1.cert, b.cert, a2.cert}) == 3, "accept reports each change");
    check(ts.size() == 2, "certs are keyed by identity");
    check(ts[a1.subject()] == a2.cert, "later cert with same identity wins");
    check(ts.accept({b.cert}) == 0, "accepting a stored cert changes nothing");
    check(ts.accept({a1.cert}) == 1 && ts[a1.subject()] == a1.cert, "last accepted replaces earlier");
    check(ts.anchors().size() == 2, "anchors are the stored certs");
    check(a1.subject().find("CN=a.example") != std::string::npos, "identity is the subject DN");
    check(! a1.cert.der().empty() && a1.cert.thumbprintHex().size() == 64, "DER encoding and SHA-256 thumbprint");
    check(a1.cert.thumbprint() != a2.cert.thumbprint() && x509Cert{a1.cert}.thumbprint() == a1.cert.thumbprint(),
          "thumbprints tell certs with the same identity apart");
}

static void fileBackend(const fs::path& dir) {
    print("pemFileBackend:\n");
    auto a = mkCert("a.example");
    auto b = mkCert("b.example");
    auto path = dir / "sub" / "KeyStore.pem";

    pemFileBackend fb{path};
    try {
        check(fb.load().empty(), "missing store loads empty");
    } catch (const store_error& e) {
        check(false, format("missing store loads empty ({})", e.what()));
    }

    trustStore ts{};
    ts.accept({a.cert, b.cert});
    fb.persist(ts);
    check(fs::exists(path), "persist creates the store and its directory");

    auto ld = pemFileBackend{path}.load();
    check(ld.size() == 2 && ld[a.subject()] == a.cert && ld[b.subject()] == b.cert, "reload returns what was persisted");

    bool leftovers{false};
    for (const auto& e : fs::directory_iterator(path.parent_path())) leftovers |= e.path() != path;
    check(! leftovers, "no temp files left behind");

    // make the temp file impossible to create: the old version must survive
    auto tmp = path;
    tmp += format(".{}.tmp", getpid());
    fs::create_directory(tmp);
    trustStore ts2 = ts;
    ts2.accept({mkCert("c.example").cert});
    bool threw{false};
    try {
        fb.persist(ts2);
    } catch (const store_error& e) {
        threw = true;
        print("    ({})\n", e.what());
    }
    check(threw, "failed persist throws store_error");
    check(pemFileBackend{path}.load().size() == 2, "failed persist leaves previous version intact");

    // a bare file name is relative to (and synced through) the working directory
    auto cwd = fs::current_path();
    fs::current_path(dir);
    threw = false;
    try {
        pemFileBackend{"bare.pem"}.persist(ts);
    } catch (const store_error& e) {
        threw = true;
        print("    ({})\n", e.what());
    }
    fs::current_path(cwd);
    check(! threw && pemFileBackend{dir / "bare.pem"}.load().size() == 2, "store with no directory part persists");

    // a store whose parent is a file can't be written
    auto blocked = dir / "afile";
    std::ofstream(blocked) << "x";
    threw = false;
    try { pemFileBackend{blocked / "KeyStore.pem"}.persist(ts); } catch (const store_error&) { threw = true; }
    check(threw, "unwritable location throws store_error");

    // garbage in the store file
    auto bad = dir / "bad.pem";
    std::ofstream(bad) << "-----BEGIN CERTIFICATE-----\nnot base64 at all\n-----END CERTIFICATE-----\n";
    threw = false;
    try { pemFileBackend{bad}.load(); } catch (const store_error&) { threw = true; }
    check(threw, "corrupt store throws store_error");
}

static void memBackend() {
    print("memoryBackend:\n");
    memoryBackend mb{};
    check(mb.load().empty(), "new memory store is empty");
    trustStore ts{};
    ts.accept({mkCert("m.example").cert});
    mb.persist(ts);
    check(mb.load().size() == 1 && mb.persists == 1, "persist then load");
    mb.failPersist = true;
    ts.accept({mkCert("n.example").cert});
    bool threw{false};
    try { mb.persist(ts); } catch (const store_error&) { threw = true; }
    check(threw && mb.load().size() == 1, "injected failure leaves contents unchanged");
}

static void config(const fs::path& dir) {
    print("trustConfig:\n");
    setenv("MEMTRUST_STORE", (dir / "env.pem").c_str(), 1);
    setenv("MEMTRUST_CA_FILE", (dir / "roots.pem").c_str(), 1);
    auto c = trustConfig::fromEnv();
    check(c.storeLocation == dir / "env.pem", "MEMTRUST_STORE sets the store location");
    check(c.caFile == dir / "roots.pem", "MEMTRUST_CA_FILE sets the platform roots");
    check(! c.decisionTimeout, "no decision timeout by default");

    unsetenv("MEMTRUST_STORE");
    setenv("XDG_DATA_HOME", dir.c_str(), 1);
    c = trustConfig::fromEnv();
    check(c.storeLocation == dir / "memtrust" / "KeyStore" / "KeyStore.pem", "default store is under the data home");

    c.setKeyStoreFile(dir / "ks", "mine.pem");
    check(c.storeLocation == dir / "ks" / "mine.pem", "setKeyStoreFile joins directory and file");

    bool threw{false};
    c.storeLocation.clear();
    try { c.check(); } catch (const config_error&) { threw = true; }
    check(threw, "empty store location is a config error");

    threw = false;
    c.storeLocation = dir / "x.pem";
    c.decisionTimeout = 0ms;
    try { c.check(); } catch (const config_error&) { threw = true; }
    check(threw, "zero decision timeout is a config error");
}

static void logLevels() {
    print("log levels:\n");
    check(log_level_from("debug") == L_DEBUG && log_level_from("WARN") == L_WARN, "level names in any case");
    check(log_level_from("Fatal") == L_FATAL && log_level_from("trace") == L_TRACE, "first and last levels");
    check(! log_level_from("verbose") && ! log_level_from("") && ! log_level_from("warning"), "unknown names rejected");
}

int main() {
    auto dir = tmpDir("store");
    try {
        storeContents();
        fileBackend(dir);
        memBackend();
        config(dir);
        logLevels();
    } catch (const std::runtime_error& e) {
        check(false, format("unexpected exception: {}", e.what()));
    }
    fs::remove_all(dir);
    return done("tst_store");
}
