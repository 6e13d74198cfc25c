/*
 * memtrust_check [flags] chain.pem - check a PEM certificate chain (leaf first)
 * the way a TLS peer's chain would be checked, asking on the terminal if it
 * can't be validated.
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

#include <getopt.h>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "memtrust/console_prompter.hpp"
#include "memtrust/trust_manager.hpp"

using namespace memtrust;

// handles command line
static struct option opts[] = {
    {"cafile", required_argument, nullptr, 'c'},
    {"debug", no_argument, nullptr, 'd'},
    {"help", no_argument, nullptr, 'h'},
    {"list", no_argument, nullptr, 'l'},
    {"purpose", required_argument, nullptr, 'p'},
    {"store", required_argument, nullptr, 's'},
    {"timeout", required_argument, nullptr, 't'},
    {nullptr, 0, nullptr, 0}
};
static void usage(const char* cname)
{
    std::cerr << "usage: " << cname << " [flags] [chain.pem]\n";
}
static void help(const char* cname)
{
    usage(cname);
    std::cerr << " flags:\n"
           "  -c |--cafile file   platform root certs (default $MEMTRUST_CA_FILE or OpenSSL's)\n"
           "  -d |--debug         enable debugging output\n"
           "  -h |--help          print help then exit\n"
           "  -l |--list          list the memorized certs\n"
           "  -p |--purpose p     'server' (default) or 'client'\n"
           "  -s |--store file    trust store (default $MEMTRUST_STORE or per-user data dir)\n"
           "  -t |--timeout secs  give up (abort) if not answered in time\n";
}

int main(int argc, char* argv[])
{
    auto cfg = trustConfig::fromEnv();
    auto use = purpose::serverAuth;
    bool list{false};

    for (int c; (c = getopt_long(argc, argv, "c:dhlp:s:t:", opts, nullptr)) != -1; ) {
        switch (c) {
        case 'c':
            cfg.caFile = optarg;
            break;
        case 'd':
            log_min_level(L_DEBUG);
            break;
        case 'h':
            help(argv[0]);
            exit(0);
        case 'l':
            list = true;
            break;
        case 'p':
            if (std::string_view{optarg} == "client") use = purpose::clientAuth;
            else if (std::string_view{optarg} == "server") use = purpose::serverAuth;
            else { usage(argv[0]); exit(1); }
            break;
        case 's':
            cfg.storeLocation = optarg;
            break;
        case 't': {
            std::string_view s{optarg};
            long secs{};
            if (auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), secs); ec != std::errc{} || secs <= 0) {
                std::cerr << "bad timeout " << s << "\n";
                exit(1);
            }
            cfg.decisionTimeout = std::chrono::seconds(secs);
            break;
        }
        default:
            usage(argv[0]);
            exit(1);
        }
    }
    if (optind >= argc && ! list) {
        usage(argv[0]);
        exit(1);
    }

    // questions are asked on their own thread, as a UI would
    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    std::thread ui([&ioc]{ ioc.run(); });
    auto finish = [&](int rc) {
        work.reset();
        ioc.stop();
        ui.join();
        return rc;
    };

    int rc{0};
    try {
        trustManager tm(cfg, std::make_shared<postedSurface>(ioc.get_executor(), consolePrompter(std::cin, std::cerr)));
        if (list) {
            auto ts = tm.memorized();
            print("{} memorized certs in {}:\n", ts.size(), cfg.storeLocation.string());
            for (const auto& [id, c] : ts) print("  {}\n    issuer {}\n    expires {}\n    SHA-256 {}\n",
                                                 id, c.issuer(), c.notAfter(), c.thumbprintHex());
        }
        if (optind < argc) {
            auto chain = readPemCerts(fileToString(argv[optind]));
            try {
                tm.checkTrusted(chain, use);
                print("{}: trusted\n", argv[optind]);
            } catch (const cert_error& e) {
                print("{}: not trusted: {}\n", argv[optind], e.what());
                rc = 2;
            }
        }
    } catch (const std::runtime_error& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        rc = 1;
    }
    return finish(rc);
}
