#include "SrftServer.h"

#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: sudo " << prog
              << " --ip A.B.C.D [--dir files_dir] [--report path] [--server-port P]"
              << " [--client-port P] [--window N] [--rto-ms MS] [--retries K]"
              << " [--chunk BYTES] [--wait-ms MS] [--verbose]\n";
}

static bool parse_args(int argc, char** argv, SrftServerArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--ip" && need(1)) a.server_ip = argv[++i];
            else if (s == "--dir" && need(1)) a.files_dir = argv[++i];
            else if (s == "--report" && need(1)) a.report_path = argv[++i];
            else if (s == "--server-port" && need(1)) a.cfg.server_port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--client-port" && need(1)) a.cfg.client_port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--window" && need(1)) a.cfg.window_size = (uint32_t)std::stoul(argv[++i]);
            else if (s == "--rto-ms" && need(1)) a.cfg.timeout_ms = std::stoi(argv[++i]);
            else if (s == "--retries" && need(1)) a.cfg.max_retries = std::stoi(argv[++i]);
            else if (s == "--chunk" && need(1)) a.cfg.max_payload_size = (size_t)std::stoul(argv[++i]);
            else if (s == "--wait-ms" && need(1)) a.cfg.completion_timeout_ms = std::stoi(argv[++i]);
            else if (s == "--verbose" || s == "-v") a.verbose = true;
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << s << "\n";
            return false;
        }
    }

    if (a.server_ip.empty()) { std::cerr << "--ip is required\n"; usage(argv[0]); return false; }
    if (a.cfg.window_size < 1) { std::cerr << "--window must be >= 1\n"; return false; }
    if (a.cfg.max_payload_size < 1 || a.cfg.max_payload_size > 65507 - 14) {
        std::cerr << "--chunk invalid; must be 1.." << (65507 - 14) << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    SrftServerArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    SrftServer s(args);
    if (!s.init()) return 2;
    if (!s.run()) return 3;
    return 0;
}
