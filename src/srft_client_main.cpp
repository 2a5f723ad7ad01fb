#include "SrftClient.h"

#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: sudo " << prog
              << " --ip A.B.C.D --server A.B.C.D --file name [--out path]"
              << " [--server-port P] [--client-port P] [--rto-ms MS] [--retries K]"
              << " [--linger-ms MS] [--idle-ms MS] [--verbose]\n";
}

static bool parse_args(int argc, char** argv, SrftClientArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--ip" && need(1)) a.client_ip = argv[++i];
            else if (s == "--server" && need(1)) a.server_ip = argv[++i];
            else if (s == "--file" && need(1)) a.filename = argv[++i];
            else if (s == "--out" && need(1)) a.out_path = argv[++i];
            else if (s == "--server-port" && need(1)) a.cfg.server_port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--client-port" && need(1)) a.cfg.client_port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--rto-ms" && need(1)) a.cfg.timeout_ms = std::stoi(argv[++i]);
            else if (s == "--retries" && need(1)) a.cfg.max_retries = std::stoi(argv[++i]);
            else if (s == "--linger-ms" && need(1)) a.linger_ms = std::stoi(argv[++i]);
            else if (s == "--idle-ms" && need(1)) a.idle_timeout_ms = std::stoi(argv[++i]);
            else if (s == "--verbose" || s == "-v") a.verbose = true;
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << s << "\n";
            return false;
        }
    }

    if (a.client_ip.empty() || a.server_ip.empty() || a.filename.empty()) {
        std::cerr << "--ip, --server and --file are required\n";
        usage(argv[0]);
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    SrftClientArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    SrftClient c(args);
    if (!c.init()) return 2;
    if (!c.run()) return 3;
    return 0;
}
