// ============================================================
// receiver/main.cpp -- chunkcp receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "receiver_app.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <cstring>
#include <csignal>

static ReceiverApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <out_dir> [options]\n"
        << "\n"
        << "  out_dir            directory receiving reconstructed files\n"
        << "\nOptions:\n"
        << "  --config FILE      JSON configuration file\n"
        << "  --host IP          address to listen on (default: 0.0.0.0)\n"
        << "  --port N           TCP port (default: 5001)\n"
        << "  --key FILE         shared key file (default: secret.key)\n"
        << "  --timeout N        seconds without a frame before a session is dropped\n"
        << "  --max-sessions N   concurrent sessions (default: 8)\n"
        << "  --no-resume        discard stored chunks instead of resuming\n"
        << "  --drop-chunks      delete stored chunks after a verified file\n"
        << "  --status FILE      progress snapshot path\n"
        << "  --log-file FILE    append log lines to FILE\n"
        << "  --no-progress      disable the console progress bar\n"
        << "  --verbose          enable debug logging\n"
        << "\nThe receiver listens indefinitely and accepts concurrent senders.\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/incoming --port 5001 --key secret.key\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 2 || argv[1][0] == '-') {
        print_usage(argv[0]);
        return 1;
    }

    std::string out_dir = argv[1];
    TransferConfig cfg = TransferConfig::defaults(Role::RECEIVER);

    try {
        // The config file is the base layer; every other flag overrides it
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                cfg.load_file(argv[i + 1]);
            }
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                ++i;
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                cfg.network.host = argv[++i];
            } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                u64 port = utils::parse_u64(argv[++i], "--port");
                if (!utils::validate_port((int)std::min<u64>(port, 65536))) {
                    std::cerr << "ERROR: Invalid port: " << port << "\n";
                    return 1;
                }
                cfg.network.port = (u16)port;
            } else if (std::strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
                cfg.security.key_file = argv[++i];
            } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
                cfg.network.timeout_s = (int)std::min<u64>(utils::parse_u64(argv[++i], "--timeout"), 86400);
            } else if (std::strcmp(argv[i], "--max-sessions") == 0 && i + 1 < argc) {
                cfg.network.max_sessions = (int)std::min<u64>(utils::parse_u64(argv[++i], "--max-sessions"), 1024);
            } else if (std::strcmp(argv[i], "--no-resume") == 0) {
                cfg.transfer.enable_resume = false;
            } else if (std::strcmp(argv[i], "--drop-chunks") == 0) {
                cfg.transfer.keep_chunks = false;
            } else if (std::strcmp(argv[i], "--status") == 0 && i + 1 < argc) {
                cfg.monitoring.status_file = argv[++i];
            } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
                cfg.logging.file = argv[++i];
            } else if (std::strcmp(argv[i], "--no-progress") == 0) {
                cfg.monitoring.show_progress = false;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                cfg.logging.level = "DEBUG";
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        cfg.validate();
        cfg.apply_logging();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (!utils::validate_path(out_dir)) {
        std::cerr << "ERROR: Invalid out_dir\n";
        return 1;
    }

    try {
        crypto::Key key = crypto::load_key_file(cfg.security.key_file);

        ReceiverApp app(std::move(cfg), key, out_dir);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
