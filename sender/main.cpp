// ============================================================
// sender/main.cpp -- chunkcp sender entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "sender_app.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <cstring>
#include <csignal>

static SenderApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file[@priority]>... [options]\n"
        << "\n"
        << "  file[@priority]     file to send; priority is 1-4 or CRITICAL/HIGH/NORMAL/LOW\n"
        << "\nOptions:\n"
        << "  --config FILE       JSON configuration file\n"
        << "  --host IP           receiver address (default: 127.0.0.1)\n"
        << "  --port N            receiver port (default: 5001)\n"
        << "  --key FILE          shared key file (default: secret.key)\n"
        << "  --priority P        priority for files without @priority (default: NORMAL)\n"
        << "  --chunk-kb N        chunk size in KB (default: 1024)\n"
        << "  --level N           zstd level (default: 3)\n"
        << "  --no-compress       disable compression\n"
        << "  --threads N         preparation threads (default: all cores)\n"
        << "  --work-dir DIR      where prepared chunks are kept (default: .)\n"
        << "  --retries N         resends of one chunk (default: 3)\n"
        << "  --attempts N        connection attempts per file (default: 3)\n"
        << "  --timeout N         seconds to wait for each ack (default: 30)\n"
        << "  --connect-retry N   seconds to keep retrying the connect (default: 30)\n"
        << "  --status FILE       progress snapshot path\n"
        << "  --log-file FILE     append log lines to FILE\n"
        << "  --no-progress       disable the console progress bar\n"
        << "  --prepare-only      chunk, compress and encrypt, then exit\n"
        << "  --verbose           enable debug logging\n"
        << "\nFiles are sent one at a time, highest priority first. An interrupted\n"
        << "transfer resumes from the chunks the receiver already verified.\n"
        << "\nExamples:\n"
        << "  " << prog << " report.pdf@CRITICAL backup.tar --host 10.0.0.2\n"
        << "  " << prog << " big.iso --prepare-only --chunk-kb 4096\n";
}

static int int_arg(const char* text, const char* what, u64 max) {
    return (int)std::min<u64>(utils::parse_u64(text, what), max);
}

// "path@priority" -> (path, priority); no suffix keeps the default
static std::pair<std::string, Priority> split_file_arg(const std::string& arg, Priority dflt) {
    size_t at = arg.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 == arg.size()) return {arg, dflt};
    return {arg.substr(0, at), parse_priority(arg.substr(at + 1))};
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    TransferConfig cfg = TransferConfig::defaults(Role::SENDER);
    std::vector<std::string> file_args;
    std::string priority_flag;
    bool prepare_only = false;

    try {
        // The config file is the base layer; every other flag overrides it
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                cfg.load_file(argv[i + 1]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                ++i;
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                cfg.network.host = argv[++i];
            } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                int port = int_arg(argv[++i], "--port", 65536);
                if (!utils::validate_port(port)) {
                    std::cerr << "ERROR: Invalid port: " << argv[i] << "\n";
                    return 1;
                }
                cfg.network.port = (u16)port;
            } else if (std::strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
                cfg.security.key_file = argv[++i];
            } else if (std::strcmp(argv[i], "--priority") == 0 && i + 1 < argc) {
                priority_flag = argv[++i];
            } else if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
                cfg.transfer.chunk_size_kb = (u32)int_arg(argv[++i], "--chunk-kb", 1u << 20);
            } else if (std::strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
                cfg.compression.level = int_arg(argv[++i], "--level", 100);
            } else if (std::strcmp(argv[i], "--no-compress") == 0) {
                cfg.compression.enabled = false;
            } else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
                cfg.transfer.prepare_threads = (size_t)int_arg(argv[++i], "--threads", 256);
            } else if (std::strcmp(argv[i], "--work-dir") == 0 && i + 1 < argc) {
                cfg.transfer.work_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--retries") == 0 && i + 1 < argc) {
                cfg.transfer.max_retries = int_arg(argv[++i], "--retries", 1000);
            } else if (std::strcmp(argv[i], "--attempts") == 0 && i + 1 < argc) {
                cfg.transfer.max_job_attempts = int_arg(argv[++i], "--attempts", 1000);
            } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
                cfg.network.timeout_s = int_arg(argv[++i], "--timeout", 86400);
            } else if (std::strcmp(argv[i], "--connect-retry") == 0 && i + 1 < argc) {
                cfg.network.connect_retry_s = int_arg(argv[++i], "--connect-retry", 86400);
            } else if (std::strcmp(argv[i], "--status") == 0 && i + 1 < argc) {
                cfg.monitoring.status_file = argv[++i];
            } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
                cfg.logging.file = argv[++i];
            } else if (std::strcmp(argv[i], "--no-progress") == 0) {
                cfg.monitoring.show_progress = false;
            } else if (std::strcmp(argv[i], "--prepare-only") == 0) {
                prepare_only = true;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                cfg.logging.level = "DEBUG";
            } else if (argv[i][0] == '-') {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            } else {
                file_args.push_back(argv[i]);
            }
        }

        if (!priority_flag.empty()) cfg.default_priority = parse_priority(priority_flag);
        cfg.validate();
        cfg.apply_logging();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (file_args.empty()) {
        std::cerr << "ERROR: No files given\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        crypto::Key key = crypto::load_key_file(cfg.security.key_file);
        Priority dflt = cfg.default_priority;
        std::string work_dir = cfg.transfer.work_dir;

        SenderApp app(std::move(cfg), key);
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        for (const auto& arg : file_args) {
            auto fp = split_file_arg(arg, dflt);
            app.add_file(fp.first, fp.second);
        }

        if (prepare_only) {
            for (const auto& arg : file_args) {
                auto fp = split_file_arg(arg, dflt);
                TransferJob job;
                job.source_path  = fp.first;
                job.priority     = fp.second;
                job.prepared_dir = SenderApp::prepared_dir_for(work_dir, job.source_path);
                Manifest m = app.prepare(job);
                std::cout << m.original_filename << "\n"
                          << "  size        " << utils::format_bytes(m.original_size) << "\n"
                          << "  sha256      " << hash::to_hex(m.original_hash) << "\n"
                          << "  chunks      " << m.chunk_count() << " x "
                          << utils::format_bytes(m.chunk_size) << "\n"
                          << "  priority    " << priority_name(m.priority) << "\n"
                          << "  compression " << compress_algo_name(m.compression) << "\n"
                          << "  prepared in " << job.prepared_dir << "\n";
            }
            g_app = nullptr;
            return 0;
        }

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
