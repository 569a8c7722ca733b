#pragma once

// ============================================================
// config.hpp -- Runtime configuration
//
// Defaults < JSON config file (--config) < command-line flags.
// Sections mirror the config file layout:
//   network, transfer, compression, security, priority, logging, monitoring
// ============================================================

#include "platform.hpp"
#include "priority.hpp"
#include "protocol.hpp"
#include <string>

enum class Role {
    SENDER,
    RECEIVER,
};

inline const char* role_name(Role r) {
    return r == Role::SENDER ? "sender" : "receiver";
}

struct NetworkConfig {
    std::string host;                // receiver: bind address; sender: peer address
    u16         port{5001};
    int         timeout_s{30};       // per-chunk ack timeout, 0 = wait forever
    int         connect_retry_s{30};
    int         max_sessions{8};
};

struct TransferSettings {
    u32         chunk_size_kb{DEFAULT_CHUNK_SIZE / 1024};
    int         max_retries{3};       // resends of one chunk
    int         max_job_attempts{3};  // connections per job
    bool        enable_resume{true};
    bool        keep_chunks{true};
    size_t      prepare_threads{0};   // 0 = hardware concurrency
    std::string work_dir{"."};
};

struct CompressionConfig {
    bool enabled{true};
    int  level{3};
};

struct SecurityConfig {
    std::string key_file{"secret.key"};
};

struct LoggingConfig {
    std::string level{"INFO"};
    std::string file;                 // empty = console only
};

struct MonitoringConfig {
    std::string status_file;
    bool        show_progress{true};
};

struct TransferConfig {
    Role              role{Role::SENDER};
    NetworkConfig     network;
    TransferSettings  transfer;
    CompressionConfig compression;
    SecurityConfig    security;
    Priority          default_priority{Priority::NORMAL};
    LoggingConfig     logging;
    MonitoringConfig  monitoring;

    static TransferConfig defaults(Role role);

    // Overlay values from a JSON file; throws std::runtime_error on a
    // missing file, bad JSON or a mistyped value.
    void load_file(const std::string& path);

    // Throws std::runtime_error naming the first invalid setting
    void validate() const;

    u32 chunk_size_bytes() const { return transfer.chunk_size_kb * 1024u; }
    size_t prepare_threads() const;

    // Apply logging.level / logging.file to the Logger singleton
    void apply_logging() const;
};
