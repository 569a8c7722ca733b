// ============================================================
// config.cpp -- Configuration defaults, JSON overlay, validation
// ============================================================

#include "config.hpp"
#include "compress.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <thread>

using json = nlohmann::json;

namespace {

const json* section(const json& root, const char* name) {
    if (!root.contains(name)) return nullptr;
    const json& s = root.at(name);
    if (!s.is_object()) {
        throw std::runtime_error(std::string("config: section '") + name + "' must be an object");
    }
    return &s;
}

std::string key_path(const char* sec, const char* key) {
    return std::string(sec) + "." + key;
}

// JSON integers are 64-bit; anything outside int is rejected rather than truncated
int checked_int(const json& v, const std::string& name) {
    if (!v.is_number_integer()) {
        throw std::runtime_error("config: " + name + " must be an integer");
    }
    bool in_range = v.is_number_unsigned()
        ? v.get<u64>() <= (u64)std::numeric_limits<int>::max()
        : v.get<long long>() >= std::numeric_limits<int>::min() &&
          v.get<long long>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::runtime_error("config: " + name + " out of range: " + v.dump());
    }
    return (int)v.get<long long>();
}

void read_int(const json* s, const char* sec, const char* key, int& out) {
    if (!s || !s->contains(key)) return;
    out = checked_int(s->at(key), key_path(sec, key));
}

void read_bool(const json* s, const char* sec, const char* key, bool& out) {
    if (!s || !s->contains(key)) return;
    const json& v = s->at(key);
    if (!v.is_boolean()) {
        throw std::runtime_error("config: " + key_path(sec, key) + " must be true or false");
    }
    out = v.get<bool>();
}

void read_string(const json* s, const char* sec, const char* key, std::string& out) {
    if (!s || !s->contains(key)) return;
    const json& v = s->at(key);
    if (!v.is_string()) {
        throw std::runtime_error("config: " + key_path(sec, key) + " must be a string");
    }
    out = v.get<std::string>();
}

} // namespace

TransferConfig TransferConfig::defaults(Role role) {
    TransferConfig c;
    c.role = role;
    if (role == Role::SENDER) {
        c.network.host = "127.0.0.1";
        c.monitoring.status_file = "sender_status.json";
    } else {
        c.network.host = "0.0.0.0";
        c.monitoring.status_file = "receiver_status.json";
    }
    return c;
}

void TransferConfig::load_file(const std::string& path) {
    auto bytes = file_io::read_file(path);
    json root;
    try {
        root = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        throw std::runtime_error("config: " + path + " is not valid JSON: " + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("config: " + path + " must contain a JSON object");
    }

    const json* net = section(root, "network");
    int port = network.port;
    read_string(net, "network", "host",            network.host);
    read_int   (net, "network", "port",            port);
    read_int   (net, "network", "timeout_s",       network.timeout_s);
    read_int   (net, "network", "connect_retry_s", network.connect_retry_s);
    read_int   (net, "network", "max_sessions",    network.max_sessions);
    if (!utils::validate_port(port)) {
        throw std::runtime_error("config: network.port out of range: " + std::to_string(port));
    }
    network.port = (u16)port;

    const json* tr = section(root, "transfer");
    int chunk_kb = (int)transfer.chunk_size_kb;
    int threads  = (int)transfer.prepare_threads;
    read_int   (tr, "transfer", "chunk_size_kb",    chunk_kb);
    read_int   (tr, "transfer", "max_retries",      transfer.max_retries);
    read_int   (tr, "transfer", "max_job_attempts", transfer.max_job_attempts);
    read_bool  (tr, "transfer", "enable_resume",    transfer.enable_resume);
    read_bool  (tr, "transfer", "keep_chunks",      transfer.keep_chunks);
    read_int   (tr, "transfer", "prepare_threads",  threads);
    read_string(tr, "transfer", "work_dir",         transfer.work_dir);
    if (chunk_kb <= 0) throw std::runtime_error("config: transfer.chunk_size_kb must be positive");
    if (threads < 0)   throw std::runtime_error("config: transfer.prepare_threads must be >= 0");
    transfer.chunk_size_kb   = (u32)chunk_kb;
    transfer.prepare_threads = (size_t)threads;

    const json* comp = section(root, "compression");
    read_bool(comp, "compression", "enabled", compression.enabled);
    read_int (comp, "compression", "level",   compression.level);

    const json* sec = section(root, "security");
    read_string(sec, "security", "key_file", security.key_file);

    const json* prio = section(root, "priority");
    if (prio && prio->contains("default")) {
        const json& v = prio->at("default");
        if (v.is_number_integer())  default_priority = priority_from_int(checked_int(v, "priority.default"));
        else if (v.is_string())     default_priority = parse_priority(v.get<std::string>());
        else throw std::runtime_error("config: priority.default must be 1..4 or a level name");
    }

    const json* lg = section(root, "logging");
    read_string(lg, "logging", "level", logging.level);
    read_string(lg, "logging", "file",  logging.file);

    const json* mon = section(root, "monitoring");
    read_string(mon, "monitoring", "status_file",   monitoring.status_file);
    read_bool  (mon, "monitoring", "show_progress", monitoring.show_progress);
}

void TransferConfig::validate() const {
    if (network.timeout_s < 0) {
        throw std::runtime_error("config: network.timeout_s must be >= 0");
    }
    if (network.connect_retry_s < 0) {
        throw std::runtime_error("config: network.connect_retry_s must be >= 0");
    }
    if (network.max_sessions < 1) {
        throw std::runtime_error("config: network.max_sessions must be >= 1");
    }
    if (role == Role::SENDER && !utils::validate_ip(network.host)) {
        throw std::runtime_error("config: network.host is not an IPv4 address: " + network.host);
    }
    if (role == Role::RECEIVER && !network.host.empty() && !utils::validate_ip(network.host)) {
        throw std::runtime_error("config: network.host is not an IPv4 address: " + network.host);
    }
    u64 chunk = (u64)transfer.chunk_size_kb * 1024u;
    if (chunk < MIN_CHUNK_SIZE || chunk > MAX_CHUNK_SIZE) {
        throw std::runtime_error("config: transfer.chunk_size_kb must be between " +
                                 std::to_string(MIN_CHUNK_SIZE / 1024) + " and " +
                                 std::to_string(MAX_CHUNK_SIZE / 1024));
    }
    if (transfer.max_retries < 0) {
        throw std::runtime_error("config: transfer.max_retries must be >= 0");
    }
    if (transfer.max_job_attempts < 1) {
        throw std::runtime_error("config: transfer.max_job_attempts must be >= 1");
    }
    if (!compress::valid_level(compression.level)) {
        throw std::runtime_error("config: compression.level out of range: " +
                                 std::to_string(compression.level));
    }
    if (security.key_file.empty()) {
        throw std::runtime_error("config: security.key_file must be set");
    }
    Logger::parse_level(logging.level);
}

size_t TransferConfig::prepare_threads() const {
    if (transfer.prepare_threads > 0) return transfer.prepare_threads;
    unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? hc : 1;
}

void TransferConfig::apply_logging() const {
    Logger::get().set_level_from_string(logging.level);
    if (!logging.file.empty()) {
        Logger::get().set_log_file(logging.file);
    }
}
