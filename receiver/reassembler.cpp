// ============================================================
// reassembler.cpp -- Ordered restore, write and whole-file verify
// ============================================================

#include "reassembler.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {

void log_fault(u32 index, const char* reason, const std::string& detail) {
    LOG_EVENT(LogLevel::WARN, "chunk_fault", {
        {"index",  std::to_string(index)},
        {"reason", reason},
        {"detail", detail},
    });
}

} // namespace

Reassembler::Reassembler(const crypto::Key& key)
    : codec_(key, compress::DEFAULT_LEVEL)
{}

AssemblyReport Reassembler::assemble(const ChunkSource& src, const Manifest& m,
                                     const std::string& output_path)
{
    report_ = AssemblyReport{};
    report_.output_path = output_path;

    const std::string part = part_path(output_path);
    file_io::ensure_parent_dirs(output_path);

    u64 t0 = utils::now_ms();
    std::vector<u32> faulty;
    {
        file_io::MmapWriter writer;
        writer.open(part, m.original_size);

        for (const auto& desc : m.chunks) {
            if (!src.has_chunk(desc.index)) {
                log_fault(desc.index, "missing", "no artifact");
                faulty.push_back(desc.index);
                continue;
            }

            std::vector<u8> token;
            try {
                token = src.load_chunk(desc.index);
            } catch (const std::exception& e) {
                log_fault(desc.index, "missing", e.what());
                faulty.push_back(desc.index);
                continue;
            }

            if (token.size() != desc.size ||
                hash::sha256(token.data(), token.size()) != desc.hash) {
                log_fault(desc.index, "transport_hash", "token digest differs from manifest");
                faulty.push_back(desc.index);
                continue;
            }

            std::vector<u8> raw;
            try {
                raw = codec_.restore(desc, token, m.compression);
            } catch (const AuthenticationError& e) {
                log_fault(desc.index, "auth_failed", e.what());
                faulty.push_back(desc.index);
                continue;
            } catch (const IntegrityError& e) {
                log_fault(desc.index, "integrity", e.what());
                faulty.push_back(desc.index);
                continue;
            }

            writer.write_at(m.chunk_offset(desc.index), raw.data(), raw.size());
            ++report_.chunks_verified;
        }
        writer.close();
    }

    if (!faulty.empty()) {
        flag_invalid(output_path);
        std::string list;
        for (size_t i = 0; i < faulty.size(); ++i) {
            if (i) list += ',';
            list += std::to_string(faulty[i]);
        }
        throw ReassemblyError(m.original_filename + ": " + std::to_string(faulty.size()) +
                              " faulty chunk(s): " + list, std::move(faulty));
    }

    // Whole-file hash over what actually landed on disk
    {
        file_io::MmapReader reader(part);
        hash::Sha256 h;
        h.update(reader.data(), (size_t)reader.size());
        report_.computed = h.digest();
    }

    if (report_.computed != m.original_hash) {
        flag_invalid(output_path);
        throw IntegrityError(m.original_filename + ": whole-file hash mismatch, expected " +
                             hash::to_hex(m.original_hash) + " got " +
                             hash::to_hex(report_.computed));
    }

    std::error_code ec;
    fs::rename(part, output_path, ec);
    if (ec) {
        throw std::runtime_error("Cannot rename " + part + " -> " + output_path +
                                 ": " + ec.message());
    }

    LOG_INFO("Reassembled " + output_path + " (" + utils::format_bytes(m.original_size) +
             ", " + std::to_string(report_.chunks_verified) + " chunks, " +
             std::to_string(utils::now_ms() - t0) + " ms)");
    return report_;
}

void Reassembler::flag_invalid(const std::string& output_path) {
    const std::string part = part_path(output_path);
    const std::string bad  = invalid_path(output_path);
    std::error_code ec;
    fs::rename(part, bad, ec);
    if (ec) {
        LOG_ERROR("Cannot flag " + part + " as invalid: " + ec.message());
    } else {
        LOG_WARN("Partial output kept as " + bad);
    }
}
