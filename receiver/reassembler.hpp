#pragma once

// ============================================================
// reassembler.hpp -- Rebuild and verify the original file
//
// Chunks are restored in index order and written at index * chunk_size
// into "<output>.part". Every faulty chunk is logged before the pass
// fails. After a clean pass the whole-file SHA-256 is recomputed over
// the written bytes; only a matching file is renamed to <output>.
// Any failure leaves the partial output as "<output>.invalid".
// ============================================================

#include "../common/platform.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/chunk_source.hpp"
#include "../common/crypto.hpp"
#include "../common/hash.hpp"
#include "../common/manifest.hpp"
#include <string>

struct AssemblyReport {
    u32             chunks_verified{0};
    hash::Digest256 computed{};
    std::string     output_path;
};

class Reassembler {
public:
    explicit Reassembler(const crypto::Key& key);

    // Throws ReassemblyError (faulty chunks listed) or IntegrityError
    // (whole-file hash mismatch).
    AssemblyReport assemble(const ChunkSource& src, const Manifest& m,
                            const std::string& output_path);

    // State of the most recent assemble() call, including failed ones
    const AssemblyReport& last_report() const { return report_; }

    static std::string part_path(const std::string& output_path) { return output_path + ".part"; }
    static std::string invalid_path(const std::string& output_path) { return output_path + ".invalid"; }

private:
    ChunkCodec     codec_;
    AssemblyReport report_;

    void flag_invalid(const std::string& output_path);
};
