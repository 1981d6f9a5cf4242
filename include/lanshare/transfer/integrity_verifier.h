#ifndef LANSHARE_TRANSFER_INTEGRITY_VERIFIER_H
#define LANSHARE_TRANSFER_INTEGRITY_VERIFIER_H

#include "lanshare/base/error_code.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanshare {

enum class HashAlgorithm {
    MD5,
    SHA1,
    SHA256
};

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);
std::string to_string(HashAlgorithm algorithm);

struct VerifyResult {
    bool matched = false;
    std::string actual;  // empty when the file could not be read
};

struct MergeResult {
    bool success = false;
    ErrorCode error = ErrorCode::Success;
    std::string message;
};

class IntegrityVerifier {
public:
    // Hex digest of the whole file, streamed with the adaptive buffer size.
    // Returns nullopt if the file cannot be opened or read.
    static std::optional<std::string> checksum(const std::string& path,
                                               HashAlgorithm algorithm = HashAlgorithm::SHA256);

    // Hex digest of the inclusive byte range [start_byte, end_byte]
    static std::optional<std::string> partial_checksum(const std::string& path,
                                                       uint64_t start_byte,
                                                       uint64_t end_byte,
                                                       HashAlgorithm algorithm = HashAlgorithm::SHA256);

    // Case-insensitive comparison against expected_digest
    static VerifyResult verify(const std::string& path,
                               const std::string& expected_digest,
                               HashAlgorithm algorithm = HashAlgorithm::SHA256);

    static std::string digest(std::string_view data, HashAlgorithm algorithm = HashAlgorithm::SHA256);

    // Size check, plus checksum check when one is supplied
    static bool verify_chunk(const std::string& path,
                             uint64_t expected_size,
                             const std::optional<std::string>& expected_checksum = std::nullopt,
                             HashAlgorithm algorithm = HashAlgorithm::SHA256);

    // Concatenate parts (already in chunk-id order) into output, then verify
    // its length and, if given, its checksum. On failure the output is left
    // in place for diagnosis.
    static MergeResult merge_and_verify(const std::vector<std::string>& parts,
                                        const std::string& output,
                                        uint64_t expected_size,
                                        const std::optional<std::string>& expected_checksum = std::nullopt,
                                        HashAlgorithm algorithm = HashAlgorithm::SHA256);
};

} // namespace lanshare

#endif // LANSHARE_TRANSFER_INTEGRITY_VERIFIER_H
