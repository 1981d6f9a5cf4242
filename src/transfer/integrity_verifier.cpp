#include "lanshare/transfer/integrity_verifier.h"
#include "lanshare/transfer/chunk_policy.h"
#include "lanshare/base/logger.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>

namespace lanshare {

namespace {

const EVP_MD* evp_for(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5: return EVP_md5();
        case HashAlgorithm::SHA1: return EVP_sha1();
        case HashAlgorithm::SHA256: return EVP_sha256();
    }
    return EVP_sha256();
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Hash `length` bytes starting at `offset`
std::optional<std::string> hash_file_range(const std::string& path, uint64_t offset,
                                           uint64_t length, HashAlgorithm algorithm) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open file for checksum: " + path);
        return std::nullopt;
    }
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        Logger::instance().error("Cannot seek to offset " + std::to_string(offset) + " in " + path);
        return std::nullopt;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1) {
        Logger::instance().error("Failed to initialise " + to_string(algorithm) + " digest");
        return std::nullopt;
    }

    std::vector<char> buffer(adaptive_buffer_size(length));
    uint64_t remaining = length;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining));
        file.read(buffer.data(), want);
        std::streamsize got = file.gcount();
        if (got <= 0) {
            Logger::instance().error("Short read while hashing " + path);
            return std::nullopt;
        }
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got));
        remaining -= static_cast<uint64_t>(got);
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        return std::nullopt;
    }
    return to_hex(md, md_len);
}

} // anonymous namespace

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "md5") return HashAlgorithm::MD5;
    if (n == "sha1") return HashAlgorithm::SHA1;
    if (n == "sha256") return HashAlgorithm::SHA256;
    return std::nullopt;
}

std::string to_string(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5: return "md5";
        case HashAlgorithm::SHA1: return "sha1";
        case HashAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
}

std::optional<std::string> IntegrityVerifier::checksum(const std::string& path, HashAlgorithm algorithm) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        Logger::instance().error("Cannot stat file for checksum: " + path + " (" + ec.message() + ")");
        return std::nullopt;
    }
    return hash_file_range(path, 0, size, algorithm);
}

std::optional<std::string> IntegrityVerifier::partial_checksum(const std::string& path,
                                                               uint64_t start_byte,
                                                               uint64_t end_byte,
                                                               HashAlgorithm algorithm) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || start_byte > end_byte || end_byte >= size) {
        Logger::instance().error("Invalid range " + std::to_string(start_byte) + "-" +
                                 std::to_string(end_byte) + " for " + path);
        return std::nullopt;
    }
    return hash_file_range(path, start_byte, end_byte - start_byte + 1, algorithm);
}

VerifyResult IntegrityVerifier::verify(const std::string& path,
                                       const std::string& expected_digest,
                                       HashAlgorithm algorithm) {
    VerifyResult result;
    auto actual = checksum(path, algorithm);
    if (!actual) {
        return result;
    }
    result.actual = *actual;
    result.matched = (lowercase(expected_digest) == result.actual);
    return result;
}

std::string IntegrityVerifier::digest(std::string_view data, HashAlgorithm algorithm) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, evp_for(algorithm), nullptr) != 1) {
        throw LanShareError(ErrorCode::InternalError, "digest computation failed");
    }
    return to_hex(md, md_len);
}

bool IntegrityVerifier::verify_chunk(const std::string& path,
                                     uint64_t expected_size,
                                     const std::optional<std::string>& expected_checksum,
                                     HashAlgorithm algorithm) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size != expected_size) {
        return false;
    }
    if (expected_checksum) {
        return verify(path, *expected_checksum, algorithm).matched;
    }
    return true;
}

MergeResult IntegrityVerifier::merge_and_verify(const std::vector<std::string>& parts,
                                                const std::string& output,
                                                uint64_t expected_size,
                                                const std::optional<std::string>& expected_checksum,
                                                HashAlgorithm algorithm) {
    MergeResult result;
    {
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.error = ErrorCode::PermissionDenied;
            result.message = "Cannot create output file: " + output;
            return result;
        }

        std::vector<char> buffer(adaptive_buffer_size(expected_size));
        for (const auto& part : parts) {
            std::ifstream in(part, std::ios::binary);
            if (!in.is_open()) {
                result.error = ErrorCode::FileNotFound;
                result.message = "Missing chunk file: " + part;
                return result;
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                if (in.gcount() > 0) {
                    out.write(buffer.data(), in.gcount());
                }
            }
        }
        out.flush();
        if (!out) {
            result.error = ErrorCode::ResourceError;
            result.message = "Write failed while merging into " + output;
            return result;
        }
    }

    std::error_code ec;
    auto actual_size = std::filesystem::file_size(output, ec);
    if (ec || actual_size != expected_size) {
        result.error = ErrorCode::SizeMismatch;
        result.message = "Size mismatch: expected " + std::to_string(expected_size) +
                         ", got " + std::to_string(ec ? 0 : actual_size);
        return result;
    }

    if (expected_checksum && !expected_checksum->empty()) {
        auto verified = verify(output, *expected_checksum, algorithm);
        if (!verified.matched) {
            Logger::instance().error("Checksum mismatch for " + output + ": expected " +
                                     *expected_checksum + ", got " + verified.actual);
            result.error = ErrorCode::ChecksumMismatch;
            result.message = "Checksum mismatch: file may be corrupted";
            return result;
        }
    }

    result.success = true;
    return result;
}

} // namespace lanshare
