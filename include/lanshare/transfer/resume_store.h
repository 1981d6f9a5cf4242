#ifndef LANSHARE_TRANSFER_RESUME_STORE_H
#define LANSHARE_TRANSFER_RESUME_STORE_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lanshare {

// Snapshot of an incomplete download
struct ResumeRecord {
    std::string url;
    std::string save_path;
    uint64_t total_size = 0;
    uint64_t downloaded = 0;
    std::optional<std::string> checksum;
    double timestamp = 0.0;  // seconds since epoch
};

enum class ResumeStatus {
    NoRecord,
    Inconsistent,
    Resumable
};

struct ResumeCheck {
    ResumeStatus status = ResumeStatus::NoRecord;
    uint64_t offset = 0;  // bytes already present when Resumable

    bool resumable() const { return status == ResumeStatus::Resumable; }
};

// One JSON file per job id under a directory
class ResumeStore {
public:
    explicit ResumeStore(std::filesystem::path directory = default_directory());

    static std::filesystem::path default_directory();

    bool save(const std::string& job_id, const ResumeRecord& record);
    std::optional<ResumeRecord> load(const std::string& job_id) const;
    bool remove(const std::string& job_id);
    bool exists(const std::string& job_id) const;

    // Resumable only when the record's total matches, the partial artifact
    // exists with exactly `downloaded` bytes, and 0 < downloaded < total
    ResumeCheck check(const std::string& job_id,
                      const std::string& partial_path,
                      uint64_t total_size) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path record_path(const std::string& job_id) const;

    std::filesystem::path directory_;
};

} // namespace lanshare

#endif // LANSHARE_TRANSFER_RESUME_STORE_H
