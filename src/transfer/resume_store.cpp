#include "lanshare/transfer/resume_store.h"
#include "lanshare/base/logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

namespace lanshare {

using json = nlohmann::json;

namespace {

json to_json(const ResumeRecord& record) {
    json j = {
        {"url", record.url},
        {"save_path", record.save_path},
        {"total_size", record.total_size},
        {"downloaded", record.downloaded},
        {"timestamp", record.timestamp}
    };
    j["checksum"] = record.checksum ? json(*record.checksum) : json(nullptr);
    return j;
}

ResumeRecord from_json(const json& j) {
    ResumeRecord record;
    record.url = j.at("url").get<std::string>();
    record.save_path = j.at("save_path").get<std::string>();
    record.total_size = j.at("total_size").get<uint64_t>();
    record.downloaded = j.at("downloaded").get<uint64_t>();
    record.timestamp = j.value("timestamp", 0.0);
    if (j.contains("checksum") && j["checksum"].is_string()) {
        record.checksum = j["checksum"].get<std::string>();
    }
    return record;
}

} // anonymous namespace

ResumeStore::ResumeStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path ResumeStore::default_directory() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? home : std::filesystem::temp_directory_path().string();
    return base / ".lan_file_share" / "resume";
}

std::filesystem::path ResumeStore::record_path(const std::string& job_id) const {
    return directory_ / (job_id + ".json");
}

bool ResumeStore::save(const std::string& job_id, const ResumeRecord& record) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        Logger::instance().error("Cannot create resume directory " + directory_.string() + ": " + ec.message());
        return false;
    }

    // Write then rename so a crash never leaves a truncated record
    auto path = record_path(job_id);
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            Logger::instance().error("Cannot write resume record: " + tmp.string());
            return false;
        }
        out << to_json(record).dump(2);
        if (!out) {
            Logger::instance().error("Failed writing resume record: " + tmp.string());
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        Logger::instance().error("Cannot commit resume record " + path.string() + ": " + ec.message());
        return false;
    }
    Logger::instance().debug("Saved resume record " + job_id);
    return true;
}

std::optional<ResumeRecord> ResumeStore::load(const std::string& job_id) const {
    auto path = record_path(job_id);
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    try {
        return from_json(json::parse(in));
    } catch (const json::exception& e) {
        Logger::instance().warning("Unreadable resume record " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool ResumeStore::remove(const std::string& job_id) {
    std::error_code ec;
    bool removed = std::filesystem::remove(record_path(job_id), ec);
    if (ec) {
        Logger::instance().warning("Cannot delete resume record " + job_id + ": " + ec.message());
        return false;
    }
    return removed;
}

bool ResumeStore::exists(const std::string& job_id) const {
    std::error_code ec;
    return std::filesystem::exists(record_path(job_id), ec);
}

ResumeCheck ResumeStore::check(const std::string& job_id,
                               const std::string& partial_path,
                               uint64_t total_size) const {
    ResumeCheck result;
    if (!exists(job_id)) {
        return result;
    }

    result.status = ResumeStatus::Inconsistent;
    auto record = load(job_id);
    if (!record || record->total_size != total_size) {
        return result;
    }

    std::error_code ec;
    auto partial_size = std::filesystem::file_size(partial_path, ec);
    if (ec) {
        return result;
    }

    if (record->downloaded == partial_size && partial_size > 0 && partial_size < total_size) {
        result.status = ResumeStatus::Resumable;
        result.offset = partial_size;
    }
    return result;
}

} // namespace lanshare
