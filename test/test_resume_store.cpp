#include <catch2/catch_test_macros.hpp>
#include "lanshare/transfer/resume_store.h"
#include "lanshare/transfer/chunked_download_client.h"
#include "test_support.h"

using namespace lanshare;
using lanshare::test::TempDir;

TEST_CASE("Resume record save and load", "[resume][store]") {
    TempDir dir("resume");
    ResumeStore store(dir.path() / "records");

    ResumeRecord record;
    record.url = "http://10.0.0.5:8000/download/abc";
    record.save_path = "/tmp/file.iso";
    record.total_size = 5000;
    record.downloaded = 1200;
    record.checksum = "deadbeef";
    record.timestamp = 1700000000.5;

    REQUIRE_FALSE(store.exists("job1"));
    REQUIRE(store.save("job1", record));
    REQUIRE(store.exists("job1"));

    auto loaded = store.load("job1");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->url == record.url);
    REQUIRE(loaded->save_path == record.save_path);
    REQUIRE(loaded->total_size == 5000);
    REQUIRE(loaded->downloaded == 1200);
    REQUIRE(loaded->checksum == std::optional<std::string>("deadbeef"));

    record.checksum.reset();
    record.downloaded = 2400;
    REQUIRE(store.save("job1", record));
    loaded = store.load("job1");
    REQUIRE(loaded->downloaded == 2400);
    REQUIRE_FALSE(loaded->checksum.has_value());

    REQUIRE(store.remove("job1"));
    REQUIRE_FALSE(store.exists("job1"));
    REQUIRE_FALSE(store.remove("job1"));
    REQUIRE_FALSE(store.load("job1").has_value());
}

TEST_CASE("Corrupt resume record is ignored", "[resume][store]") {
    TempDir dir("resume_corrupt");
    ResumeStore store(dir.path());
    test::write_file((dir.path() / "broken.json").string(), "{not json");

    REQUIRE(store.exists("broken"));
    REQUIRE_FALSE(store.load("broken").has_value());
    REQUIRE(store.check("broken", dir.file("x.partial"), 100).status == ResumeStatus::Inconsistent);
}

TEST_CASE("Resume check requires a consistent partial file", "[resume][check]") {
    TempDir dir("resume_check");
    ResumeStore store(dir.path() / "records");
    auto partial = dir.file("movie.mkv.partial");

    ResumeRecord record;
    record.url = "http://peer/download/1";
    record.save_path = dir.file("movie.mkv");
    record.total_size = 1000;
    record.downloaded = 400;

    SECTION("No record") {
        REQUIRE(store.check("job", partial, 1000).status == ResumeStatus::NoRecord);
    }

    SECTION("Matching record and partial") {
        store.save("job", record);
        test::write_file(partial, std::string(400, 'a'));
        auto check = store.check("job", partial, 1000);
        REQUIRE(check.resumable());
        REQUIRE(check.offset == 400);
    }

    SECTION("Partial size disagrees with the record") {
        store.save("job", record);
        test::write_file(partial, std::string(300, 'a'));
        REQUIRE(store.check("job", partial, 1000).status == ResumeStatus::Inconsistent);
    }

    SECTION("Total size changed on the server") {
        store.save("job", record);
        test::write_file(partial, std::string(400, 'a'));
        REQUIRE(store.check("job", partial, 2000).status == ResumeStatus::Inconsistent);
    }

    SECTION("Partial file missing") {
        store.save("job", record);
        REQUIRE(store.check("job", partial, 1000).status == ResumeStatus::Inconsistent);
    }

    SECTION("Already complete partial is not resumable") {
        record.downloaded = 1000;
        store.save("job", record);
        test::write_file(partial, std::string(1000, 'a'));
        REQUIRE_FALSE(store.check("job", partial, 1000).resumable());
    }
}

TEST_CASE("Job ids are stable per url, destination and size", "[resume][job]") {
    auto a = ChunkedDownloadClient::make_job_id("http://h/download/1", "/tmp/a", 100);
    auto b = ChunkedDownloadClient::make_job_id("http://h/download/1", "/tmp/a", 100);
    auto c = ChunkedDownloadClient::make_job_id("http://h/download/1", "/tmp/a", 101);
    auto d = ChunkedDownloadClient::make_job_id("http://h/download/1", "/tmp/b", 100);

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a != d);
    REQUIRE(a.size() == 32);
}
