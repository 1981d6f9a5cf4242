#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <regex>
#include <set>
#include "lanshare/server/share_catalog.h"
#include "test_support.h"

using namespace lanshare;
using lanshare::test::TempDir;

TEST_CASE("Generated ids are random UUIDs", "[catalog][id]") {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = ShareCatalog::generate_id();
        REQUIRE(std::regex_match(id, uuid));
        seen.insert(id);
    }
    REQUIRE(seen.size() == 200);
}

TEST_CASE("Adding and removing files", "[catalog][files]") {
    TempDir dir("catalog");
    test::write_file(dir.file("Report.PDF"), std::string(2048, 'r'));
    test::write_file(dir.file("notes.txt"), "hello");

    ShareCatalog catalog;
    auto report = catalog.add_file(dir.file("Report.PDF"));
    auto notes = catalog.add_file(dir.file("notes.txt"));
    REQUIRE(report.has_value());
    REQUIRE(notes.has_value());
    REQUIRE(*report != *notes);
    REQUIRE(catalog.size() == 2);
    REQUIRE(catalog.total_bytes() == 2053);

    auto entry = catalog.find(*report);
    REQUIRE(entry.has_value());
    REQUIRE(entry->display_name == "Report.PDF");
    REQUIRE(entry->extension == ".pdf");
    REQUIRE(entry->size_bytes == 2048);
    REQUIRE(std::filesystem::path(entry->local_path).is_absolute());

    SECTION("Entries are ordered by name") {
        auto all = catalog.entries();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].display_name == "Report.PDF");
        REQUIRE(all[1].display_name == "notes.txt");
    }

    SECTION("Removed ids are gone") {
        REQUIRE(catalog.remove(*notes));
        REQUIRE_FALSE(catalog.remove(*notes));
        REQUIRE_FALSE(catalog.find(*notes).has_value());
        REQUIRE(catalog.size() == 1);
    }

    SECTION("Clear") {
        catalog.clear();
        REQUIRE(catalog.size() == 0);
        REQUIRE(catalog.total_bytes() == 0);
    }
}

TEST_CASE("Rejected inputs", "[catalog][reject]") {
    TempDir dir("catalog_reject");
    ShareCatalog catalog;

    REQUIRE_FALSE(catalog.add_file(dir.file("missing.bin")).has_value());
    REQUIRE_FALSE(catalog.add_file(dir.path().string()).has_value());
    REQUIRE(catalog.add_folder(dir.file("missing_dir")).empty());

    SECTION("Size limit") {
        ServerConfig config;
        config.max_file_size_mb = 0;
        ShareCatalog strict(config);
        test::write_file(dir.file("one.bin"), "x");
        REQUIRE_FALSE(strict.add_file(dir.file("one.bin")).has_value());
        test::write_file(dir.file("empty.bin"), "");
        REQUIRE(strict.add_file(dir.file("empty.bin")).has_value());
    }
}

TEST_CASE("Folder sharing keeps relative folders", "[catalog][folder]") {
    TempDir dir("catalog_folder");
    auto root = dir.path() / "photos";
    std::filesystem::create_directories(root / "2024" / "june");
    test::write_file((root / "cover.jpg").string(), "c");
    test::write_file((root / "2024" / "a.png").string(), "a");
    test::write_file((root / "2024" / "june" / "b.png").string(), "b");

    ShareCatalog catalog;
    auto ids = catalog.add_folder(root.string());
    REQUIRE(ids.size() == 3);

    std::set<std::string> folders;
    for (const auto& e : catalog.entries()) {
        folders.insert(e.folder);
    }
    REQUIRE(folders == std::set<std::string>{"photos", "photos/2024", "photos/2024/june"});
}

TEST_CASE("Catalog JSON and HTML rendering", "[catalog][render]") {
    TempDir dir("catalog_render");
    ShareCatalog catalog;

    REQUIRE(catalog.to_json() == "[]");
    REQUIRE(catalog.to_html().find("No files are currently being shared.") != std::string::npos);

    test::write_file(dir.file("a<b>.txt"), std::string(1536, 'x'));
    auto id = catalog.add_file(dir.file("a<b>.txt"));
    REQUIRE(id.has_value());

    auto doc = nlohmann::json::parse(catalog.to_json());
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0]["id"] == *id);
    REQUIRE(doc[0]["name"] == "a<b>.txt");
    REQUIRE(doc[0]["size"] == "1.5 KB");
    REQUIRE(doc[0]["size_bytes"] == 1536);
    REQUIRE(doc[0]["extension"] == ".txt");
    REQUIRE(doc[0]["folder"] == "");
    REQUIRE(doc[0]["modified"].get<std::string>().size() == 19);

    auto html = catalog.to_html();
    REQUIRE(html.find("a&lt;b&gt;.txt") != std::string::npos);
    REQUIRE(html.find("a<b>.txt") == std::string::npos);
    REQUIRE(html.find("/download/" + *id) != std::string::npos);
    REQUIRE(html.find("/files/" + *id) != std::string::npos);
}

TEST_CASE("File size formatting and limits", "[catalog][size]") {
    REQUIRE(format_file_size(512) == "512 B");
    REQUIRE(format_file_size(1536) == "1.5 KB");
    REQUIRE(format_file_size(12 * MiB) == "12.0 MB");
    REQUIRE(format_file_size(GiB + GiB / 4) == "1.25 GB");

    ServerConfig config;
    REQUIRE(validate_file_size(MiB, config).allowed);
    REQUIRE_FALSE(validate_file_size(MiB, config).message.has_value());

    auto warn = validate_file_size(2 * GiB, config);
    REQUIRE(warn.allowed);
    REQUIRE(warn.message.has_value());

    auto reject = validate_file_size(11 * GiB, config);
    REQUIRE_FALSE(reject.allowed);
    REQUIRE(*reject.message == "File exceeds maximum size limit of 10240 MB");
}
