#include <catch2/catch_test_macros.hpp>
#include "RelocationRules.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("rules load and map extensions to target directories") {
    TempDir temp;
    const auto rules_path = temp.path() / "rules.ini";
    write_file(rules_path,
               "[Documents]\n"
               "extensions = .pdf, DOCX\n"
               "target_dir = Docs   ; relative to the sorted dir\n"
               "\n"
               "[Images]\n"
               "extensions = .jpg,.png\n"
               "target_dir = /srv/pictures\n");

    RelocationRules rules(rules_path.string());
    REQUIRE(rules.load());
    REQUIRE(rules.list_names() == std::vector<std::string>{"Documents", "Images"});

    const auto docs = rules.get("Documents");
    REQUIRE(docs.has_value());
    REQUIRE(docs->extensions == std::vector<std::string>{".pdf", ".docx"});
    REQUIRE(docs->target_dir.string() == "Docs");
    REQUIRE_FALSE(docs->preserve_path.has_value());

    const fs::path base = "/home/u/inbox";
    const auto tax = rules.destination_for(base / "Tax.PDF", base);
    REQUIRE(tax.has_value());
    REQUIRE(tax->string() == (base / "Docs" / "Tax.PDF").string());
    const auto cat = rules.destination_for(base / "cat.png", base);
    REQUIRE(cat.has_value());
    REQUIRE(cat->string() == "/srv/pictures/cat.png");
    REQUIRE_FALSE(rules.destination_for(base / "song.mp3", base).has_value());
    REQUIRE_FALSE(rules.destination_for(base / "Makefile", base).has_value());
}

TEST_CASE("invalid rules are skipped at load time") {
    TempDir temp;
    const auto rules_path = temp.path() / "rules.ini";
    write_file(rules_path,
               "[NoExtensions]\n"
               "target_dir = Misc\n"
               "[NoTarget]\n"
               "extensions = .zip\n"
               "[BadFlag]\n"
               "extensions = .iso\n"
               "target_dir = Images\n"
               "preserve_path = sometimes\n"
               "[Music]\n"
               "extensions = mp3\n"
               "target_dir = Music\n");

    RelocationRules rules(rules_path.string());
    REQUIRE(rules.load());
    REQUIRE(rules.size() == 1);
    REQUIRE(rules.get("Music").has_value());
    REQUIRE_FALSE(rules.get("NoTarget").has_value());
}

TEST_CASE("preserve_path keeps the relative layout under the target") {
    TempDir temp;
    const auto rules_path = temp.path() / "rules.ini";
    write_file(rules_path,
               "[Archive]\n"
               "extensions = .zip\n"
               "target_dir = /backup/zips\n"
               "preserve_path = true\n");

    RelocationRules rules(rules_path.string());
    REQUIRE(rules.load());

    const fs::path base = "/data";
    const auto zip = rules.destination_for(base / "2024" / "q1.zip", base);
    REQUIRE(zip.has_value());
    REQUIRE(zip->string() == "/backup/zips/2024/q1.zip");
}

TEST_CASE("a missing rules file loads nothing") {
    TempDir temp;
    RelocationRules rules((temp.path() / "absent.ini").string());
    REQUIRE_FALSE(rules.load());
    REQUIRE(rules.empty());
}

TEST_CASE("normalize_extension lowercases and adds the dot") {
    REQUIRE(RelocationRules::normalize_extension("PDF") == ".pdf");
    REQUIRE(RelocationRules::normalize_extension(".Tar") == ".tar");
    REQUIRE(RelocationRules::normalize_extension("").empty());
}
