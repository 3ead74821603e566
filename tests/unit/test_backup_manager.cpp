#include <catch2/catch_test_macros.hpp>
#include "BackupManager.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

TEST_CASE("create_backup copies the file under a timestamped name") {
    TempDir temp;
    const auto file = temp.path() / "notes.txt";
    write_file(file, "keep me");
    const auto backup_dir = temp.path() / "backup" / "file_backups";

    BackupManager backups(backup_dir);
    const auto backup = backups.create_backup(file);

    REQUIRE(backup.has_value());
    REQUIRE(backup->parent_path().string() == backup_dir.string());
    const std::string name = backup->filename().string();
    REQUIRE(name.starts_with("notes.txt."));
    REQUIRE(name.ends_with(".bak"));
    REQUIRE(read_file(*backup) == "keep me");
    REQUIRE(read_file(file) == "keep me");
}

TEST_CASE("backup_path_for splices the timestamp before .bak") {
    const auto path = BackupManager::backup_path_for("/data/backups", "/src/report.txt", 1700000000);
    REQUIRE(path.filename().string() == "report.txt.1700000000.bak");
}

TEST_CASE("backup_path_for appends the counter after the timestamp") {
    const auto path = BackupManager::backup_path_for("/data/backups", "/src/report.txt", 1700000000, 2);
    REQUIRE(path.filename().string() == "report.txt.1700000000_2.bak");
}

TEST_CASE("create_backup never overwrites an earlier backup of the same name") {
    TempDir temp;
    const auto first = temp.path() / "a" / "report.txt";
    const auto second = temp.path() / "b" / "report.txt";
    write_file(first, "FIRST");
    write_file(second, "SECOND");
    const auto backup_dir = temp.path() / "backups";

    BackupManager backups(backup_dir);
    // Occupy every name the next few seconds could produce so both backups collide.
    const std::int64_t now = Utils::unix_timestamp();
    for (std::int64_t ts = now; ts <= now + 5; ++ts) {
        write_file(BackupManager::backup_path_for(backup_dir, first, ts), "OLD");
    }

    const auto first_backup = backups.create_backup(first);
    const auto second_backup = backups.create_backup(second);

    REQUIRE(first_backup.has_value());
    REQUIRE(second_backup.has_value());
    REQUIRE(first_backup->string() != second_backup->string());
    REQUIRE(read_file(*first_backup) == "FIRST");
    REQUIRE(read_file(*second_backup) == "SECOND");
    REQUIRE(read_file(BackupManager::backup_path_for(backup_dir, first, now)) == "OLD");
}

TEST_CASE("create_backup returns nothing for missing files or when disabled") {
    TempDir temp;
    const auto file = temp.path() / "notes.txt";
    write_file(file, "data");

    BackupManager enabled(temp.path() / "backups");
    REQUIRE_FALSE(enabled.create_backup(temp.path() / "missing.txt").has_value());

    BackupManager disabled(temp.path() / "backups", false);
    REQUIRE_FALSE(disabled.enabled());
    REQUIRE_FALSE(disabled.create_backup(file).has_value());
}

TEST_CASE("create_backup fails softly when the backup dir cannot be created") {
    TempDir temp;
    const auto file = temp.path() / "notes.txt";
    write_file(file, "data");
    const auto blocker = temp.path() / "blocker";
    write_file(blocker, "not a directory");

    BackupManager backups(blocker / "backups");
    REQUIRE_FALSE(backups.create_backup(file).has_value());
    REQUIRE(read_file(file) == "data");
}

TEST_CASE("prune_expired removes only backups older than the retention") {
    TempDir temp;
    const auto backup_dir = temp.path() / "backups";
    const auto old_backup = backup_dir / "old.txt.1.bak";
    const auto fresh_backup = backup_dir / "fresh.txt.2.bak";
    write_file(old_backup, "old");
    write_file(fresh_backup, "fresh");
    std::filesystem::last_write_time(old_backup,
        std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * 10));

    BackupManager backups(backup_dir);
    REQUIRE(backups.prune_expired(std::chrono::hours(24 * 7)) == 1);
    REQUIRE_FALSE(std::filesystem::exists(old_backup));
    REQUIRE(std::filesystem::exists(fresh_backup));
}

TEST_CASE("prune_expired tolerates a missing backup directory") {
    TempDir temp;
    BackupManager backups(temp.path() / "never-created");
    REQUIRE(backups.prune_expired(std::chrono::seconds(0)) == 0);
}
