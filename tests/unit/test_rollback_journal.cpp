#include <catch2/catch_test_macros.hpp>
#include "RollbackJournal.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace {
Operation make_operation(const std::string& source, const std::string& destination, double timestamp = 100.0) {
    Operation op;
    op.kind = OperationKind::Move;
    op.source_path = source;
    op.destination_path = destination;
    op.timestamp = timestamp;
    return op;
}
}

TEST_CASE("a missing journal loads as empty") {
    TempDir temp;
    RollbackJournal journal(temp.path() / "rollback.json");
    REQUIRE(journal.load().empty());
    REQUIRE_FALSE(journal.last_error().has_value());
}

TEST_CASE("append assigns increasing ids and persists every field") {
    TempDir temp;
    RollbackJournal journal(temp.path() / "rollback.json");

    Operation first = make_operation("/a/one.txt", "/b/one.txt");
    first.backup_path = "/backups/one.txt.100.bak";
    const auto stored_first = journal.append(first);
    Operation second = make_operation("/a/two.txt", "/b/two.txt", 200.5);
    second.outcome = MoveOutcome::VerificationFailed;
    const auto stored_second = journal.append(second);

    REQUIRE(stored_first.has_value());
    REQUIRE(stored_second.has_value());
    REQUIRE(stored_first->id == 1);
    REQUIRE(stored_second->id == 2);

    RollbackJournal reopened(temp.path() / "rollback.json");
    const auto entries = reopened.load();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].source_path == "/a/one.txt");
    REQUIRE(entries[0].destination_path == "/b/one.txt");
    REQUIRE(entries[0].backup_path == std::optional<std::string>("/backups/one.txt.100.bak"));
    REQUIRE(entries[0].outcome == MoveOutcome::Committed);
    REQUIRE(entries[0].state == OperationState::Active);
    REQUIRE(entries[1].timestamp == 200.5);
    REQUIRE_FALSE(entries[1].backup_path.has_value());
    REQUIRE(entries[1].outcome == MoveOutcome::VerificationFailed);
}

TEST_CASE("the journal file is a pretty-printed JSON array") {
    TempDir temp;
    const auto path = temp.path() / "rollback.json";
    RollbackJournal journal(path);
    REQUIRE(journal.append(make_operation("/a/x", "/b/x")).has_value());

    const std::string content = read_file(path);
    REQUIRE(content.front() == '[');
    REQUIRE(content.find("\"operation\" : \"move\"") != std::string::npos);
    REQUIRE(content.find("\"backup\" : null") != std::string::npos);
    REQUIRE(content.find("\n        \"source\"") != std::string::npos);
    REQUIRE_FALSE(fs::exists(temp.path() / "rollback.json.tmp"));
}

TEST_CASE("update replaces entries by id") {
    TempDir temp;
    RollbackJournal journal(temp.path() / "rollback.json");
    auto stored = journal.append(make_operation("/a/x", "/b/x"));
    REQUIRE(journal.append(make_operation("/a/y", "/b/y")).has_value());
    REQUIRE(stored.has_value());

    stored->state = OperationState::Undone;
    stored->source_path = "/a/x_1700000000";
    REQUIRE(journal.update(*stored));

    const auto entries = journal.load();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].state == OperationState::Undone);
    REQUIRE(entries[0].source_path == "/a/x_1700000000");
    REQUIRE(entries[1].state == OperationState::Active);
}

TEST_CASE("clear empties the journal and can be repeated") {
    TempDir temp;
    const auto path = temp.path() / "rollback.json";
    RollbackJournal journal(path);
    REQUIRE(journal.append(make_operation("/a/x", "/b/x")).has_value());

    REQUIRE(journal.clear());
    REQUIRE(journal.clear());
    REQUIRE(journal.load().empty());
    REQUIRE(read_file(path).find("[]") != std::string::npos);
}

TEST_CASE("prune_older_than drops only old entries") {
    TempDir temp;
    RollbackJournal journal(temp.path() / "rollback.json");
    REQUIRE(journal.append(make_operation("/a/old", "/b/old", 10.0)).has_value());
    REQUIRE(journal.append(make_operation("/a/new", "/b/new", 1000.0)).has_value());

    REQUIRE(journal.prune_older_than(500.0));

    const auto entries = journal.load();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().source_path == "/a/new");
}

TEST_CASE("invalid JSON reads as empty and is replaced on the next write") {
    TempDir temp;
    const auto path = temp.path() / "rollback.json";
    write_file(path, "{ this is not json");

    RollbackJournal journal(path);
    REQUIRE(journal.load().empty());
    REQUIRE(journal.last_error() == std::optional<ErrorCodes::Code>(ErrorCodes::Code::JOURNAL_PARSE_FAILED));

    const auto stored = journal.append(make_operation("/a/x", "/b/x"));
    REQUIRE(stored.has_value());
    REQUIRE(stored->id == 1);
    REQUIRE(journal.load().size() == 1);
    REQUIRE_FALSE(journal.last_error().has_value());
}

TEST_CASE("a non-array root reads as empty") {
    TempDir temp;
    const auto path = temp.path() / "rollback.json";
    write_file(path, "{\"operation\": \"move\"}");

    RollbackJournal journal(path);
    REQUIRE(journal.load().empty());
}

TEST_CASE("entries without ids or outcomes load as committed and active") {
    TempDir temp;
    const auto path = temp.path() / "rollback.json";
    write_file(path, R"([
    {"timestamp": 1.0, "operation": "move", "source": "/a/x", "destination": "/b/x", "backup": null},
    {"timestamp": 2.0, "operation": "move", "source": "/a/y", "destination": "/b/y", "backup": "/bk/y.2.bak"},
    {"timestamp": 3.0, "operation": "copy", "source": "/a/z", "destination": "/b/z"}
])");

    RollbackJournal journal(path);
    const auto entries = journal.load();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].id == 1);
    REQUIRE(entries[1].id == 2);
    REQUIRE(entries[0].outcome == MoveOutcome::Committed);
    REQUIRE(entries[1].state == OperationState::Active);
    REQUIRE(entries[1].backup_path == std::optional<std::string>("/bk/y.2.bak"));
}

TEST_CASE("writes fail softly when the journal directory is not writable") {
    TempDir temp;
    const auto blocker = temp.path() / "blocker";
    write_file(blocker, "file, not directory");

    RollbackJournal journal(blocker / "rollback.json", std::chrono::milliseconds(50));
    REQUIRE_FALSE(journal.append(make_operation("/a/x", "/b/x")).has_value());
    REQUIRE(journal.last_error().has_value());
}
