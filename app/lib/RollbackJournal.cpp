#include "RollbackJournal.hpp"
#include "FileLock.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
std::shared_ptr<spdlog::logger> journal_logger()
{
    return Logger::get_logger("journal_logger");
}

std::uint64_t max_id(const std::vector<Operation>& entries)
{
    std::uint64_t result = 0;
    for (const auto& entry : entries) {
        result = std::max(result, entry.id);
    }
    return result;
}
}


RollbackJournal::RollbackJournal(fs::path journal_path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(journal_path)),
      lock_path_(Utils::utf8_to_path(Utils::path_to_utf8(path_) + ".lock")),
      lock_timeout_(lock_timeout)
{
}


Json::Value RollbackJournal::to_json(const Operation& op)
{
    Json::Value value(Json::objectValue);
    value["id"] = Json::UInt64(op.id);
    value["operation"] = to_string(op.kind);
    value["source"] = op.source_path;
    value["destination"] = op.destination_path;
    value["timestamp"] = op.timestamp;
    value["backup"] = op.backup_path ? Json::Value(*op.backup_path) : Json::Value(Json::nullValue);
    value["outcome"] = to_string(op.outcome);
    value["state"] = to_string(op.state);
    return value;
}


std::optional<Operation> RollbackJournal::from_json(const Json::Value& value)
{
    if (!value.isObject() || !value["operation"].isString() || !value["source"].isString() ||
        !value["destination"].isString()) {
        return std::nullopt;
    }
    const auto kind = operation_kind_from_string(value["operation"].asString());
    if (!kind) {
        return std::nullopt;
    }

    Operation op;
    op.kind = *kind;
    op.source_path = value["source"].asString();
    op.destination_path = value["destination"].asString();
    if (value["id"].isUInt64()) {
        op.id = value["id"].asUInt64();
    }
    if (value["timestamp"].isNumeric()) {
        op.timestamp = value["timestamp"].asDouble();
    }
    if (value["backup"].isString()) {
        op.backup_path = value["backup"].asString();
    }
    // Entries written before outcomes were tracked are treated as committed moves.
    if (value["outcome"].isString()) {
        const auto outcome = move_outcome_from_string(value["outcome"].asString());
        if (!outcome) {
            return std::nullopt;
        }
        op.outcome = *outcome;
    }
    if (value["state"].isString()) {
        const auto state = operation_state_from_string(value["state"].asString());
        if (!state) {
            return std::nullopt;
        }
        op.state = *state;
    }
    return op;
}


void RollbackJournal::fail(ErrorCodes::Code code, const std::string& context) const
{
    last_error_ = code;
    if (auto logger = journal_logger()) {
        logger->error("{}", ErrorCodes::ErrorCatalog::get_error_info(code, context).get_full_details());
    }
}


std::optional<ErrorCodes::Code> RollbackJournal::last_error() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return last_error_;
}


std::vector<Operation> RollbackJournal::read_entries() const
{
    std::vector<Operation> entries;
    const std::string path_str = Utils::path_to_utf8(path_);

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return entries;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        fail(ErrorCodes::Code::JOURNAL_READ_FAILED, path_str);
        return entries;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return entries;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(content);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        fail(ErrorCodes::Code::JOURNAL_PARSE_FAILED, path_str + ": " + errors);
        return entries;
    }
    if (!root.isArray()) {
        if (auto logger = journal_logger()) {
            logger->warn("Rollback log does not contain a JSON array: {}", path_str);
        }
        return entries;
    }

    entries.reserve(root.size());
    for (const auto& item : root) {
        if (auto op = from_json(item)) {
            entries.push_back(std::move(*op));
        } else if (auto logger = journal_logger()) {
            logger->warn("Skipping malformed rollback entry in {}", path_str);
        }
    }

    std::uint64_t next_id = max_id(entries);
    for (auto& entry : entries) {
        if (entry.id == 0) {
            entry.id = ++next_id;
        }
    }
    return entries;
}


bool RollbackJournal::write_entries(const std::vector<Operation>& entries) const
{
    const std::string path_str = Utils::path_to_utf8(path_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            fail(ErrorCodes::Code::JOURNAL_WRITE_FAILED, path_str + ": " + ec.message());
            return false;
        }
    }

    Json::Value root(Json::arrayValue);
    for (const auto& entry : entries) {
        root.append(to_json(entry));
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "    ";
    const std::string serialized = Json::writeString(writer, root);

    const fs::path temp_path = Utils::utf8_to_path(path_str + ".tmp");
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            fail(ErrorCodes::Code::JOURNAL_WRITE_FAILED, Utils::path_to_utf8(temp_path));
            return false;
        }
        out << serialized << '\n';
        out.flush();
        if (!out) {
            fail(ErrorCodes::Code::JOURNAL_WRITE_FAILED, Utils::path_to_utf8(temp_path));
            out.close();
            fs::remove(temp_path, ec);
            return false;
        }
    }

    fs::rename(temp_path, path_, ec);
    if (ec) {
        fail(ErrorCodes::Code::JOURNAL_WRITE_FAILED, path_str + ": " + ec.message());
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return false;
    }
    return true;
}


bool RollbackJournal::rewrite(const Mutator& mutator)
{
    std::lock_guard<std::mutex> guard(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    FileLock lock(lock_path_);
    if (!lock.acquire(lock_timeout_)) {
        fail(ErrorCodes::Code::JOURNAL_LOCK_FAILED, Utils::path_to_utf8(lock_path_));
        return false;
    }

    std::vector<Operation> entries = read_entries();
    mutator(entries);
    const bool written = write_entries(entries);
    if (written) {
        last_error_.reset();
    }
    return written;
}


std::vector<Operation> RollbackJournal::load() const
{
    std::lock_guard<std::mutex> guard(mutex_);

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return {};
    }

    FileLock lock(lock_path_);
    if (!lock.acquire(lock_timeout_)) {
        if (auto logger = journal_logger()) {
            logger->warn("Reading {} without the journal lock", Utils::path_to_utf8(path_));
        }
    }
    return read_entries();
}


std::optional<Operation> RollbackJournal::append(Operation op)
{
    Operation stored;
    const bool written = rewrite([&op, &stored](std::vector<Operation>& entries) {
        op.id = max_id(entries) + 1;
        entries.push_back(op);
        stored = op;
    });
    if (!written) {
        return std::nullopt;
    }
    if (auto logger = journal_logger()) {
        logger->debug("Journaled operation #{} ({} -> {}, {})", stored.id, stored.source_path,
                      stored.destination_path, to_string(stored.outcome));
    }
    return stored;
}


bool RollbackJournal::update(const std::vector<Operation>& ops)
{
    if (ops.empty()) {
        return true;
    }
    return rewrite([&ops](std::vector<Operation>& entries) {
        for (auto& entry : entries) {
            const auto it = std::find_if(ops.begin(), ops.end(),
                                         [&entry](const Operation& op) { return op.id == entry.id; });
            if (it != ops.end()) {
                entry = *it;
            }
        }
    });
}


bool RollbackJournal::update(const Operation& op)
{
    return update(std::vector<Operation>{op});
}


bool RollbackJournal::clear()
{
    const bool cleared = rewrite([](std::vector<Operation>& entries) { entries.clear(); });
    if (cleared) {
        if (auto logger = journal_logger()) {
            logger->info("Cleared rollback journal {}", Utils::path_to_utf8(path_));
        }
    }
    return cleared;
}


bool RollbackJournal::prune_older_than(double cutoff)
{
    std::size_t removed = 0;
    const bool written = rewrite([cutoff, &removed](std::vector<Operation>& entries) {
        const auto before = entries.size();
        std::erase_if(entries, [cutoff](const Operation& op) { return op.timestamp < cutoff; });
        removed = before - entries.size();
    });
    if (written) {
        if (auto logger = journal_logger()) {
            logger->info("Pruned {} rollback entr{} older than cutoff", removed, removed == 1 ? "y" : "ies");
        }
    }
    return written;
}
