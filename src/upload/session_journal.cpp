#include "vidup/upload/session_journal.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace vidup::upload {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

UploadStatus status_from_string(const std::string& text) {
    if (text == "uploading") return UploadStatus::Uploading;
    if (text == "paused") return UploadStatus::Paused;
    if (text == "completed") return UploadStatus::Completed;
    if (text == "failed") return UploadStatus::Failed;
    return UploadStatus::Idle;
}

bool valid_key(const std::string& key) {
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

json entry_to_json(const std::string& key, const UploadSession& session) {
    json j;
    j["key"] = key;
    j["session_id"] = session.session_id;
    j["file_name"] = session.file_name;
    j["total_size"] = session.total_size;
    j["offset"] = session.offset;
    j["title"] = session.metadata.title;
    j["description"] = session.metadata.description;
    j["status"] = to_string(session.status);
    return j;
}

Result<JournalEntry> entry_from_json(const json& j) {
    if (!j.is_object() || !j.contains("session_id") || !j["session_id"].is_string()) {
        return Err<JournalEntry>(std::string("Journal entry missing session_id"));
    }
    try {
        JournalEntry entry;
        entry.key = j.value("key", "");
        entry.session_id = j.at("session_id").get<std::string>();
        entry.file_name = j.value("file_name", "");
        entry.total_size = j.value("total_size", std::uint64_t{0});
        entry.offset = j.value("offset", std::uint64_t{0});
        entry.metadata.title = j.value("title", "");
        entry.metadata.description = j.value("description", "");
        entry.status = status_from_string(j.value("status", "idle"));
        return Ok(std::move(entry));
    } catch (const json::exception& e) {
        return Err<JournalEntry>(std::string("Malformed journal entry: ") + e.what());
    }
}

} // namespace

SessionJournal::SessionJournal(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::warn("Failed to create journal directory {}: {}", directory_.string(), ec.message());
    }
}

Result<void> SessionJournal::save(const std::string& key, const UploadSession& session) {
    auto path = path_for(key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    std::lock_guard lock(mutex_);
    // Write to a sibling file and rename so a crash never leaves a torn entry
    const fs::path temp = path.value().string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(std::string("Failed to open journal file: ") + temp.string());
        }
        out << entry_to_json(key, session).dump(2);
        if (!out) {
            return Err<void>(std::string("Failed to write journal file: ") + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path.value(), ec);
    if (ec) {
        return Err<void>(std::string("Failed to commit journal file: ") + path.value().string());
    }
    return Ok();
}

Result<JournalEntry> SessionJournal::load(const std::string& key) const {
    auto path = path_for(key);
    if (path.is_error()) {
        return Err<JournalEntry>(path.error());
    }

    std::lock_guard lock(mutex_);
    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return Err<JournalEntry>(std::string("No journal entry for key: ") + key);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return Err<JournalEntry>(std::string("Invalid JSON in journal entry: ") + key);
    }
    auto entry = entry_from_json(parsed);
    if (entry.is_ok() && entry.value().key.empty()) {
        entry.value().key = key;
    }
    return entry;
}

Result<void> SessionJournal::remove(const std::string& key) {
    auto path = path_for(key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path.value(), ec);
    if (ec) {
        return Err<void>(std::string("Failed to remove journal entry: ") + key);
    }
    return Ok();
}

bool SessionJournal::contains(const std::string& key) const {
    auto path = path_for(key);
    if (path.is_error()) {
        return false;
    }
    std::lock_guard lock(mutex_);
    std::error_code ec;
    return fs::exists(path.value(), ec);
}

std::vector<JournalEntry> SessionJournal::list() const {
    std::vector<JournalEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return entries;
    }

    for (const auto& item : fs::directory_iterator(directory_, ec)) {
        if (!item.is_regular_file() || item.path().extension() != ".json") {
            continue;
        }
        auto entry = load(item.path().stem().string());
        if (entry.is_error()) {
            spdlog::warn("Skipping journal file {}: {}", item.path().string(), entry.error());
            continue;
        }
        entries.push_back(std::move(entry.value()));
    }

    std::sort(entries.begin(), entries.end(), [](const JournalEntry& a, const JournalEntry& b) {
        return a.key < b.key;
    });
    return entries;
}

Result<fs::path> SessionJournal::path_for(const std::string& key) const {
    if (!valid_key(key)) {
        return Err<fs::path>(std::string("Invalid journal key: ") + key);
    }
    return Ok(directory_ / (key + ".json"));
}

} // namespace vidup::upload
