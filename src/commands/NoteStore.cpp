/**
 * NoteStore.cpp - JSON note file
 */

#include "aegis/commands/NoteStore.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace aegis::commands {

namespace {

std::string localTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

} // anonymous namespace

NoteStore::NoteStore(std::string path)
    : path_(std::move(path)) {
    load();
}

void NoteStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return;
    }

    std::ifstream file(path_);
    try {
        json j = json::parse(file);
        int index = 0;
        for (const auto& item : j) {
            ++index;
            Note note;
            note.id = item.value("id", index);
            note.timestamp = item.value("timestamp", "");
            note.category = item.value("category", "note");
            note.text = item.value("text", "");
            notes_.push_back(std::move(note));
        }
        std::cout << "[NoteStore] Loaded " << notes_.size() << " notes from " << path_ << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[NoteStore] Failed to load " << path_ << ": " << e.what() << std::endl;
        notes_.clear();
    }
}

bool NoteStore::save() const {
    json j = json::array();
    for (const auto& note : notes_) {
        j.push_back({
            {"id", note.id},
            {"timestamp", note.timestamp},
            {"category", note.category},
            {"text", note.text}
        });
    }

    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream file(path_);
    if (!file.good()) {
        std::cerr << "[NoteStore] Cannot write " << path_ << std::endl;
        return false;
    }
    file << j.dump(2) << std::endl;
    return file.good();
}

bool NoteStore::add(const std::string& text, const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);

    Note note;
    note.id = notes_.empty() ? 1 : notes_.back().id + 1;
    note.timestamp = localTimestamp();
    note.category = category;
    note.text = text;
    notes_.push_back(note);

    if (!save()) {
        notes_.pop_back();
        return false;
    }
    std::cout << "[NoteStore] Note [" << note.id << "] (" << category << "): " << text << std::endl;
    return true;
}

std::vector<Note> NoteStore::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = notes_.size() > limit ? notes_.size() - limit : 0;
    return std::vector<Note>(notes_.begin() + start, notes_.end());
}

size_t NoteStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_.size();
}

} // namespace aegis::commands
