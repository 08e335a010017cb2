/**
 * NoteStore.hpp - Persistent notes ("remember that ...")
 *
 * JSON array of {"id", "timestamp", "category", "text"}.
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace aegis::commands {

struct Note {
    int id = 0;
    std::string timestamp;
    std::string category = "note";
    std::string text;
};

class NoteStore {
public:
    explicit NoteStore(std::string path);

    // Appends and writes the file. Returns false if the file cannot be written.
    bool add(const std::string& text, const std::string& category = "note");

    std::vector<Note> recent(size_t limit) const;
    size_t size() const;
    const std::string& path() const { return path_; }

private:
    void load();
    bool save() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<Note> notes_;
};

} // namespace aegis::commands
