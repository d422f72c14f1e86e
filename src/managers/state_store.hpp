#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Forward order of an item through the pipeline. FAILED is terminal for
// a run and is reachable from every other stage.
enum class Stage {
    PENDING,
    DOWNLOADED,
    UPLOADED,
    PROCESSED,
    CHECKED,
    COMPLETED,
    FAILED,
};

const char* stage_name(Stage s);
std::optional<Stage> parse_stage(const std::string& s);

// True if `later` comes after `earlier` in the forward order (FAILED never does).
bool stage_after(Stage later, Stage earlier);

struct ItemRecord {
    std::string item_id;
    Stage stage = Stage::PENDING;
    std::string updated_at;         // ISO timestamp
    std::string last_error;
};

// Durable item_id -> record map. Every update rewrites the whole file via
// write-temp-then-rename, so a crash leaves either the old or the new file.
// An unreadable file loads as an empty store.
class StateStore {
public:
    using Listener = std::function<void(const ItemRecord&)>;

    explicit StateStore(const fs::path& file);

    // Called after every persisted update
    void set_listener(Listener listener);

    // Upsert and persist before returning.
    Result<void> update(const std::string& item_id, Stage stage, const std::string& error = "");

    std::optional<ItemRecord> get(const std::string& item_id) const;

    // Recorded stage is `stage` or later (a FAILED record has reached nothing).
    bool reached(const std::string& item_id, Stage stage) const;

    // Recorded stage is UPLOADED or later.
    bool can_skip_download(const std::string& item_id) const;
    // Recorded stage is PROCESSED or later.
    bool can_skip_upload(const std::string& item_id) const;

    // Explicit operator actions
    Result<int> clear_failed();
    Result<bool> remove(const std::string& item_id);

    std::vector<ItemRecord> all() const;

    const fs::path& path() const { return path_; }
    const std::string& load_warning() const { return load_warning_; }

private:
    void load();
    Result<void> save_locked() const;

    fs::path path_;
    std::map<std::string, ItemRecord> records_;
    std::string load_warning_;
    Listener listener_;
    mutable std::mutex mutex_;
};
