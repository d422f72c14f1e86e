#include "state_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::PENDING:    return "pending";
        case Stage::DOWNLOADED: return "downloaded";
        case Stage::UPLOADED:   return "uploaded";
        case Stage::PROCESSED:  return "processed";
        case Stage::CHECKED:    return "checked";
        case Stage::COMPLETED:  return "completed";
        case Stage::FAILED:     return "failed";
    }
    return "pending";
}

std::optional<Stage> parse_stage(const std::string& s) {
    for (Stage st : {Stage::PENDING, Stage::DOWNLOADED, Stage::UPLOADED, Stage::PROCESSED,
                     Stage::CHECKED, Stage::COMPLETED, Stage::FAILED}) {
        if (s == stage_name(st)) return st;
    }
    return std::nullopt;
}

bool stage_after(Stage later, Stage earlier) {
    if (later == Stage::FAILED || earlier == Stage::FAILED) return false;
    return static_cast<int>(later) > static_cast<int>(earlier);
}

StateStore::StateStore(const fs::path& file) : path_(file) {
    load();
}

void StateStore::load() {
    if (!fs::exists(path_)) {
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        YAML::Node items = root["items"];
        if (items && !items.IsMap()) {
            throw std::runtime_error("'items' is not a map");
        }
        for (const auto& kv : items) {
            ItemRecord rec;
            rec.item_id = kv.first.as<std::string>();
            auto stage = parse_stage(kv.second["stage"].as<std::string>(""));
            if (!stage) {
                throw std::runtime_error("unknown stage for " + rec.item_id);
            }
            rec.stage = *stage;
            rec.updated_at = kv.second["updated_at"].as<std::string>("");
            rec.last_error = kv.second["last_error"].as<std::string>("");
            records_[rec.item_id] = rec;
        }
        ferry_log(fmt::format("[state] loaded {} record(s) from {}", records_.size(), path_.string()));
    } catch (const std::exception& e) {
        // Corrupted state file: start fresh
        records_.clear();
        load_warning_ = fmt::format("state file {} unreadable ({}), starting with empty state",
                                    path_.string(), e.what());
        ferry_log("[state] WARNING " + load_warning_);
    }
}

Result<void> StateStore::save_locked() const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "items" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, rec] : records_) {
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "stage" << YAML::Value << stage_name(rec.stage);
        out << YAML::Key << "updated_at" << YAML::Value << rec.updated_at;
        out << YAML::Key << "last_error" << YAML::Value << rec.last_error;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    fs::path tmp = path_;
    tmp += fmt::format(".tmp.{}", ::getpid());
    {
        std::ofstream fout(tmp, std::ios::trunc);
        if (!fout) {
            return Result<void>::Err("cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        fout.flush();
        if (!fout) {
            return Result<void>::Err("short write to " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err("cannot replace " + path_.string());
    }
    return Result<void>::Ok();
}

void StateStore::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

Result<void> StateStore::update(const std::string& item_id, Stage stage, const std::string& error) {
    ItemRecord copy;
    Listener listener;
    Result<void> r = Result<void>::Ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ItemRecord& rec = records_[item_id];
        rec.item_id = item_id;
        rec.stage = stage;
        rec.updated_at = now_iso();
        rec.last_error = error;
        r = save_locked();
        copy = rec;
        listener = listener_;
    }
    if (r.is_err()) {
        ferry_log("[state] ERROR persisting " + item_id + ": " + r.error);
        return r;
    }
    if (listener) listener(copy);
    return r;
}

std::optional<ItemRecord> StateStore::get(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(item_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

bool StateStore::reached(const std::string& item_id, Stage stage) const {
    auto rec = get(item_id);
    if (!rec) return false;
    return rec->stage == stage || stage_after(rec->stage, stage);
}

bool StateStore::can_skip_download(const std::string& item_id) const {
    return reached(item_id, Stage::UPLOADED);
}

bool StateStore::can_skip_upload(const std::string& item_id) const {
    return reached(item_id, Stage::PROCESSED);
}

Result<int> StateStore::clear_failed() {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.stage == Stage::FAILED) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    auto r = save_locked();
    if (r.is_err()) return Result<int>::Err(r.error);
    return Result<int>::Ok(removed);
}

Result<bool> StateStore::remove(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(item_id) == 0) return Result<bool>::Ok(false);
    auto r = save_locked();
    if (r.is_err()) return Result<bool>::Err(r.error);
    return Result<bool>::Ok(true);
}

std::vector<ItemRecord> StateStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ItemRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_) out.push_back(rec);
    return out;
}
