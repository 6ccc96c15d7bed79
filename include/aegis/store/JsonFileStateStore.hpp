#pragma once

#include <filesystem>
#include <mutex>

#include "aegis/store/StateStore.hpp"

namespace aegis {

// ---------------------------------------------------------------------------
// Directory-backed store.
//
// Layout under root:
//   docs/<key>.json     one file per document, replaced via temp + rename
//   logs/<log>.jsonl    append-only JSON lines
//   batch.redo          pending multi-key batch (exists only mid-commit)
//
// commit() first writes the whole batch to batch.redo (temp + rename, so the
// redo file is either complete or absent), then applies each key, then
// removes the redo file. A crash between those steps is repaired on open by
// replaying batch.redo, which makes every batch all-or-nothing.
//
// A torn trailing line in a log (crash mid-append) is skipped on read.
// ---------------------------------------------------------------------------
class JsonFileStateStore final : public StateStore {
public:
    explicit JsonFileStateStore(const std::string& root);

    std::optional<nlohmann::json> get(const std::string& key) const override;

    std::vector<std::pair<std::string, nlohmann::json>>
    scan(const std::string& prefix) const override;

    void commit(const WriteBatch& batch) override;

    void append(const std::string& log, const nlohmann::json& record) override;

    std::vector<nlohmann::json> read_log(const std::string& log) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    void recover();
    void apply(const WriteBatch& batch);

    std::filesystem::path doc_path(const std::string& key) const;
    std::filesystem::path log_path(const std::string& log) const;

    static std::string encode_key(const std::string& key);
    static std::string decode_key(const std::string& name);
    static void write_atomic(const std::filesystem::path& path, const std::string& data);

    std::filesystem::path root_;
    std::filesystem::path docs_dir_;
    std::filesystem::path logs_dir_;
    std::filesystem::path redo_path_;
    mutable std::mutex mtx_;
};

} // namespace aegis
