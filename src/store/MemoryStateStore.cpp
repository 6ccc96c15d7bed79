#include "aegis/store/MemoryStateStore.hpp"

namespace aegis {

std::optional<nlohmann::json> MemoryStateStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = docs_.find(key);
    if (it == docs_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<std::string, nlohmann::json>>
MemoryStateStore::scan(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::pair<std::string, nlohmann::json>> out;
    for (auto it = docs_.lower_bound(prefix); it != docs_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.emplace_back(it->first, it->second);
    }
    return out;
}

void MemoryStateStore::commit(const WriteBatch& batch) {
    if (batch.empty()) return;
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& kv : batch.puts) {
        docs_[kv.first] = kv.second;
    }
    for (const auto& key : batch.erases) {
        docs_.erase(key);
    }
    commits_++;
}

void MemoryStateStore::append(const std::string& log, const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(mtx_);
    logs_[log].push_back(record);
}

std::vector<nlohmann::json> MemoryStateStore::read_log(const std::string& log) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = logs_.find(log);
    if (it == logs_.end()) return {};
    return it->second;
}

uint64_t MemoryStateStore::commit_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return commits_;
}

} // namespace aegis
