#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "aegis/store/StateStore.hpp"

namespace aegis {

// In-process store. Used by tests and by deployments that accept losing
// state on restart (paper sandboxes).
class MemoryStateStore final : public StateStore {
public:
    std::optional<nlohmann::json> get(const std::string& key) const override;

    std::vector<std::pair<std::string, nlohmann::json>>
    scan(const std::string& prefix) const override;

    void commit(const WriteBatch& batch) override;

    void append(const std::string& log, const nlohmann::json& record) override;

    std::vector<nlohmann::json> read_log(const std::string& log) const override;

    uint64_t commit_count() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, nlohmann::json> docs_;
    std::unordered_map<std::string, std::vector<nlohmann::json>> logs_;
    uint64_t commits_ = 0;
};

} // namespace aegis
