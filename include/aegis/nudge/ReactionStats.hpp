#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace aegis {

// Historical 5-minute price reaction of one sector to one event type.
struct ReactionStats {
    std::string event_type;
    std::string sector;
    bool passes_validation = false;
    int sample_size_5m = 0;
    bool last_12m_threshold = false;
    double effect_size_5m = 0.0;
    std::optional<double> orthogonality_score;
    double avg_return_5m = 0.0;
    double hit_rate_5m = 0.0;
};

void to_json(nlohmann::json& j, const ReactionStats& s);
void from_json(const nlohmann::json& j, ReactionStats& s);

class ReactionStatsProvider {
public:
    virtual ~ReactionStatsProvider() = default;

    virtual std::optional<ReactionStats>
    get(const std::string& event_type, const std::string& sector) const = 0;

    virtual std::vector<ReactionStats> validated() const = 0;
};

// In-memory table, usually loaded from a JSON array file. A row with
// sector "*" answers for any sector that has no row of its own.
class ReactionStatsTable final : public ReactionStatsProvider {
public:
    ReactionStatsTable() = default;

    // Throws InvalidArgument on a malformed file, NotFound if missing.
    size_t load_file(const std::string& path);
    size_t load_json(const nlohmann::json& rows);

    void put(const ReactionStats& s);

    std::optional<ReactionStats>
    get(const std::string& event_type, const std::string& sector) const override;

    std::vector<ReactionStats> validated() const override;

    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::pair<std::string, std::string>, ReactionStats> rows_;
};

} // namespace aegis
