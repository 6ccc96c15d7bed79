#include "aegis/nudge/ReactionStats.hpp"
#include "aegis/infra/Errors.hpp"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const ReactionStats& s) {
    j = json{
        {"eventType", s.event_type},
        {"sector", s.sector},
        {"passesValidation", s.passes_validation},
        {"sampleSize5m", s.sample_size_5m},
        {"last12mThreshold", s.last_12m_threshold},
        {"effectSize5m", s.effect_size_5m},
        {"avgReturn5m", s.avg_return_5m},
        {"hitRate5m", s.hit_rate_5m}
    };
    if (s.orthogonality_score) j["orthogonalityScore"] = *s.orthogonality_score;
}

void from_json(const json& j, ReactionStats& s) {
    s.event_type = j.at("eventType").get<std::string>();
    s.sector = j.value("sector", "*");
    s.passes_validation = j.value("passesValidation", false);
    s.sample_size_5m = j.value("sampleSize5m", 0);
    s.last_12m_threshold = j.value("last12mThreshold", false);
    s.effect_size_5m = j.value("effectSize5m", 0.0);
    if (j.contains("orthogonalityScore") && j.at("orthogonalityScore").is_number()) {
        s.orthogonality_score = j.at("orthogonalityScore").get<double>();
    } else {
        s.orthogonality_score.reset();
    }
    s.avg_return_5m = j.value("avgReturn5m", 0.0);
    s.hit_rate_5m = j.value("hitRate5m", 0.0);
}

size_t ReactionStatsTable::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw NotFound("reaction stats file not found: " + path);

    json rows;
    try {
        in >> rows;
    } catch (const json::exception& e) {
        throw InvalidArgument("reaction stats file " + path + " is not valid JSON: " + e.what());
    }

    size_t n = load_json(rows);
    std::cout << "[NUDGE] Loaded " << n << " reaction stats rows from " << path << "\n";
    return n;
}

size_t ReactionStatsTable::load_json(const json& rows) {
    if (!rows.is_array()) throw InvalidArgument("reaction stats must be a JSON array");

    std::vector<ReactionStats> parsed;
    parsed.reserve(rows.size());
    try {
        for (const auto& r : rows) parsed.push_back(r.get<ReactionStats>());
    } catch (const json::exception& e) {
        throw InvalidArgument(std::string("malformed reaction stats row: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& s : parsed) {
        rows_[{s.event_type, s.sector}] = std::move(s);
    }
    return parsed.size();
}

void ReactionStatsTable::put(const ReactionStats& s) {
    std::lock_guard<std::mutex> lock(mtx_);
    rows_[{s.event_type, s.sector}] = s;
}

std::optional<ReactionStats>
ReactionStatsTable::get(const std::string& event_type, const std::string& sector) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = rows_.find({event_type, sector});
    if (it != rows_.end()) return it->second;
    it = rows_.find({event_type, "*"});
    if (it != rows_.end()) return it->second;
    return std::nullopt;
}

std::vector<ReactionStats> ReactionStatsTable::validated() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ReactionStats> out;
    for (const auto& kv : rows_) {
        if (kv.second.passes_validation) out.push_back(kv.second);
    }
    return out;
}

size_t ReactionStatsTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return rows_.size();
}

} // namespace aegis
