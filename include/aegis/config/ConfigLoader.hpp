#pragma once
// =============================================================================
// ConfigLoader.hpp - INI file parser for the control plane
// =============================================================================
// Loads settings from config.ini. Keys are addressed as (section, key).
// Sections may be namespaced with a dot ("pipeline.conservative_promotion")
// so repeated blocks can be enumerated with sections_with_prefix().
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace aegis {

class ConfigLoader {
public:
    ConfigLoader() = default;

    // Tries path, then ../path. AEGIS_CONFIG env var overrides path.
    bool load(const std::string& path = "config.ini");
    bool load_string(const std::string& text);

    bool has(const std::string& section, const std::string& key) const;

    std::string get(const std::string& section, const std::string& key,
                    const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key, bool default_val = false) const;

    // Suffixes of every section named "<prefix>.<suffix>", in file order.
    std::vector<std::string> sections_with_prefix(const std::string& prefix) const;

    const std::string& config_path() const { return config_path_; }

    void dump() const;

private:
    bool parse(std::istream& in);

    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> sections_;
    std::string config_path_;
};

} // namespace aegis
