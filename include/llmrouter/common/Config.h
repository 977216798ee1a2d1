#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llmrouter/common/noncopyable.h"

namespace llmrouter {
namespace common {

// INI settings store. Values may reference the environment as ${VAR};
// plain sections can be overridden with LLM_ROUTER__<SECTION>__<KEY>.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    // Returns the number of overrides applied.
    int ApplyEnvOverrides(const std::string& prefix = "LLM_ROUTER__");

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    std::optional<std::string> LoadedFilename() const;

    bool HasSection(const std::string& section) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    // Get value as double
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;

    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Sections whose name starts with prefix, in declaration order.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

    // Replaces ${VAR} with getenv(VAR); unset variables expand to "".
    static std::string ExpandEnv(const std::string& value);

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    bool ParseLocked(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, Section> settings_;
    std::vector<std::string> sectionOrder_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace llmrouter
