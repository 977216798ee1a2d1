#include "llmrouter/common/Config.h"
#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

extern char** environ;

namespace llmrouter {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string Config::ExpandEnv(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            const size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
            const std::string name = value.substr(i + 2, close - i - 2);
            const char* env = name.empty() ? nullptr : ::getenv(name.c_str());
            if (env) out.append(env);
            i = close + 1;
            continue;
        }
        out.push_back(value[i++]);
    }
    return out;
}

bool Config::ParseLocked(std::istream& in) {
    settings_.clear();
    sectionOrder_.clear();

    std::string line, section = "global";
    sectionOrder_.push_back(section);
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            if (std::find(sectionOrder_.begin(), sectionOrder_.end(), section) == sectionOrder_.end()) {
                sectionOrder_.push_back(section);
            }
            settings_[section];
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (!key.empty()) settings_[section][key] = ExpandEnv(value);
        }
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ParseLocked(file);
    loadedFilename_ = filename;

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return ParseLocked(in);
}

int Config::ApplyEnvOverrides(const std::string& prefix) {
    int applied = 0;
    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        if (entry.rfind(prefix, 0) != 0) continue;
        const size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;

        const std::string path = entry.substr(prefix.size(), eq - prefix.size());
        const size_t sep = path.find("__");
        if (sep == std::string::npos || sep == 0 || sep + 2 >= path.size()) continue;

        std::string section = path.substr(0, sep);
        std::string key = path.substr(sep + 2);
        std::transform(section.begin(), section.end(), section.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        SetString(section, key, entry.substr(eq + 1));
        LOG_DEBUG << "Config override from environment: [" << section << "] " << key;
        ++applied;
    }
    return applied;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(sectionOrder_.begin(), sectionOrder_.end(), section) == sectionOrder_.end()) {
        sectionOrder_.push_back(section);
    }
    settings_[section][key] = value;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::HasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.count(section) != 0;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not a number, using " << defaultVal;
        return defaultVal;
    }
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    return defaultVal;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<std::pair<std::string, Section>> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& section : sectionOrder_) {
        if (section.rfind(prefix, 0) != 0) continue;
        auto it = settings_.find(section);
        if (it == settings_.end()) continue;
        out.push_back({section, it->second});
    }
    return out;
}

} // namespace common
} // namespace llmrouter
