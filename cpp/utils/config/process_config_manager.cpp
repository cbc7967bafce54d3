#include "process_config_manager.hpp"
#include "config_manager.hpp"
#include "../logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {
const char* kComponent = "CONFIG";

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

bool ProcessConfigManager::load_config(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        LOG_ERROR_COMP(kComponent, "Cannot open config file " + config_file);
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    bool ok = load_config_from_string(content.str());
    for (const auto& error : parse_errors_) {
        LOG_WARN_COMP(kComponent, config_file + " " + error);
    }
    return ok;
}

bool ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    sections_.clear();
    parse_errors_.clear();

    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.size() < 3 || line.back() != ']') {
                parse_errors_.push_back("line " + std::to_string(line_number) + ": malformed section header");
                current_section.clear();
                continue;
            }
            current_section = trim(line.substr(1, line.size() - 2));
            sections_[current_section];
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            parse_errors_.push_back("line " + std::to_string(line_number) + ": expected key = value");
            continue;
        }
        if (current_section.empty()) {
            parse_errors_.push_back("line " + std::to_string(line_number) + ": key outside of a section");
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            parse_errors_.push_back("line " + std::to_string(line_number) + ": empty key");
            continue;
        }

        sections_[current_section][key] = EnvironmentConfig::expand_env_vars(trim(line.substr(eq + 1)));
    }

    return parse_errors_.empty();
}

const std::string* ProcessConfigManager::find(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return nullptr;
    }
    auto key_it = section_it->second.find(key);
    return key_it == section_it->second.end() ? nullptr : &key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key, const std::string& default_value) const {
    const std::string* value = find(section, key);
    return value ? *value : default_value;
}

int ProcessConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    const std::string* value = find(section, key);
    if (!value) {
        return default_value;
    }
    try {
        size_t used = 0;
        int parsed = std::stoi(*value, &used);
        if (used == value->size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    LOG_WARN_COMP(kComponent, section + "." + key + " is not an integer: '" + *value + "'");
    return default_value;
}

double ProcessConfigManager::get_double(const std::string& section, const std::string& key, double default_value) const {
    const std::string* value = find(section, key);
    if (!value) {
        return default_value;
    }
    try {
        size_t used = 0;
        double parsed = std::stod(*value, &used);
        if (used == value->size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    LOG_WARN_COMP(kComponent, section + "." + key + " is not a number: '" + *value + "'");
    return default_value;
}

bool ProcessConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    const std::string* value = find(section, key);
    if (!value) {
        return default_value;
    }
    std::string lowered = to_lower(*value);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    LOG_WARN_COMP(kComponent, section + "." + key + " is not a boolean: '" + *value + "'");
    return default_value;
}

std::vector<std::string> ProcessConfigManager::get_list(const std::string& section, const std::string& key,
                                                       const std::vector<std::string>& default_value) const {
    const std::string* value = find(section, key);
    if (!value) {
        return default_value;
    }

    std::vector<std::string> items;
    std::istringstream stream(*value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> ProcessConfigManager::get_sections() const {
    std::vector<std::string> sections;
    for (const auto& entry : sections_) {
        sections.push_back(entry.first);
    }
    return sections;
}

std::vector<std::string> ProcessConfigManager::get_keys(const std::string& section) const {
    std::vector<std::string> keys;
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        for (const auto& entry : section_it->second) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

bool ProcessConfigManager::has_section(const std::string& section) const {
    return sections_.count(section) > 0;
}

bool ProcessConfigManager::has_key(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

std::string get_default_config_file(const std::string& process_type) {
    return "config/" + process_type + ".ini";
}

} // namespace config
