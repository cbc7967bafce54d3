#pragma once
#include <map>
#include <string>
#include <vector>

namespace config {

/**
 * INI configuration for a single process
 *
 * Sections and keys are case-sensitive; values are stored as strings and
 * converted on access. Lines starting with '#' or ';' are comments.
 * Values may reference environment variables as ${NAME}; they are
 * expanded when the file is loaded, an unset variable expanding to "".
 *
 * A load replaces everything previously loaded. Malformed lines are
 * skipped and reported by get_parse_errors(); the load then returns false
 * but the well-formed entries remain readable.
 */
class ProcessConfigManager {
public:
    ProcessConfigManager() = default;

    bool load_config(const std::string& config_file);
    bool load_config_from_string(const std::string& config_content);

    std::string get_string(const std::string& section, const std::string& key, const std::string& default_value = "") const;

    // Typed getters return default_value when the key is missing or does not parse
    int get_int(const std::string& section, const std::string& key, int default_value = 0) const;
    double get_double(const std::string& section, const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false) const;

    // Comma-separated list value, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                      const std::vector<std::string>& default_value = {}) const;

    std::vector<std::string> get_sections() const;
    std::vector<std::string> get_keys(const std::string& section) const;
    bool has_section(const std::string& section) const;
    bool has_key(const std::string& section, const std::string& key) const;

    // "line N: ..." for each line skipped by the last load
    const std::vector<std::string>& get_parse_errors() const { return parse_errors_; }

private:
    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> sections_;
    std::vector<std::string> parse_errors_;
};

// Default configuration file for a process, e.g. config/trade_ingest.ini
std::string get_default_config_file(const std::string& process_type);

} // namespace config
