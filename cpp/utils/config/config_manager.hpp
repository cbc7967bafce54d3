#pragma once
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <functional>
#include <stdexcept>
#include <cstdlib>

namespace config {

class ConfigValidator {
public:
    using ValidatorFunc = std::function<bool(const std::string&)>;

    void add_validator(const std::string& key, ValidatorFunc validator, const std::string& error_msg) {
        validators_[key] = {validator, error_msg};
    }

    // Throws std::invalid_argument naming the first key that fails
    bool validate(const std::map<std::string, std::string>& config) const {
        for (const auto& [key, validator_info] : validators_) {
            auto it = config.find(key);
            if (it != config.end()) {
                if (!validator_info.first(it->second)) {
                    throw std::invalid_argument("Validation failed for " + key + ": " + validator_info.second);
                }
            }
        }
        return true;
    }

    static bool is_positive_integer(const std::string& value) {
        if (value.empty()) return false;
        for (char c : value) {
            if (c < '0' || c > '9') return false;
        }
        return value.find_first_not_of('0') != std::string::npos;
    }

    static bool is_non_empty(const std::string& value) {
        return !value.empty();
    }

private:
    struct ValidatorInfo {
        ValidatorFunc first;
        std::string second;
    };
    std::map<std::string, ValidatorInfo> validators_;
};

class EnvironmentConfig {
public:
    static std::string get_env_var(const std::string& name, const std::string& default_value = "") {
        const char* value = std::getenv(name.c_str());
        return value ? std::string(value) : default_value;
    }

    static bool has_env_var(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        return value != nullptr && value[0] != '\0';
    }

    static std::string expand_env_vars(const std::string& input) {
        std::string result = input;
        size_t start = 0;

        while ((start = result.find("${", start)) != std::string::npos) {
            size_t end = result.find("}", start);
            if (end == std::string::npos) break;

            std::string var_name = result.substr(start + 2, end - start - 2);
            std::string var_value = get_env_var(var_name);

            result.replace(start, end - start + 1, var_value);
            start += var_value.length();
        }

        return result;
    }

    // Deployment overrides recognised by the ingest service, only those that are set
    static std::map<std::string, std::string> load_env_config() {
        static const char* const kNames[] = {
            "REDIS_URL",
            "BINANCE_WS_URL",
            "BINANCE_REST_URL",
            "MAX_STREAM_LENGTH",
            "PAIR_REFRESH_INTERVAL",
            "PAIRS_PER_CONNECTION",
            "HEALTH_PORT",
            "PAIR_LIMIT",
            "FALLBACK_PAIRS",
            "COINGECKO_API_BASE",
            "COINGECKO_PRO_API_KEY",
            "LOG_LEVEL",
        };

        std::map<std::string, std::string> config;
        for (const char* name : kNames) {
            if (has_env_var(name)) {
                config[name] = get_env_var(name);
            }
        }
        return config;
    }
};

} // namespace config
