#include "config/config_manager.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "common/logger.h"
#include <yaml-cpp/yaml.h>

namespace ctlwire {

// Helper function to convert YAML::Node to nlohmann::json
static nlohmann::json yamlToJson(const YAML::Node& node) {
    nlohmann::json result;

    switch (node.Type()) {
        case YAML::NodeType::Null:
            result = nullptr;
            break;
        case YAML::NodeType::Scalar:
            // Try bool, then integer, then floating point, else keep the text
            try {
                result = node.as<bool>();
            } catch (const YAML::BadConversion&) {
                try {
                    result = node.as<int64_t>();
                } catch (const YAML::BadConversion&) {
                    try {
                        result = node.as<double>();
                    } catch (const YAML::BadConversion&) {
                        result = node.as<std::string>();
                    }
                }
            }
            break;
        case YAML::NodeType::Sequence:
            result = nlohmann::json::array();
            for (const auto& item : node) {
                result.push_back(yamlToJson(item));
            }
            break;
        case YAML::NodeType::Map:
            result = nlohmann::json::object();
            for (const auto& pair : node) {
                result[pair.first.as<std::string>()] = yamlToJson(pair.second);
            }
            break;
        default:
            result = nullptr;
            break;
    }

    return result;
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filepath) {
    LOG_INFO("Loading codec configuration from: " << filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open configuration file: " << filepath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!parseYaml(buffer.str())) {
        return false;
    }

    // Store filepath for reload
    config_filepath_ = filepath;

    LOG_INFO("Successfully loaded configuration from: " << filepath);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);
    return parseYaml(yaml_content);
}

bool ConfigManager::reload() {
    std::string filepath;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filepath = config_filepath_;
    }

    if (filepath.empty()) {
        LOG_ERROR("Cannot reload: no configuration file loaded");
        return false;
    }

    LOG_INFO("Reloading configuration from: " << filepath);
    return loadFromFile(filepath);
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    logging_config_ = LoggingConfig{};
    dns_options_ = dns::DnsCodecOptions{};
    gtp_options_ = gtp::GtpCodecOptions{};
    config_filepath_.clear();
}

bool ConfigManager::parseYaml(const std::string& yaml_content) {
    // Parse into copies so a bad file leaves the current settings untouched
    LoggingConfig logging = logging_config_;
    dns::DnsCodecOptions dns_options = dns_options_;
    gtp::GtpCodecOptions gtp_options = gtp_options_;

    try {
        nlohmann::json config = yamlToJson(YAML::Load(yaml_content));
        if (config.is_null()) {
            config = nlohmann::json::object();
        }
        if (!config.is_object()) {
            LOG_ERROR("Configuration root must be a mapping");
            return false;
        }

        // Parse Logging configuration
        if (config.contains("logging")) {
            const auto& log_json = config["logging"];
            if (log_json.contains("level")) {
                logging.level = log_json["level"].get<std::string>();
            }
        }

        // Parse DNS configuration
        if (config.contains("dns")) {
            const auto& dns_json = config["dns"];
            if (dns_json.contains("compress_names")) {
                dns_options.compress_names = dns_json["compress_names"].get<bool>();
            }
            if (dns_json.contains("accept_unknown_rr_types")) {
                dns_options.accept_unknown_rr_types =
                    dns_json["accept_unknown_rr_types"].get<bool>();
            }
            LOG_DEBUG("Loaded DNS configuration");
        }

        // Parse GTP configuration
        if (config.contains("gtp")) {
            const auto& gtp_json = config["gtp"];
            if (gtp_json.contains("strict_length")) {
                gtp_options.strict_length = gtp_json["strict_length"].get<bool>();
            }
            if (gtp_json.contains("v2_grouped_types")) {
                if (!gtp_json["v2_grouped_types"].is_array()) {
                    LOG_ERROR("gtp.v2_grouped_types must be a list of IE types");
                    return false;
                }
                gtp_options.grouped_v2_types.clear();
                for (const auto& type : gtp_json["v2_grouped_types"]) {
                    int value = type.get<int>();
                    if (value < 0 || value > 255) {
                        LOG_ERROR("GTPv2 IE type out of range: " << value);
                        return false;
                    }
                    gtp_options.grouped_v2_types.push_back(static_cast<uint8_t>(value));
                }
            }
            LOG_DEBUG("Loaded GTP configuration");
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parsing error: " << e.what());
        return false;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Invalid configuration value: " << e.what());
        return false;
    }

    if (const char* env_level = std::getenv(kLogLevelEnv)) {
        if (parseLogLevel(env_level).has_value()) {
            logging.level = env_level;
        } else {
            LOG_WARN("Ignoring invalid {}={}", kLogLevelEnv, env_level);
        }
    }

    auto level = parseLogLevel(logging.level);
    if (!level.has_value()) {
        LOG_ERROR("Unknown log level: " << logging.level);
        return false;
    }
    logging.level = logLevelToString(level.value());

    logging_config_ = logging;
    dns_options_ = dns_options;
    gtp_options_ = gtp_options;

    Logger::getInstance().setLevel(level.value());
    return true;
}

LoggingConfig ConfigManager::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logging_config_;
}

dns::DnsCodecOptions ConfigManager::getDnsOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dns_options_;
}

gtp::GtpCodecOptions ConfigManager::getGtpOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gtp_options_;
}

nlohmann::json ConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json result;
    result["logging"]["level"] = logging_config_.level;
    result["dns"]["compress_names"] = dns_options_.compress_names;
    result["dns"]["accept_unknown_rr_types"] = dns_options_.accept_unknown_rr_types;
    result["gtp"]["strict_length"] = gtp_options_.strict_length;
    result["gtp"]["v2_grouped_types"] = gtp_options_.grouped_v2_types;

    if (!config_filepath_.empty()) {
        result["source"] = config_filepath_;
    }

    return result;
}

}  // namespace ctlwire
