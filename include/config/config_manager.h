#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "protocols/dns/dns_types.h"
#include "protocols/gtp/gtp_types.h"

namespace ctlwire {

/**
 * Logging Configuration
 */
struct LoggingConfig {
    std::string level = "INFO";
};

/**
 * Codec Configuration Manager
 *
 * Loads the codec switches from a YAML file and hands them out as the plain
 * option structs the codecs take. Access is thread-safe; the codecs never
 * read this singleton themselves.
 *
 * Example usage:
 *   auto& config_mgr = ConfigManager::getInstance();
 *   config_mgr.loadFromFile("config/ctlwire.yaml");
 *
 *   auto msg = dns::DnsMessage::decode(data, len, config_mgr.getDnsOptions());
 */
class ConfigManager {
public:
    /**
     * Environment variable overriding logging.level
     */
    static constexpr const char* kLogLevelEnv = "CTLWIRE_LOG_LEVEL";

    /**
     * Get singleton instance
     */
    static ConfigManager& getInstance();

    /**
     * Load configuration from YAML file
     *
     * @param filepath Path to the YAML file
     * @return true on success, false on failure (previous settings are kept)
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * Load configuration from YAML text
     *
     * @return true on success, false on failure (previous settings are kept)
     */
    bool loadFromString(const std::string& yaml_content);

    /**
     * Reload configuration from the last file loaded
     *
     * @return true on success, false on failure
     */
    bool reload();

    /**
     * Restore every setting to its default and forget the loaded file
     */
    void reset();

    LoggingConfig getLoggingConfig() const;
    dns::DnsCodecOptions getDnsOptions() const;
    gtp::GtpCodecOptions getGtpOptions() const;

    /**
     * Export the effective configuration as JSON
     */
    nlohmann::json exportToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Delete copy/move constructors and assignment operators
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Parse YAML configuration and commit it when every section is valid
     *
     * @param yaml_content YAML content as string
     * @return true on success, false on failure
     */
    bool parseYaml(const std::string& yaml_content);

    // Configuration storage
    LoggingConfig logging_config_;
    dns::DnsCodecOptions dns_options_;
    gtp::GtpCodecOptions gtp_options_;

    // Configuration file path (for reload)
    std::string config_filepath_;

    // Thread safety
    mutable std::mutex mutex_;
};

}  // namespace ctlwire
