#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "component_registry.hpp"

namespace asftoken {

struct ValidationSettings {
    bool require_registry = true;  // Consult the registry when validating and scanning
};

struct ScanSettings {
    std::size_t max_matches = 0;   // 0 = unlimited
};

struct TokenConfig {
    std::vector<std::string> components;
    ValidationSettings validation;
    ScanSettings scan;

    // Registry holding the configured components
    std::shared_ptr<StaticComponentRegistry> createRegistry() const;
};

/**
 * Loads and parses the asftoken.yaml configuration file.
 *
 * Example:
 *   components: [sample, atr]
 *   validation:
 *     require_registry: true
 *   scan:
 *     max_matches: 0
 */
class ConfigLoader {
public:
    explicit ConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * Load and parse a YAML file from disk.
     *
     * @param file_path Absolute path, or relative to the config directory
     * @return Parsed YAML::Node representing the file contents
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    YAML::Node loadYamlFile(const std::filesystem::path& file_path) const;

    /**
     * Load the main configuration file.
     * @throws std::runtime_error on missing files, bad YAML or invalid values
     */
    TokenConfig load() const;

    /**
     * Interpret an already parsed configuration document.
     * @throws std::runtime_error on invalid values
     */
    static TokenConfig parse(const YAML::Node& root);

    std::filesystem::path resolvePath(const std::filesystem::path& relative_path) const;

    std::filesystem::path getConfigFilePath() const { return config_file_path_; }
    std::filesystem::path getBasePath() const { return base_path_; }

private:
    std::filesystem::path config_file_path_;
    std::filesystem::path base_path_;
};

} // namespace asftoken
