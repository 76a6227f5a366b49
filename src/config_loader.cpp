#include "config_loader.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <crow/logging.h>

#include "token_grammar.hpp"

namespace asftoken {

std::shared_ptr<StaticComponentRegistry> TokenConfig::createRegistry() const {
    return std::make_shared<StaticComponentRegistry>(components);
}

ConfigLoader::ConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(std::filesystem::absolute(config_file_path)),
      base_path_(config_file_path_.parent_path()) {
    CROW_LOG_DEBUG << "ConfigLoader initialized with config file: " << config_file_path_.string();
}

std::filesystem::path ConfigLoader::resolvePath(const std::filesystem::path& relative_path) const {
    if (relative_path.empty()) {
        return base_path_;
    }
    if (relative_path.is_absolute()) {
        return relative_path;
    }
    return base_path_ / relative_path;
}

YAML::Node ConfigLoader::loadYamlFile(const std::filesystem::path& file_path) const {
    std::filesystem::path full_path = resolvePath(file_path);
    try {
        if (!std::filesystem::exists(full_path)) {
            throw std::runtime_error("Configuration file not found: " + full_path.string());
        }

        CROW_LOG_DEBUG << "Loading YAML file: " << full_path.string();

        std::ifstream file(full_path);
        if (!file) {
            throw std::runtime_error("Cannot open configuration file: " + full_path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return YAML::Load(buffer.str());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + full_path.string() + "': " + e.what());
    }
}

TokenConfig ConfigLoader::load() const {
    YAML::Node root = loadYamlFile(config_file_path_);
    try {
        TokenConfig config = parse(root);
        CROW_LOG_INFO << "Loaded configuration with " << config.components.size()
                      << " allocated components from " << config_file_path_.string();
        return config;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid configuration in '" + config_file_path_.string() + "': " + e.what());
    }
}

TokenConfig ConfigLoader::parse(const YAML::Node& root) {
    TokenConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    if (auto components = root["components"]) {
        if (!components.IsSequence()) {
            throw std::runtime_error("'components' must be a list of component names");
        }
        std::set<std::string> seen;
        for (const auto& node : components) {
            std::string component = node.as<std::string>();
            if (!isValidComponent(component)) {
                throw std::runtime_error("Invalid component '" + component +
                                         "': must be 3-6 lowercase ASCII letters");
            }
            if (!seen.insert(component).second) {
                CROW_LOG_WARNING << "Duplicate component in configuration: " << component;
                continue;
            }
            config.components.push_back(component);
        }
    }

    if (auto validation = root["validation"]) {
        if (validation["require_registry"]) {
            config.validation.require_registry = validation["require_registry"].as<bool>();
        }
    }

    if (auto scan = root["scan"]) {
        if (scan["max_matches"]) {
            int max_matches = scan["max_matches"].as<int>();
            if (max_matches < 0) {
                throw std::runtime_error("'scan.max_matches' must not be negative");
            }
            config.scan.max_matches = static_cast<std::size_t>(max_matches);
        }
    }

    return config;
}

} // namespace asftoken
