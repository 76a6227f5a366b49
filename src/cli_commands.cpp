#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <crow/json.h>
#include <crow/logging.h>

#include "token.hpp"
#include "token_detector.hpp"
#include "token_generator.hpp"
#include "token_validator.hpp"

namespace asftoken {

namespace {
    std::shared_ptr<const ComponentRegistry> validationRegistry(const TokenConfig& config, bool offline) {
        if (offline || !config.validation.require_registry) {
            return nullptr;
        }
        return config.createRegistry();
    }

    int printError(const Error& error, std::ostream& out) {
        out << error.toJson().dump() << std::endl;
        return kExitFailure;
    }
}

TokenConfig loadCommandConfig(const std::string& config_file) {
    if (!std::filesystem::exists(config_file)) {
        CROW_LOG_WARNING << "Configuration file " << config_file
                         << " not found, continuing with an empty registry";
        return TokenConfig();
    }
    try {
        return ConfigLoader(config_file).load();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
}

std::string readCommandInput(const std::string& path, std::istream& in) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int runGenerate(const TokenConfig& config,
                const std::string& component,
                std::shared_ptr<EntropySource> entropy,
                std::ostream& out) {
    TokenGenerator generator(config.createRegistry(), std::move(entropy));
    auto token = generator.generate(component);
    if (!token) {
        return printError(token.error(), out);
    }
    out << token->toString() << std::endl;
    return kExitOk;
}

int runValidate(const TokenConfig& config, bool offline, const std::string& candidate, std::ostream& out) {
    TokenValidator validator(validationRegistry(config, offline));
    auto token = validator.validate(candidate);
    if (!token) {
        return printError(token.error(), out);
    }

    auto fingerprint = token->fingerprint();
    if (!fingerprint) {
        return printError(fingerprint.error(), out);
    }

    crow::json::wvalue result;
    result["success"] = true;
    result["component"] = token->component();
    result["fingerprint"] = *fingerprint;
    result["registry_checked"] = validator.hasRegistry();
    out << result.dump() << std::endl;
    return kExitOk;
}

int runScan(const TokenConfig& config, bool offline, std::string_view text, std::ostream& out) {
    TokenDetector detector(validationRegistry(config, offline));

    DetectionStats stats;
    auto detections = detector.detectAll(text, config.scan.max_matches, &stats);

    for (const auto& detection : detections) {
        auto fingerprint = detection.token.fingerprint();
        if (!fingerprint) {
            return printError(fingerprint.error(), out);
        }
        out << detection.offset << ":" << detection.length << " "
            << detection.token.component() << " "
            << fingerprint->substr(0, kFingerprintPrefixLength)
            << (detection.registry_checked ? "" : " unverified-component") << std::endl;
    }

    CROW_LOG_INFO << "Scanned " << text.size() << " bytes: " << stats.candidates << " candidates, "
                  << stats.confirmed << " confirmed, " << stats.checksum_rejects
                  << " checksum rejects, " << stats.registry_rejects << " registry rejects";

    return detections.empty() ? kExitOk : kExitTokensFound;
}

int runFingerprint(const std::string& text, std::ostream& out) {
    auto fingerprint = fingerprintToken(text);
    if (!fingerprint) {
        return printError(fingerprint.error(), out);
    }
    out << *fingerprint << std::endl;
    return kExitOk;
}

int runPattern(std::ostream& out) {
    out << kTokenPattern << std::endl;
    return kExitOk;
}

} // namespace asftoken
