#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "config_loader.hpp"
#include "entropy_source.hpp"

namespace asftoken {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitTokensFound = 2;

// Number of fingerprint hex characters printed by scan
constexpr std::size_t kFingerprintPrefixLength = 12;

/**
 * Loads the configuration for a command. A missing file yields an empty
 * configuration; an unreadable or invalid one throws std::runtime_error.
 */
TokenConfig loadCommandConfig(const std::string& config_file);

// Reads the scan input from a file, or from `in` when path is "-"
std::string readCommandInput(const std::string& path, std::istream& in);

int runGenerate(const TokenConfig& config,
                const std::string& component,
                std::shared_ptr<EntropySource> entropy,
                std::ostream& out);

int runValidate(const TokenConfig& config, bool offline, const std::string& candidate, std::ostream& out);

// Prints one line per confirmed token; never the token itself
int runScan(const TokenConfig& config, bool offline, std::string_view text, std::ostream& out);

int runFingerprint(const std::string& text, std::ostream& out);

int runPattern(std::ostream& out);

} // namespace asftoken
