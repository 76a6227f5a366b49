#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "component_registry.hpp"
#include "token.hpp"
#include "token_grammar.hpp"
#include "token_validator.hpp"

namespace asftoken {

struct Detection {
    std::size_t offset;
    std::size_t length;
    Token token;
    // False when no registry is configured or the registry could not answer
    bool registry_checked;
};

struct DetectionStats {
    std::size_t candidates = 0;
    std::size_t confirmed = 0;
    std::size_t checksum_rejects = 0;
    std::size_t registry_rejects = 0;
    std::size_t registry_errors = 0;
};

/**
 * Finds leaked tokens in free text.
 *
 * Tier one is the structural scan, tier two recomputes the checksum and
 * drops mismatches, tier three (only with a registry) drops components that
 * are definitely unallocated. A registry that cannot answer does not hide a
 * checksum-confirmed token; it is reported with registry_checked = false.
 */
class TokenDetector {
public:
    /**
     * Lazy, restartable sequence of confirmed detections over one text.
     * The text must outlive the cursor.
     */
    class Cursor {
    public:
        std::optional<Detection> next();

        void reset(std::size_t offset = 0);
        std::size_t position() const { return scanner_.position(); }

        const DetectionStats& stats() const { return stats_; }

    private:
        friend class TokenDetector;
        Cursor(std::string_view text, const TokenValidator& validator);

        TokenScanner scanner_;
        TokenValidator validator_;
        DetectionStats stats_;
    };

    // Offline detector: grammar and checksum tiers only
    TokenDetector() = default;
    explicit TokenDetector(std::shared_ptr<const ComponentRegistry> registry);

    Cursor scan(std::string_view text) const;

    /**
     * Collect all confirmed detections.
     * @param max_matches Stop after this many detections; 0 means unlimited
     * @param stats Optional out-parameter receiving the tier counters
     */
    std::vector<Detection> detectAll(std::string_view text,
                                     std::size_t max_matches = 0,
                                     DetectionStats* stats = nullptr) const;

    bool hasRegistry() const { return validator_.hasRegistry(); }

private:
    TokenValidator validator_;
};

} // namespace asftoken
