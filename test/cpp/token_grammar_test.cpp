#include <catch2/catch_test_macros.hpp>
#include <regex>
#include <string>
#include <vector>

#include "token_grammar.hpp"
#include "test_utils.hpp"

using namespace asftoken;
using namespace asftoken::test;

namespace {
    const std::string kEntropy(27, '0');

    std::string tokenWithComponent(const std::string& component, const std::string& checksum = "2MvMGi") {
        return "asf_" + component + "_" + kEntropy + checksum;
    }

    std::vector<TokenSpan> scanAll(std::string_view text) {
        std::vector<TokenSpan> spans;
        TokenScanner scanner(text);
        while (auto span = scanner.next()) {
            spans.push_back(*span);
        }
        return spans;
    }
}

TEST_CASE("isValidComponent", "[grammar]") {
    REQUIRE(isValidComponent("abc"));
    REQUIRE(isValidComponent("abcdef"));
    REQUIRE(isValidComponent("sample"));

    REQUIRE_FALSE(isValidComponent("ab"));
    REQUIRE_FALSE(isValidComponent("abcdefg"));
    REQUIRE_FALSE(isValidComponent("Sample"));
    REQUIRE_FALSE(isValidComponent("sam1"));
    REQUIRE_FALSE(isValidComponent("sa_m"));
    REQUIRE_FALSE(isValidComponent(""));
}

TEST_CASE("Token length bounds", "[grammar]") {
    REQUIRE(kMinTokenLength == 41);
    REQUIRE(kMaxTokenLength == 44);
}

TEST_CASE("parseToken accepts well formed tokens", "[grammar]") {
    SECTION("Published vector splits into its segments") {
        auto outcome = parseToken(kZeroToken);
        REQUIRE(outcome.accepted);
        REQUIRE(outcome.parts.component == "sample");
        REQUIRE(outcome.parts.entropy == kEntropy);
        REQUIRE(outcome.parts.checksum == "2MvMGi");
        REQUIRE(outcome.reason == RejectReason::None);
    }

    SECTION("Component of length 3 gives a 41 character token") {
        std::string token = tokenWithComponent("abc");
        REQUIRE(token.size() == 41);
        auto outcome = parseToken(token);
        REQUIRE(outcome.accepted);
        REQUIRE(outcome.parts.component == "abc");
    }

    SECTION("Component of length 6 gives a 44 character token") {
        std::string token = tokenWithComponent("abcdef");
        REQUIRE(token.size() == 44);
        auto outcome = parseToken(token);
        REQUIRE(outcome.accepted);
        REQUIRE(outcome.parts.component == "abcdef");
    }

    SECTION("Grammar does not verify the checksum value") {
        auto outcome = parseToken(tokenWithComponent("sample", "0AAAAA"));
        REQUIRE(outcome.accepted);
    }
}

TEST_CASE("parseToken reports where and why it rejected", "[grammar]") {
    SECTION("Wrong prefix") {
        auto outcome = parseToken("asg_sample_0000000000000000000000000002MvMGi");
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Prefix);
        REQUIRE(outcome.failed_offset == 2);
        REQUIRE(outcome.reason == RejectReason::UnexpectedCharacter);
    }

    SECTION("Empty input ends prematurely at Start") {
        auto outcome = parseToken("");
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Start);
        REQUIRE(outcome.reason == RejectReason::PrematureEnd);
    }

    SECTION("Component too short") {
        auto outcome = parseToken(tokenWithComponent("ab"));
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Component);
        REQUIRE(outcome.failed_offset == 6);
        REQUIRE(outcome.reason == RejectReason::ComponentTooShort);
    }

    SECTION("Component too long") {
        auto outcome = parseToken(tokenWithComponent("abcdefg"));
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Component);
        REQUIRE(outcome.failed_offset == 10);
        REQUIRE(outcome.reason == RejectReason::ComponentTooLong);
    }

    SECTION("Uppercase component") {
        auto outcome = parseToken(tokenWithComponent("Sample"));
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Component);
        REQUIRE(outcome.failed_offset == 4);
    }

    SECTION("Wrong separator after component") {
        auto outcome = parseToken("asf_sample-0000000000000000000000000002MvMGi");
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Separator);
        REQUIRE(outcome.failed_offset == 10);
    }

    SECTION("Non-base62 character in entropy") {
        std::string token = kZeroToken;
        token[20] = '-';
        auto outcome = parseToken(token);
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Entropy);
        REQUIRE(outcome.failed_offset == 20);
    }

    SECTION("Checksum leading digit above 4") {
        for (std::string lead : {"5", "9", "A", "z"}) {
            auto outcome = parseToken(tokenWithComponent("sample", lead + "MvMGi"));
            REQUIRE_FALSE(outcome.accepted);
            REQUIRE(outcome.failed_state == ParserState::Checksum);
            REQUIRE(outcome.failed_offset == 38);
            REQUIRE(outcome.reason == RejectReason::ChecksumLeadingDigit);
        }
    }

    SECTION("Truncated checksum") {
        std::string token = kZeroToken;
        token.pop_back();
        auto outcome = parseToken(token);
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Checksum);
        REQUIRE(outcome.failed_offset == 43);
        REQUIRE(outcome.reason == RejectReason::PrematureEnd);
    }

    SECTION("Trailing characters after a complete token") {
        std::string token = std::string(kZeroToken) + "x";
        auto outcome = parseToken(token);
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Accept);
        REQUIRE(outcome.failed_offset == 44);
        REQUIRE(outcome.reason == RejectReason::TrailingCharacters);
    }

    SECTION("Leading whitespace") {
        auto outcome = parseToken(std::string(" ") + kZeroToken);
        REQUIRE_FALSE(outcome.accepted);
        REQUIRE(outcome.failed_state == ParserState::Start);
        REQUIRE(outcome.failed_offset == 0);
    }
}

TEST_CASE("TokenStateMachine stays rejected", "[grammar]") {
    TokenStateMachine machine;
    REQUIRE(machine.feed('x') == ParserState::Reject);
    REQUIRE(machine.feed('a') == ParserState::Reject);
    REQUIRE(machine.finish() == ParserState::Reject);
    REQUIRE(machine.failedOffset() == 0);

    machine.reset();
    REQUIRE(machine.state() == ParserState::Start);
    REQUIRE(machine.feed('a') == ParserState::Prefix);
}

TEST_CASE("TokenScanner finds tokens inside free text", "[grammar]") {
    SECTION("Token embedded in a log line") {
        std::string text = std::string("2026-01-01 INFO auth header=Bearer ") + kZeroToken + " user=alice";
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 1);
        REQUIRE(spans[0].offset == 35);
        REQUIRE(spans[0].length == 44);
        REQUIRE(text.substr(spans[0].offset, spans[0].length) == kZeroToken);
    }

    SECTION("Multiple tokens are returned in order without overlap") {
        std::string text = std::string(kZeroToken) + "\n" + kZedToken + "\n";
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[0].offset == 0);
        REQUIRE(spans[1].offset == 45);
    }

    SECTION("Back to back tokens without a separator") {
        std::string text = std::string(kZeroToken) + kZedToken;
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[1].offset == 44);
    }

    SECTION("Failed prefix attempts restart at the next character") {
        std::string text = std::string("aasf_asf_") + kZeroToken;
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 1);
        REQUIRE(spans[0].offset == 9);
    }

    SECTION("Unanchored match ignores trailing characters") {
        std::string text = std::string(kZeroToken) + "extra";
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 1);
        REQUIRE(spans[0].length == 44);
    }

    SECTION("Near misses are not structural matches") {
        std::string text = "asf_toolongname_0000000000000000000000000002MvMGi "
                           "asf_sample_000000000000000000000000000" "9MvMGi "
                           "asf_sample_000";
        REQUIRE(scanAll(text).empty());
    }

    SECTION("Spans carry the component length") {
        std::string text = tokenWithComponent("abc") + " " + tokenWithComponent("abcdef");
        auto spans = scanAll(text);
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[0].length == 41);
        REQUIRE(spans[0].component_length == 3);
        REQUIRE(spans[1].length == 44);
        REQUIRE(spans[1].component_length == 6);

        TokenParts parts = splitTokenParts(std::string_view(text).substr(spans[1].offset, spans[1].length),
                                           spans[1].component_length);
        REQUIRE(parts.component == "abcdef");
        REQUIRE(parts.entropy == kEntropy);
        REQUIRE(parts.checksum == "2MvMGi");
    }

    SECTION("Scanning is restartable") {
        std::string text = std::string(kZeroToken) + " " + kZedToken;
        TokenScanner scanner(text);
        auto first = scanner.next();
        REQUIRE(first);
        REQUIRE(scanner.position() == 44);

        scanner.reset(0);
        auto again = scanner.next();
        REQUIRE(again);
        REQUIRE(again->offset == first->offset);

        scanner.reset(1);
        auto second = scanner.next();
        REQUIRE(second);
        REQUIRE(second->offset == 45);
        REQUIRE_FALSE(scanner.next());
        REQUIRE_FALSE(scanner.next());
    }
}

TEST_CASE("Published pattern agrees with the parser", "[grammar]") {
    const std::regex pattern{std::string(kTokenPattern)};

    const std::vector<std::string> candidates = {
        kZeroToken,
        kZedToken,
        tokenWithComponent("abc"),
        tokenWithComponent("abcdef"),
        tokenWithComponent("ab"),
        tokenWithComponent("abcdefg"),
        tokenWithComponent("Sample"),
        tokenWithComponent("sample", "5MvMGi"),
        tokenWithComponent("sample", "2MvMG"),
        "asf_sample_" + std::string(26, '0') + "2MvMGi",
        "asg_sample_" + kEntropy + "2MvMGi",
    };

    for (const auto& candidate : candidates) {
        INFO(candidate);
        const bool regex_match = std::regex_match(candidate, pattern);
        const bool parser_match = parseToken(candidate).accepted;
        REQUIRE(regex_match == parser_match);
    }

    const std::string token = kZeroToken;
    std::smatch groups;
    REQUIRE(std::regex_match(token, groups, pattern));
    REQUIRE(groups[1] == "sample");
    REQUIRE(groups[2] == kEntropy);
    REQUIRE(groups[3] == "2MvMGi");
}
