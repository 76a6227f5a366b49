#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace asftoken {

// Token layout: asf_<component>_<entropy><checksum>
constexpr std::string_view kTokenPrefix = "asf";
constexpr char kTokenSeparator = '_';
constexpr std::size_t kMinComponentLength = 3;
constexpr std::size_t kMaxComponentLength = 6;
constexpr std::size_t kEntropyLength = 27;
constexpr std::size_t kChecksumLength = 6;
constexpr std::size_t kMinTokenLength = 4 + kMinComponentLength + 1 + kEntropyLength + kChecksumLength;
constexpr std::size_t kMaxTokenLength = 4 + kMaxComponentLength + 1 + kEntropyLength + kChecksumLength;

// Unanchored detection pattern, published verbatim for secret scanning rules
constexpr std::string_view kTokenPattern =
    "asf_([a-z]{3,6})_([0-9A-Za-z]{27})([0-4][0-9A-Za-z]{5})";

enum class ParserState {
    Start,
    Prefix,
    Component,
    Separator,
    Entropy,
    Checksum,
    Accept,
    Reject
};

enum class RejectReason {
    None,
    UnexpectedCharacter,
    PrematureEnd,
    ComponentTooShort,
    ComponentTooLong,
    ChecksumLeadingDigit,
    TrailingCharacters
};

std::string parserStateName(ParserState state);
std::string rejectReasonDescription(RejectReason reason);

// True for 3-6 lowercase ASCII letters
bool isValidComponent(std::string_view component);

struct TokenSpan {
    std::size_t offset = 0;
    std::size_t length = 0;
    std::size_t component_length = 0;
};

// Views into the parsed input; only valid while that input is alive
struct TokenParts {
    std::string_view component;
    std::string_view entropy;
    std::string_view checksum;
};

struct ParseOutcome {
    bool accepted = false;
    TokenParts parts;
    ParserState failed_state = ParserState::Start;
    std::size_t failed_offset = 0;
    RejectReason reason = RejectReason::None;
};

/**
 * Character-at-a-time recognizer for the token grammar.
 *
 * States advance Start -> Prefix -> Component -> Separator -> Entropy ->
 * Checksum -> Accept. Any class mismatch moves to the absorbing Reject state
 * and records the state and offset at which it happened. Feeding a character
 * after Accept rejects with TrailingCharacters, which gives anchored parsing;
 * scan mode simply stops feeding once Accept is reached.
 */
class TokenStateMachine {
public:
    TokenStateMachine() = default;

    void reset();

    ParserState feed(char c);

    // Signal end of input. Any state other than Accept or Reject rejects
    // with PrematureEnd.
    ParserState finish();

    ParserState state() const { return state_; }
    ParserState failedState() const { return failed_state_; }
    std::size_t failedOffset() const { return failed_offset_; }
    RejectReason rejectReason() const { return reason_; }

    std::size_t consumed() const { return consumed_; }
    std::size_t componentLength() const { return component_length_; }

private:
    ParserState reject(RejectReason reason, std::size_t offset);

    ParserState state_ = ParserState::Start;
    ParserState failed_state_ = ParserState::Start;
    std::size_t failed_offset_ = 0;
    RejectReason reason_ = RejectReason::None;
    std::size_t consumed_ = 0;
    std::size_t segment_count_ = 0;
    std::size_t component_length_ = 0;
};

// Anchored parse: the whole input must be exactly one token
ParseOutcome parseToken(std::string_view input);

// Split an accepted token of the given component length into its segments
TokenParts splitTokenParts(std::string_view token, std::size_t component_length);

/**
 * Unanchored scan over free text. Each call to next() returns the next
 * leftmost structural match, never overlapping a previous one. The scanner
 * keeps a view of the text, so the text must outlive it.
 */
class TokenScanner {
public:
    explicit TokenScanner(std::string_view text, std::size_t start = 0);

    std::optional<TokenSpan> next();

    // Offset where the next search begins
    std::size_t position() const { return cursor_; }

    // Restart scanning from an arbitrary offset
    void reset(std::size_t offset = 0);

    std::string_view text() const { return text_; }

private:
    std::string_view text_;
    std::size_t cursor_;
};

} // namespace asftoken
