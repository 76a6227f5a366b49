#include "token_grammar.hpp"

#include <algorithm>

#include "base62.hpp"

namespace asftoken {

namespace {
    // Prefix state consumes the literal and its trailing separator
    constexpr std::string_view kPrefixLiteral = "asf_";

    bool isLowerAlpha(char c) {
        return c >= 'a' && c <= 'z';
    }

    bool isChecksumLeadingDigit(char c) {
        return c >= '0' && c <= '4';
    }
}

std::string parserStateName(ParserState state) {
    switch (state) {
        case ParserState::Start:
            return "Start";
        case ParserState::Prefix:
            return "Prefix";
        case ParserState::Component:
            return "Component";
        case ParserState::Separator:
            return "Separator";
        case ParserState::Entropy:
            return "Entropy";
        case ParserState::Checksum:
            return "Checksum";
        case ParserState::Accept:
            return "Accept";
        case ParserState::Reject:
            return "Reject";
        default:
            return "Unknown";
    }
}

std::string rejectReasonDescription(RejectReason reason) {
    switch (reason) {
        case RejectReason::None:
            return "no error";
        case RejectReason::UnexpectedCharacter:
            return "unexpected character";
        case RejectReason::PrematureEnd:
            return "premature end of input";
        case RejectReason::ComponentTooShort:
            return "component shorter than 3 letters";
        case RejectReason::ComponentTooLong:
            return "component longer than 6 letters";
        case RejectReason::ChecksumLeadingDigit:
            return "checksum must start with 0-4";
        case RejectReason::TrailingCharacters:
            return "trailing characters after token";
        default:
            return "unknown reason";
    }
}

bool isValidComponent(std::string_view component) {
    if (component.size() < kMinComponentLength || component.size() > kMaxComponentLength) {
        return false;
    }
    return std::all_of(component.begin(), component.end(), isLowerAlpha);
}

void TokenStateMachine::reset() {
    *this = TokenStateMachine();
}

ParserState TokenStateMachine::reject(RejectReason reason, std::size_t offset) {
    failed_state_ = state_;
    failed_offset_ = offset;
    reason_ = reason;
    state_ = ParserState::Reject;
    return state_;
}

ParserState TokenStateMachine::feed(char c) {
    if (state_ == ParserState::Reject) {
        return state_;
    }

    const std::size_t offset = consumed_++;

    switch (state_) {
        case ParserState::Start:
            if (c != kPrefixLiteral[0]) {
                return reject(RejectReason::UnexpectedCharacter, offset);
            }
            state_ = ParserState::Prefix;
            segment_count_ = 1;
            break;

        case ParserState::Prefix:
            if (c != kPrefixLiteral[segment_count_]) {
                return reject(RejectReason::UnexpectedCharacter, offset);
            }
            if (++segment_count_ == kPrefixLiteral.size()) {
                state_ = ParserState::Component;
                segment_count_ = 0;
            }
            break;

        case ParserState::Component:
            if (isLowerAlpha(c)) {
                if (segment_count_ == kMaxComponentLength) {
                    return reject(RejectReason::ComponentTooLong, offset);
                }
                ++segment_count_;
                break;
            }
            if (segment_count_ < kMinComponentLength) {
                return reject(c == kTokenSeparator ? RejectReason::ComponentTooShort
                                                   : RejectReason::UnexpectedCharacter,
                              offset);
            }
            // The component ends at its first non-letter, which must be the separator
            component_length_ = segment_count_;
            state_ = ParserState::Separator;
            [[fallthrough]];

        case ParserState::Separator:
            if (c != kTokenSeparator) {
                return reject(RejectReason::UnexpectedCharacter, offset);
            }
            state_ = ParserState::Entropy;
            segment_count_ = 0;
            break;

        case ParserState::Entropy:
            if (!Base62::isDigit(c)) {
                return reject(RejectReason::UnexpectedCharacter, offset);
            }
            if (++segment_count_ == kEntropyLength) {
                state_ = ParserState::Checksum;
                segment_count_ = 0;
            }
            break;

        case ParserState::Checksum:
            if (!Base62::isDigit(c)) {
                return reject(RejectReason::UnexpectedCharacter, offset);
            }
            if (segment_count_ == 0 && !isChecksumLeadingDigit(c)) {
                return reject(RejectReason::ChecksumLeadingDigit, offset);
            }
            if (++segment_count_ == kChecksumLength) {
                state_ = ParserState::Accept;
            }
            break;

        case ParserState::Accept:
            return reject(RejectReason::TrailingCharacters, offset);

        case ParserState::Reject:
            break;
    }

    return state_;
}

ParserState TokenStateMachine::finish() {
    if (state_ != ParserState::Accept && state_ != ParserState::Reject) {
        reject(RejectReason::PrematureEnd, consumed_);
    }
    return state_;
}

TokenParts splitTokenParts(std::string_view token, std::size_t component_length) {
    const std::size_t component_offset = kPrefixLiteral.size();
    const std::size_t entropy_offset = component_offset + component_length + 1;
    const std::size_t checksum_offset = entropy_offset + kEntropyLength;

    TokenParts parts;
    parts.component = token.substr(component_offset, component_length);
    parts.entropy = token.substr(entropy_offset, kEntropyLength);
    parts.checksum = token.substr(checksum_offset, kChecksumLength);
    return parts;
}

ParseOutcome parseToken(std::string_view input) {
    TokenStateMachine machine;
    for (char c : input) {
        if (machine.feed(c) == ParserState::Reject) {
            break;
        }
    }
    machine.finish();

    ParseOutcome outcome;
    if (machine.state() != ParserState::Accept) {
        outcome.failed_state = machine.failedState();
        outcome.failed_offset = machine.failedOffset();
        outcome.reason = machine.rejectReason();
        return outcome;
    }

    outcome.accepted = true;
    outcome.parts = splitTokenParts(input, machine.componentLength());
    return outcome;
}

TokenScanner::TokenScanner(std::string_view text, std::size_t start)
    : text_(text), cursor_(std::min(start, text.size())) {}

void TokenScanner::reset(std::size_t offset) {
    cursor_ = std::min(offset, text_.size());
}

std::optional<TokenSpan> TokenScanner::next() {
    TokenStateMachine machine;

    while (cursor_ < text_.size()) {
        const std::size_t start = text_.find(kPrefixLiteral[0], cursor_);
        if (start == std::string_view::npos) {
            cursor_ = text_.size();
            break;
        }

        machine.reset();
        for (std::size_t i = start; i < text_.size(); ++i) {
            if (machine.feed(text_[i]) != ParserState::Accept) {
                if (machine.state() == ParserState::Reject) {
                    break;
                }
                continue;
            }
            cursor_ = start + machine.consumed();
            return TokenSpan{start, machine.consumed(), machine.componentLength()};
        }

        // No match anchored here; retry from the next character
        cursor_ = start + 1;
    }

    return std::nullopt;
}

} // namespace asftoken
