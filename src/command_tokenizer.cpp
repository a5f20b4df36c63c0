#include "command_tokenizer.hpp"
#include "gate_error.hpp"
#include <cctype>
#include <iostream>

namespace urgate {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

GateError disallowed(const Token& token) {
    return GateError(GateErrorCode::DisallowedOption, "disallowed option " + token.text,
                     token.position, token.text);
}

// Capability suffix of a server cluster: e<digits>.<word chars>
bool is_capability_suffix(const std::string& text, size_t pos) {
    if (pos >= text.size() || text[pos] != 'e') {
        return false;
    }
    ++pos;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != '.') {
        return false;
    }
    ++pos;
    while (pos < text.size()) {
        if (!is_word_char(text[pos])) {
            return false;
        }
        ++pos;
    }
    return true;
}

} // namespace

CommandTokenizer::CommandTokenizer(const OptionPolicyTable& policy, bool verbose)
    : policy_(policy), verbose_(verbose) {
}

std::vector<Token> CommandTokenizer::split_words(const std::string& remainder, size_t base_offset) {
    std::vector<Token> words;
    size_t i = 0;
    while (i < remainder.size()) {
        if (is_space(remainder[i])) {
            ++i;
            continue;
        }

        Token word;
        word.position = base_offset + i;
        while (i < remainder.size() && !is_space(remainder[i])) {
            char c = remainder[i];
            if (c == '\\') {
                if (i + 1 >= remainder.size()) {
                    throw GateError(GateErrorCode::MalformedSyntax, "dangling escape at end of command",
                                    base_offset + i);
                }
                word.raw.push_back(c);
                word.raw.push_back(remainder[i + 1]);
                word.text.push_back(remainder[i + 1]);
                i += 2;
                continue;
            }
            word.raw.push_back(c);
            word.text.push_back(c);
            ++i;
        }
        words.push_back(word);
    }
    return words;
}

std::vector<Token> CommandTokenizer::tokenize(const std::string& remainder, size_t base_offset) const {
    std::vector<Token> tokens = split_words(remainder, base_offset);

    ScanState state = ScanState::Options;
    std::string pending;
    size_t pending_position = base_offset;

    for (Token& token : tokens) {
        switch (state) {
            case ScanState::CheckArg:
                token.kind = TokenKind::OptionValue;
                token.name = pending;
                pending.clear();
                state = ScanState::Options;
                break;

            case ScanState::Arguments:
                token.kind = TokenKind::PathArgument;
                break;

            case ScanState::Options:
                if (token.text == ".") {
                    token.kind = TokenKind::RegionSeparator;
                    state = ScanState::Arguments;
                } else if (token.text.compare(0, 2, "--") == 0) {
                    classify_long(token, state, pending);
                    pending_position = token.position;
                } else if (token.text.size() > 1 && token.text[0] == '-') {
                    classify_short(token);
                } else {
                    throw disallowed(token);
                }
                break;
        }
    }

    if (state == ScanState::CheckArg) {
        throw GateError(GateErrorCode::MalformedSyntax, "option --" + pending + " is missing its value",
                        pending_position);
    }
    if (state == ScanState::Options) {
        throw GateError(GateErrorCode::MalformedSyntax, "missing argument separator",
                        base_offset + remainder.size());
    }

    if (verbose_) {
        for (const Token& token : tokens) {
            log(std::to_string(token.position) + " " + GateTypeUtils::token_kind_to_string(token.kind)
                + " " + token.raw);
        }
    }
    return tokens;
}

void CommandTokenizer::classify_long(Token& token, ScanState& state, std::string& pending) const {
    std::string body = token.text.substr(2);
    size_t eq = body.find('=');
    if (eq != std::string::npos) {
        token.name = body.substr(0, eq);
        token.value = body.substr(eq + 1);
        token.has_inline_value = true;
    } else {
        token.name = body;
    }
    token.kind = TokenKind::OptionLong;

    if (token.name.empty()) {
        throw disallowed(token);
    }
    OptionPolicy policy = policy_.long_policy(token.name);
    if (!policy.enabled) {
        throw disallowed(token);
    }
    if (token.has_inline_value && !policy.takes_value()) {
        throw disallowed(token);
    }
    if (!token.has_inline_value && policy.takes_value()) {
        pending = token.name;
        state = ScanState::CheckArg;
    }
}

void CommandTokenizer::classify_short(Token& token) const {
    const std::string& text = token.text;
    token.kind = TokenKind::OptionShortCluster;

    char first = text[1];
    if (policy_.is_numeric_short(first)) {
        if (!policy_.short_policy(first).enabled || text.size() < 3) {
            throw disallowed(token);
        }
        for (size_t i = 2; i < text.size(); ++i) {
            if (!is_digit(text[i])) {
                throw disallowed(token);
            }
        }
        return;
    }

    size_t pos = 1;
    for (; pos < text.size() && text[pos] != 'e'; ++pos) {
        OptionPolicy policy = policy_.short_policy(text[pos]);
        if (!policy.enabled || policy.takes_value()) {
            throw disallowed(token);
        }
    }
    if (pos < text.size() && !is_capability_suffix(text, pos)) {
        throw disallowed(token);
    }
}

void CommandTokenizer::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[CommandTokenizer] " << message << std::endl;
    }
}

} // namespace urgate
