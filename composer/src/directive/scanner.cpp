//! # WGSL Source Scanner
//!
//! Character-level tokenizer. Unterminated block comments extend to the end
//! of the text; the scanner itself never fails.

#include "directive/scanner.hpp"

#include <cctype>

namespace smc::directive {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier(std::string_view text) {
    if (text.empty() || !is_ident_start(text[0])) {
        return false;
    }
    for (char c : text) {
        if (!is_ident_char(c)) {
            return false;
        }
    }
    return true;
}

std::vector<Token> tokenize(std::string_view source) {
    return Scanner(source).tokenize();
}

char Scanner::peek() const {
    return is_at_end() ? '\0' : source_[pos_];
}

char Scanner::peek_next() const {
    return pos_ + 1 < source_.size() ? source_[pos_ + 1] : '\0';
}

void Scanner::advance() {
    if (source_[pos_] == '\n') {
        ++line_;
    }
    ++pos_;
}

std::vector<Token> Scanner::tokenize() {
    std::vector<Token> tokens;

    while (!is_at_end()) {
        size_t start = pos_;
        size_t start_line = line_;
        TokenKind kind;
        char c = peek();

        if (std::isspace(static_cast<unsigned char>(c))) {
            while (!is_at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
                advance();
            }
            kind = TokenKind::Whitespace;
        } else if (c == '/' && peek_next() == '/') {
            scan_line_comment();
            kind = TokenKind::Comment;
        } else if (c == '/' && peek_next() == '*') {
            scan_block_comment();
            kind = TokenKind::Comment;
        } else if (c == '#' && is_ident_start(peek_next())) {
            advance();
            scan_identifier();
            kind = TokenKind::MacroRef;
        } else if (is_ident_start(c)) {
            scan_identifier();
            kind = TokenKind::Identifier;
            // alias::symbol is one token when written without spaces
            if (peek() == ':' && peek_next() == ':' && pos_ + 2 < source_.size() &&
                is_ident_start(source_[pos_ + 2])) {
                advance();
                advance();
                scan_identifier();
                kind = TokenKind::Qualified;
            }
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            scan_number();
            kind = TokenKind::Number;
        } else {
            advance();
            kind = TokenKind::Punct;
        }

        tokens.push_back(Token{kind, source_.substr(start, pos_ - start), start, start_line});
    }

    return tokens;
}

void Scanner::scan_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

void Scanner::scan_block_comment() {
    advance();
    advance();

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }
}

void Scanner::scan_identifier() {
    while (!is_at_end() && is_ident_char(peek())) {
        advance();
    }
}

void Scanner::scan_number() {
    // Covers 12, 0x1F, 1.5, 2u, 1.0f; exponent signs split into Punct tokens
    while (!is_at_end() && (is_ident_char(peek()) || peek() == '.')) {
        advance();
    }
}

} // namespace smc::directive
