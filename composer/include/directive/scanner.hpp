//! # WGSL Source Scanner
//!
//! Splits shader text into a lossless token stream: concatenating the lexemes
//! of all tokens reproduces the input exactly. The macro expander and the
//! namespacer rewrite source by replacing individual tokens and copying the
//! rest through.
//!
//! ## Token Kinds
//!
//! | Kind         | Example             |
//! |--------------|---------------------|
//! | `Identifier` | `camera`, `vec4`    |
//! | `MacroRef`   | `#TEXTURE_GROUP`    |
//! | `Qualified`  | `camera::Camera`    |
//! | `Number`     | `0`, `1.0f`, `0x1F` |
//! | `Punct`      | `@`, `(`, `{`, `;`  |
//! | `Whitespace` | spaces and newlines |
//! | `Comment`    | `// ...`, `/* */`   |
//!
//! Block comments nest, as in WGSL.

#ifndef SMC_DIRECTIVE_SCANNER_HPP
#define SMC_DIRECTIVE_SCANNER_HPP

#include <cstddef>
#include <string_view>
#include <vector>

namespace smc::directive {

/// Token categories produced by the scanner.
enum class TokenKind {
    Identifier,
    MacroRef,
    Qualified,
    Number,
    Punct,
    Whitespace,
    Comment,
};

/// A token referencing the scanned text.
struct Token {
    TokenKind kind;
    std::string_view lexeme; ///< Exact source text of the token
    size_t offset;           ///< Byte offset in the source
    size_t line;             ///< 1-based line of the first character

    /// True for tokens that carry meaning (not whitespace or comments).
    [[nodiscard]] bool is_significant() const {
        return kind != TokenKind::Whitespace && kind != TokenKind::Comment;
    }

    [[nodiscard]] bool is_punct(char c) const {
        return kind == TokenKind::Punct && lexeme.size() == 1 && lexeme[0] == c;
    }

    /// Name of a `#NAME` reference without the leading `#`.
    [[nodiscard]] std::string_view macro_name() const {
        return lexeme.substr(1);
    }

    /// `alias` part of an `alias::symbol` reference.
    [[nodiscard]] std::string_view qualifier() const {
        return lexeme.substr(0, lexeme.find("::"));
    }

    /// `symbol` part of an `alias::symbol` reference.
    [[nodiscard]] std::string_view member() const {
        return lexeme.substr(lexeme.find("::") + 2);
    }
};

/// Tokenizer for WGSL text.
///
/// The source must outlive the scanner and every token it produced.
class Scanner {
public:
    explicit Scanner(std::string_view source) : source_(source) {}

    /// Scans the whole source.
    [[nodiscard]] std::vector<Token> tokenize();

private:
    std::string_view source_;
    size_t pos_ = 0;
    size_t line_ = 1;

    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    [[nodiscard]] bool is_at_end() const {
        return pos_ >= source_.size();
    }
    void advance();

    void scan_line_comment();
    void scan_block_comment();
    void scan_identifier();
    void scan_number();
};

/// Convenience wrapper around `Scanner::tokenize()`.
[[nodiscard]] std::vector<Token> tokenize(std::string_view source);

/// True if `c` may start an identifier.
[[nodiscard]] bool is_ident_start(char c);

/// True if `c` may continue an identifier.
[[nodiscard]] bool is_ident_char(char c);

/// True if `text` is a complete identifier `[A-Za-z_][A-Za-z0-9_]*`.
[[nodiscard]] bool is_identifier(std::string_view text);

} // namespace smc::directive

#endif // SMC_DIRECTIVE_SCANNER_HPP
