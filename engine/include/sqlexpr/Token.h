#pragma once
#include "sqlexpr/Diagnostic.h"
#include <string>

namespace sqlexpr {

// ── Token kinds ───────────────────────────────────────────────────────────────
enum class TK {
    // Literals (the token text holds the literal as written, or the unescaped
    // string contents)
    IntLit, FloatLit, StringLit,

    // Identifier (bare identifiers are folded to lower case)
    Ident,
    QuotedIdent,

    // ── Keywords (case-insensitive) ──────────────────────────────────────────
    KW_true, KW_false, KW_null, KW_infinity, KW_nan,
    KW_and, KW_or, KW_not, KW_is, KW_like,

    // ── Operators ─────────────────────────────────────────────────────────────
    Plus, Minus, Star, Slash, Percent, Caret,
    Bang,
    Eq, BangEq,
    Lt, Gt, LtEq, GtEq,
    Dot,

    // ── Punctuation ───────────────────────────────────────────────────────────
    LParen, RParen,

    // ── Special ───────────────────────────────────────────────────────────────
    Eof, Invalid
};

struct Token {
    TK             kind = TK::Invalid;
    std::string    text;
    SourceLocation loc;

    Token() = default;
    Token(TK k, std::string t, SourceLocation l)
        : kind(k), text(std::move(t)), loc(l) {}

    bool is   (TK k) const { return kind == k; }
    bool isEof()     const { return kind == TK::Eof; }
    bool isKeyword() const { return kind >= TK::KW_true && kind <= TK::KW_like; }

    // How the token reads in a parse error: keywords upper-case, strings
    // quoted, everything else as written.
    std::string describe() const;

    // Spelling of a token kind, e.g. "NULL", ")" or "end of input".
    static const char *kindName(TK k);
};

} // namespace sqlexpr
