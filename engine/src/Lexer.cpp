#include "sqlexpr/Lexer.h"
#include "llvm/Support/ConvertUTF.h"
#include <cctype>
#include <unordered_map>

namespace sqlexpr {

// ── Keyword table ─────────────────────────────────────────────────────────────
TK Lexer::keywordKind(const std::string &w) {
    static const std::unordered_map<std::string, TK> kw = {
        {"TRUE",     TK::KW_true},
        {"FALSE",    TK::KW_false},
        {"NULL",     TK::KW_null},
        {"INFINITY", TK::KW_infinity},
        {"NAN",      TK::KW_nan},
        {"AND",      TK::KW_and},
        {"OR",       TK::KW_or},
        {"NOT",      TK::KW_not},
        {"IS",       TK::KW_is},
        {"LIKE",     TK::KW_like},
    };
    auto it = kw.find(w);
    return (it != kw.end()) ? it->second : TK::Ident;
}

// ── Constructor ───────────────────────────────────────────────────────────────
Lexer::Lexer(std::string source, DiagEngine &diag)
    : src_(std::move(source)), diag_(diag) {}

void Lexer::reset() {
    pos_  = 0;
    line_ = 1;
    col_  = 1;
}

// ── Character helpers ─────────────────────────────────────────────────────────
char Lexer::peek(int offset) const {
    size_t idx = pos_ + offset;
    return (idx < src_.size()) ? src_[idx] : '\0';
}

char Lexer::advance() {
    char c = src_[pos_++];
    if (c == '\n') { ++line_; col_ = 1; }
    else           { ++col_; }
    return c;
}

void Lexer::skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(peek())))
        advance();
}

static bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

Token Lexer::invalid(std::string msg) {
    diag_.lexError(startLoc_, std::move(msg));
    return make(TK::Invalid, src_.substr(startLoc_.offset, pos_ - startLoc_.offset));
}

// ── Number ────────────────────────────────────────────────────────────────────
// digits [ '.' digits* ] [ ('e'|'E') ['+'|'-'] digits+ ]
Token Lexer::lexNumber() {
    startLoc_ = curLoc();
    std::string s;
    bool isFloat = false;

    while (!atEnd() && isDigit(peek())) s += advance();
    if (!atEnd() && peek() == '.') {
        isFloat = true;
        s += advance();
        while (!atEnd() && isDigit(peek())) s += advance();
    }
    if (!atEnd() && (peek() == 'e' || peek() == 'E')) {
        isFloat = true;
        s += advance();
        if (!atEnd() && (peek() == '+' || peek() == '-')) s += advance();
        if (atEnd() || !isDigit(peek()))
            return invalid("invalid number literal '" + s + "'");
        while (!atEnd() && isDigit(peek())) s += advance();
    }

    return make(isFloat ? TK::FloatLit : TK::IntLit, std::move(s));
}

// ── String ────────────────────────────────────────────────────────────────────
// 'text' with '' standing for a single quote. Nothing else is an escape.
Token Lexer::lexString() {
    startLoc_ = curLoc();
    advance(); // consume opening '
    std::string s;
    for (;;) {
        if (atEnd()) return invalid("unterminated string literal");
        char c = advance();
        if (c == '\'') {
            if (peek() != '\'') break;
            advance();
        }
        s += c;
    }

    auto *begin = reinterpret_cast<const llvm::UTF8 *>(s.data());
    if (!llvm::isLegalUTF8String(&begin, begin + s.size()))
        return invalid("invalid UTF-8 in string literal");
    return make(TK::StringLit, std::move(s));
}

// ── Quoted identifier ─────────────────────────────────────────────────────────
Token Lexer::lexQuotedIdent() {
    startLoc_ = curLoc();
    advance(); // consume opening "
    std::string s;
    for (;;) {
        if (atEnd()) return invalid("unterminated quoted identifier");
        char c = advance();
        if (c == '"') {
            if (peek() != '"') break;
            advance();
        }
        s += c;
    }
    if (s.empty()) return invalid("empty quoted identifier");
    return make(TK::QuotedIdent, std::move(s));
}

// ── Identifier or keyword ─────────────────────────────────────────────────────
Token Lexer::lexIdOrKeyword() {
    startLoc_ = curLoc();
    std::string s;
    while (!atEnd() && isIdentChar(peek())) s += advance();

    std::string folded;
    folded.reserve(s.size());
    for (char c : s) folded += (char)std::toupper(static_cast<unsigned char>(c));
    TK k = keywordKind(folded);
    if (k != TK::Ident) return make(k, std::move(folded));

    for (char &c : s) c = (char)std::tolower(static_cast<unsigned char>(c));
    return make(TK::Ident, std::move(s));
}

// ── Punctuation & operators ───────────────────────────────────────────────────
Token Lexer::lexPunct() {
    startLoc_ = curLoc();
    char c = advance();
    auto eat = [&](char e) -> bool {
        if (peek() == e) { advance(); return true; }
        return false;
    };

    switch (c) {
    case '+': return make(TK::Plus,    "+");
    case '-': return make(TK::Minus,   "-");
    case '*': return make(TK::Star,    "*");
    case '/': return make(TK::Slash,   "/");
    case '%': return make(TK::Percent, "%");
    case '^': return make(TK::Caret,   "^");
    case '!':
        if (eat('=')) return make(TK::BangEq, "!=");
        return make(TK::Bang, "!");
    case '=': return make(TK::Eq, "=");
    case '<':
        if (eat('=')) return make(TK::LtEq, "<=");
        return make(TK::Lt, "<");
    case '>':
        if (eat('=')) return make(TK::GtEq, ">=");
        return make(TK::Gt, ">");
    case '.': return make(TK::Dot,    ".");
    case '(': return make(TK::LParen, "(");
    case ')': return make(TK::RParen, ")");
    default: {
        // Report the whole UTF-8 sequence rather than its first byte.
        unsigned len = llvm::getNumBytesForUTF8(static_cast<llvm::UTF8>(c));
        while (len > 1 && !atEnd()) { advance(); --len; }
        return invalid("unexpected character '" +
                       src_.substr(startLoc_.offset, pos_ - startLoc_.offset) + "'");
    }
    }
}

// ── next() ────────────────────────────────────────────────────────────────────
Token Lexer::next() {
    skipWhitespace();
    if (atEnd()) return {TK::Eof, "", curLoc()};

    char c = peek();
    if (isDigit(c))       return lexNumber();
    if (c == '\'')        return lexString();
    if (c == '"')         return lexQuotedIdent();
    if (isIdentStart(c))  return lexIdOrKeyword();
    return lexPunct();
}

// ── lexAll() ──────────────────────────────────────────────────────────────────
std::vector<Token> Lexer::lexAll() {
    std::vector<Token> toks;
    while (true) {
        Token t = next();
        toks.push_back(t);
        if (t.is(TK::Eof) || t.is(TK::Invalid)) break;
    }
    return toks;
}

std::optional<std::vector<Token>> tokenize(const std::string &text, DiagEngine &diag) {
    Lexer lexer(text, diag);
    auto toks = lexer.lexAll();
    if (toks.back().is(TK::Invalid)) return std::nullopt;
    return toks;
}

// ── Token::kindName() ─────────────────────────────────────────────────────────
const char *Token::kindName(TK k) {
    switch (k) {
    case TK::IntLit:      return "integer literal";
    case TK::FloatLit:    return "float literal";
    case TK::StringLit:   return "string literal";
    case TK::Ident:       return "identifier";
    case TK::QuotedIdent: return "quoted identifier";
    case TK::KW_true:     return "TRUE";
    case TK::KW_false:    return "FALSE";
    case TK::KW_null:     return "NULL";
    case TK::KW_infinity: return "INFINITY";
    case TK::KW_nan:      return "NAN";
    case TK::KW_and:      return "AND";
    case TK::KW_or:       return "OR";
    case TK::KW_not:      return "NOT";
    case TK::KW_is:       return "IS";
    case TK::KW_like:     return "LIKE";
    case TK::Plus:        return "+";
    case TK::Minus:       return "-";
    case TK::Star:        return "*";
    case TK::Slash:       return "/";
    case TK::Percent:     return "%";
    case TK::Caret:       return "^";
    case TK::Bang:        return "!";
    case TK::Eq:          return "=";
    case TK::BangEq:      return "!=";
    case TK::Lt:          return "<";
    case TK::Gt:          return ">";
    case TK::LtEq:        return "<=";
    case TK::GtEq:        return ">=";
    case TK::Dot:         return ".";
    case TK::LParen:      return "(";
    case TK::RParen:      return ")";
    case TK::Eof:         return "end of input";
    case TK::Invalid:     return "invalid token";
    }
    return "<token>";
}

std::string Token::describe() const {
    switch (kind) {
    case TK::IntLit:
    case TK::FloatLit:
    case TK::Ident:
    case TK::Invalid:
        return text;
    case TK::StringLit: {
        std::string out = "'";
        for (char c : text) {
            if (c == '\'') out += '\'';
            out += c;
        }
        return out + "'";
    }
    case TK::QuotedIdent: {
        std::string out = "\"";
        for (char c : text) {
            if (c == '"') out += '"';
            out += c;
        }
        return out + "\"";
    }
    default:
        return kindName(kind);
    }
}

} // namespace sqlexpr
