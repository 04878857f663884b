#include "sqlexpr/Parser.h"
#include "sqlexpr/Lexer.h"
#include "llvm/ADT/StringRef.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace sqlexpr {

namespace {

// Counts active parenthesis/exponent recursion for the lifetime of a frame.
struct RecursionGuard {
    unsigned &count;
    explicit RecursionGuard(unsigned &c) : count(c) { ++count; }
    ~RecursionGuard() { --count; }
};

} // namespace

// ── Constructor ───────────────────────────────────────────────────────────────
Parser::Parser(std::vector<Token> tokens, DiagEngine &diag, ParserOptions opts)
    : toks_(std::move(tokens)), diag_(diag), opts_(opts) {
    // Ensure there's always an EOF
    if (toks_.empty() || !toks_.back().is(TK::Eof))
        toks_.push_back({TK::Eof, "", toks_.empty() ? SourceLocation{} : toks_.back().loc});
}

// ── Token stream helpers ──────────────────────────────────────────────────────
Token Parser::consume() {
    Token t = toks_[pos_];
    if (pos_ + 1 < toks_.size()) ++pos_;
    return t;
}

bool Parser::expect(TK kind) {
    if (cur().is(kind)) { consume(); return true; }
    diag_.parseError(cur().loc, std::string("Expected token ") + Token::kindName(kind) +
                                ", found " + cur().describe());
    return false;
}

bool Parser::match(TK k) {
    if (cur().is(k)) { consume(); return true; }
    return false;
}

// ── Errors & depth tracking ───────────────────────────────────────────────────
ExprPtr Parser::unexpected() {
    if (atEnd()) diag_.parseError(cur().loc, "Unexpected end of input");
    else         diag_.parseError(cur().loc, "Unexpected token " + cur().describe());
    return nullptr;
}

ExprPtr Parser::tooDeep(SourceLocation loc) {
    diag_.parseError(loc, "Expression nesting exceeds " +
                          std::to_string(opts_.maxDepth) + " levels");
    return nullptr;
}

unsigned Parser::depthOf(const Expr *e) const {
    auto it = depth_.find(e);
    return (it != depth_.end()) ? it->second : 1;
}

ExprPtr Parser::track(ExprPtr e) {
    unsigned d = 1;
    switch (e->kind) {
    case ExprKind::Literal:
    case ExprKind::Column:
        break;
    case ExprKind::Unary:
        d = 1 + depthOf(static_cast<UnaryExpr &>(*e).operand.get());
        break;
    case ExprKind::Postfix:
        d = 1 + depthOf(static_cast<PostfixExpr &>(*e).operand.get());
        break;
    case ExprKind::Binary: {
        auto &b = static_cast<BinaryExpr &>(*e);
        d = 1 + std::max(depthOf(b.lhs.get()), depthOf(b.rhs.get()));
        break;
    }
    }
    if (d > opts_.maxTreeDepth) {
        diag_.parseError(e->loc, "Expression tree depth exceeds " +
                                 std::to_string(opts_.maxTreeDepth) + " levels");
        return nullptr;
    }
    depth_[e.get()] = d;
    return e;
}

// ── Entry point ───────────────────────────────────────────────────────────────
ExprPtr Parser::parseExpression() {
    pos_ = 0;
    recursion_ = 0;
    depth_.clear();

    auto e = parseOrExpr();
    if (e && !atEnd()) e = unexpected();
    depth_.clear();
    return e;
}

// ── Binary tiers ──────────────────────────────────────────────────────────────
ExprPtr Parser::parseOrExpr() {
    auto lhs = parseAndExpr();
    while (lhs && check(TK::KW_or)) {
        auto loc = cur().loc; consume();
        auto rhs = parseAndExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(BinaryOp::Or, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

ExprPtr Parser::parseAndExpr() {
    auto lhs = parseEqualityExpr();
    while (lhs && check(TK::KW_and)) {
        auto loc = cur().loc; consume();
        auto rhs = parseEqualityExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(BinaryOp::And, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

ExprPtr Parser::parseEqualityExpr() {
    auto lhs = parseRelationalExpr();
    while (lhs && (check(TK::Eq) || check(TK::BangEq) || check(TK::KW_like))) {
        auto loc = cur().loc;
        BinaryOp op = check(TK::Eq)     ? BinaryOp::Eq
                    : check(TK::BangEq) ? BinaryOp::NEq : BinaryOp::Like;
        consume();
        auto rhs = parseRelationalExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

ExprPtr Parser::parseRelationalExpr() {
    auto lhs = parseAddExpr();
    while (lhs && (check(TK::Gt) || check(TK::GtEq) || check(TK::Lt) || check(TK::LtEq))) {
        auto loc = cur().loc;
        BinaryOp op = check(TK::Gt)   ? BinaryOp::Gt
                    : check(TK::GtEq) ? BinaryOp::GEq
                    : check(TK::Lt)   ? BinaryOp::Lt : BinaryOp::LEq;
        consume();
        auto rhs = parseAddExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

ExprPtr Parser::parseAddExpr() {
    auto lhs = parseMulExpr();
    while (lhs && (check(TK::Plus) || check(TK::Minus))) {
        auto loc = cur().loc;
        BinaryOp op = check(TK::Plus) ? BinaryOp::Add : BinaryOp::Sub;
        consume();
        auto rhs = parseMulExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

ExprPtr Parser::parseMulExpr() {
    auto lhs = parsePowExpr();
    while (lhs && (check(TK::Star) || check(TK::Slash) || check(TK::Percent))) {
        auto loc = cur().loc;
        BinaryOp op = check(TK::Star)  ? BinaryOp::Mul
                    : check(TK::Slash) ? BinaryOp::Div : BinaryOp::Mod;
        consume();
        auto rhs = parsePowExpr();
        if (!rhs) return nullptr;
        lhs = track(std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs), loc));
    }
    return lhs;
}

// a ^ b ^ c is a ^ (b ^ c). Every nested parenthesis comes back through here,
// so this is where parser recursion is bounded.
ExprPtr Parser::parsePowExpr() {
    RecursionGuard guard(recursion_);
    if (recursion_ > opts_.maxDepth) return tooDeep(cur().loc);

    auto lhs = parseUnaryExpr();
    if (!lhs || !check(TK::Caret)) return lhs;
    auto loc = cur().loc; consume();
    auto rhs = parsePowExpr();
    if (!rhs) return nullptr;
    return track(std::make_unique<BinaryExpr>(BinaryOp::Pow, std::move(lhs), std::move(rhs), loc));
}

// ── Unary level ───────────────────────────────────────────────────────────────
// prefix* primary postfix*. Prefix operators bind to the primary innermost
// first, then postfix operators apply to the prefixed result: -3! is (-3)!.
ExprPtr Parser::parseUnaryExpr() {
    std::vector<std::pair<UnaryOp, SourceLocation>> prefix;
    for (;;) {
        if      (check(TK::KW_not)) prefix.emplace_back(UnaryOp::Not,  cur().loc);
        else if (check(TK::Plus))   prefix.emplace_back(UnaryOp::Plus, cur().loc);
        else if (check(TK::Minus))  prefix.emplace_back(UnaryOp::Neg,  cur().loc);
        else break;
        if (recursion_ + prefix.size() > opts_.maxDepth) return tooDeep(cur().loc);
        consume();
    }

    auto e = parsePrimaryExpr();
    for (auto it = prefix.rbegin(); e && it != prefix.rend(); ++it)
        e = track(std::make_unique<UnaryExpr>(it->first, std::move(e), it->second));

    while (e) {
        auto loc = cur().loc;
        if (match(TK::Bang)) {
            e = track(std::make_unique<PostfixExpr>(PostfixOp::Factorial, std::move(e), loc));
        } else if (match(TK::KW_is)) {
            bool negated = match(TK::KW_not);
            PostfixOp op;
            if (match(TK::KW_null))
                op = negated ? PostfixOp::IsNotNull : PostfixOp::IsNull;
            else if (match(TK::KW_true))
                op = negated ? PostfixOp::IsNotTrue : PostfixOp::IsTrue;
            else if (match(TK::KW_false))
                op = negated ? PostfixOp::IsNotFalse : PostfixOp::IsFalse;
            else {
                expect(TK::KW_null);
                return nullptr;
            }
            e = track(std::make_unique<PostfixExpr>(op, std::move(e), loc));
        } else {
            break;
        }
    }
    return e;
}

// ── Primary ───────────────────────────────────────────────────────────────────
ExprPtr Parser::parsePrimaryExpr() {
    auto loc = cur().loc;
    switch (cur().kind) {
    case TK::IntLit:
        return parseIntLiteral(consume());
    case TK::FloatLit:
        return parseFloatLiteral(consume());
    case TK::StringLit:
        return track(std::make_unique<LiteralExpr>(Value::mkString(consume().text), loc));
    case TK::KW_true:
        consume();
        return track(std::make_unique<LiteralExpr>(Value::mkBool(true), loc));
    case TK::KW_false:
        consume();
        return track(std::make_unique<LiteralExpr>(Value::mkBool(false), loc));
    case TK::KW_null:
        consume();
        return track(std::make_unique<LiteralExpr>(Value::mkNull(), loc));
    case TK::KW_infinity:
        consume();
        return track(std::make_unique<LiteralExpr>(Value::mkFloat(HUGE_VAL), loc));
    case TK::KW_nan:
        consume();
        return track(std::make_unique<LiteralExpr>(Value::mkFloat(std::nan("")), loc));
    case TK::Ident:
    case TK::QuotedIdent:
        return parseColumnRef();
    case TK::LParen: {
        consume();
        auto e = parseOrExpr();
        if (!e || !expect(TK::RParen)) return nullptr;
        return e;
    }
    default:
        return unexpected();
    }
}

// name | table.name
ExprPtr Parser::parseColumnRef() {
    auto loc = cur().loc;
    std::string first = consume().text;
    if (!match(TK::Dot))
        return track(std::make_unique<ColumnExpr>(ColumnRef(std::move(first)), loc));

    if (!check(TK::Ident) && !check(TK::QuotedIdent)) {
        expect(TK::Ident);
        return nullptr;
    }
    std::string second = consume().text;
    return track(std::make_unique<ColumnExpr>(ColumnRef(std::move(first), std::move(second)), loc));
}

// ── Literal conversion ────────────────────────────────────────────────────────
// The bound applies to the literal alone; a leading '-' is a separate unary
// operator, so INT64_MIN can't be written as a literal.
ExprPtr Parser::parseIntLiteral(const Token &t) {
    int64_t v = 0;
    if (llvm::StringRef(t.text).getAsInteger(10, v)) {
        diag_.parseError(t.loc, "number too large to fit in target type");
        return nullptr;
    }
    return track(std::make_unique<LiteralExpr>(Value::mkInt(v), t.loc));
}

// strtod rounds to nearest, saturates to infinity and flushes to zero; none
// of those are errors here.
ExprPtr Parser::parseFloatLiteral(const Token &t) {
    double v = std::strtod(t.text.c_str(), nullptr);
    return track(std::make_unique<LiteralExpr>(Value::mkFloat(v), t.loc));
}

// ── Convenience ───────────────────────────────────────────────────────────────
ExprPtr parseExpression(const std::string &text, DiagEngine &diag, ParserOptions opts) {
    auto tokens = tokenize(text, diag);
    if (!tokens) return nullptr;
    Parser parser(std::move(*tokens), diag, opts);
    return parser.parseExpression();
}

} // namespace sqlexpr
