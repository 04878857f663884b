#pragma once
#include "sqlexpr/AST.h"
#include "sqlexpr/Token.h"
#include "sqlexpr/Diagnostic.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlexpr {

struct ParserOptions {
    // Deepest nesting accepted: parentheses, '^' operands and prefix
    // operators stacked on one operand. Flat operator chains don't count.
    unsigned maxDepth = 512;
    // Deepest tree accepted, chains included. Bounds the recursion of the
    // evaluator and the other tree walks.
    unsigned maxTreeDepth = 4096;
};

class Parser {
public:
    Parser(std::vector<Token> tokens, DiagEngine &diag, ParserOptions opts = {});

    // Parse a complete expression; the whole token stream must be consumed.
    // Returns null after reporting a parse error.
    ExprPtr parseExpression();

private:
    // ── Token stream ──────────────────────────────────────────────────────────
    const Token &cur()  const { return toks_[pos_]; }
    Token consume();
    bool  expect(TK kind);
    bool  check(TK k)  const { return cur().is(k); }
    bool  match(TK k);
    bool  atEnd()      const { return cur().is(TK::Eof); }

    // ── Expressions (loosest to tightest) ─────────────────────────────────────
    ExprPtr parseOrExpr();
    ExprPtr parseAndExpr();
    ExprPtr parseEqualityExpr();     // = != LIKE
    ExprPtr parseRelationalExpr();   // > >= < <=
    ExprPtr parseAddExpr();
    ExprPtr parseMulExpr();
    ExprPtr parsePowExpr();          // right-associative
    ExprPtr parseUnaryExpr();        // prefix run, primary, postfix run
    ExprPtr parsePrimaryExpr();
    ExprPtr parseColumnRef();

    // ── Literal conversion ────────────────────────────────────────────────────
    ExprPtr parseIntLiteral(const Token &t);
    ExprPtr parseFloatLiteral(const Token &t);

    // ── Errors & depth tracking ───────────────────────────────────────────────
    ExprPtr unexpected();
    ExprPtr tooDeep(SourceLocation loc);
    // Records the node's tree depth; null (after an error) past maxTreeDepth.
    ExprPtr track(ExprPtr e);
    unsigned depthOf(const Expr *e) const;

    std::vector<Token>                        toks_;
    DiagEngine                               &diag_;
    ParserOptions                             opts_;
    size_t                                    pos_       = 0;
    unsigned                                  recursion_ = 0;
    std::unordered_map<const Expr *, unsigned> depth_;
};

// Lex and parse `text` in one step. Returns null after a lex or parse error.
ExprPtr parseExpression(const std::string &text, DiagEngine &diag,
                        ParserOptions opts = {});

} // namespace sqlexpr
