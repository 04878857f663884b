#pragma once
#include "sqlexpr/AST.h"
#include "sqlexpr/Diagnostic.h"
#include "sqlexpr/Parser.h"
#include "sqlexpr/RowContext.h"
#include "sqlexpr/Value.h"
#include <optional>
#include <string>

namespace sqlexpr {

// =============================================================================
// Evaluator: post-order walk of an expression tree
// =============================================================================
// Both operands of every binary operator are evaluated; there is no
// short-circuiting. The tree is never modified, so one tree may be evaluated by
// many Evaluators at once, each with its own DiagEngine.
//
// On failure exactly one value error is recorded and nullopt is returned.
class Evaluator {
public:
    explicit Evaluator(DiagEngine &diag) : diag_(diag) {}

    // `row` may be null for constant expressions; a column reference then
    // fails with "Can't resolve column <name> without a row".
    std::optional<Value> eval(const Expr &e, const RowContext *row = nullptr) const;

private:
    std::optional<Value> evalLiteral(const LiteralExpr &e) const;
    std::optional<Value> evalColumn (const ColumnExpr  &e, const RowContext *row) const;
    std::optional<Value> evalUnary  (const UnaryExpr   &e, const RowContext *row) const;
    std::optional<Value> evalBinary (const BinaryExpr  &e, const RowContext *row) const;
    std::optional<Value> evalPostfix(const PostfixExpr &e, const RowContext *row) const;

    std::optional<Value> compare(BinaryOp op, const Value &l, const Value &r,
                                 SourceLocation loc) const;
    std::optional<Value> like(const Value &l, const Value &r, SourceLocation loc) const;

    DiagEngine &diag_;
};

// Parse and evaluate `text` in one step.
std::optional<Value> evaluate(const std::string &text, DiagEngine &diag,
                              const RowContext *row = nullptr,
                              ParserOptions opts = {});

} // namespace sqlexpr
