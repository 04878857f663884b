#pragma once
#include "sqlexpr/Diagnostic.h"
#include "sqlexpr/Value.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <optional>
#include <string>

namespace sqlexpr {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

// =============================================================================
// EXPRESSIONS
// =============================================================================

enum class ExprKind {
    Literal,        // constant Value
    Column,         // column reference, resolved by a RowContext
    Unary,          // NOT x, +x, -x
    Binary,         // x + y, x = y, x AND y, x LIKE y, ...
    Postfix,        // x!, x IS [NOT] NULL|TRUE|FALSE
};

enum class UnaryOp {
    Plus, Neg, Not,
};

enum class BinaryOp {
    Or, And,
    Eq, NEq, Like,
    Gt, GEq, Lt, LEq,
    Add, Sub,
    Mul, Div, Mod,
    Pow,
};

enum class PostfixOp {
    Factorial,
    IsNull,  IsNotNull,
    IsTrue,  IsNotTrue,
    IsFalse, IsNotFalse,
};

// Operator spellings: "NOT", "-", "<=", "LIKE", "IS NOT NULL", "!", ...
const char *unaryOpStr(UnaryOp op);
const char *binaryOpStr(BinaryOp op);
const char *postfixOpStr(PostfixOp op);

// ── Column handle ─────────────────────────────────────────────────────────────
struct ColumnRef {
    std::optional<std::string> table;   // qualifier in table.name
    std::string                name;

    ColumnRef() = default;
    explicit ColumnRef(std::string n) : name(std::move(n)) {}
    ColumnRef(std::string t, std::string n)
        : table(std::move(t)), name(std::move(n)) {}

    // name or table.name, quoting any part that would not lex back as a
    // bare identifier.
    std::string str() const;

    bool operator==(const ColumnRef &o) const {
        return table == o.table && name == o.name;
    }
};

// ── Base expression ───────────────────────────────────────────────────────────
struct Expr {
    ExprKind       kind;
    SourceLocation loc;

    explicit Expr(ExprKind k, SourceLocation l) : kind(k), loc(l) {}
    virtual ~Expr() = default;
};

struct LiteralExpr : Expr {
    Value value;
    LiteralExpr(Value v, SourceLocation l)
        : Expr(ExprKind::Literal, l), value(std::move(v)) {}
};

struct ColumnExpr : Expr {
    ColumnRef ref;
    ColumnExpr(ColumnRef r, SourceLocation l)
        : Expr(ExprKind::Column, l), ref(std::move(r)) {}
};

// ── Unary expression ──────────────────────────────────────────────────────────
struct UnaryExpr : Expr {
    UnaryOp op;
    ExprPtr operand;
    UnaryExpr(UnaryOp o, ExprPtr e, SourceLocation l)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e)) {}
};

// ── Binary expression ─────────────────────────────────────────────────────────
struct BinaryExpr : Expr {
    BinaryOp op;
    ExprPtr  lhs;
    ExprPtr  rhs;
    BinaryExpr(BinaryOp o, ExprPtr l, ExprPtr r, SourceLocation loc)
        : Expr(ExprKind::Binary, loc), op(o),
          lhs(std::move(l)), rhs(std::move(r)) {}
};

// ── Postfix expression ────────────────────────────────────────────────────────
struct PostfixExpr : Expr {
    PostfixOp op;
    ExprPtr   operand;
    PostfixExpr(PostfixOp o, ExprPtr e, SourceLocation l)
        : Expr(ExprKind::Postfix, l), op(o), operand(std::move(e)) {}
};

// ── Printing ──────────────────────────────────────────────────────────────────
// Fully parenthesized form, e.g. (1 + (2 * 3)), ((-3)!), (x IS NOT NULL).
// Constants use Value::literal(), so the output parses back to an expression
// with the same value.
std::string printExpr(const Expr &e);

// Indented one-node-per-line tree dump.
void dumpExpr(const Expr &e, llvm::raw_ostream &os, int indent = 0);

// Number of nodes in the tree.
size_t countNodes(const Expr &e);

} // namespace sqlexpr
