#include "sqlexpr/Evaluator.h"
#include "sqlexpr/Like.h"

namespace sqlexpr {

// ── Dispatch ──────────────────────────────────────────────────────────────────
std::optional<Value> Evaluator::eval(const Expr &e, const RowContext *row) const {
    switch (e.kind) {
    case ExprKind::Literal: return evalLiteral(static_cast<const LiteralExpr &>(e));
    case ExprKind::Column:  return evalColumn (static_cast<const ColumnExpr  &>(e), row);
    case ExprKind::Unary:   return evalUnary  (static_cast<const UnaryExpr   &>(e), row);
    case ExprKind::Binary:  return evalBinary (static_cast<const BinaryExpr  &>(e), row);
    case ExprKind::Postfix: return evalPostfix(static_cast<const PostfixExpr &>(e), row);
    }
    diag_.valueError(e.loc, "Unknown expression kind");
    return std::nullopt;
}

std::optional<Value> Evaluator::evalLiteral(const LiteralExpr &e) const {
    return e.value;
}

std::optional<Value> Evaluator::evalColumn(const ColumnExpr &e, const RowContext *row) const {
    if (!row) {
        diag_.valueError(e.loc, "Can't resolve column " + e.ref.str() + " without a row");
        return std::nullopt;
    }
    return row->resolve(e.ref, diag_, e.loc);
}

// ── Unary ─────────────────────────────────────────────────────────────────────
std::optional<Value> Evaluator::evalUnary(const UnaryExpr &e, const RowContext *row) const {
    auto v = eval(*e.operand, row);
    if (!v) return std::nullopt;

    switch (e.op) {
    case UnaryOp::Plus: return ops::positive(*v, diag_, e.loc);
    case UnaryOp::Neg:  return ops::negate(*v, diag_, e.loc);
    case UnaryOp::Not:  return ops::logicalNot(*v, diag_, e.loc);
    }
    return std::nullopt;
}

// ── Binary ────────────────────────────────────────────────────────────────────
std::optional<Value> Evaluator::evalBinary(const BinaryExpr &e, const RowContext *row) const {
    auto l = eval(*e.lhs, row);
    if (!l) return std::nullopt;
    auto r = eval(*e.rhs, row);
    if (!r) return std::nullopt;

    switch (e.op) {
    case BinaryOp::Or:   return ops::logicalOr (*l, *r, diag_, e.loc);
    case BinaryOp::And:  return ops::logicalAnd(*l, *r, diag_, e.loc);

    case BinaryOp::Eq:
    case BinaryOp::NEq:
    case BinaryOp::Gt:
    case BinaryOp::GEq:
    case BinaryOp::Lt:
    case BinaryOp::LEq:
        return compare(e.op, *l, *r, e.loc);
    case BinaryOp::Like:
        return like(*l, *r, e.loc);

    case BinaryOp::Add:  return ops::add         (*l, *r, diag_, e.loc);
    case BinaryOp::Sub:  return ops::subtract    (*l, *r, diag_, e.loc);
    case BinaryOp::Mul:  return ops::multiply    (*l, *r, diag_, e.loc);
    case BinaryOp::Div:  return ops::divide      (*l, *r, diag_, e.loc);
    case BinaryOp::Mod:  return ops::remainder   (*l, *r, diag_, e.loc);
    case BinaryOp::Pow:  return ops::exponentiate(*l, *r, diag_, e.loc);
    }
    return std::nullopt;
}

// NaN is unordered: every comparison with it is false except !=.
std::optional<Value> Evaluator::compare(BinaryOp op, const Value &l, const Value &r,
                                        SourceLocation loc) const {
    if (l.isNull() || r.isNull()) return Value::mkNull();

    auto ord = compareValues(l, r);
    if (!ord) {
        diag_.valueError(loc, "Can't compare " + l.str() + " and " + r.str());
        return std::nullopt;
    }

    bool result = false;
    switch (op) {
    case BinaryOp::Eq:  result = *ord == Ordering::Equal; break;
    case BinaryOp::NEq: result = *ord != Ordering::Equal; break;
    case BinaryOp::Gt:  result = *ord == Ordering::Greater; break;
    case BinaryOp::GEq: result = *ord == Ordering::Greater || *ord == Ordering::Equal; break;
    case BinaryOp::Lt:  result = *ord == Ordering::Less; break;
    case BinaryOp::LEq: result = *ord == Ordering::Less || *ord == Ordering::Equal; break;
    default: break;
    }
    return Value::mkBool(result);
}

std::optional<Value> Evaluator::like(const Value &l, const Value &r, SourceLocation loc) const {
    if (l.isNull() || r.isNull()) return Value::mkNull();
    if (l.kind != Value::String || r.kind != Value::String) {
        diag_.valueError(loc, "Can't LIKE " + l.str() + " and " + r.str());
        return std::nullopt;
    }
    return Value::mkBool(likeMatch(l.strVal, r.strVal));
}

// ── Postfix ───────────────────────────────────────────────────────────────────
std::optional<Value> Evaluator::evalPostfix(const PostfixExpr &e, const RowContext *row) const {
    auto v = eval(*e.operand, row);
    if (!v) return std::nullopt;

    bool isTrue  = v->isBool() && v->boolVal;
    bool isFalse = v->isBool() && !v->boolVal;
    switch (e.op) {
    case PostfixOp::Factorial:  return ops::factorial(*v, diag_, e.loc);
    case PostfixOp::IsNull:     return Value::mkBool(v->isNull());
    case PostfixOp::IsNotNull:  return Value::mkBool(!v->isNull());
    case PostfixOp::IsTrue:     return Value::mkBool(isTrue);
    case PostfixOp::IsNotTrue:  return Value::mkBool(!isTrue);
    case PostfixOp::IsFalse:    return Value::mkBool(isFalse);
    case PostfixOp::IsNotFalse: return Value::mkBool(!isFalse);
    }
    return std::nullopt;
}

// ── Convenience ───────────────────────────────────────────────────────────────
std::optional<Value> evaluate(const std::string &text, DiagEngine &diag,
                              const RowContext *row, ParserOptions opts) {
    auto expr = parseExpression(text, diag, opts);
    if (!expr) return std::nullopt;
    return Evaluator(diag).eval(*expr, row);
}

} // namespace sqlexpr
