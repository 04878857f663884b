#include "sqlexpr/ConstFold.h"
#include "sqlexpr/Evaluator.h"

namespace sqlexpr {

namespace {

bool isLiteral(const ExprPtr &e) { return e->kind == ExprKind::Literal; }

class Folder {
public:
    ExprPtr fold(ExprPtr e) {
        switch (e->kind) {
        case ExprKind::Literal:
        case ExprKind::Column:
            return e;
        case ExprKind::Unary: {
            auto &u = static_cast<UnaryExpr &>(*e);
            u.operand = fold(std::move(u.operand));
            if (!isLiteral(u.operand)) return e;
            return tryFold(std::move(e));
        }
        case ExprKind::Binary: {
            auto &b = static_cast<BinaryExpr &>(*e);
            b.lhs = fold(std::move(b.lhs));
            b.rhs = fold(std::move(b.rhs));
            if (!isLiteral(b.lhs) || !isLiteral(b.rhs)) return e;
            return tryFold(std::move(e));
        }
        case ExprKind::Postfix: {
            auto &p = static_cast<PostfixExpr &>(*e);
            p.operand = fold(std::move(p.operand));
            if (!isLiteral(p.operand)) return e;
            return tryFold(std::move(e));
        }
        }
        return e;
    }

    unsigned folded = 0;

private:
    // Operands are already literals, so this evaluates a single operator.
    ExprPtr tryFold(ExprPtr e) {
        DiagEngine scratch;
        auto v = Evaluator(scratch).eval(*e);
        if (!v) return e;
        ++folded;
        return std::make_unique<LiteralExpr>(std::move(*v), e->loc);
    }
};

} // namespace

ExprPtr foldConstants(ExprPtr e, unsigned *folded) {
    if (!e) return e;
    Folder f;
    auto out = f.fold(std::move(e));
    if (folded) *folded = f.folded;
    return out;
}

} // namespace sqlexpr
