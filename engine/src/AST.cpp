#include "sqlexpr/AST.h"
#include <cctype>

namespace sqlexpr {

// ── Operator spellings ────────────────────────────────────────────────────────
const char *unaryOpStr(UnaryOp op) {
    switch (op) {
    case UnaryOp::Plus: return "+";
    case UnaryOp::Neg:  return "-";
    case UnaryOp::Not:  return "NOT";
    }
    return "?";
}

const char *binaryOpStr(BinaryOp op) {
    switch (op) {
    case BinaryOp::Or:   return "OR";
    case BinaryOp::And:  return "AND";
    case BinaryOp::Eq:   return "=";
    case BinaryOp::NEq:  return "!=";
    case BinaryOp::Like: return "LIKE";
    case BinaryOp::Gt:   return ">";
    case BinaryOp::GEq:  return ">=";
    case BinaryOp::Lt:   return "<";
    case BinaryOp::LEq:  return "<=";
    case BinaryOp::Add:  return "+";
    case BinaryOp::Sub:  return "-";
    case BinaryOp::Mul:  return "*";
    case BinaryOp::Div:  return "/";
    case BinaryOp::Mod:  return "%";
    case BinaryOp::Pow:  return "^";
    }
    return "?";
}

const char *postfixOpStr(PostfixOp op) {
    switch (op) {
    case PostfixOp::Factorial:  return "!";
    case PostfixOp::IsNull:     return "IS NULL";
    case PostfixOp::IsNotNull:  return "IS NOT NULL";
    case PostfixOp::IsTrue:     return "IS TRUE";
    case PostfixOp::IsNotTrue:  return "IS NOT TRUE";
    case PostfixOp::IsFalse:    return "IS FALSE";
    case PostfixOp::IsNotFalse: return "IS NOT FALSE";
    }
    return "?";
}

// ── ColumnRef::str() ──────────────────────────────────────────────────────────
static bool isReservedWord(const std::string &s) {
    static const char *const words[] = {
        "true", "false", "null", "infinity", "nan",
        "and", "or", "not", "is", "like",
    };
    std::string lower;
    for (char c : s) lower += (char)std::tolower(static_cast<unsigned char>(c));
    for (const char *w : words)
        if (lower == w) return true;
    return false;
}

// A bare identifier lexes to itself only if it is lower case, starts with a
// letter or '_', and is not a keyword.
static std::string quoteIdent(const std::string &s) {
    bool bare = !s.empty() && !isReservedWord(s) &&
                (std::islower(static_cast<unsigned char>(s[0])) || s[0] == '_');
    for (char c : s) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '_'))
            bare = false;
    }
    if (bare) return s;

    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

std::string ColumnRef::str() const {
    if (table) return quoteIdent(*table) + "." + quoteIdent(name);
    return quoteIdent(name);
}

// ── printExpr() ───────────────────────────────────────────────────────────────
std::string printExpr(const Expr &e) {
    switch (e.kind) {
    case ExprKind::Literal:
        return static_cast<const LiteralExpr &>(e).value.literal();
    case ExprKind::Column:
        return static_cast<const ColumnExpr &>(e).ref.str();
    case ExprKind::Unary: {
        auto &u = static_cast<const UnaryExpr &>(e);
        std::string sep = (u.op == UnaryOp::Not) ? " " : "";
        return "(" + std::string(unaryOpStr(u.op)) + sep + printExpr(*u.operand) + ")";
    }
    case ExprKind::Binary: {
        auto &b = static_cast<const BinaryExpr &>(e);
        return "(" + printExpr(*b.lhs) + " " + binaryOpStr(b.op) + " " +
               printExpr(*b.rhs) + ")";
    }
    case ExprKind::Postfix: {
        auto &p = static_cast<const PostfixExpr &>(e);
        std::string sep = (p.op == PostfixOp::Factorial) ? "" : " ";
        return "(" + printExpr(*p.operand) + sep + postfixOpStr(p.op) + ")";
    }
    }
    return "?";
}

// ── dumpExpr() ────────────────────────────────────────────────────────────────
void dumpExpr(const Expr &e, llvm::raw_ostream &os, int indent) {
    std::string pad(indent * 2, ' ');
    os << pad;
    switch (e.kind) {
    case ExprKind::Literal: {
        auto &l = static_cast<const LiteralExpr &>(e);
        os << "Literal " << l.value.literal() << " : " << l.value.typeStr() << "\n";
        break;
    }
    case ExprKind::Column:
        os << "Column " << static_cast<const ColumnExpr &>(e).ref.str() << "\n";
        break;
    case ExprKind::Unary: {
        auto &u = static_cast<const UnaryExpr &>(e);
        os << "Unary '" << unaryOpStr(u.op) << "'\n";
        dumpExpr(*u.operand, os, indent + 1);
        break;
    }
    case ExprKind::Binary: {
        auto &b = static_cast<const BinaryExpr &>(e);
        os << "Binary '" << binaryOpStr(b.op) << "'\n";
        dumpExpr(*b.lhs, os, indent + 1);
        dumpExpr(*b.rhs, os, indent + 1);
        break;
    }
    case ExprKind::Postfix: {
        auto &p = static_cast<const PostfixExpr &>(e);
        os << "Postfix '" << postfixOpStr(p.op) << "'\n";
        dumpExpr(*p.operand, os, indent + 1);
        break;
    }
    }
}

size_t countNodes(const Expr &e) {
    switch (e.kind) {
    case ExprKind::Literal:
    case ExprKind::Column:
        return 1;
    case ExprKind::Unary:
        return 1 + countNodes(*static_cast<const UnaryExpr &>(e).operand);
    case ExprKind::Binary: {
        auto &b = static_cast<const BinaryExpr &>(e);
        return 1 + countNodes(*b.lhs) + countNodes(*b.rhs);
    }
    case ExprKind::Postfix:
        return 1 + countNodes(*static_cast<const PostfixExpr &>(e).operand);
    }
    return 1;
}

} // namespace sqlexpr
