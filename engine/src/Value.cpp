#include "sqlexpr/Value.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/MathExtras.h"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace sqlexpr {

// =============================================================================
// Value helpers
// =============================================================================

bool Value::isNaN() const { return kind == Float && std::isnan(floatVal); }

std::string formatFloat(double v) {
    if (std::isnan(v)) return "NAN";
    if (std::isinf(v)) return v < 0 ? "-INFINITY" : "INFINITY";
    // Shortest digits come from the scientific form; the plain overload's
    // fixed form prints every digit of large integers.
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    size_t ePos = sci.find('e');
    int exp = std::atoi(sci.c_str() + ePos + 1);
    if (exp < -5 || exp > 20) return sci;

    std::string digits;
    for (size_t i = 0; i < ePos; ++i)
        if (std::isdigit(static_cast<unsigned char>(sci[i]))) digits += sci[i];

    std::string out = std::signbit(v) ? "-" : "";
    if (exp < 0) {
        out += "0." + std::string(-exp - 1, '0') + digits;
    } else if (digits.size() <= size_t(exp) + 1) {
        out += digits + std::string(exp + 1 - digits.size(), '0') + ".0";
    } else {
        out += digits.substr(0, exp + 1) + "." + digits.substr(exp + 1);
    }
    return out;
}

std::string Value::str() const {
    switch (kind) {
    case Null:    return "NULL";
    case Boolean: return boolVal ? "TRUE" : "FALSE";
    case Integer: return std::to_string(intVal);
    case Float:   return formatFloat(floatVal);
    case String:  return strVal;
    }
    return "?";
}

std::string Value::literal() const {
    if (kind != String) return str();
    std::string out = "'";
    for (char c : strVal) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

const char *Value::typeStr() const {
    switch (kind) {
    case Null:    return "NULL";
    case Boolean: return "BOOLEAN";
    case Integer: return "INTEGER";
    case Float:   return "FLOAT";
    case String:  return "STRING";
    }
    return "?";
}

bool Value::operator==(const Value &o) const {
    if (kind != o.kind) return false;
    switch (kind) {
    case Null:    return true;
    case Boolean: return boolVal == o.boolVal;
    case Integer: return intVal == o.intVal;
    case Float:   return floatVal == o.floatVal;
    case String:  return strVal == o.strVal;
    }
    return false;
}

template <typename T>
static Ordering orderOf(T l, T r) {
    if (l < r) return Ordering::Less;
    if (l > r) return Ordering::Greater;
    if (l == r) return Ordering::Equal;
    return Ordering::Unordered;
}

std::optional<Ordering> compareValues(const Value &l, const Value &r) {
    switch (l.kind) {
    case Value::Boolean:
        if (r.kind == Value::Boolean) return orderOf<int>(l.boolVal, r.boolVal);
        return std::nullopt;
    case Value::Integer:
        if (r.kind == Value::Integer) return orderOf(l.intVal, r.intVal);
        if (r.kind == Value::Float)   return orderOf(l.toFloat(), r.floatVal);
        return std::nullopt;
    case Value::Float:
        if (r.isNumeric()) return orderOf(l.floatVal, r.toFloat());
        return std::nullopt;
    case Value::String:
        if (r.kind == Value::String) {
            int c = llvm::StringRef(l.strVal).compare(llvm::StringRef(r.strVal));
            return c < 0 ? Ordering::Less : c > 0 ? Ordering::Greater : Ordering::Equal;
        }
        return std::nullopt;
    case Value::Null:
        return std::nullopt;
    }
    return std::nullopt;
}

// =============================================================================
// Operators
// =============================================================================

namespace ops {

static std::optional<Value> overflow(DiagEngine &diag, SourceLocation loc) {
    diag.valueError(loc, "Integer overflow");
    return std::nullopt;
}

static std::optional<Value> divideByZero(DiagEngine &diag, SourceLocation loc) {
    diag.valueError(loc, "Can't divide by zero");
    return std::nullopt;
}

static std::optional<Value> binaryTypeError(const char *verb, const Value &l,
                                            const Value &r, DiagEngine &diag,
                                            SourceLocation loc) {
    diag.valueError(loc, std::string("Can't ") + verb + " " + l.str() + " and " + r.str());
    return std::nullopt;
}

static std::optional<Value> unaryTypeError(const char *verb, const Value &v,
                                           DiagEngine &diag, SourceLocation loc) {
    diag.valueError(loc, std::string("Can't ") + verb + " " + v.str());
    return std::nullopt;
}

// Shared shape of the arithmetic operators: Null absorbs, two integers go
// through `intOp`, any other numeric pair is widened to double for `floatOp`.
template <typename IntOp, typename FloatOp>
static std::optional<Value> arithmetic(const char *verb, const Value &l,
                                       const Value &r, DiagEngine &diag,
                                       SourceLocation loc, IntOp intOp,
                                       FloatOp floatOp) {
    if (l.isNull() || r.isNull()) return Value::mkNull();
    if (l.kind == Value::Integer && r.kind == Value::Integer)
        return intOp(l.intVal, r.intVal);
    if (l.isNumeric() && r.isNumeric())
        return Value::mkFloat(floatOp(l.toFloat(), r.toFloat()));
    return binaryTypeError(verb, l, r, diag, loc);
}

std::optional<Value> add(const Value &l, const Value &r, DiagEngine &diag,
                         SourceLocation loc) {
    return arithmetic("add", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            int64_t res;
            if (llvm::AddOverflow(a, b, res)) return overflow(diag, loc);
            return Value::mkInt(res);
        },
        [](double a, double b) { return a + b; });
}

std::optional<Value> subtract(const Value &l, const Value &r, DiagEngine &diag,
                              SourceLocation loc) {
    return arithmetic("subtract", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            int64_t res;
            if (llvm::SubOverflow(a, b, res)) return overflow(diag, loc);
            return Value::mkInt(res);
        },
        [](double a, double b) { return a - b; });
}

std::optional<Value> multiply(const Value &l, const Value &r, DiagEngine &diag,
                              SourceLocation loc) {
    return arithmetic("multiply", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            int64_t res;
            if (llvm::MulOverflow(a, b, res)) return overflow(diag, loc);
            return Value::mkInt(res);
        },
        [](double a, double b) { return a * b; });
}

std::optional<Value> divide(const Value &l, const Value &r, DiagEngine &diag,
                            SourceLocation loc) {
    return arithmetic("divide", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            if (b == 0) return divideByZero(diag, loc);
            if (a == std::numeric_limits<int64_t>::min() && b == -1)
                return overflow(diag, loc);
            return Value::mkInt(a / b);
        },
        [](double a, double b) { return a / b; });
}

std::optional<Value> remainder(const Value &l, const Value &r, DiagEngine &diag,
                               SourceLocation loc) {
    return arithmetic("take modulo of", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            if (b == 0) return divideByZero(diag, loc);
            // INT64_MIN % -1 traps on most targets.
            if (b == -1) return Value::mkInt(0);
            return Value::mkInt(a % b);
        },
        [](double a, double b) { return std::fmod(a, b); });
}

std::optional<int64_t> checkedPow(int64_t base, int64_t exp) {
    int64_t result = 1;
    while (exp > 0) {
        if (exp & 1) {
            if (llvm::MulOverflow(result, base, result)) return std::nullopt;
        }
        exp >>= 1;
        // Squaring past the last bit could overflow spuriously.
        if (exp > 0 && llvm::MulOverflow(base, base, base)) return std::nullopt;
    }
    return result;
}

std::optional<Value> exponentiate(const Value &l, const Value &r,
                                  DiagEngine &diag, SourceLocation loc) {
    return arithmetic("exponentiate", l, r, diag, loc,
        [&](int64_t a, int64_t b) -> std::optional<Value> {
            if (b < 0) return Value::mkFloat(std::pow((double)a, (double)b));
            auto res = checkedPow(a, b);
            if (!res) return overflow(diag, loc);
            return Value::mkInt(*res);
        },
        [](double a, double b) { return std::pow(a, b); });
}

std::optional<Value> positive(const Value &v, DiagEngine &diag,
                              SourceLocation loc) {
    switch (v.kind) {
    case Value::Null:
    case Value::Integer:
    case Value::Float:
        return v;
    case Value::Boolean:
    case Value::String:
        break;
    }
    return unaryTypeError("take the positive of", v, diag, loc);
}

std::optional<Value> negate(const Value &v, DiagEngine &diag,
                            SourceLocation loc) {
    switch (v.kind) {
    case Value::Null:
        return v;
    case Value::Integer: {
        int64_t res;
        if (llvm::SubOverflow<int64_t>(0, v.intVal, res)) return overflow(diag, loc);
        return Value::mkInt(res);
    }
    case Value::Float:
        return Value::mkFloat(-v.floatVal);
    case Value::Boolean:
    case Value::String:
        break;
    }
    return unaryTypeError("negate", v, diag, loc);
}

std::optional<Value> factorial(const Value &v, DiagEngine &diag,
                               SourceLocation loc) {
    switch (v.kind) {
    case Value::Null:
        return v;
    case Value::Integer: {
        if (v.intVal < 0) {
            diag.valueError(loc, "Can't take factorial of negative number");
            return std::nullopt;
        }
        // 21! already overflows, so the loop is short either way.
        int64_t res = 1;
        for (int64_t i = 2; i <= v.intVal; ++i)
            if (llvm::MulOverflow(res, i, res)) return overflow(diag, loc);
        return Value::mkInt(res);
    }
    case Value::Boolean:
    case Value::Float:
    case Value::String:
        break;
    }
    return unaryTypeError("take factorial of", v, diag, loc);
}

// Three-valued AND/OR: `dominant` is the Boolean that decides the result on
// its own (FALSE for AND, TRUE for OR) even against NULL.
static std::optional<Value> kleene(const char *verb, bool dominant,
                                   const Value &l, const Value &r,
                                   DiagEngine &diag, SourceLocation loc) {
    bool lOk = l.isBool() || l.isNull();
    bool rOk = r.isBool() || r.isNull();
    if (!lOk || !rOk) return binaryTypeError(verb, l, r, diag, loc);

    if ((l.isBool() && l.boolVal == dominant) || (r.isBool() && r.boolVal == dominant))
        return Value::mkBool(dominant);
    if (l.isNull() || r.isNull()) return Value::mkNull();
    return Value::mkBool(!dominant);
}

std::optional<Value> logicalAnd(const Value &l, const Value &r,
                                DiagEngine &diag, SourceLocation loc) {
    return kleene("and", false, l, r, diag, loc);
}

std::optional<Value> logicalOr(const Value &l, const Value &r,
                               DiagEngine &diag, SourceLocation loc) {
    return kleene("or", true, l, r, diag, loc);
}

std::optional<Value> logicalNot(const Value &v, DiagEngine &diag,
                                SourceLocation loc) {
    switch (v.kind) {
    case Value::Null:    return v;
    case Value::Boolean: return Value::mkBool(!v.boolVal);
    case Value::Integer:
    case Value::Float:
    case Value::String:
        break;
    }
    return unaryTypeError("negate", v, diag, loc);
}

} // namespace ops

} // namespace sqlexpr
