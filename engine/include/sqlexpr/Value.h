#pragma once
#include "sqlexpr/Diagnostic.h"
#include <cstdint>
#include <optional>
#include <string>

namespace sqlexpr {

// =============================================================================
// Value: the scalar every expression evaluates to
// =============================================================================
// Exactly one payload field is meaningful, selected by `kind`. Floats may hold
// NaN or ±Infinity; both are ordinary values.
struct Value {
    enum Kind { Null, Boolean, Integer, Float, String };

    Kind        kind     = Null;
    bool        boolVal  = false;
    int64_t     intVal   = 0;
    double      floatVal = 0.0;
    std::string strVal;

    static Value mkNull()                { return {}; }
    static Value mkBool(bool v)          { Value c; c.kind = Boolean; c.boolVal  = v; return c; }
    static Value mkInt(int64_t v)        { Value c; c.kind = Integer; c.intVal   = v; return c; }
    static Value mkFloat(double v)       { Value c; c.kind = Float;   c.floatVal = v; return c; }
    static Value mkString(std::string s) {
        Value c; c.kind = String; c.strVal = std::move(s); return c;
    }

    bool isNull()    const { return kind == Null; }
    bool isBool()    const { return kind == Boolean; }
    bool isNumeric() const { return kind == Integer || kind == Float; }
    bool isNaN()     const;

    // Integer or Float widened to double.
    double toFloat() const { return kind == Integer ? (double)intVal : floatVal; }

    // Display form used in messages: NULL, TRUE, 42, 3.14, text unquoted.
    std::string str() const;
    // Literal form: like str(), but strings are quoted so the text parses
    // back to an equal value.
    std::string literal() const;
    // NULL, BOOLEAN, INTEGER, FLOAT or STRING.
    const char *typeStr() const;

    // Structural equality: same kind and same payload (NaN != NaN).
    bool operator==(const Value &o) const;
    bool operator!=(const Value &o) const { return !(*this == o); }
};

// Shortest round-tripping digits of a double, always readable as a float
// literal. Decimal exponents -5..20 print positionally, padded with zeros
// (0.00001, 3.0, 9223372036854776000.0); others print in scientific form
// (1e-06, 1e+21). Specials are INFINITY, -INFINITY and NAN.
std::string formatFloat(double v);

// Result of ordering two comparable values. NaN against anything is Unordered.
enum class Ordering { Less, Equal, Greater, Unordered };

// Orders two non-null values. Booleans order FALSE < TRUE, integers and floats
// compare numerically, strings compare byte-wise. Returns nullopt when the two
// kinds can't be compared with each other.
std::optional<Ordering> compareValues(const Value &l, const Value &r);

// =============================================================================
// Scalar operators
// =============================================================================
// Each operator returns nullopt after reporting a value error to `diag` at
// `loc`. A Null operand yields Null without any type check, except for the
// logical operators which follow three-valued logic.
namespace ops {

std::optional<Value> add        (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> subtract   (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> multiply   (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> divide     (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> remainder  (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> exponentiate(const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);

std::optional<Value> positive (const Value &v, DiagEngine &diag, SourceLocation loc);
std::optional<Value> negate   (const Value &v, DiagEngine &diag, SourceLocation loc);
std::optional<Value> factorial(const Value &v, DiagEngine &diag, SourceLocation loc);

std::optional<Value> logicalAnd(const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> logicalOr (const Value &l, const Value &r, DiagEngine &diag, SourceLocation loc);
std::optional<Value> logicalNot(const Value &v, DiagEngine &diag, SourceLocation loc);

// Checked integer power for a non-negative exponent; nullopt on overflow.
std::optional<int64_t> checkedPow(int64_t base, int64_t exp);

} // namespace ops

} // namespace sqlexpr
