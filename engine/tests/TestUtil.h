#pragma once
#include "sqlexpr/Evaluator.h"
#include <gtest/gtest.h>
#include <ostream>
#include <string>

namespace sqlexpr {

// Readable failure output for EXPECT_EQ on values.
inline void PrintTo(const Value &v, std::ostream *os) {
    *os << v.typeStr() << " " << v.literal();
}

namespace test {

inline Value Null()                { return Value::mkNull(); }
inline Value Bool(bool b)          { return Value::mkBool(b); }
inline Value Int(int64_t i)        { return Value::mkInt(i); }
inline Value Float(double d)       { return Value::mkFloat(d); }
inline Value Str(std::string s)    { return Value::mkString(std::move(s)); }

struct Outcome {
    std::optional<Value> value;
    ErrorKind            kind = ErrorKind::None;
    std::string          error;
    int                  errors = 0;
};

inline Outcome run(const std::string &text, const RowContext *row = nullptr,
                   ParserOptions opts = {}) {
    DiagEngine diag;
    Outcome o;
    o.value  = evaluate(text, diag, row, opts);
    o.errors = diag.errorCount();
    if (const Diagnostic *d = diag.lastError()) {
        o.kind  = d->kind;
        o.error = d->message;
    }
    return o;
}

// NaN matches NaN; everything else uses Value::operator==.
inline bool sameValue(const Value &a, const Value &b) {
    if (a.isNaN() || b.isNaN()) return a.isNaN() && b.isNaN();
    return a == b;
}

inline ::testing::AssertionResult Evaluates(const std::string &text, const Value &expected,
                                            const RowContext *row = nullptr) {
    Outcome o = run(text, row);
    if (!o.value)
        return ::testing::AssertionFailure() << "'" << text << "' failed: " << o.error;
    if (!sameValue(*o.value, expected))
        return ::testing::AssertionFailure()
               << "'" << text << "' gave " << o.value->typeStr() << " " << o.value->literal()
               << ", expected " << expected.typeStr() << " " << expected.literal();
    return ::testing::AssertionSuccess();
}

inline ::testing::AssertionResult Fails(const std::string &text, ErrorKind kind,
                                        const std::string &message,
                                        const RowContext *row = nullptr) {
    Outcome o = run(text, row);
    if (o.value)
        return ::testing::AssertionFailure()
               << "'" << text << "' gave " << o.value->literal() << ", expected an error";
    if (o.kind != kind || o.error != message)
        return ::testing::AssertionFailure()
               << "'" << text << "' failed with '" << o.error << "' (kind "
               << static_cast<int>(o.kind) << "), expected '" << message << "' (kind "
               << static_cast<int>(kind) << ")";
    if (o.errors != 1)
        return ::testing::AssertionFailure()
               << "'" << text << "' recorded " << o.errors << " errors";
    return ::testing::AssertionSuccess();
}

inline ::testing::AssertionResult ValueError(const std::string &text, const std::string &message,
                                             const RowContext *row = nullptr) {
    return Fails(text, ErrorKind::Value, message, row);
}

inline ::testing::AssertionResult ParseError(const std::string &text, const std::string &message) {
    return Fails(text, ErrorKind::Parse, message);
}

} // namespace test
} // namespace sqlexpr
