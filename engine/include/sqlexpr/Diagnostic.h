#pragma once
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace sqlexpr {

struct SourceLocation {
    unsigned line   = 1;
    unsigned col    = 1;
    size_t   offset = 0;   // byte offset into the expression text

    SourceLocation() = default;
    SourceLocation(unsigned l, unsigned c, size_t o = 0)
        : line(l), col(c), offset(o) {}
};

enum class DiagLevel { Warning, Error };

// Which stage rejected the input.
enum class ErrorKind { None, Lex, Parse, Value };

struct Diagnostic {
    DiagLevel      level;
    ErrorKind      kind;
    SourceLocation loc;
    std::string    message;
};

class DiagEngine {
public:
    explicit DiagEngine(const char *filename = nullptr,
                        llvm::raw_ostream *echo = nullptr)
        : filename_(filename), echo_(echo) {}

    void warn      (SourceLocation l, std::string msg) { emit(DiagLevel::Warning, ErrorKind::None,  l, std::move(msg)); }
    void lexError  (SourceLocation l, std::string msg) { emit(DiagLevel::Error,   ErrorKind::Lex,   l, std::move(msg)); ++errorCount_; }
    void parseError(SourceLocation l, std::string msg) { emit(DiagLevel::Error,   ErrorKind::Parse, l, std::move(msg)); ++errorCount_; }
    void valueError(SourceLocation l, std::string msg) { emit(DiagLevel::Error,   ErrorKind::Value, l, std::move(msg)); ++errorCount_; }

    bool hasErrors()  const { return errorCount_ > 0; }
    int  errorCount() const { return errorCount_; }

    // Most recent error, or nullptr if none was reported.
    const Diagnostic *lastError() const;

    const std::vector<Diagnostic> &diagnostics() const { return diags_; }

    // Drop everything recorded so far; used between rows and between
    // expressions read by the CLI.
    void clear() { diags_.clear(); errorCount_ = 0; }

private:
    void emit(DiagLevel level, ErrorKind kind, SourceLocation loc, std::string msg);

    const char             *filename_   = nullptr;
    llvm::raw_ostream      *echo_       = nullptr;
    int                     errorCount_ = 0;
    std::vector<Diagnostic> diags_;
};

} // namespace sqlexpr
