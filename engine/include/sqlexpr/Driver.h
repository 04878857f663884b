#pragma once
#include "sqlexpr/Diagnostic.h"
#include "sqlexpr/Parser.h"
#include "sqlexpr/RowContext.h"
#include "llvm/Support/raw_ostream.h"
#include <string>

namespace sqlexpr {

struct DriverOptions {
    bool     dumpTokens   = false;
    bool     dumpAST      = false;   // dump instead of evaluating
    bool     fold         = false;
    bool     literal      = false;   // print results in literal form
    bool     types        = false;   // prefix results with their type
    bool     verbose      = false;
    unsigned maxDepth     = 512;
    unsigned maxTreeDepth = 4096;
};

// Runs expressions through lex, parse, optional folding and evaluation
// against the columns bound so far, writing results and dumps to `out`.
// Failures are reported through `diag`.
class Driver {
public:
    Driver(DriverOptions opts, DiagEngine &diag, llvm::raw_ostream &out)
        : opts_(opts), diag_(diag), out_(out) {}

    // NAME=VALUE. NAME is read as a column reference (so it folds case and
    // may be qualified or quoted); VALUE is evaluated as a constant
    // expression. Rebinding a column warns and keeps the new value.
    bool bindColumn(const std::string &def);

    bool run(const std::string &text);

    const MapRowContext &row() const { return row_; }

private:
    ParserOptions parserOptions() const;

    DriverOptions      opts_;
    DiagEngine        &diag_;
    llvm::raw_ostream &out_;
    MapRowContext      row_;
};

} // namespace sqlexpr
