#include "sqlexpr/Diagnostic.h"
#include "sqlexpr/Driver.h"

#include "llvm/Support/raw_ostream.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

// ── CLI options ───────────────────────────────────────────────────────────────
static llvm::cl::list<std::string>
    Expressions(llvm::cl::Positional, llvm::cl::desc("<expression>..."),
                llvm::cl::ZeroOrMore);

// -D NAME=VALUE column bindings
static llvm::cl::list<std::string>
    ColumnDefs("D", llvm::cl::desc("Bind a column to the value of a constant expression"),
               llvm::cl::value_desc("NAME=VALUE"), llvm::cl::Prefix);

static llvm::cl::opt<bool>
    DumpTokens("dump-tokens", llvm::cl::desc("Print the token stream of each expression"));

static llvm::cl::opt<bool>
    DumpAST("dump-ast", llvm::cl::desc("Dump the AST only, skip evaluation"));

static llvm::cl::opt<bool>
    Fold("fold", llvm::cl::desc("Fold constant subexpressions before dumping or evaluating"));

static llvm::cl::opt<bool>
    PrintLiteral("literal", llvm::cl::desc("Print results as literals (strings quoted)"));

static llvm::cl::opt<bool>
    Types("types", llvm::cl::desc("Prefix each result with its type"));

static llvm::cl::opt<unsigned>
    MaxDepth("max-depth", llvm::cl::desc("Maximum parenthesis/operator nesting"),
             llvm::cl::value_desc("N"), llvm::cl::init(512));

static llvm::cl::opt<unsigned>
    MaxTreeDepth("max-tree-depth", llvm::cl::desc("Maximum expression tree depth"),
                 llvm::cl::value_desc("N"), llvm::cl::init(4096));

static llvm::cl::opt<bool>
    Verbose("v", llvm::cl::desc("Verbose output"));

// ── Main ──────────────────────────────────────────────────────────────────────
int main(int argc, char **argv) {
    llvm::InitLLVM X(argc, argv);
    llvm::cl::ParseCommandLineOptions(argc, argv, "SQL scalar expression evaluator\n");

    sqlexpr::DriverOptions opts;
    opts.dumpTokens   = DumpTokens;
    opts.dumpAST      = DumpAST;
    opts.fold         = Fold;
    opts.literal      = PrintLiteral;
    opts.types        = Types;
    opts.verbose      = Verbose;
    opts.maxDepth     = MaxDepth;
    opts.maxTreeDepth = MaxTreeDepth;

    sqlexpr::DiagEngine diag(nullptr, &llvm::errs());
    sqlexpr::Driver driver(opts, diag, llvm::outs());

    for (auto &d : ColumnDefs) {
        if (!driver.bindColumn(d)) return 1;
    }

    std::vector<std::string> inputs(Expressions.begin(), Expressions.end());
    if (inputs.empty()) {
        if (Verbose) fprintf(stderr, "[sqlexpr] Reading expressions from stdin\n");
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r\n\f\v") == std::string::npos) continue;
            inputs.push_back(line);
        }
    }

    int failures = 0;
    for (auto &text : inputs) {
        diag.clear();
        if (!driver.run(text)) ++failures;
    }
    llvm::outs().flush();

    if (failures) {
        fprintf(stderr, "%d of %zu expression(s) failed\n", failures, inputs.size());
        return 1;
    }
    return 0;
}
