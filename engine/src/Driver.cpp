#include "sqlexpr/Driver.h"
#include "sqlexpr/ConstFold.h"
#include "sqlexpr/Evaluator.h"
#include "sqlexpr/Lexer.h"
#include "sqlexpr/Parser.h"

#include <cstdio>
#include <vector>

namespace sqlexpr {

ParserOptions Driver::parserOptions() const {
    ParserOptions p;
    p.maxDepth     = opts_.maxDepth;
    p.maxTreeDepth = opts_.maxTreeDepth;
    return p;
}

// ── Column bindings ───────────────────────────────────────────────────────────
bool Driver::bindColumn(const std::string &def) {
    auto eq = def.find('=');
    if (eq == std::string::npos) {
        diag_.parseError(SourceLocation(), "Expected NAME=VALUE, found '" + def + "'");
        return false;
    }

    std::string nameText = def.substr(0, eq);
    auto name = parseExpression(nameText, diag_, parserOptions());
    if (!name) return false;
    if (name->kind != ExprKind::Column) {
        diag_.parseError(name->loc, "'" + nameText + "' is not a column name");
        return false;
    }
    auto &ref = static_cast<ColumnExpr &>(*name).ref;

    auto value = evaluate(def.substr(eq + 1), diag_, nullptr, parserOptions());
    if (!value) return false;

    if (row_.contains(ref))
        diag_.warn(name->loc, "Column " + ref.str() + " bound more than once, keeping " +
                              value->literal());
    if (opts_.verbose) fprintf(stderr, "[sqlexpr] Bound %s = %s\n",
                               ref.str().c_str(), value->literal().c_str());
    row_.bind(ref, std::move(*value));
    return true;
}

// ── Token dump ────────────────────────────────────────────────────────────────
static void dumpTokens(const std::vector<Token> &tokens, llvm::raw_ostream &os) {
    for (auto &t : tokens) {
        os << "  " << t.loc.line << ":" << t.loc.col << "\t" << Token::kindName(t.kind);
        if (!t.isEof()) os << "\t" << t.describe();
        os << "\n";
    }
}

// ── One expression ────────────────────────────────────────────────────────────
bool Driver::run(const std::string &text) {
    // ── 1. Lex ────────────────────────────────────────────────────────────────
    if (opts_.verbose) fprintf(stderr, "[sqlexpr] Lexing '%s' ...\n", text.c_str());
    auto tokens = tokenize(text, diag_);
    if (!tokens) return false;
    if (opts_.verbose) fprintf(stderr, "[sqlexpr] Lexed %zu tokens\n", tokens->size());
    if (opts_.dumpTokens) dumpTokens(*tokens, out_);

    // ── 2. Parse ──────────────────────────────────────────────────────────────
    Parser parser(std::move(*tokens), diag_, parserOptions());
    auto expr = parser.parseExpression();
    if (!expr) return false;
    if (opts_.verbose) fprintf(stderr, "[sqlexpr] Parsed %zu nodes\n", countNodes(*expr));

    // ── 3. Constant folding ───────────────────────────────────────────────────
    if (opts_.fold) {
        unsigned folded = 0;
        expr = foldConstants(std::move(expr), &folded);
        if (opts_.verbose) fprintf(stderr, "[sqlexpr] Folded %u operator nodes\n", folded);
    }

    // ── 4. AST dump ───────────────────────────────────────────────────────────
    if (opts_.dumpAST) {
        dumpExpr(*expr, out_);
        return true;
    }

    // ── 5. Evaluate ───────────────────────────────────────────────────────────
    if (opts_.verbose) fprintf(stderr, "[sqlexpr] Evaluating %s ...\n",
                               printExpr(*expr).c_str());
    auto value = Evaluator(diag_).eval(*expr, &row_);
    if (!value) return false;

    if (opts_.types) out_ << value->typeStr() << " ";
    out_ << (opts_.literal ? value->literal() : value->str()) << "\n";
    return true;
}

} // namespace sqlexpr
