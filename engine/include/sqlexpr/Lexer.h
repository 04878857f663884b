#pragma once
#include "sqlexpr/Token.h"
#include "sqlexpr/Diagnostic.h"
#include <optional>
#include <string>
#include <vector>

namespace sqlexpr {

class Lexer {
public:
    Lexer(std::string source, DiagEngine &diag);

    // Lex all tokens up to and including EOF. Stops after the first invalid
    // token, which is then the last element.
    std::vector<Token> lexAll();

    // Single token advance (used by the streaming interface). Returns Eof
    // repeatedly once the input is exhausted.
    Token next();

    // Rewind to the start of the source.
    void reset();

private:
    // Character helpers
    char  peek(int offset = 0) const;
    char  advance();
    bool  atEnd() const { return pos_ >= src_.size(); }
    void  skipWhitespace();

    // Lexing sub-routines
    Token lexNumber();
    Token lexString();
    Token lexQuotedIdent();
    Token lexIdOrKeyword();
    Token lexPunct();

    // Helpers
    SourceLocation curLoc() const { return {line_, col_, pos_}; }
    Token make(TK k, std::string text) { return {k, std::move(text), startLoc_}; }
    Token invalid(std::string msg);

    static TK keywordKind(const std::string &upper);

    std::string    src_;
    DiagEngine    &diag_;
    size_t         pos_  = 0;
    unsigned       line_ = 1;
    unsigned       col_  = 1;
    SourceLocation startLoc_;
};

// Lex a whole expression. Returns nullopt after reporting a lex error.
std::optional<std::vector<Token>> tokenize(const std::string &text, DiagEngine &diag);

} // namespace sqlexpr
