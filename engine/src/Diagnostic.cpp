#include "sqlexpr/Diagnostic.h"

namespace sqlexpr {

const Diagnostic *DiagEngine::lastError() const {
    for (auto it = diags_.rbegin(); it != diags_.rend(); ++it)
        if (it->level == DiagLevel::Error) return &*it;
    return nullptr;
}

void DiagEngine::emit(DiagLevel level, ErrorKind kind, SourceLocation loc,
                      std::string msg) {
    if (echo_) {
        const char *prefix = "";
        switch (level) {
        case DiagLevel::Warning: prefix = "warning"; break;
        case DiagLevel::Error:   prefix = "error";   break;
        }
        *echo_ << (filename_ ? filename_ : "<expr>") << ':' << loc.line << ':'
               << loc.col << ": " << prefix << ": " << msg << '\n';
        echo_->flush();
    }
    diags_.push_back({level, kind, loc, std::move(msg)});
}

} // namespace sqlexpr
