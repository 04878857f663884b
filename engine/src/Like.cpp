#include "sqlexpr/Like.h"
#include "llvm/Support/ConvertUTF.h"
#include <vector>

namespace sqlexpr {

namespace {

// Bytes that are not part of a valid UTF-8 sequence are mapped above the
// Unicode range so they still compare equal to themselves.
constexpr llvm::UTF32 kInvalidByteBase = 0x110000;

std::vector<llvm::UTF32> decodeUTF8(llvm::StringRef s) {
    std::vector<llvm::UTF32> out;
    out.reserve(s.size());
    auto *p   = reinterpret_cast<const llvm::UTF8 *>(s.begin());
    auto *end = reinterpret_cast<const llvm::UTF8 *>(s.end());
    while (p < end) {
        const llvm::UTF8 *start = p;
        llvm::UTF32 cp = 0;
        if (llvm::convertUTF8Sequence(&p, end, &cp, llvm::strictConversion) !=
            llvm::conversionOK) {
            cp = kInvalidByteBase + *start;
            p  = start + 1;
        }
        out.push_back(cp);
    }
    return out;
}

struct PatternElem {
    enum Kind { Literal, AnyOne, AnyRun } kind;
    llvm::UTF32 ch = 0;
};

std::vector<PatternElem> compilePattern(llvm::StringRef pattern) {
    std::vector<llvm::UTF32> cps = decodeUTF8(pattern);
    std::vector<PatternElem> elems;
    for (size_t i = 0; i < cps.size(); ++i) {
        llvm::UTF32 c = cps[i];
        bool doubled = i + 1 < cps.size() && cps[i + 1] == c;
        if (c == '%' && !doubled) {
            // A run of wildcards matches the same as a single one.
            if (elems.empty() || elems.back().kind != PatternElem::AnyRun)
                elems.push_back({PatternElem::AnyRun, 0});
        } else if (c == '_' && !doubled) {
            elems.push_back({PatternElem::AnyOne, 0});
        } else {
            if ((c == '%' || c == '_') && doubled) ++i;
            elems.push_back({PatternElem::Literal, c});
        }
    }
    return elems;
}

} // namespace

bool likeMatch(llvm::StringRef text, llvm::StringRef pattern) {
    std::vector<llvm::UTF32>  t = decodeUTF8(text);
    std::vector<PatternElem>  p = compilePattern(pattern);
    const size_t m = p.size();

    // prev[j]: the text consumed so far matches the first j pattern elements.
    std::vector<char> prev(m + 1, 0), cur(m + 1, 0);
    prev[0] = 1;
    for (size_t j = 1; j <= m; ++j)
        prev[j] = prev[j - 1] && p[j - 1].kind == PatternElem::AnyRun;

    for (llvm::UTF32 c : t) {
        cur[0] = 0;
        for (size_t j = 1; j <= m; ++j) {
            const PatternElem &e = p[j - 1];
            switch (e.kind) {
            case PatternElem::AnyRun:
                cur[j] = cur[j - 1] || prev[j];
                break;
            case PatternElem::AnyOne:
                cur[j] = prev[j - 1];
                break;
            case PatternElem::Literal:
                cur[j] = prev[j - 1] && e.ch == c;
                break;
            }
        }
        prev.swap(cur);
    }
    return prev[m] != 0;
}

} // namespace sqlexpr
