#pragma once
#include "llvm/ADT/StringRef.h"

namespace sqlexpr {

// SQL LIKE matching over UTF-8 text. The whole text must match.
//   %   any run of characters, including none
//   _   exactly one character (one Unicode scalar)
//   %%  a literal '%'
//   __  a literal '_'
// Every other pattern character matches itself, case-sensitively.
bool likeMatch(llvm::StringRef text, llvm::StringRef pattern);

} // namespace sqlexpr
