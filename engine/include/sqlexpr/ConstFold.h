#pragma once
#include "sqlexpr/AST.h"

namespace sqlexpr {

// Replaces every column-free subtree that evaluates successfully with a
// Literal holding its value. Subtrees that fail to evaluate are left as they
// are, so evaluating the folded tree reports the same error as the unfolded one.
// If `folded` is given it receives the number of operator nodes removed.
ExprPtr foldConstants(ExprPtr e, unsigned *folded = nullptr);

} // namespace sqlexpr
