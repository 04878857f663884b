#include "sqlexpr/RowContext.h"

namespace sqlexpr {

std::string MapRowContext::keyOf(const ColumnRef &col) {
    return col.table ? *col.table + "." + col.name : col.name;
}

void MapRowContext::bind(const ColumnRef &col, Value v) {
    values_[keyOf(col)] = std::move(v);
}

std::optional<Value> MapRowContext::resolve(const ColumnRef &col, DiagEngine &diag,
                                            SourceLocation loc) const {
    if (col.table) {
        auto it = values_.find(*col.table + "." + col.name);
        if (it != values_.end()) return it->second;
    }
    auto it = values_.find(col.name);
    if (it != values_.end()) return it->second;

    diag.valueError(loc, "Unknown column " + col.str());
    return std::nullopt;
}

} // namespace sqlexpr
