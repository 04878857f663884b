#pragma once
#include "sqlexpr/AST.h"
#include "sqlexpr/Diagnostic.h"
#include "sqlexpr/Value.h"
#include <map>
#include <optional>
#include <string>

namespace sqlexpr {

// Supplies column values for one row. A failed lookup reports its own
// diagnostic and returns nullopt. Implementations must be safe to call from
// several threads at once if the row is shared.
class RowContext {
public:
    virtual ~RowContext() = default;
    virtual std::optional<Value> resolve(const ColumnRef &col, DiagEngine &diag,
                                         SourceLocation loc) const = 0;
};

// Row backed by name -> value bindings. A qualified reference t.c matches a
// "t.c" binding first, then a bare "c" binding.
class MapRowContext : public RowContext {
public:
    MapRowContext() = default;

    void bind(const std::string &name, Value v) { values_[name] = std::move(v); }
    void bind(const ColumnRef &col, Value v);
    bool contains(const std::string &name) const { return values_.count(name) != 0; }
    bool contains(const ColumnRef &col) const { return contains(keyOf(col)); }
    size_t size() const { return values_.size(); }
    void clear() { values_.clear(); }

    std::optional<Value> resolve(const ColumnRef &col, DiagEngine &diag,
                                 SourceLocation loc) const override;

private:
    static std::string keyOf(const ColumnRef &col);

    std::map<std::string, Value> values_;
};

} // namespace sqlexpr
