#include "TestUtil.h"
#include "sqlexpr/ConstFold.h"
#include "sqlexpr/Parser.h"

using namespace sqlexpr;
using namespace sqlexpr::test;

namespace {

struct Folded {
    std::string text;
    unsigned    count = 0;
};

Folded foldText(const std::string &src) {
    DiagEngine diag;
    auto e = parseExpression(src, diag);
    EXPECT_TRUE(e) << src;
    if (!e) return {};
    Folded f;
    e = foldConstants(std::move(e), &f.count);
    f.text = printExpr(*e);
    return f;
}

} // namespace

TEST(ConstFoldTest, ColumnsBlockFolding) {
    Folded f = foldText("1 + 2 * x");
    EXPECT_EQ(f.text, "(1 + (2 * x))");
    EXPECT_EQ(f.count, 0u);
}

TEST(ConstFoldTest, FoldsConstantSubtrees) {
    Folded f = foldText("x + 2 * 3");
    EXPECT_EQ(f.text, "(x + 6)");
    EXPECT_EQ(f.count, 1u);

    f = foldText("-(1 + 2) * x");
    EXPECT_EQ(f.text, "(-3 * x)");
    EXPECT_EQ(f.count, 2u);

    f = foldText("3! + x IS NULL");
    EXPECT_EQ(f.text, "(6 + (x IS NULL))");
    EXPECT_EQ(f.count, 1u);

    f = foldText("y LIKE 'a' AND (NULL + 1) IS NULL");
    EXPECT_EQ(f.text, "((y LIKE 'a') AND TRUE)");
    EXPECT_EQ(f.count, 2u);
}

TEST(ConstFoldTest, FullyConstantTreeBecomesLiteral) {
    DiagEngine diag;
    auto e = parseExpression("2 ^ 3 + 1 > 8 AND 'ab' LIKE 'a%'", diag);
    ASSERT_TRUE(e);
    unsigned count = 0;
    e = foldConstants(std::move(e), &count);
    ASSERT_EQ(e->kind, ExprKind::Literal);
    EXPECT_EQ(static_cast<LiteralExpr &>(*e).value, Bool(true));
    EXPECT_EQ(count, 5u);
    EXPECT_EQ(countNodes(*e), 1u);
}

TEST(ConstFoldTest, FailingSubtreeIsKept) {
    Folded f = foldText("1 / 0 + x");
    EXPECT_EQ(f.text, "((1 / 0) + x)");
    EXPECT_EQ(f.count, 0u);

    f = foldText("(1 + 1) / 0");
    EXPECT_EQ(f.text, "(2 / 0)");
    EXPECT_EQ(f.count, 1u);
}

TEST(ConstFoldTest, FailingSubtreeReportsSameError) {
    DiagEngine diag;
    auto e = parseExpression("(2 * 3) / (1 - 1)", diag);
    ASSERT_TRUE(e);
    e = foldConstants(std::move(e));
    EXPECT_FALSE(diag.hasErrors());

    auto v = Evaluator(diag).eval(*e);
    EXPECT_FALSE(v);
    ASSERT_EQ(diag.errorCount(), 1);
    EXPECT_EQ(diag.lastError()->message, "Can't divide by zero");
}

TEST(ConstFoldTest, FoldedTreeEvaluatesTheSame) {
    const char *exprs[] = {
        "x * (2 + 3) - 4 ^ 2",
        "(x > 1 + 1) OR NOT (NULL IS NULL)",
        "-(-(x)) % (7 - 4) + 3!",
        "x / 2.0 + 1e2",
        "name LIKE 'r%' AND 1 + 1 = 2",
        "name = 'row' AND 2 >= 2",
    };

    for (const char *src : exprs) {
        DiagEngine diag;
        auto plain = parseExpression(src, diag);
        auto folded = parseExpression(src, diag);
        ASSERT_TRUE(plain) << src;
        ASSERT_TRUE(folded) << src;
        folded = foldConstants(std::move(folded));

        for (int64_t x : {-3, 0, 1, 2, 10}) {
            MapRowContext row;
            row.bind("x", Int(x));
            row.bind("name", Str("row"));
            DiagEngine d1, d2;
            auto a = Evaluator(d1).eval(*plain, &row);
            auto b = Evaluator(d2).eval(*folded, &row);
            ASSERT_EQ(a.has_value(), b.has_value()) << src;
            if (a) {
                EXPECT_TRUE(sameValue(*a, *b)) << src << " with x = " << x;
            } else {
                EXPECT_EQ(d1.lastError()->message, d2.lastError()->message) << src;
            }
        }
    }
}

TEST(ConstFoldTest, NullInputIsPassedThrough) {
    unsigned count = 0;
    EXPECT_FALSE(foldConstants(nullptr, &count));
}
