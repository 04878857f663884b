#include "TestUtil.h"
#include "sqlexpr/Driver.h"

using namespace sqlexpr;
using namespace sqlexpr::test;

namespace {

struct DriverHarness {
    explicit DriverHarness(DriverOptions opts = {}) : os(out), driver(opts, diag, os) {}

    std::string output() { return os.str(); }

    std::string  out;
    DiagEngine   diag;
    llvm::raw_string_ostream os;
    Driver       driver;
};

} // namespace

TEST(DriverTest, PrintsDisplayForm) {
    DriverHarness h;
    EXPECT_TRUE(h.driver.run("1 + 2"));
    EXPECT_TRUE(h.driver.run("'it''s'"));
    EXPECT_TRUE(h.driver.run("9223372036854775807 + 10.0"));
    EXPECT_EQ(h.output(), "3\nit's\n9223372036854776000.0\n");
}

TEST(DriverTest, LiteralAndTypes) {
    DriverOptions opts;
    opts.literal = true;
    opts.types   = true;
    DriverHarness h(opts);
    EXPECT_TRUE(h.driver.run("'it''s'"));
    EXPECT_TRUE(h.driver.run("3.0"));
    EXPECT_TRUE(h.driver.run("NULL"));
    EXPECT_EQ(h.output(), "STRING 'it''s'\nFLOAT 3.0\nNULL NULL\n");
}

TEST(DriverTest, ColumnBindings) {
    DriverHarness h;
    ASSERT_TRUE(h.driver.bindColumn("price=9.5"));
    ASSERT_TRUE(h.driver.bindColumn("Name='bob'"));
    ASSERT_TRUE(h.driver.bindColumn("t.id=1 + 2"));
    EXPECT_EQ(h.driver.row().size(), 3u);
    EXPECT_TRUE(h.driver.row().contains("t.id"));

    EXPECT_TRUE(h.driver.run("price * 2"));
    EXPECT_TRUE(h.driver.run("name LIKE 'b%'"));
    EXPECT_TRUE(h.driver.run("T.ID"));
    EXPECT_EQ(h.output(), "19.0\nTRUE\n3\n");
    EXPECT_FALSE(h.diag.hasErrors());
}

TEST(DriverTest, RebindingWarnsAndKeepsNewValue) {
    DriverHarness h;
    ASSERT_TRUE(h.driver.bindColumn("x=1"));
    ASSERT_TRUE(h.driver.bindColumn("X=2"));
    EXPECT_FALSE(h.diag.hasErrors());
    ASSERT_EQ(h.diag.diagnostics().size(), 1u);
    EXPECT_EQ(h.diag.diagnostics()[0].level, DiagLevel::Warning);
    EXPECT_EQ(h.diag.diagnostics()[0].message, "Column x bound more than once, keeping 2");

    EXPECT_TRUE(h.driver.run("x"));
    EXPECT_EQ(h.output(), "2\n");
}

TEST(DriverTest, BadBindings) {
    DriverHarness h;
    EXPECT_FALSE(h.driver.bindColumn("novalue"));
    EXPECT_EQ(h.diag.lastError()->message, "Expected NAME=VALUE, found 'novalue'");
    EXPECT_FALSE(h.driver.bindColumn("1=2"));
    EXPECT_EQ(h.diag.lastError()->message, "'1' is not a column name");
    EXPECT_FALSE(h.driver.bindColumn("x=1/0"));
    EXPECT_EQ(h.diag.lastError()->message, "Can't divide by zero");
    EXPECT_FALSE(h.driver.bindColumn("x=y"));
    EXPECT_EQ(h.diag.lastError()->message, "Can't resolve column y without a row");
    EXPECT_EQ(h.driver.row().size(), 0u);
}

TEST(DriverTest, FoldThenDump) {
    DriverOptions opts;
    opts.fold    = true;
    opts.dumpAST = true;
    DriverHarness h(opts);
    // Dumping skips evaluation, so x needs no binding.
    EXPECT_TRUE(h.driver.run("x + 2 * 3"));
    EXPECT_EQ(h.output(),
              "Binary '+'\n"
              "  Column x\n"
              "  Literal 6 : INTEGER\n");
    EXPECT_FALSE(h.diag.hasErrors());
}

TEST(DriverTest, FoldKeepsResults) {
    DriverOptions opts;
    opts.fold = true;
    DriverHarness h(opts);
    ASSERT_TRUE(h.driver.bindColumn("x=4"));
    EXPECT_TRUE(h.driver.run("x * (2 + 3) - 2 ^ 2"));
    EXPECT_FALSE(h.driver.run("x + 1 / 0"));
    EXPECT_EQ(h.diag.lastError()->message, "Can't divide by zero");
    EXPECT_EQ(h.output(), "16\n");
}

TEST(DriverTest, DumpTokens) {
    DriverOptions opts;
    opts.dumpTokens = true;
    DriverHarness h(opts);
    EXPECT_TRUE(h.driver.run("1"));
    std::string out = h.output();
    EXPECT_NE(out.find("  1:1\tinteger literal\t1\n"), std::string::npos) << out;
    EXPECT_NE(out.find("end of input\n"), std::string::npos) << out;
    EXPECT_EQ(out.substr(out.size() - 2), "1\n");
}

TEST(DriverTest, FailuresWriteNothing) {
    DriverHarness h;
    EXPECT_FALSE(h.driver.run("1 +"));
    EXPECT_EQ(h.diag.lastError()->message, "Unexpected end of input");
    EXPECT_FALSE(h.driver.run("'a' * 2"));
    EXPECT_EQ(h.diag.lastError()->kind, ErrorKind::Value);
    EXPECT_EQ(h.output(), "");
}

TEST(DriverTest, DepthOptionsReachParser) {
    DriverOptions opts;
    opts.maxDepth     = 4;
    opts.maxTreeDepth = 8;
    DriverHarness h(opts);
    EXPECT_FALSE(h.driver.run("((((1))))"));
    EXPECT_EQ(h.diag.lastError()->message, "Expression nesting exceeds 4 levels");
    EXPECT_FALSE(h.driver.run("1 + 1 + 1 + 1 + 1 + 1 + 1 + 1 + 1"));
    EXPECT_EQ(h.diag.lastError()->message, "Expression tree depth exceeds 8 levels");
}
