#include <gtest/gtest.h>
#include "mcpfs/edit.hpp"

using namespace mcpfs;

TEST(ApplyEdits, ReplacesFirstExactOccurrence) {
    auto out = apply_edits("foo foo\n", {{"foo", "bar"}});
    EXPECT_FALSE(out.unmatched.has_value());
    EXPECT_EQ(out.content, "bar foo\n");
}

TEST(ApplyEdits, EditsApplyInSequence) {
    auto out = apply_edits("alpha\nbeta\n", {{"alpha", "gamma"}, {"gamma\nbeta", "done"}});
    EXPECT_FALSE(out.unmatched.has_value());
    EXPECT_EQ(out.content, "done\n");
}

TEST(ApplyEdits, MultiLineExactMatch) {
    auto out = apply_edits("a\nb\nc\n", {{"b\nc", "x\ny\nz"}});
    EXPECT_EQ(out.content, "a\nx\ny\nz\n");
}

TEST(ApplyEdits, ReportsFirstUnmatchedEdit) {
    auto out = apply_edits("hello\n", {{"hello", "hi"}, {"missing", "x"}, {"hi", "yo"}});
    ASSERT_TRUE(out.unmatched.has_value());
    EXPECT_EQ(*out.unmatched, "missing");
}

TEST(ApplyEdits, TrimmedLineMatchIndentsFirstLine) {
    std::string content = "fn() {\n    call(1);\n}\n";
    auto out = apply_edits(content, {{"call(1);", "call(2);"}});
    EXPECT_EQ(out.content, "fn() {\n    call(2);\n}\n");

    auto loose = apply_edits(content, {{"  call(1);  \n}", "call(3);\n}"}});
    ASSERT_FALSE(loose.unmatched.has_value());
    EXPECT_EQ(loose.content.rfind("fn() {\n    call(3);\n", 0), 0u) << loose.content;
    EXPECT_EQ(loose.content.find("call(1)"), std::string::npos);
}

TEST(ApplyEdits, NoEditsLeavesContent) {
    auto out = apply_edits("x", {});
    EXPECT_EQ(out.content, "x");
    EXPECT_FALSE(out.unmatched.has_value());
}
