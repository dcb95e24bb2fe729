#include <gtest/gtest.h>

#include "candidate/patch_canonicalizer.h"

using namespace PatchArbiter;

namespace {

const char kPatchA[] =
    "diff --git a/pkg/f.py b/pkg/f.py\n"
    "--- a/pkg/f.py\n"
    "+++ b/pkg/f.py\n"
    "@@ -1,2 +1,2 @@\n"
    " def f():\n"
    "-    return 1\n"
    "+    return 2\n";

// Same change with a trailing comment, an extra comment line and other spacing.
const char kPatchB[] =
    "diff --git a/pkg/f.py b/pkg/f.py\n"
    "--- a/pkg/f.py\n"
    "+++ b/pkg/f.py\n"
    "@@ -1,2 +1,3 @@\n"
    " def f():\n"
    "-    return 1\n"
    "+    # the value changed\n"
    "+    return  2   # fixed\n";

}  // namespace

class PatchCanonicalizerTest : public ::testing::Test {};

TEST_F(PatchCanonicalizerTest, ParsesFilesAndHunks) {
    auto files = ParseUnifiedDiff(kPatchA);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].source, "a/pkg/f.py");
    EXPECT_EQ(files[0].target, "b/pkg/f.py");
    ASSERT_EQ(files[0].hunks.size(), 1u);
    ASSERT_EQ(files[0].hunks[0].lines.size(), 3u);
    EXPECT_EQ(files[0].hunks[0].lines[1].kind, '-');
    EXPECT_EQ(files[0].hunks[0].lines[2].text, "    return 2");
}

TEST_F(PatchCanonicalizerTest, SignatureIgnoresCommentsAndWhitespace) {
    EXPECT_EQ(CanonicalizePatch(kPatchA), "-return1+return2");
    EXPECT_EQ(CanonicalizePatch(kPatchA), CanonicalizePatch(kPatchB));
}

TEST_F(PatchCanonicalizerTest, DifferentChangesDiffer) {
    std::string other = kPatchA;
    other.replace(other.find("return 2"), 8, "return 3");
    EXPECT_NE(CanonicalizePatch(kPatchA), CanonicalizePatch(other));
}

TEST_F(PatchCanonicalizerTest, HeaderLikeContentStaysInsideHunk) {
    const char diff[] =
        "--- a/notes.txt\n"
        "+++ b/notes.txt\n"
        "@@ -1,2 +1,2 @@\n"
        "--- old heading\n"
        "+++ new heading\n"
        " tail\n";
    auto files = ParseUnifiedDiff(diff);
    ASSERT_EQ(files.size(), 1u);
    ASSERT_EQ(files[0].hunks.size(), 1u);
    EXPECT_EQ(files[0].hunks[0].lines.size(), 3u);
    EXPECT_EQ(CanonicalizePatch(diff), "-oldheading+newheading");
}

TEST_F(PatchCanonicalizerTest, ChangesPastUnderstatedCountsAreKept) {
    const char understated[] =
        "--- a/f.py\n"
        "+++ b/f.py\n"
        "@@ -1,1 +1,1 @@\n"
        "-x = 1\n"
        "+x = 2\n"
        "+y = 3\n"
        "--- a/g.py\n"
        "+++ b/g.py\n"
        "@@ -1 +1 @@\n"
        "-z = 1\n"
        "+z = 2\n";
    auto files = ParseUnifiedDiff(understated);
    ASSERT_EQ(files.size(), 2u);
    ASSERT_EQ(files[0].hunks.size(), 1u);
    EXPECT_EQ(files[0].hunks[0].lines.size(), 3u);
    EXPECT_EQ(files[1].source, "a/g.py");
    EXPECT_EQ(CanonicalizePatch(understated), "-x=1+x=2+y=3-z=1+z=2");

    std::string other = understated;
    other.replace(other.find("y = 3"), 5, "y = 4");
    EXPECT_NE(CanonicalizePatch(understated), CanonicalizePatch(other));
}

TEST_F(PatchCanonicalizerTest, MultipleFiles) {
    std::string two = std::string(kPatchA) +
        "diff --git a/g.py b/g.py\n"
        "--- a/g.py\n"
        "+++ b/g.py\n"
        "@@ -5 +5 @@\n"
        "-x = 1\n"
        "+x = 2\n";
    auto files = ParseUnifiedDiff(two);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[1].target, "b/g.py");
    EXPECT_EQ(CanonicalizePatch(two), "-return1+return2-x=1+x=2");
}

TEST_F(PatchCanonicalizerTest, BareLinesWithoutHeaders) {
    EXPECT_EQ(CanonicalizePatch("+a\n-b"), "+a-b");
    EXPECT_EQ(CanonicalizePatch("+a # c\n-b"), "+a-b");
}

TEST_F(PatchCanonicalizerTest, EmptyInput) {
    EXPECT_EQ(CanonicalizePatch(""), "");
    EXPECT_EQ(CanonicalizePatch("   \n"), "");
}

TEST_F(PatchCanonicalizerTest, Deterministic) {
    EXPECT_EQ(CanonicalizePatch(kPatchB), CanonicalizePatch(kPatchB));
}

TEST_F(PatchCanonicalizerTest, StripTrailingCommentRespectsStrings) {
    EXPECT_EQ(StripTrailingComment("x = 1  # note"), "x = 1");
    EXPECT_EQ(StripTrailingComment("x = \"a # b\"  # c"), "x = \"a # b\"");
    EXPECT_EQ(StripTrailingComment("x = 'it''s' # c"), "x = 'it''s'");
    EXPECT_EQ(StripTrailingComment("s = '''a # b''' # c"), "s = '''a # b'''");
    EXPECT_EQ(StripTrailingComment("s = \"esc \\\" # in\" # out"), "s = \"esc \\\" # in\"");
    EXPECT_EQ(StripTrailingComment("no_comment()"), "no_comment()");
}

TEST_F(PatchCanonicalizerTest, StripTrailingCommentFallsBackToFirstHash) {
    // Unbalanced bracket and unterminated string cannot be tokenized alone.
    EXPECT_EQ(StripTrailingComment("call(a,  # first arg"), "call(a,");
    EXPECT_EQ(StripTrailingComment("s = \"open # x"), "s = \"open");
    EXPECT_EQ(StripTrailingComment("s = \"open"), "s = \"open");
}
