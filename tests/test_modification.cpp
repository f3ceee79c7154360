#include <gtest/gtest.h>
#include <ai-ghostline/text/modification.hpp>

using namespace ghostline;

TEST(ApplyModifications, SinglePrimitives) {
    Lines base{"a\n", "b\n"};
    EXPECT_EQ(apply_modifications(base, {Insert{1, {"x\n"}}}), (Lines{"a\n", "x\n", "b\n"}));
    EXPECT_EQ(apply_modifications(base, {Delete{{0, 1}}}), (Lines{"b\n"}));
    EXPECT_EQ(apply_modifications(base, {Replace{{1, 2}, {"y\n", "z\n"}}}), (Lines{"a\n", "y\n", "z\n"}));
    EXPECT_EQ(apply_modifications(base, {Insert{2, {"end"}}}), (Lines{"a\n", "b\n", "end"}));
    EXPECT_EQ(apply_modifications(base, {}), base);
}

TEST(ApplyModifications, IndicesReferToOriginalLines) {
    Lines base{"a\n", "b\n", "c\n"};
    Modifications mods{Insert{0, {"0\n"}}, Delete{{1, 2}}, Replace{{2, 3}, {"C\n"}}};
    EXPECT_EQ(apply_modifications(base, mods), (Lines{"0\n", "a\n", "C\n"}));
}

TEST(ApplyModifications, InsertMaySharePositionWithFollowingRange) {
    Lines base{"a\n", "b\n", "c\n"};
    Modifications mods{Insert{1, {"x\n"}}, Delete{{1, 2}}};
    EXPECT_EQ(apply_modifications(base, mods), (Lines{"a\n", "x\n", "c\n"}));

    Modifications twice{Insert{1, {"1\n"}}, Insert{1, {"2\n"}}};
    EXPECT_EQ(apply_modifications(base, twice), (Lines{"a\n", "1\n", "2\n", "b\n", "c\n"}));
}

TEST(ApplyModifications, OverlapIsMalformed) {
    Lines base{"a\n", "b\n", "c\n"};
    try {
        apply_modifications(base, {Delete{{0, 2}}, Delete{{1, 3}}});
        FAIL() << "expected MalformedPatch";
    } catch (const MalformedPatch& e) {
        EXPECT_EQ(e.index(), 1u);
    }
    EXPECT_THROW(apply_modifications(base, {Replace{{0, 2}, {"x\n"}}, Insert{1, {"y\n"}}}), MalformedPatch);
}

TEST(ApplyModifications, UnsortedOutOfBoundsAndInvertedAreMalformed) {
    Lines base{"a\n", "b\n", "c\n"};
    EXPECT_THROW(apply_modifications(base, {Delete{{2, 3}}, Delete{{0, 1}}}), MalformedPatch);
    EXPECT_THROW(apply_modifications(base, {Delete{{2, 4}}}), MalformedPatch);
    EXPECT_THROW(apply_modifications(base, {Insert{4, {"x\n"}}}), MalformedPatch);
    EXPECT_THROW(apply_modifications(base, {Replace{{2, 1}, {}}}), MalformedPatch);
}

TEST(DiffLines, MinimalSingleHunk) {
    Lines a{"a\n", "b\n", "c\n"};
    EXPECT_TRUE(diff_lines(a, a).empty());

    auto ins = diff_lines(a, {"a\n", "x\n", "b\n", "c\n"});
    ASSERT_EQ(ins.size(), 1u);
    EXPECT_EQ(std::get<Insert>(ins[0]), (Insert{1, {"x\n"}}));

    auto del = diff_lines(a, {"a\n", "c\n"});
    ASSERT_EQ(del.size(), 1u);
    EXPECT_EQ(std::get<Delete>(del[0]), (Delete{{1, 2}}));

    Lines changed{"a\n", "q\n", "r\n", "c\n"};
    auto rep = diff_lines(a, changed);
    ASSERT_EQ(rep.size(), 1u);
    EXPECT_EQ(std::get<Replace>(rep[0]), (Replace{{1, 2}, {"q\n", "r\n"}}));
    EXPECT_EQ(apply_modifications(a, rep), changed);
}

TEST(DiffLines, RepeatedLinesStillApplyCleanly) {
    Lines from{"\n", "\n", "\n"};
    Lines to{"\n", "x\n", "\n", "\n", "\n"};
    EXPECT_EQ(apply_modifications(from, diff_lines(from, to)), to);
    EXPECT_EQ(apply_modifications(to, diff_lines(to, from)), from);
}

TEST(PatchComposition, SequentialEqualsCombined) {
    Lines base{"a\n", "b\n", "c\n"};
    Modifications m1{Insert{1, {"x\n"}}};
    Lines step1 = apply_modifications(base, m1);
    Modifications m2{Delete{{0, 1}}, Replace{{2, 3}, {"q\n"}}}; // against step1
    Lines step2 = apply_modifications(step1, m2);
    EXPECT_EQ(step2, (Lines{"x\n", "q\n", "c\n"}));
    EXPECT_EQ(apply_modifications(base, diff_lines(base, step2)), step2);
}

TEST(ModificationInfo, RangeAndDelta) {
    Modification ins = Insert{3, {"a", "b"}};
    Modification rep = Replace{{1, 4}, {"z"}};
    EXPECT_EQ(affected_range(ins), (LineRange{3, 3}));
    EXPECT_EQ(line_delta(ins), 2);
    EXPECT_EQ(line_delta(rep), -2);
    EXPECT_EQ(line_delta(Modification{Delete{{0, 2}}}), -2);
    EXPECT_NE(describe(rep).find("replace"), std::string::npos);
}
