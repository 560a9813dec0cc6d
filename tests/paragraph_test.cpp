#include <gtest/gtest.h>
#include "errors.h"
#include "paragraph.h"

static RecognitionResult line(const std::string &text, float x0, float y0, float x1, float y1) {
    RecognitionResult r;
    r.text = text;
    r.box = {cv::Point2f(x0, y0), cv::Point2f(x1, y0), cv::Point2f(x1, y1), cv::Point2f(x0, y1)};
    r.confidence = 0.9f;
    return r;
}

TEST(ParagraphBuilder, IsolatedLinesStaySeparate) {
    std::vector<RecognitionResult> lines = {line("one", 0, 0, 100, 20), line("two", 500, 0, 600, 20),
                                            line("three", 0, 400, 100, 420)};
    auto paras = ParagraphBuilder().build(lines);
    ASSERT_EQ(paras.size(), 3u);
    EXPECT_EQ(paras[0].text, "one");
    EXPECT_EQ(paras[1].text, "two");
    EXPECT_EQ(paras[2].text, "three");
}

TEST(ParagraphBuilder, StackedLinesMergeTopToBottom) {
    auto paras = ParagraphBuilder().build({line("world", 0, 25, 100, 45), line("hello", 0, 0, 100, 20)});
    ASSERT_EQ(paras.size(), 1u);
    EXPECT_EQ(paras[0].text, "hello world");
    cv::Rect2f b = quad_bounds(paras[0].box);
    EXPECT_FLOAT_EQ(b.x, 0.f);
    EXPECT_FLOAT_EQ(b.y, 0.f);
    EXPECT_FLOAT_EQ(b.x + b.width, 100.f);
    EXPECT_FLOAT_EQ(b.y + b.height, 45.f);
}

TEST(ParagraphBuilder, LineSeparatorJoinsRows) {
    ParagraphBuilder::Params p;
    p.line_separator = "\n";
    auto paras = ParagraphBuilder(p).build({line("a", 0, 0, 40, 20), line("b", 50, 0, 90, 20),
                                            line("c", 0, 25, 40, 45)});
    ASSERT_EQ(paras.size(), 1u);
    EXPECT_EQ(paras[0].text, "a b\nc");
}

TEST(ParagraphBuilder, RightToLeftReadsRowsFromTheRight) {
    ParagraphBuilder::Params p;
    p.mode = ReadingDirection::RightToLeft;
    p.reorder_rtl = false;
    auto paras = ParagraphBuilder(p).build({line("a", 0, 0, 40, 20), line("b", 50, 0, 90, 20)});
    ASSERT_EQ(paras.size(), 1u);
    EXPECT_EQ(paras[0].text, "b a");

    p.mode = ReadingDirection::LeftToRight;
    paras = ParagraphBuilder(p).build({line("a", 0, 0, 40, 20), line("b", 50, 0, 90, 20)});
    EXPECT_EQ(paras[0].text, "a b");
}

TEST(ParagraphBuilder, EmptyInput) {
    EXPECT_TRUE(ParagraphBuilder().build({}).empty());
}

TEST(ParagraphBuilder, ZeroHeightLinesStillFormRows) {
    auto paras = ParagraphBuilder().build({line("a", 0, 10, 40, 10), line("b", 40, 10, 80, 10)});
    ASSERT_EQ(paras.size(), 1u);
    EXPECT_EQ(paras[0].text, "a b");
}

TEST(ParagraphBuilder, NonPositiveRowThresholdIsRejected) {
    ParagraphBuilder::Params p;
    p.row_ths = 0.f;
    EXPECT_THROW(ParagraphBuilder(p).build({}), ConfigurationError);
    p.row_ths = -0.5f;
    EXPECT_THROW(ParagraphBuilder(p).build({}), ConfigurationError);
}
