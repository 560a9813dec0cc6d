#include <gtest/gtest.h>
#include <algorithm>
#include "box_grouper.h"

static RawRegion rect_region(float x0, float y0, float x1, float y1) {
    RawRegion r;
    r.points = {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
    return r;
}

static std::vector<int> all_sources(const GroupedBoxes &g) {
    std::vector<int> s;
    for (const auto &h: g.horizontal)
        s.insert(s.end(), h.sources.begin(), h.sources.end());
    for (const auto &f: g.free)
        s.insert(s.end(), f.sources.begin(), f.sources.end());
    std::sort(s.begin(), s.end());
    return s;
}

static size_t largest_box(const GroupedBoxes &g) {
    size_t n = 0;
    for (const auto &h: g.horizontal)
        n = std::max(n, h.sources.size());
    return n;
}

// 随机生成 3~6 个水平矩形
static std::vector<RawRegion> random_layout(cv::RNG &rng) {
    std::vector<RawRegion> regions;
    int n = rng.uniform(3, 7);
    for (int i = 0; i < n; ++i) {
        float x0 = rng.uniform(0.f, 200.f), y0 = rng.uniform(0.f, 80.f);
        float w = rng.uniform(10.f, 60.f), h = rng.uniform(10.f, 30.f);
        regions.push_back(rect_region(x0, y0, x0 + w, y0 + h));
    }
    return regions;
}

// 单个阈值从小到大扫描：框数不增，最大一组的成员数不减
static void expect_monotonic(float BoxGrouper::Params::*field, const char *name) {
    cv::RNG rng(20240611);
    const float sweep[] = {0.05f, 0.2f, 0.5f, 0.8f, 1.0f, 1.4f, 2.0f, 3.0f};
    for (int layout = 0; layout < 500; ++layout) {
        std::vector<RawRegion> regions = random_layout(rng);
        size_t prev_boxes = regions.size() + 1, prev_largest = 0;
        for (float ths: sweep) {
            BoxGrouper::Params p;
            p.*field = ths;
            GroupedBoxes g = BoxGrouper(p).group(regions);
            ASSERT_LE(g.size(), prev_boxes) << name << "=" << ths << " layout " << layout;
            ASSERT_GE(largest_box(g), prev_largest) << name << "=" << ths << " layout " << layout;
            prev_boxes = g.size();
            prev_largest = largest_box(g);
        }
    }
}

TEST(BoxGrouper, EmptyInputGivesEmptyLists) {
    GroupedBoxes g = BoxGrouper().group({});
    EXPECT_TRUE(g.horizontal.empty());
    EXPECT_TRUE(g.free.empty());
}

TEST(BoxGrouper, SmallGapMergesIntoOneLine) {
    // 间隙 = 0.05 * 高度
    GroupedBoxes g = BoxGrouper().group({rect_region(0, 0, 50, 20), rect_region(51, 0, 101, 20)});
    ASSERT_EQ(g.horizontal.size(), 1u);
    EXPECT_TRUE(g.free.empty());
    const HorizontalBox &h = g.horizontal[0];
    EXPECT_EQ(h.sources, (std::vector<int>{0, 1}));
    // margin = int(0.1 * 20) = 2
    EXPECT_EQ(h.x_min, -2);
    EXPECT_EQ(h.x_max, 103);
    EXPECT_EQ(h.y_min, -2);
    EXPECT_EQ(h.y_max, 22);
}

TEST(BoxGrouper, LargeGapStaysSplit) {
    // 间隙 = 2 * 高度
    GroupedBoxes g = BoxGrouper().group({rect_region(0, 0, 50, 20), rect_region(90, 0, 140, 20)});
    ASSERT_EQ(g.horizontal.size(), 2u);
    EXPECT_EQ(g.horizontal[0].sources, std::vector<int>{0});
    EXPECT_EQ(g.horizontal[1].sources, std::vector<int>{1});
}

TEST(BoxGrouper, DifferentRowsAreNotMerged) {
    GroupedBoxes g = BoxGrouper().group({rect_region(0, 0, 50, 20), rect_region(0, 60, 50, 80)});
    EXPECT_EQ(g.horizontal.size(), 2u);
}

TEST(BoxGrouper, SteepRegionBecomesFreeBox) {
    RawRegion steep;
    steep.points = {{0, 0}, {100, 50}, {90, 70}, {-10, 20}};
    GroupedBoxes g = BoxGrouper().group({steep, rect_region(0, 200, 40, 220)});
    ASSERT_EQ(g.free.size(), 1u);
    ASSERT_EQ(g.horizontal.size(), 1u);
    EXPECT_EQ(g.free[0].sources, std::vector<int>{0});
    // 外扩后左上角仍在原左上角的左上方
    EXPECT_LE(g.free[0].points[0].x, 0.f);
    EXPECT_LE(g.free[0].points[0].y, 0.f);
}

TEST(BoxGrouper, EveryRegionLandsInExactlyOneBox) {
    std::vector<RawRegion> regions = {
        rect_region(0, 0, 40, 20),     rect_region(42, 1, 90, 21),   rect_region(200, 0, 260, 22),
        rect_region(0, 50, 30, 70),    rect_region(35, 52, 80, 70),  rect_region(10, 120, 20, 180),
        rect_region(300, 300, 310, 305),
    };
    RawRegion tilted;
    tilted.points = {{400, 400}, {480, 440}, {470, 460}, {390, 420}};
    regions.push_back(tilted);

    GroupedBoxes g = BoxGrouper().group(regions);
    std::vector<int> expected(regions.size());
    for (int i = 0; i < (int) expected.size(); ++i)
        expected[i] = i;
    EXPECT_EQ(all_sources(g), expected);
}

TEST(BoxGrouper, LargerWidthThresholdNeverAddsBoxes) {
    std::vector<RawRegion> regions = {rect_region(0, 0, 40, 20), rect_region(45, 0, 80, 20),
                                      rect_region(95, 0, 130, 20), rect_region(155, 0, 190, 20)};
    size_t prev = regions.size() + 1;
    for (float ths: {0.1f, 0.3f, 0.5f, 1.0f, 1.5f}) {
        BoxGrouper::Params p;
        p.width_ths = ths;
        size_t n = BoxGrouper(p).group(regions).size();
        EXPECT_LE(n, prev) << "width_ths=" << ths;
        prev = n;
    }
    EXPECT_EQ(prev, 1u);
}

TEST(BoxGrouper, MergeDisabledKeepsOneBoxPerRegion) {
    BoxGrouper::Params p;
    p.merge_horizontal = false;
    GroupedBoxes g = BoxGrouper(p).group({rect_region(0, 0, 50, 20), rect_region(51, 0, 101, 20)});
    ASSERT_EQ(g.horizontal.size(), 2u);
    EXPECT_EQ(g.horizontal[0].sources, std::vector<int>{0});
    EXPECT_EQ(g.horizontal[1].sources, std::vector<int>{1});
}

TEST(BoxGrouper, PolygonWithMorePointsIsReducedToQuad) {
    RawRegion poly;
    poly.points = {{0, 0}, {30, 0}, {60, 0}, {60, 20}, {30, 20}, {0, 20}};
    GroupedBoxes g = BoxGrouper().group({poly});
    ASSERT_EQ(g.horizontal.size(), 1u);
    // minAreaRect 有浮点误差
    EXPECT_NEAR(g.horizontal[0].x_min, -2, 1);
    EXPECT_NEAR(g.horizontal[0].x_max, 62, 1);
    EXPECT_EQ(g.horizontal[0].sources, std::vector<int>{0});
}

TEST(BoxGrouper, SlightlyOffsetOverlappingBoxesMerge) {
    // 中心 y 相差 0.05 * 高度，x 方向重叠
    GroupedBoxes g = BoxGrouper().group({rect_region(0, 0, 50, 20), rect_region(40, 1, 90, 21)});
    ASSERT_EQ(g.horizontal.size(), 1u);
    EXPECT_EQ(g.horizontal[0].sources, (std::vector<int>{0, 1}));
}

TEST(BoxGrouper, LargerYCenterThresholdJoinsRows) {
    std::vector<RawRegion> regions = {rect_region(0, 0, 40, 20), rect_region(45, 6, 85, 26),
                                      rect_region(90, 12, 130, 32)};
    BoxGrouper::Params tight;
    tight.ycenter_ths = 0.2f;
    EXPECT_EQ(BoxGrouper(tight).group(regions).size(), 3u);
    BoxGrouper::Params loose;
    loose.ycenter_ths = 0.5f;
    GroupedBoxes g = BoxGrouper(loose).group(regions);
    ASSERT_EQ(g.horizontal.size(), 1u);
    EXPECT_EQ(g.horizontal[0].sources, (std::vector<int>{0, 1, 2}));
}

TEST(BoxGrouper, LargerHeightThresholdJoinsMixedSizes) {
    // 高 20 与高 30，中心 y 相同
    std::vector<RawRegion> regions = {rect_region(0, 5, 40, 25), rect_region(42, 0, 90, 30)};
    BoxGrouper::Params tight;
    tight.height_ths = 0.3f;
    EXPECT_EQ(BoxGrouper(tight).group(regions).size(), 2u);
    BoxGrouper::Params loose;
    loose.height_ths = 0.5f;
    EXPECT_EQ(BoxGrouper(loose).group(regions).size(), 1u);
}

TEST(BoxGrouper, MergingIsMonotonicInYCenterThreshold) {
    expect_monotonic(&BoxGrouper::Params::ycenter_ths, "ycenter_ths");
}

TEST(BoxGrouper, MergingIsMonotonicInHeightThreshold) {
    expect_monotonic(&BoxGrouper::Params::height_ths, "height_ths");
}

TEST(BoxGrouper, MergingIsMonotonicInWidthThreshold) {
    expect_monotonic(&BoxGrouper::Params::width_ths, "width_ths");
}
