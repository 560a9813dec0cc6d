#pragma once
#include <array>
#include <opencv2/core.hpp>
#include <vector>

// 四点，顺序：左上、右上、右下、左下
using Quad = std::array<cv::Point2f, 4>;

// 检测器输出的原始区域
struct RawRegion {
    std::vector<cv::Point2f> points; // 4 点或更多
    int estimated_chars{-1};         // 估计字符数，-1 表示未估计
};

struct HorizontalBox {
    int x_min{0}, x_max{0}, y_min{0}, y_max{0};
    std::vector<int> sources; // 组成该行的 RawRegion 下标

    int width() const { return x_max - x_min; }
    int height() const { return y_max - y_min; }
    Quad quad() const;
};

struct FreeBox {
    Quad points;
    std::vector<int> sources;
};

struct GroupedBoxes {
    std::vector<HorizontalBox> horizontal;
    std::vector<FreeBox> free;

    size_t size() const { return horizontal.size() + free.size(); }
    bool empty() const { return horizontal.empty() && free.empty(); }
};

Quad order_quad(const std::vector<cv::Point2f>& q);
Quad region_quad(const std::vector<cv::Point2f>& points);
float seg_len(const cv::Point2f& a, const cv::Point2f& b);
cv::Rect2f quad_bounds(const Quad& q);
