#include "geometry.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <opencv2/imgproc.hpp>

Quad HorizontalBox::quad() const {
    return {cv::Point2f((float) x_min, (float) y_min), cv::Point2f((float) x_max, (float) y_min),
            cv::Point2f((float) x_max, (float) y_max), cv::Point2f((float) x_min, (float) y_max)};
}

float seg_len(const cv::Point2f &a, const cv::Point2f &b) {
    float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// 保持环绕顺序，只做旋转（x+y 最小者为起点）；逆时针输入先反转为顺时针
Quad order_quad(const std::vector<cv::Point2f> &q) {
    CV_Assert(q.size() == 4);
    std::vector<cv::Point2f> pts = q;
    double area2 = 0.0;
    for (int i = 0; i < 4; ++i) {
        const cv::Point2f &a = pts[i];
        const cv::Point2f &b = pts[(i + 1) % 4];
        area2 += (double) a.x * b.y - (double) b.x * a.y;
    }
    if (area2 < 0)
        std::reverse(pts.begin(), pts.end());

    int start = 0;
    float min_sum = FLT_MAX;
    for (int i = 0; i < 4; ++i) {
        float s = pts[i].x + pts[i].y;
        if (s < min_sum) {
            min_sum = s;
            start = i;
        }
    }
    return {pts[start], pts[(start + 1) % 4], pts[(start + 2) % 4], pts[(start + 3) % 4]};
}

Quad region_quad(const std::vector<cv::Point2f> &points) {
    if (points.size() == 4)
        return order_quad(points);
    CV_Assert(points.size() > 4);
    cv::RotatedRect rr = cv::minAreaRect(points);
    cv::Point2f pts[4];
    rr.points(pts);
    return order_quad({pts[0], pts[1], pts[2], pts[3]});
}

cv::Rect2f quad_bounds(const Quad &q) {
    float x0 = q[0].x, x1 = q[0].x, y0 = q[0].y, y1 = q[0].y;
    for (const auto &p: q) {
        x0 = std::min(x0, p.x);
        x1 = std::max(x1, p.x);
        y0 = std::min(y0, p.y);
        y1 = std::max(y1, p.y);
    }
    return {x0, y0, x1 - x0, y1 - y0};
}
