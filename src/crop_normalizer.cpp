#include "crop_normalizer.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

CropNormalizer::CropNormalizer() : params_() {}

CropNormalizer::CropNormalizer(const Params &p) : params_(p) {
    if (params_.img_h < 1)
        throw ConfigurationError("img_h must be positive");
}

cv::Mat CropNormalizer::to_height(const cv::Mat &strip) const {
    if (strip.empty())
        throw DegenerateBoxError("empty strip");
    float r = float(strip.cols) / float(strip.rows);
    int w = std::max(1, (int) std::lround(params_.img_h * r));
    // 缩小用面积插值，放大用三次插值
    int interp = strip.rows > params_.img_h ? cv::INTER_AREA : cv::INTER_CUBIC;
    cv::Mat out;
    cv::resize(strip, out, cv::Size(w, params_.img_h), 0, 0, interp);
    return out;
}

LineCrop CropNormalizer::rectify(const HorizontalBox &box, const cv::Mat &grey, int box_id) const {
    CV_Assert(grey.type() == CV_8UC1);
    int x0 = std::max(0, box.x_min), x1 = std::min(box.x_max, grey.cols);
    int y0 = std::max(0, box.y_min), y1 = std::min(box.y_max, grey.rows);
    if (x1 <= x0 || y1 <= y0)
        throw DegenerateBoxError(cv::format("box %d has no area inside the image: x[%d,%d] y[%d,%d]", box_id,
                                            box.x_min, box.x_max, box.y_min, box.y_max));

    LineCrop lc;
    lc.box_id = box_id;
    lc.box = {cv::Point2f((float) x0, (float) y0), cv::Point2f((float) x1, (float) y0),
              cv::Point2f((float) x1, (float) y1), cv::Point2f((float) x0, (float) y1)};
    lc.image = to_height(grey(cv::Rect(x0, y0, x1 - x0, y1 - y0)));
    lc.pad = {lc.image.cols, lc.image.cols};
    return lc;
}

LineCrop CropNormalizer::rectify(const FreeBox &box, const cv::Mat &grey, int box_id) const {
    CV_Assert(grey.type() == CV_8UC1);
    const Quad &q = box.points;
    for (const auto &p: q) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y))
            throw DegenerateBoxError(cv::format("box %d has non-finite corners", box_id));
    }
    cv::Rect2f bounds = quad_bounds(q);
    cv::Rect2f image_rect(0.f, 0.f, (float) grey.cols, (float) grey.rows);
    if ((bounds & image_rect).area() <= 0.f)
        throw DegenerateBoxError(cv::format("box %d lies outside the image", box_id));

    const cv::Point2f &tl = q[0], &tr = q[1], &br = q[2], &bl = q[3];
    int w = (int) std::max(seg_len(tl, tr), seg_len(bl, br));
    int h = (int) std::max(seg_len(tl, bl), seg_len(tr, br));
    if (w < 2 || h < 2)
        throw DegenerateBoxError(cv::format("box %d is too thin to rectify (%dx%d)", box_id, w, h));

    std::vector<cv::Point2f> src{tl, tr, br, bl};
    std::vector<cv::Point2f> dst{{0, 0}, {(float) w - 1, 0}, {(float) w - 1, (float) h - 1}, {0, (float) h - 1}};
    cv::Mat line;
    try {
        cv::Mat M = cv::getPerspectiveTransform(src, dst);
        cv::warpPerspective(grey, line, M, cv::Size(w, h), cv::INTER_CUBIC, cv::BORDER_REPLICATE);
    } catch (const cv::Exception &e) {
        throw DegenerateBoxError(cv::format("box %d cannot be rectified: %s", box_id, e.what()));
    }

    LineCrop lc;
    lc.box_id = box_id;
    lc.box = q;
    lc.image = to_height(line);
    lc.pad = {lc.image.cols, lc.image.cols};
    return lc;
}

int CropNormalizer::pad_to_common_width(std::vector<LineCrop> &crops) {
    int max_w = 0;
    for (const auto &c: crops)
        max_w = std::max(max_w, c.image.cols);
    for (auto &c: crops) {
        int w = c.image.cols;
        // 右侧补背景：复制最后一列
        if (w < max_w)
            cv::copyMakeBorder(c.image, c.image, 0, 0, 0, max_w - w, cv::BORDER_REPLICATE);
        c.pad = {w, max_w};
    }
    return max_w;
}

// 线性插值的百分位数（与 numpy 默认一致）
static double percentile_u8(const int hist[256], int total, double p) {
    double rank = p * (total - 1);
    int lo = (int) std::floor(rank), hi = (int) std::ceil(rank);
    auto value_at = [&](int r) {
        int cum = 0;
        for (int v = 0; v < 256; ++v) {
            cum += hist[v];
            if (cum > r)
                return v;
        }
        return 255;
    };
    int vlo = value_at(lo), vhi = value_at(hi);
    return vlo + (vhi - vlo) * (rank - lo);
}

void CropNormalizer::adjust_contrast(cv::Mat &grey, float target) {
    CV_Assert(grey.type() == CV_8UC1);
    if (grey.empty())
        return;
    int hist[256] = {0};
    for (int y = 0; y < grey.rows; ++y) {
        const uchar *row = grey.ptr<uchar>(y);
        for (int x = 0; x < grey.cols; ++x)
            hist[row[x]]++;
    }
    int total = grey.rows * grey.cols;
    double high = percentile_u8(hist, total, 0.9);
    double low = percentile_u8(hist, total, 0.1);
    double contrast = (high - low) / std::max(10.0, high + low);
    if (contrast >= target)
        return;
    double ratio = 200.0 / std::max(10.0, high - low);
    // (v - low + 25) * ratio，convertTo 自带饱和截断
    grey.convertTo(grey, CV_8U, ratio, (25.0 - low) * ratio);
}
