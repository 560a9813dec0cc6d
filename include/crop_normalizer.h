#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "geometry.h"

struct PadInfo {
    int valid_width{0};  // 补齐前的宽度，识别时超出部分的时间步被忽略
    int padded_width{0};
};

// 送入识别器的固定高度行图
struct LineCrop {
    int box_id{-1}; // 在 (水平框..., 自由框...) 序列中的下标
    int angle{0};   // 旋转变体角度，0 为原图
    Quad box;       // 原图坐标
    cv::Mat image;  // CV_8UC1，高度恒为 img_h
    PadInfo pad;
};

class CropNormalizer {
public:
    struct Params {
        int img_h = 64;
    };

    CropNormalizer();
    explicit CropNormalizer(const Params& p);

    // 失败抛 DegenerateBoxError
    LineCrop rectify(const HorizontalBox& box, const cv::Mat& grey, int box_id) const;
    LineCrop rectify(const FreeBox& box, const cv::Mat& grey, int box_id) const;

    // 按高度 img_h 等比缩放
    cv::Mat to_height(const cv::Mat& strip) const;

    int img_h() const { return params_.img_h; }

    // 右侧补齐到本批最大宽度，返回该宽度
    static int pad_to_common_width(std::vector<LineCrop>& crops);
    // 低对比度灰度图拉伸
    static void adjust_contrast(cv::Mat& grey, float target);

private:
    Params params_;
};
