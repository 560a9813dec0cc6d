#pragma once
#include <vector>
#include "crop_normalizer.h"
#include "results.h"

// 方向集成：识别前展开旋转变体，识别后按 box_id 取置信度最高者
class OrientationEnsemble {
public:
    OrientationEnsemble(std::vector<int> angles, const CropNormalizer& normalizer);

    bool enabled() const { return !angles_.empty(); }
    const std::vector<int>& angles() const { return angles_; }

    // 原 crop 保持在前，变体依次追加；输入必须是未补齐的行图
    std::vector<LineCrop> expand(const std::vector<LineCrop>& crops) const;

    static std::vector<RecognitionResult> collapse(const std::vector<RecognitionResult>& results);
    static int normalize_angle(int angle);

private:
    std::vector<int> angles_; // 去重、归一化到 [0,360)，不含 0
    const CropNormalizer& normalizer_;

    cv::Mat rotate_strip(const cv::Mat& strip, int angle) const;
};
