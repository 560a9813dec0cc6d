#pragma once
#include <filesystem>
#include <opencv2/core.hpp>
#include <vector>
#include "onnx_session.h"
#include "oracles.h"

// CRAFT 文本检测：输出字符区域图与字间连接图，连通域 -> 最小外接矩形
class CraftDetector : public TextDetector {
public:
    explicit CraftDetector(const std::filesystem::path& det_model, bool use_cuda=false);

    std::vector<RawRegion> detect_regions(const cv::Mat& bgr, const DetectorParams& p) const override;

    // textmap/linkmap 为 CV_32F 同尺寸热图，返回热图坐标下的四点区域
    static std::vector<RawRegion> decode_maps(const cv::Mat& textmap, const cv::Mat& linkmap,
                                              const DetectorParams& p);

private:
    OnnxSession det_session_;
    static cv::Mat resize_to_x32(const cv::Mat& rgb, int canvas_size, float mag_ratio, float* out_ratio);
    static void normalize_rgb(cv::Mat& rgb);
};
