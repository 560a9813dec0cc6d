#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "charset.h"
#include "crop_normalizer.h"
#include "geometry.h"

struct DetectorParams {
    int   canvas_size = 2560;
    float mag_ratio = 1.f;
    float text_threshold = 0.7f;
    float link_threshold = 0.4f;
    float low_text = 0.4f;
    bool  estimate_num_chars = false;
};

// 文本检测：整图 -> 原始区域（原图坐标）
class TextDetector {
public:
    virtual ~TextDetector() = default;
    virtual std::vector<RawRegion> detect_regions(const cv::Mat& bgr, const DetectorParams& p) const = 0;
};

enum class Decoder { Greedy, BeamSearch };

Decoder parse_decoder(const std::string& name);

struct RecognizerRequest {
    const std::vector<std::string>* model_chars{nullptr}; // 不含 blank
    CharSet ignore_chars;
    CharSet separators;
    Decoder decoder{Decoder::Greedy};
    int beam_width{5};
};

struct TextScore {
    std::string text;
    float confidence{0.f};
};

// 行识别：一批等宽行图 -> 每张一个结果，顺序与输入一致
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;
    virtual std::vector<TextScore> recognize_batch(const std::vector<LineCrop>& crops,
                                                   const RecognizerRequest& req) const = 0;
};
