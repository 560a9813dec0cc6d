#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "crop_normalizer.h"
#include "geometry.h"
#include "image_input.h"
#include "languages.h"
#include "oracles.h"
#include "results.h"

struct DetectOptions {
    int   min_size = 20;        // 较长边不超过该值的框丢弃，0 关闭
    float text_threshold = 0.7f;
    float low_text = 0.4f;
    float link_threshold = 0.4f;
    int   canvas_size = 2560;
    float mag_ratio = 1.f;
    float slope_ths = 0.1f;
    float ycenter_ths = 0.5f;
    float height_ths = 0.5f;
    float width_ths = 0.5f;
    float add_margin = 0.1f;
    int   optimal_num_chars = -1; // >=0 时不合并水平框，按估计字符数接近程度排序
};

struct RecognizeOptions {
    std::string decoder = "greedy"; // greedy / beamsearch
    int beam_width = 5;
    int batch_size = 1;
    std::string allowlist;
    std::string blocklist;
    std::vector<int> rotation_info; // 例如 {90, 180, 270}
    bool paragraph = false;
    float contrast_ths = 0.1f;      // 低于此置信度的行做对比度增强后重识别
    float adjust_contrast = 0.5f;
};

struct ReadOptions {
    DetectOptions detect;
    RecognizeOptions recognize;
};

// 流水线：检测 -> 分组 -> 裁剪 -> (方向展开) -> 识别 -> (方向收敛) -> (段落)
class Reader {
public:
    struct Config {
        std::vector<std::string> lang_list{"en"};
        bool gpu = true;
        std::filesystem::path model_dir;   // 为空时取 default_module_path()/model
        std::filesystem::path char_dir;    // 为空时取 default_module_path()/character
        std::string detector_file = "craft.onnx";
        int img_h = 64;
        bool detector = true;
        bool recognizer = true;
    };

    explicit Reader(const Config& cfg);
    // 注入已解析的语言配置与检测/识别实现（任一可为空）
    Reader(const Config& cfg, LanguageProfile profile, std::unique_ptr<TextDetector> det,
           std::unique_ptr<TextRecognizer> rec);
    ~Reader();

    GroupedBoxes detect(const cv::Mat& image, const DetectOptions& o = DetectOptions()) const;

    // boxes 为空时返回空结果
    ReadResult recognize(const cv::Mat& image, const GroupedBoxes& boxes,
                         const RecognizeOptions& o = RecognizeOptions()) const;
    // 整图作为一行
    ReadResult recognize(const cv::Mat& image, const RecognizeOptions& o = RecognizeOptions()) const;

    ReadResult read(const PreparedImage& img, const ReadOptions& o = ReadOptions()) const;
    ReadResult read(const cv::Mat& img, const ReadOptions& o = ReadOptions()) const;
    ReadResult read(const std::string& path, const ReadOptions& o = ReadOptions()) const;

    const LanguageProfile& profile() const { return profile_; }
    const Config& config() const { return cfg_; }

    // $LINEOCR_MODULE_PATH，否则 ~/.lineocr
    static std::filesystem::path default_module_path();

private:
    Config cfg_;
    LanguageProfile profile_;
    CropNormalizer normalizer_;
    std::unique_ptr<TextDetector> det_;
    std::unique_ptr<TextRecognizer> rec_;

    RecognizerRequest make_request(const RecognizeOptions& o) const;
    ReadResult recognize_boxes(const cv::Mat& grey, const GroupedBoxes& boxes, const RecognizeOptions& o,
                               const RecognizerRequest& req) const;
    std::vector<RecognitionResult> run_recognizer(const std::vector<LineCrop>& crops, const RecognizerRequest& req,
                                                  int batch_size) const;
    void retry_low_contrast(const std::vector<LineCrop>& crops, std::vector<RecognitionResult>& results,
                            const RecognizeOptions& o, const RecognizerRequest& req) const;
};
