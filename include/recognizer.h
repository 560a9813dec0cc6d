#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "onnx_session.h"
#include "oracles.h"

// CTC 词表：labels[0] 为 blank，其余依次对应模型字符
struct CtcVocabulary {
    std::vector<std::string> labels;
    std::vector<int> ignore_idx; // 解码前概率置零
    std::vector<int> drop_idx;   // 解码后去掉（分词符）

    static CtcVocabulary from_request(const RecognizerRequest& req);
};

class CrnnRecognizer : public TextRecognizer {
public:
    explicit CrnnRecognizer(const std::filesystem::path& rec_model, bool use_cuda=false);

    std::vector<TextScore> recognize_batch(const std::vector<LineCrop>& crops,
                                           const RecognizerRequest& req) const override;

    // logits 为 T x C，只解码前 valid_steps 个时间步
    static TextScore decode(const cv::Mat& logits_TxC, int valid_steps, const CtcVocabulary& vocab,
                            Decoder decoder, int beam_width);

private:
    OnnxSession rec_;
    static void normalize_rec(const cv::Mat& grey, float* dst);
};
