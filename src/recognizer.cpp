#include "recognizer.h"
#include "ctc_decoder.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

CtcVocabulary CtcVocabulary::from_request(const RecognizerRequest &req) {
    if (!req.model_chars)
        throw std::invalid_argument("recognizer request carries no character list");
    CtcVocabulary v;
    v.labels.reserve(req.model_chars->size() + 1);
    v.labels.emplace_back(); // blank
    for (const auto &c: *req.model_chars)
        v.labels.push_back(c);
    // 模型索引 = 字典索引+1（blank=0）
    for (int k = 1; k < (int) v.labels.size(); ++k) {
        if (req.ignore_chars.count(v.labels[k]))
            v.ignore_idx.push_back(k);
        if (req.separators.count(v.labels[k]))
            v.drop_idx.push_back(k);
    }
    return v;
}

CrnnRecognizer::CrnnRecognizer(const std::filesystem::path &rec_model, bool use_cuda) : rec_(rec_model, use_cuda) {}

// 灰度 [0,255] -> [-1,1]
void CrnnRecognizer::normalize_rec(const cv::Mat &grey, float *dst) {
    cv::Mat f(grey.rows, grey.cols, CV_32F, dst);
    grey.convertTo(f, CV_32F, 2.0 / 255.0, -1.0);
}

TextScore CrnnRecognizer::decode(const cv::Mat &logits_TxC, int valid_steps, const CtcVocabulary &vocab,
                                 Decoder decoder, int beam_width) {
    int steps = std::clamp(valid_steps, 1, std::max(1, logits_TxC.rows));
    cv::Mat probs = softmax_rows(logits_TxC.rowRange(0, std::min(steps, logits_TxC.rows)));
    suppress_classes(probs, vocab.ignore_idx);

    TextScore ts;
    ts.text = decoder == Decoder::BeamSearch ? ctc_beam_search(probs, vocab.labels, vocab.drop_idx, beam_width)
                                             : ctc_greedy(probs, vocab.labels, vocab.drop_idx);
    ts.confidence = sequence_confidence(probs);
    return ts;
}

std::vector<TextScore> CrnnRecognizer::recognize_batch(const std::vector<LineCrop> &crops,
                                                       const RecognizerRequest &req) const {
    if (crops.empty())
        return {};
    const int N = (int) crops.size();
    const int H = crops[0].image.rows;
    int W = 0;
    for (const auto &c: crops) {
        if (c.image.rows != H || c.image.type() != CV_8UC1)
            throw std::invalid_argument("recognizer batch mixes strip heights or pixel types");
        W = std::max(W, c.image.cols);
    }

    // NCHW，C=1；宽度不足的行图右侧复制补齐
    std::vector<float> blob((size_t) N * H * W);
    for (int i = 0; i < N; ++i) {
        cv::Mat img = crops[i].image;
        if (img.cols < W)
            cv::copyMakeBorder(img, img, 0, 0, 0, W - img.cols, cv::BORDER_REPLICATE);
        normalize_rec(img, blob.data() + (size_t) i * H * W);
    }
    Ort::Value out = rec_.run(blob.data(), {N, 1, H, W});

    CtcVocabulary vocab = CtcVocabulary::from_request(req);
    const int C_expected = (int) vocab.labels.size();
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape();
    if (shp.size() != 3 || shp[0] != N)
        throw OracleFailure("unexpected recognizer output shape (rank " + std::to_string(shp.size()) + ")");
    // 统一 TxC：第二维等于词表大小时视为 N x C x T
    bool layout_NCT = (shp[1] == C_expected && shp[2] != C_expected);
    int T = (int) (layout_NCT ? shp[2] : shp[1]);
    int C = (int) (layout_NCT ? shp[1] : shp[2]);
    if (C != C_expected)
        spdlog::warn("recognizer emits {} classes but the character list has {}", C, C_expected);
    const float *ptr = out.GetTensorData<float>();

    std::vector<TextScore> results;
    results.reserve(N);
    for (int i = 0; i < N; ++i) {
        const float *base = ptr + (size_t) i * T * C;
        cv::Mat logits_TxC;
        if (!layout_NCT) {
            logits_TxC = cv::Mat(T, C, CV_32F, const_cast<float *>(base));
        } else {
            logits_TxC.create(T, C, CV_32F);
            for (int t = 0; t < T; ++t) {
                float *dst = logits_TxC.ptr<float>(t);
                for (int c = 0; c < C; ++c)
                    dst[c] = base[(size_t) c * T + t];
            }
        }
        // 补齐区域对应的时间步不参与解码
        int valid_w = crops[i].pad.valid_width > 0 ? std::min(crops[i].pad.valid_width, W) : W;
        int valid_steps = (int) std::ceil((double) T * valid_w / W);
        results.push_back(decode(logits_TxC, valid_steps, vocab, req.decoder, req.beam_width));
    }
    return results;
}
