#include "ctc_decoder.h"
#include "oracles.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <map>

Decoder parse_decoder(const std::string &name) {
    if (name == "greedy")
        return Decoder::Greedy;
    if (name == "beamsearch")
        return Decoder::BeamSearch;
    throw ConfigurationError("unsupported decoder '" + name + "' (expected greedy or beamsearch)");
}

cv::Mat softmax_rows(const cv::Mat &logits_TxC) {
    CV_Assert(logits_TxC.type() == CV_32F);
    cv::Mat out(logits_TxC.size(), CV_32F);
    const int T = logits_TxC.rows, C = logits_TxC.cols;
    for (int t = 0; t < T; ++t) {
        const float *row = logits_TxC.ptr<float>(t);
        float *dst = out.ptr<float>(t);
        float m = *std::max_element(row, row + C);
        double s = 0.0;
        for (int c = 0; c < C; ++c) {
            dst[c] = std::exp(row[c] - m);
            s += dst[c];
        }
        for (int c = 0; c < C; ++c)
            dst[c] = (float) (dst[c] / s);
    }
    return out;
}

void suppress_classes(cv::Mat &probs_TxC, const std::vector<int> &classes) {
    if (classes.empty())
        return;
    const int C = probs_TxC.cols;
    for (int t = 0; t < probs_TxC.rows; ++t) {
        float *row = probs_TxC.ptr<float>(t);
        for (int c: classes)
            if (c >= 0 && c < C)
                row[c] = 0.f;
        double s = 0.0;
        for (int c = 0; c < C; ++c)
            s += row[c];
        if (s <= 0.0)
            continue;
        for (int c = 0; c < C; ++c)
            row[c] = (float) (row[c] / s);
    }
}

static inline bool is_dropped(int k, const std::vector<int> &drop) {
    return k == 0 || std::find(drop.begin(), drop.end(), k) != drop.end();
}

static std::string labels_to_text(const std::vector<int> &seq, const std::vector<std::string> &labels,
                                  const std::vector<int> &drop) {
    std::string out;
    for (int k: seq) {
        if (!is_dropped(k, drop) && k < (int) labels.size())
            out += labels[k];
    }
    return out;
}

std::string ctc_greedy(const cv::Mat &probs_TxC, const std::vector<std::string> &labels, const std::vector<int> &drop) {
    const int T = probs_TxC.rows, C = probs_TxC.cols;
    std::vector<int> seq;
    int prev_k = -1;
    for (int t = 0; t < T; ++t) {
        const float *row = probs_TxC.ptr<float>(t);
        int k = int(std::max_element(row, row + C) - row); // argmax
        // 正常 CTC：相邻重复合并，blank 分隔
        if (k != prev_k)
            seq.push_back(k);
        prev_k = k;
    }
    return labels_to_text(seq, labels, drop);
}

std::string ctc_beam_search(const cv::Mat &probs_TxC, const std::vector<std::string> &labels,
                            const std::vector<int> &drop, int beam_width) {
    struct Score {
        double blank = 0.0, non_blank = 0.0;
        double total() const { return blank + non_blank; }
    };
    using Beams = std::map<std::vector<int>, Score>;

    const int T = probs_TxC.rows, C = probs_TxC.cols;
    beam_width = std::max(1, beam_width);
    Beams beams;
    beams[std::vector<int>()].blank = 1.0;

    for (int t = 0; t < T; ++t) {
        const float *row = probs_TxC.ptr<float>(t);
        Beams next;
        for (const auto &kv: beams) {
            const std::vector<int> &prefix = kv.first;
            const Score &s = kv.second;
            int last = prefix.empty() ? -1 : prefix.back();
            for (int c = 0; c < C; ++c) {
                double p = row[c];
                if (p <= 0.0)
                    continue;
                if (c == 0) {
                    next[prefix].blank += s.total() * p;
                    continue;
                }
                std::vector<int> extended = prefix;
                extended.push_back(c);
                if (c == last) {
                    // 重复字符必须被 blank 隔开才算新字符
                    next[extended].non_blank += s.blank * p;
                    next[prefix].non_blank += s.non_blank * p;
                } else {
                    next[extended].non_blank += s.total() * p;
                }
            }
        }

        std::vector<std::pair<std::vector<int>, Score>> ranked(next.begin(), next.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto &a, const auto &b) { return a.second.total() > b.second.total(); });
        if ((int) ranked.size() > beam_width)
            ranked.resize(beam_width);

        // 每步重新归一化，防止长序列下溢
        double mass = 0.0;
        for (const auto &r: ranked)
            mass += r.second.total();
        beams.clear();
        for (auto &r: ranked) {
            if (mass > 0.0) {
                r.second.blank /= mass;
                r.second.non_blank /= mass;
            }
            beams.emplace(std::move(r.first), r.second);
        }
    }

    const std::vector<int> *best = nullptr;
    double best_score = -1.0;
    for (const auto &kv: beams) {
        if (kv.second.total() > best_score) {
            best_score = kv.second.total();
            best = &kv.first;
        }
    }
    return best ? labels_to_text(*best, labels, drop) : std::string();
}

float sequence_confidence(const cv::Mat &probs_TxC) {
    const int T = probs_TxC.rows, C = probs_TxC.cols;
    if (T == 0 || C == 0)
        return 0.f;
    double sum_log = 0.0;
    for (int t = 0; t < T; ++t) {
        const float *row = probs_TxC.ptr<float>(t);
        sum_log += std::log(std::max(1e-12, (double) *std::max_element(row, row + C)));
    }
    return (float) std::exp(sum_log * 2.0 / std::sqrt((double) T));
}
