#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// 所有函数的概率矩阵均为 T x C（CV_32F），第 0 列为 CTC blank；labels[0] 对应 blank

cv::Mat softmax_rows(const cv::Mat& logits_TxC);

// 把指定类别概率置零后逐行重新归一化
void suppress_classes(cv::Mat& probs_TxC, const std::vector<int>& classes);

// drop：解码结果中需要去掉的类别（blank 之外，例如分词符）
std::string ctc_greedy(const cv::Mat& probs_TxC, const std::vector<std::string>& labels,
                       const std::vector<int>& drop = {});

std::string ctc_beam_search(const cv::Mat& probs_TxC, const std::vector<std::string>& labels,
                            const std::vector<int>& drop = {}, int beam_width = 5);

// 每步最大概率之积再开 sqrt(T)/2 次方
float sequence_confidence(const cv::Mat& probs_TxC);
