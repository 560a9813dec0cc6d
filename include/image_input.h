#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// 检测用彩色图与识别用灰度图，同一来源只解码一次
struct PreparedImage {
    cv::Mat bgr;  // CV_8UC3
    cv::Mat grey; // CV_8UC1
};

// 支持灰度 / BGR / BGRA，8 位
PreparedImage prepare_image(const cv::Mat& img);
PreparedImage prepare_image(const std::string& path);
PreparedImage prepare_image(const std::vector<uchar>& encoded);
