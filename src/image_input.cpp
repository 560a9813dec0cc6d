#include "image_input.h"
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

PreparedImage prepare_image(const cv::Mat &img) {
    if (img.empty())
        throw std::runtime_error("empty image");
    if (img.depth() != CV_8U)
        throw std::runtime_error("only 8-bit images are supported");

    PreparedImage out;
    switch (img.channels()) {
        case 1:
            out.grey = img.clone();
            cv::cvtColor(img, out.bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            out.bgr = img.clone();
            cv::cvtColor(img, out.grey, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(img, out.bgr, cv::COLOR_BGRA2BGR);
            cv::cvtColor(out.bgr, out.grey, cv::COLOR_BGR2GRAY);
            break;
        default:
            throw std::runtime_error("unsupported channel count " + std::to_string(img.channels()));
    }
    return out;
}

PreparedImage prepare_image(const std::string &path) {
    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty())
        throw std::runtime_error("read image failed: " + path);
    return prepare_image(img);
}

PreparedImage prepare_image(const std::vector<uchar> &encoded) {
    cv::Mat img = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
    if (img.empty())
        throw std::runtime_error("cannot decode image bytes");
    return prepare_image(img);
}
