#include "orientation.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <opencv2/imgproc.hpp>

int OrientationEnsemble::normalize_angle(int angle) {
    int a = angle % 360;
    return a < 0 ? a + 360 : a;
}

static inline int rotation_distance(int angle) {
    int a = OrientationEnsemble::normalize_angle(angle);
    return std::min(a, 360 - a);
}

OrientationEnsemble::OrientationEnsemble(std::vector<int> angles, const CropNormalizer &normalizer) :
    normalizer_(normalizer) {
    for (int a: angles) {
        int n = normalize_angle(a);
        if (n != 0 && std::find(angles_.begin(), angles_.end(), n) == angles_.end())
            angles_.push_back(n);
    }
}

// 正角度为逆时针
cv::Mat OrientationEnsemble::rotate_strip(const cv::Mat &strip, int angle) const {
    cv::Mat out;
    switch (angle) {
        case 90:
            cv::rotate(strip, out, cv::ROTATE_90_COUNTERCLOCKWISE);
            break;
        case 180:
            cv::rotate(strip, out, cv::ROTATE_180);
            break;
        case 270:
            cv::rotate(strip, out, cv::ROTATE_90_CLOCKWISE);
            break;
        default: {
            // 任意角度：放大画布保证内容不被裁掉
            cv::Point2f center(strip.cols * 0.5f, strip.rows * 0.5f);
            cv::Mat M = cv::getRotationMatrix2D(center, angle, 1.0);
            double c = std::abs(M.at<double>(0, 0)), s = std::abs(M.at<double>(0, 1));
            int nw = std::max(1, (int) std::lround(strip.rows * s + strip.cols * c));
            int nh = std::max(1, (int) std::lround(strip.rows * c + strip.cols * s));
            M.at<double>(0, 2) += nw * 0.5 - center.x;
            M.at<double>(1, 2) += nh * 0.5 - center.y;
            cv::warpAffine(strip, out, M, cv::Size(nw, nh), cv::INTER_LINEAR, cv::BORDER_REPLICATE);
        }
    }
    return normalizer_.to_height(out);
}

std::vector<LineCrop> OrientationEnsemble::expand(const std::vector<LineCrop> &crops) const {
    std::vector<LineCrop> out = crops;
    out.reserve(crops.size() * (angles_.size() + 1));
    for (int angle: angles_) {
        for (const auto &c: crops) {
            LineCrop v;
            v.box_id = c.box_id;
            v.angle = angle;
            v.box = c.box;
            v.image = rotate_strip(c.image, angle);
            v.pad = {v.image.cols, v.image.cols};
            out.push_back(std::move(v));
        }
    }
    return out;
}

std::vector<RecognitionResult> OrientationEnsemble::collapse(const std::vector<RecognitionResult> &results) {
    std::vector<RecognitionResult> out;
    std::map<int, size_t> slot; // box_id -> out 下标
    for (const auto &r: results) {
        auto it = slot.find(r.box_id);
        if (it == slot.end()) {
            slot.emplace(r.box_id, out.size());
            out.push_back(r);
            continue;
        }
        RecognitionResult &best = out[it->second];
        bool better = r.confidence > best.confidence;
        if (r.confidence == best.confidence) {
            int dr = rotation_distance(r.angle), db = rotation_distance(best.angle);
            better = dr < db || (dr == db && normalize_angle(r.angle) < normalize_angle(best.angle));
        }
        if (better)
            best = r;
    }
    return out;
}
