#include "detector.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

CraftDetector::CraftDetector(const std::filesystem::path &det_model, bool use_cuda) :
    det_session_(det_model, use_cuda) {}

// 归一化：在 RGB 空间做 (x - mean*255) / (std*255)
void CraftDetector::normalize_rgb(cv::Mat &rgb) {
    CV_Assert(rgb.type() == CV_32FC3);
    const cv::Scalar mean(0.485 * 255.0, 0.456 * 255.0, 0.406 * 255.0);
    const cv::Scalar stdv(0.229 * 255.0, 0.224 * 255.0, 0.225 * 255.0);
    cv::subtract(rgb, mean, rgb);
    cv::divide(rgb, stdv, rgb);
}

// 检测前处理：长边按 mag_ratio 放大（不超过 canvas_size），右下 pad 到 32 的倍数
cv::Mat CraftDetector::resize_to_x32(const cv::Mat &rgb, int canvas_size, float mag_ratio, float *out_ratio) {
    const int h = rgb.rows, w = rgb.cols;
    float target = mag_ratio * (float) std::max(h, w);
    if (target > (float) canvas_size)
        target = (float) canvas_size;
    float ratio = target / (float) std::max(h, w);

    int nh = std::max(1, static_cast<int>(h * ratio));
    int nw = std::max(1, static_cast<int>(w * ratio));
    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(nw, nh), 0, 0, cv::INTER_LINEAR);

    int ph = (nh + 31) / 32 * 32;
    int pw = (nw + 31) / 32 * 32;
    cv::Mat padded(ph, pw, rgb.type(), cv::Scalar(0, 0, 0));
    resized.copyTo(padded(cv::Rect(0, 0, nw, nh)));
    if (out_ratio)
        *out_ratio = ratio;
    return padded;
}

std::vector<RawRegion> CraftDetector::decode_maps(const cv::Mat &textmap, const cv::Mat &linkmap,
                                                  const DetectorParams &p) {
    CV_Assert(textmap.type() == CV_32F && linkmap.type() == CV_32F && textmap.size() == linkmap.size());
    const int H = textmap.rows, W = textmap.cols;

    cv::Mat text_score = textmap > p.low_text;
    cv::Mat link_score = linkmap > p.link_threshold;
    cv::Mat link_only = link_score & ~text_score;
    cv::Mat labels, stats, centroids;
    int n = cv::connectedComponentsWithStats(text_score | link_score, labels, stats, centroids, 4, CV_32S);

    // 字符峰值图：去掉连接区后仍高于 text_threshold 的像素，每个区域按 segmap 截取
    cv::Mat char_peaks;
    if (p.estimate_num_chars) {
        cv::Mat diff = textmap - linkmap;
        char_peaks = diff > p.text_threshold;
    }

    std::vector<RawRegion> regions;
    for (int k = 1; k < n; ++k) {
        int area = stats.at<int>(k, cv::CC_STAT_AREA);
        if (area < 10)
            continue;
        cv::Mat comp = labels == k;
        double peak = 0.0;
        cv::minMaxLoc(textmap, nullptr, &peak, nullptr, nullptr, comp);
        if (peak < p.text_threshold)
            continue;

        cv::Mat segmap = cv::Mat::zeros(textmap.size(), CV_8U);
        segmap.setTo(255, comp);
        segmap.setTo(0, link_only);

        // 按连通域大小膨胀，补回被阈值截掉的字符边缘
        int x = stats.at<int>(k, cv::CC_STAT_LEFT), y = stats.at<int>(k, cv::CC_STAT_TOP);
        int w = stats.at<int>(k, cv::CC_STAT_WIDTH), h = stats.at<int>(k, cv::CC_STAT_HEIGHT);
        int niter = (int) (std::sqrt((double) area * std::min(w, h) / ((double) w * h)) * 2.0);
        int sx = std::max(0, x - niter), ex = std::min(W, x + w + niter + 1);
        int sy = std::max(0, y - niter), ey = std::min(H, y + h + niter + 1);
        cv::Mat roi = segmap(cv::Rect(sx, sy, ex - sx, ey - sy));
        cv::dilate(roi, roi, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(1 + niter, 1 + niter)));

        std::vector<cv::Point> pts;
        cv::findNonZero(segmap, pts);
        if (pts.empty())
            continue;

        cv::RotatedRect rr = cv::minAreaRect(pts);
        cv::Point2f box[4];
        rr.points(box);
        std::vector<cv::Point2f> quad(box, box + 4);
        // 近似正方形（菱形）时改用轴对齐外接框
        float bw = seg_len(box[0], box[1]), bh = seg_len(box[1], box[2]);
        float box_ratio = std::max(bw, bh) / (std::min(bw, bh) + 1e-5f);
        if (std::abs(1.f - box_ratio) <= 0.1f) {
            cv::Rect br = cv::boundingRect(pts);
            float l = (float) br.x, r = (float) (br.x + br.width - 1);
            float t = (float) br.y, b = (float) (br.y + br.height - 1);
            quad = {{l, t}, {r, t}, {r, b}, {l, b}};
        }

        RawRegion region;
        Quad q = order_quad(quad);
        region.points.assign(q.begin(), q.end());
        if (p.estimate_num_chars) {
            cv::Mat chars = cv::Mat::zeros(textmap.size(), CV_8U);
            char_peaks.copyTo(chars, segmap);
            cv::Mat char_lbl;
            region.estimated_chars = cv::connectedComponents(chars, char_lbl) - 1;
        }
        regions.push_back(std::move(region));
    }
    return regions;
}

std::vector<RawRegion> CraftDetector::detect_regions(const cv::Mat &bgr, const DetectorParams &p) const {
    CV_Assert(bgr.type() == CV_8UC3);
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    float ratio = 1.f;
    cv::Mat img = resize_to_x32(rgb, p.canvas_size, p.mag_ratio, &ratio);
    img.convertTo(img, CV_32FC3);
    normalize_rgb(img);

    // NCHW
    cv::Mat chw;
    cv::dnn::blobFromImage(img, chw, 1.0, cv::Size(), cv::Scalar(), false, false);
    Ort::Value out = det_session_.run((float *) chw.data, {1, 3, (int64_t) img.rows, (int64_t) img.cols});

    auto shp = out.GetTensorTypeAndShapeInfo().GetShape();
    const float *ptr = out.GetTensorData<float>();
    cv::Mat textmap, linkmap;
    if (shp.size() == 4 && shp[3] == 2) {
        // [1, H/2, W/2, 2]
        int oh = (int) shp[1], ow = (int) shp[2];
        textmap.create(oh, ow, CV_32F);
        linkmap.create(oh, ow, CV_32F);
        for (int y = 0; y < oh; ++y) {
            float *t = textmap.ptr<float>(y), *l = linkmap.ptr<float>(y);
            for (int x = 0; x < ow; ++x) {
                t[x] = ptr[((size_t) y * ow + x) * 2];
                l[x] = ptr[((size_t) y * ow + x) * 2 + 1];
            }
        }
    } else if (shp.size() == 4 && shp[1] == 2) {
        int oh = (int) shp[2], ow = (int) shp[3];
        textmap = cv::Mat(oh, ow, CV_32F, const_cast<float *>(ptr)).clone();
        linkmap = cv::Mat(oh, ow, CV_32F, const_cast<float *>(ptr) + (size_t) oh * ow).clone();
    } else {
        throw OracleFailure("unexpected detector output rank " + std::to_string(shp.size()));
    }

    auto regions = decode_maps(textmap, linkmap, p);
    // 热图 -> 网络输入 -> 原图
    float sx = (float) img.cols / (float) textmap.cols / ratio;
    float sy = (float) img.rows / (float) textmap.rows / ratio;
    for (auto &r: regions) {
        for (auto &pt: r.points) {
            pt.x *= sx;
            pt.y *= sy;
        }
    }
    spdlog::debug("detector: {} regions (net {}x{}, heatmap {}x{})", regions.size(), img.cols, img.rows,
                  textmap.cols, textmap.rows);
    return regions;
}
