#include "reader.h"
#include "bidi.h"
#include "box_grouper.h"
#include "detector.h"
#include "errors.h"
#include "orientation.h"
#include "paragraph.h"
#include "recognizer.h"
#include <algorithm>
#include <cstdlib>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

std::vector<std::string> ReadResult::texts() const {
    std::vector<std::string> out;
    if (is_paragraph) {
        for (const auto &p: paragraphs)
            out.push_back(p.text);
    } else {
        for (const auto &r: lines)
            out.push_back(r.text);
    }
    return out;
}

std::filesystem::path Reader::default_module_path() {
    if (const char *env = std::getenv("LINEOCR_MODULE_PATH"))
        return env;
    if (const char *home = std::getenv("HOME"))
        return std::filesystem::path(home) / ".lineocr";
    return ".lineocr";
}

static std::filesystem::path model_dir_of(const Reader::Config &cfg) {
    return cfg.model_dir.empty() ? Reader::default_module_path() / "model" : cfg.model_dir;
}

static std::filesystem::path char_dir_of(const Reader::Config &cfg) {
    return cfg.char_dir.empty() ? Reader::default_module_path() / "character" : cfg.char_dir;
}

static CropNormalizer::Params normalizer_params(int img_h) {
    CropNormalizer::Params p;
    p.img_h = img_h;
    return p;
}

Reader::Reader(const Config &cfg) :
    cfg_(cfg),
    profile_(load_language_profile(cfg.lang_list, char_dir_of(cfg), model_dir_of(cfg))),
    normalizer_(normalizer_params(cfg.img_h)) {
    if (!cfg_.gpu)
        spdlog::warn("Using CPU. Note: This module is much faster with a GPU.");
    const auto model_dir = model_dir_of(cfg_);
    if (cfg_.detector)
        det_ = std::make_unique<CraftDetector>(model_dir / cfg_.detector_file, cfg_.gpu);
    if (cfg_.recognizer)
        rec_ = std::make_unique<CrnnRecognizer>(model_dir / (profile_.group.model_id + ".onnx"), cfg_.gpu);
}

Reader::Reader(const Config &cfg, LanguageProfile profile, std::unique_ptr<TextDetector> det,
               std::unique_ptr<TextRecognizer> rec) :
    cfg_(cfg),
    profile_(std::move(profile)),
    normalizer_(normalizer_params(cfg.img_h)),
    det_(std::move(det)),
    rec_(std::move(rec)) {}

Reader::~Reader() = default;

static cv::Mat as_bgr(const cv::Mat &image) {
    if (image.type() == CV_8UC3)
        return image;
    return prepare_image(image).bgr;
}

static cv::Mat as_grey(const cv::Mat &image) {
    if (image.type() == CV_8UC1)
        return image;
    return prepare_image(image).grey;
}

// 较长边 > min_size 才保留
static bool large_enough(int w, int h, int min_size) {
    return min_size <= 0 || std::max(w, h) > min_size;
}

GroupedBoxes Reader::detect(const cv::Mat &image, const DetectOptions &o) const {
    if (!det_)
        throw ConfigurationError("reader was created without a detector");

    DetectorParams dp;
    dp.canvas_size = o.canvas_size;
    dp.mag_ratio = o.mag_ratio;
    dp.text_threshold = o.text_threshold;
    dp.link_threshold = o.link_threshold;
    dp.low_text = o.low_text;
    dp.estimate_num_chars = o.optimal_num_chars >= 0;
    std::vector<RawRegion> regions = det_->detect_regions(as_bgr(image), dp);

    if (o.optimal_num_chars >= 0) {
        const int optimal = o.optimal_num_chars;
        std::stable_sort(regions.begin(), regions.end(), [optimal](const RawRegion &a, const RawRegion &b) {
            return std::abs(optimal - a.estimated_chars) < std::abs(optimal - b.estimated_chars);
        });
    }

    BoxGrouper::Params gp;
    gp.slope_ths = o.slope_ths;
    gp.ycenter_ths = o.ycenter_ths;
    gp.height_ths = o.height_ths;
    gp.width_ths = o.width_ths;
    gp.add_margin = o.add_margin;
    gp.merge_horizontal = o.optimal_num_chars < 0;
    GroupedBoxes grouped = BoxGrouper(gp).group(regions);

    GroupedBoxes out;
    for (auto &h: grouped.horizontal) {
        if (large_enough(h.width(), h.height(), o.min_size))
            out.horizontal.push_back(std::move(h));
    }
    for (auto &f: grouped.free) {
        cv::Rect2f b = quad_bounds(f.points);
        if (large_enough((int) b.width, (int) b.height, o.min_size))
            out.free.push_back(std::move(f));
    }
    spdlog::debug("detect: {} regions -> {} horizontal, {} free boxes", regions.size(), out.horizontal.size(),
                  out.free.size());
    return out;
}

RecognizerRequest Reader::make_request(const RecognizeOptions &o) const {
    if (!rec_)
        throw ConfigurationError("reader was created without a recognizer");
    if (o.batch_size < 1)
        throw ConfigurationError("batch_size must be at least 1");
    if (o.beam_width < 1)
        throw ConfigurationError("beam_width must be at least 1");

    RecognizerRequest req;
    req.decoder = parse_decoder(o.decoder);
    if (profile_.group.greedy_only && req.decoder != Decoder::Greedy) {
        spdlog::warn("language group '{}' only supports greedy decoding", profile_.group.key);
        req.decoder = Decoder::Greedy;
    }
    req.beam_width = o.beam_width;
    req.model_chars = &profile_.model_chars;
    req.ignore_chars = build_ignore_set(profile_.model_chars, profile_.lang_chars, o.allowlist, o.blocklist);
    req.separators = CharSet(profile_.group.separators.begin(), profile_.group.separators.end());
    return req;
}

ReadResult Reader::recognize(const cv::Mat &image, const GroupedBoxes &boxes, const RecognizeOptions &o) const {
    RecognizerRequest req = make_request(o);
    if (boxes.empty()) {
        ReadResult empty;
        empty.is_paragraph = o.paragraph;
        return empty;
    }
    return recognize_boxes(as_grey(image), boxes, o, req);
}

ReadResult Reader::recognize(const cv::Mat &image, const RecognizeOptions &o) const {
    if (image.empty())
        throw std::runtime_error("empty image");
    GroupedBoxes whole;
    HorizontalBox hb;
    hb.x_max = image.cols;
    hb.y_max = image.rows;
    whole.horizontal.push_back(hb);
    return recognize(image, whole, o);
}

ReadResult Reader::read(const PreparedImage &img, const ReadOptions &o) const {
    // 先校验识别参数，再调用检测器
    RecognizerRequest req = make_request(o.recognize);
    GroupedBoxes boxes = detect(img.bgr, o.detect);
    if (boxes.empty()) {
        ReadResult empty;
        empty.is_paragraph = o.recognize.paragraph;
        return empty;
    }
    return recognize_boxes(img.grey, boxes, o.recognize, req);
}

ReadResult Reader::read(const cv::Mat &img, const ReadOptions &o) const {
    return read(prepare_image(img), o);
}

ReadResult Reader::read(const std::string &path, const ReadOptions &o) const {
    return read(prepare_image(path), o);
}

std::vector<RecognitionResult> Reader::run_recognizer(const std::vector<LineCrop> &crops,
                                                      const RecognizerRequest &req, int batch_size) const {
    std::vector<RecognitionResult> results;
    results.reserve(crops.size());
    for (size_t begin = 0; begin < crops.size(); begin += (size_t) batch_size) {
        size_t end = std::min(crops.size(), begin + (size_t) batch_size);
        std::vector<LineCrop> batch(crops.begin() + begin, crops.begin() + end);
        std::vector<TextScore> scores = rec_->recognize_batch(batch, req);
        if (scores.size() != batch.size())
            throw OracleFailure("recognizer returned " + std::to_string(scores.size()) + " results for " +
                                std::to_string(batch.size()) + " crops");
        for (size_t i = 0; i < batch.size(); ++i) {
            RecognitionResult r;
            r.box = batch[i].box;
            r.text = std::move(scores[i].text);
            r.confidence = scores[i].confidence;
            r.box_id = batch[i].box_id;
            r.angle = batch[i].angle;
            results.push_back(std::move(r));
        }
    }
    return results;
}

// 置信度过低的行拉伸对比度后重识别，保留更好的结果
void Reader::retry_low_contrast(const std::vector<LineCrop> &crops, std::vector<RecognitionResult> &results,
                                const RecognizeOptions &o, const RecognizerRequest &req) const {
    std::vector<size_t> low;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].confidence < o.contrast_ths)
            low.push_back(i);
    }
    if (low.empty())
        return;

    std::vector<LineCrop> retry;
    retry.reserve(low.size());
    for (size_t i: low) {
        LineCrop c = crops[i];
        // 只拉伸有效区域，补齐部分重新复制
        cv::Mat valid = c.image.colRange(0, std::max(1, c.pad.valid_width)).clone();
        CropNormalizer::adjust_contrast(valid, o.adjust_contrast);
        if (valid.cols < c.pad.padded_width)
            cv::copyMakeBorder(valid, valid, 0, 0, 0, c.pad.padded_width - valid.cols, cv::BORDER_REPLICATE);
        c.image = valid;
        retry.push_back(std::move(c));
    }
    std::vector<RecognitionResult> second = run_recognizer(retry, req, o.batch_size);
    for (size_t k = 0; k < low.size(); ++k) {
        if (second[k].confidence > results[low[k]].confidence)
            results[low[k]] = std::move(second[k]);
    }
    spdlog::debug("contrast pass: {} low-confidence lines retried", low.size());
}

ReadResult Reader::recognize_boxes(const cv::Mat &grey, const GroupedBoxes &boxes, const RecognizeOptions &o,
                                   const RecognizerRequest &req) const {
    std::vector<LineCrop> crops;
    crops.reserve(boxes.size());
    int box_id = 0;
    for (const auto &h: boxes.horizontal) {
        try {
            crops.push_back(normalizer_.rectify(h, grey, box_id));
        } catch (const DegenerateBoxError &e) {
            spdlog::warn("skip box {}: {}", box_id, e.what());
        }
        ++box_id;
    }
    for (const auto &f: boxes.free) {
        try {
            crops.push_back(normalizer_.rectify(f, grey, box_id));
        } catch (const DegenerateBoxError &e) {
            spdlog::warn("skip box {}: {}", box_id, e.what());
        }
        ++box_id;
    }

    ReadResult out;
    out.is_paragraph = o.paragraph;
    if (crops.empty()) {
        spdlog::warn("none of the {} boxes could be cropped", boxes.size());
        return out;
    }

    OrientationEnsemble orientation(o.rotation_info, normalizer_);
    if (orientation.enabled())
        crops = orientation.expand(crops);
    int max_w = CropNormalizer::pad_to_common_width(crops);
    spdlog::debug("recognize: {} crops padded to width {}", crops.size(), max_w);

    std::vector<RecognitionResult> results = run_recognizer(crops, req, o.batch_size);
    if (o.contrast_ths > 0.f)
        retry_low_contrast(crops, results, o, req);
    if (orientation.enabled())
        results = OrientationEnsemble::collapse(results);

    if (profile_.group.rtl) {
        for (auto &r: results)
            r.text = bidi_display(r.text);
    }

    if (!o.paragraph) {
        out.lines = std::move(results);
        return out;
    }
    ParagraphBuilder::Params pp;
    pp.mode = profile_.group.rtl ? ReadingDirection::RightToLeft : ReadingDirection::LeftToRight;
    pp.reorder_rtl = false; // 上面已逐行重排
    out.paragraphs = ParagraphBuilder(pp).build(std::move(results));
    return out;
}
