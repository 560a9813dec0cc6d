#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <optional>
#include "errors.h"
#include "reader.h"

namespace py = pybind11;

// numpy 数组按 OpenCV 习惯视为 BGR(A) / 灰度
static PreparedImage to_prepared(const py::object& image) {
    // py::str 的类型检查也接受 bytes，先判断 bytes
    if (py::isinstance<py::bytes>(image)) {
        std::string raw = image.cast<std::string>();
        return prepare_image(std::vector<uchar>(raw.begin(), raw.end()));
    }
    if (py::isinstance<py::str>(image))
        return prepare_image(image.cast<std::string>());
    auto arr = py::array_t<uint8_t, py::array::c_style | py::array::forcecast>::ensure(image);
    if (!arr)
        throw py::type_error("image must be a path, bytes or a numpy uint8 array");
    if (arr.ndim() != 2 && arr.ndim() != 3)
        throw py::value_error("image array must be HxW or HxWxC");
    int rows = (int) arr.shape(0), cols = (int) arr.shape(1);
    int ch = arr.ndim() == 3 ? (int) arr.shape(2) : 1;
    cv::Mat view(rows, cols, CV_8UC(ch), const_cast<uint8_t*>(arr.data()));
    return prepare_image(view); // 内部会拷贝
}

static py::list quad_to_py(const Quad& q) {
    py::list pts;
    for (const auto& p : q)
        pts.append(py::make_tuple(p.x, p.y));
    return pts;
}

static py::list result_to_py(const ReadResult& r, int detail) {
    py::list out;
    if (detail == 0) {
        for (const auto& t : r.texts())
            out.append(py::str(t));
        return out;
    }
    if (r.is_paragraph) {
        for (const auto& p : r.paragraphs)
            out.append(py::make_tuple(quad_to_py(p.box), p.text));
    } else {
        for (const auto& l : r.lines)
            out.append(py::make_tuple(quad_to_py(l.box), l.text, l.confidence));
    }
    return out;
}

static RecognizeOptions recognize_options(const std::string& decoder, int beam_width, int batch_size,
                                          const std::optional<std::string>& allowlist,
                                          const std::optional<std::string>& blocklist,
                                          const std::optional<std::vector<int>>& rotation_info, bool paragraph,
                                          float contrast_ths, float adjust_contrast) {
    RecognizeOptions o;
    o.decoder = decoder;
    o.beam_width = beam_width;
    o.batch_size = batch_size;
    o.allowlist = allowlist.value_or("");
    o.blocklist = blocklist.value_or("");
    o.rotation_info = rotation_info.value_or(std::vector<int>());
    o.paragraph = paragraph;
    o.contrast_ths = contrast_ths;
    o.adjust_contrast = adjust_contrast;
    return o;
}

static DetectOptions detect_options(int min_size, float text_threshold, float low_text, float link_threshold,
                                    int canvas_size, float mag_ratio, float slope_ths, float ycenter_ths,
                                    float height_ths, float width_ths, float add_margin,
                                    const std::optional<int>& optimal_num_chars) {
    DetectOptions o;
    o.min_size = min_size;
    o.text_threshold = text_threshold;
    o.low_text = low_text;
    o.link_threshold = link_threshold;
    o.canvas_size = canvas_size;
    o.mag_ratio = mag_ratio;
    o.slope_ths = slope_ths;
    o.ycenter_ths = ycenter_ths;
    o.height_ths = height_ths;
    o.width_ths = width_ths;
    o.add_margin = add_margin;
    o.optimal_num_chars = optimal_num_chars.value_or(-1);
    return o;
}

PYBIND11_MODULE(lineocr, m) {
    m.doc() = "Line OCR: CRAFT detection + CTC line recognition";

    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<DegenerateBoxError>(m, "DegenerateBoxError");
    py::register_exception<OracleFailure>(m, "OracleFailure");

    py::class_<Reader>(m, "Reader")
        .def(py::init([](std::vector<std::string> lang_list, bool gpu,
                         std::optional<std::filesystem::path> model_storage_directory,
                         std::optional<std::filesystem::path> character_directory, bool detector, bool recognizer) {
                 Reader::Config cfg;
                 cfg.lang_list = std::move(lang_list);
                 cfg.gpu = gpu;
                 if (model_storage_directory)
                     cfg.model_dir = *model_storage_directory;
                 if (character_directory)
                     cfg.char_dir = *character_directory;
                 cfg.detector = detector;
                 cfg.recognizer = recognizer;
                 return std::make_unique<Reader>(cfg);
             }),
             py::arg("lang_list"), py::arg("gpu") = true, py::arg("model_storage_directory") = py::none(),
             py::arg("character_directory") = py::none(), py::arg("detector") = true, py::arg("recognizer") = true)
        .def_property_readonly("lang_list", [](const Reader& r) { return r.profile().lang_list; })
        .def_property_readonly("model_lang", [](const Reader& r) { return r.profile().group.key; })
        .def("detect",
             [](const Reader& r, const py::object& image, int min_size, float text_threshold, float low_text,
                float link_threshold, int canvas_size, float mag_ratio, float slope_ths, float ycenter_ths,
                float height_ths, float width_ths, float add_margin, std::optional<int> optimal_num_chars) {
                 PreparedImage img = to_prepared(image);
                 DetectOptions o = detect_options(min_size, text_threshold, low_text, link_threshold, canvas_size,
                                                  mag_ratio, slope_ths, ycenter_ths, height_ths, width_ths,
                                                  add_margin, optimal_num_chars);
                 GroupedBoxes boxes;
                 {
                     py::gil_scoped_release release;
                     boxes = r.detect(img.bgr, o);
                 }
                 py::list horizontal, free_boxes;
                 for (const auto& h : boxes.horizontal)
                     horizontal.append(py::make_tuple(h.x_min, h.x_max, h.y_min, h.y_max));
                 for (const auto& f : boxes.free)
                     free_boxes.append(quad_to_py(f.points));
                 return py::make_tuple(horizontal, free_boxes);
             },
             py::arg("image"), py::arg("min_size") = 20, py::arg("text_threshold") = 0.7f,
             py::arg("low_text") = 0.4f, py::arg("link_threshold") = 0.4f, py::arg("canvas_size") = 2560,
             py::arg("mag_ratio") = 1.f, py::arg("slope_ths") = 0.1f, py::arg("ycenter_ths") = 0.5f,
             py::arg("height_ths") = 0.5f, py::arg("width_ths") = 0.5f, py::arg("add_margin") = 0.1f,
             py::arg("optimal_num_chars") = py::none())
        .def("recognize",
             [](const Reader& r, const py::object& image,
                std::optional<std::vector<std::array<int, 4>>> horizontal_list,
                std::optional<std::vector<std::vector<std::array<float, 2>>>> free_list, int detail,
                const std::string& decoder, int beam_width, int batch_size, std::optional<std::string> allowlist,
                std::optional<std::string> blocklist, std::optional<std::vector<int>> rotation_info,
                bool paragraph, float contrast_ths, float adjust_contrast) {
                 PreparedImage img = to_prepared(image);
                 RecognizeOptions o = recognize_options(decoder, beam_width, batch_size, allowlist, blocklist,
                                                        rotation_info, paragraph, contrast_ths, adjust_contrast);
                 GroupedBoxes boxes;
                 if (horizontal_list) {
                     for (const auto& h : *horizontal_list) {
                         HorizontalBox hb;
                         hb.x_min = h[0];
                         hb.x_max = h[1];
                         hb.y_min = h[2];
                         hb.y_max = h[3];
                         boxes.horizontal.push_back(hb);
                     }
                 }
                 if (free_list) {
                     for (const auto& pts : *free_list) {
                         std::vector<cv::Point2f> poly;
                         for (const auto& p : pts)
                             poly.emplace_back(p[0], p[1]);
                         if (poly.size() < 4)
                             throw py::value_error("free box needs at least 4 points");
                         FreeBox fb;
                         fb.points = region_quad(poly);
                         boxes.free.push_back(fb);
                     }
                 }
                 ReadResult res;
                 {
                     py::gil_scoped_release release;
                     if (!horizontal_list && !free_list)
                         res = r.recognize(img.grey, o);
                     else
                         res = r.recognize(img.grey, boxes, o);
                 }
                 return result_to_py(res, detail);
             },
             py::arg("image"), py::arg("horizontal_list") = py::none(), py::arg("free_list") = py::none(),
             py::arg("detail") = 1, py::arg("decoder") = "greedy", py::arg("beamWidth") = 5,
             py::arg("batch_size") = 1, py::arg("allowlist") = py::none(), py::arg("blocklist") = py::none(),
             py::arg("rotation_info") = py::none(), py::arg("paragraph") = false, py::arg("contrast_ths") = 0.1f,
             py::arg("adjust_contrast") = 0.5f)
        .def("readtext",
             [](const Reader& r, const py::object& image, int detail, const std::string& decoder, int beam_width,
                int batch_size, std::optional<std::string> allowlist, std::optional<std::string> blocklist,
                std::optional<std::vector<int>> rotation_info, bool paragraph, int min_size, float contrast_ths,
                float adjust_contrast, float text_threshold, float low_text, float link_threshold, int canvas_size,
                float mag_ratio, float slope_ths, float ycenter_ths, float height_ths, float width_ths,
                float add_margin, std::optional<int> optimal_num_chars) {
                 PreparedImage img = to_prepared(image);
                 ReadOptions o;
                 o.detect = detect_options(min_size, text_threshold, low_text, link_threshold, canvas_size,
                                           mag_ratio, slope_ths, ycenter_ths, height_ths, width_ths, add_margin,
                                           optimal_num_chars);
                 o.recognize = recognize_options(decoder, beam_width, batch_size, allowlist, blocklist,
                                                 rotation_info, paragraph, contrast_ths, adjust_contrast);
                 ReadResult res;
                 {
                     py::gil_scoped_release release;
                     res = r.read(img, o);
                 }
                 return result_to_py(res, detail);
             },
             py::arg("image"), py::arg("detail") = 1, py::arg("decoder") = "greedy", py::arg("beamWidth") = 5,
             py::arg("batch_size") = 1, py::arg("allowlist") = py::none(), py::arg("blocklist") = py::none(),
             py::arg("rotation_info") = py::none(), py::arg("paragraph") = false, py::arg("min_size") = 20,
             py::arg("contrast_ths") = 0.1f, py::arg("adjust_contrast") = 0.5f, py::arg("text_threshold") = 0.7f,
             py::arg("low_text") = 0.4f, py::arg("link_threshold") = 0.4f, py::arg("canvas_size") = 2560,
             py::arg("mag_ratio") = 1.f, py::arg("slope_ths") = 0.1f, py::arg("ycenter_ths") = 0.5f,
             py::arg("height_ths") = 0.5f, py::arg("width_ths") = 0.5f, py::arg("add_margin") = 0.1f,
             py::arg("optimal_num_chars") = py::none());
}
