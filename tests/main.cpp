#include <cstdlib>
#include <iostream>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include "errors.h"
#include "reader.h"

static void usage() {
    std::cerr << "usage: lineocr_demo <image> --lang en[,fr] [--models DIR] [--chars DIR] [--gpu]\n"
                 "                    [--detail 0|1] [--paragraph] [--rotation 90,180,270]\n"
                 "                    [--decoder greedy|beamsearch] [--vis out.jpg] [--verbose]\n";
}

static std::vector<std::string> split_list(const std::string &s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ','))
        if (!item.empty())
            out.push_back(item);
    return out;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        usage();
        return 2;
    }

    std::string image_path;
    std::string vis_path;
    int detail = 1;
    Reader::Config cfg;
    cfg.gpu = false;
    ReadOptions opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                usage();
                std::exit(2);
            }
            return argv[++i];
        };
        if (a == "--lang")
            cfg.lang_list = split_list(next());
        else if (a == "--models")
            cfg.model_dir = next();
        else if (a == "--chars")
            cfg.char_dir = next();
        else if (a == "--gpu")
            cfg.gpu = true;
        else if (a == "--detail")
            detail = std::atoi(next().c_str());
        else if (a == "--paragraph")
            opt.recognize.paragraph = true;
        else if (a == "--rotation") {
            for (const auto &s: split_list(next()))
                opt.recognize.rotation_info.push_back(std::atoi(s.c_str()));
        } else if (a == "--decoder")
            opt.recognize.decoder = next();
        else if (a == "--vis")
            vis_path = next();
        else if (a == "--verbose")
            spdlog::set_level(spdlog::level::debug);
        else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "unknown option " << a << "\n";
            usage();
            return 2;
        } else
            image_path = a;
    }
    if (image_path.empty()) {
        usage();
        return 2;
    }

    try {
        Reader reader(cfg);
        PreparedImage img = prepare_image(image_path);
        ReadResult result = reader.read(img, opt);

        if (detail == 0) {
            for (const auto &t: result.texts())
                std::cout << t << "\n";
        } else if (result.is_paragraph) {
            for (const auto &p: result.paragraphs)
                std::cout << p.text << "\n";
        } else {
            for (const auto &l: result.lines)
                std::cout << l.text << "  score=" << l.confidence << "\n";
        }

        if (!vis_path.empty()) {
            cv::Mat vis = img.bgr.clone();
            auto draw = [&vis](const Quad &q) {
                for (int i = 0; i < 4; ++i)
                    cv::line(vis, q[i], q[(i + 1) % 4], {0, 255, 0}, 2);
            };
            for (const auto &l: result.lines)
                draw(l.box);
            for (const auto &p: result.paragraphs)
                draw(p.box);
            cv::imwrite(vis_path, vis);
            std::cout << "Saved to " << vis_path << "\n";
        }
        std::cout << "texts=" << result.texts().size() << " (GPU=" << (cfg.gpu ? "on" : "off") << ")\n";
    } catch (const ConfigurationError &e) {
        spdlog::error("configuration: {}", e.what());
        return 2;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
