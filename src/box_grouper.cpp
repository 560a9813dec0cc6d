#include "box_grouper.h"
#include <algorithm>
#include <cmath>
#include <numeric>

// 斜率分母至少取 10 像素，避免短边把噪声放大
static inline float edge_slope(const cv::Point2f &from, const cv::Point2f &to) {
    return (to.y - from.y) / std::max(10.f, to.x - from.x);
}

BoxGrouper::BoxGrouper() : params_() {}

BoxGrouper::BoxGrouper(const Params &p) : params_(p) {}

bool BoxGrouper::is_horizontal(const Quad &q) const {
    float slope_up = edge_slope(q[0], q[1]);
    float slope_down = edge_slope(q[3], q[2]);
    float s = std::max(std::abs(slope_up), std::abs(slope_down));
    return std::isfinite(s) && s <= params_.slope_ths;
}

FreeBox BoxGrouper::make_free_box(const Quad &q, int source) const {
    float height = seg_len(q[3], q[0]);
    float width = seg_len(q[1], q[0]);
    int margin = (int) (1.44f * params_.add_margin * std::min(width, height));

    // 沿两条对角线方向外扩
    float theta13 = std::abs(std::atan((q[0].y - q[2].y) / std::max(10.f, q[0].x - q[2].x)));
    float theta24 = std::abs(std::atan((q[1].y - q[3].y) / std::max(10.f, q[1].x - q[3].x)));
    float c13 = std::cos(theta13) * margin, s13 = std::sin(theta13) * margin;
    float c24 = std::cos(theta24) * margin, s24 = std::sin(theta24) * margin;

    FreeBox fb;
    fb.points = {cv::Point2f(q[0].x - c13, q[0].y - s13), cv::Point2f(q[1].x + c24, q[1].y - s24),
                 cv::Point2f(q[2].x + c13, q[2].y + s13), cv::Point2f(q[3].x - c24, q[3].y + s24)};
    fb.sources = {source};
    return fb;
}

HorizontalBox BoxGrouper::enclose(const std::vector<Candidate> &members) const {
    float x0 = members[0].x_min, x1 = members[0].x_max;
    float y0 = members[0].y_min, y1 = members[0].y_max;
    HorizontalBox hb;
    for (const auto &c: members) {
        x0 = std::min(x0, c.x_min);
        x1 = std::max(x1, c.x_max);
        y0 = std::min(y0, c.y_min);
        y1 = std::max(y1, c.y_max);
        hb.sources.push_back(c.source);
    }
    std::sort(hb.sources.begin(), hb.sources.end());
    int margin = (int) (params_.add_margin * (y1 - y0));
    hb.x_min = (int) std::floor(x0) - margin;
    hb.x_max = (int) std::ceil(x1) + margin;
    hb.y_min = (int) std::floor(y0) - margin;
    hb.y_max = (int) std::ceil(y1) + margin;
    return hb;
}

// 按中心 y 排序，相邻两框的中心差不超过 ycenter_ths * 两框平均高度 则同行
std::vector<std::vector<BoxGrouper::Candidate>> BoxGrouper::split_lines(std::vector<Candidate> cands) const {
    std::stable_sort(cands.begin(), cands.end(),
                     [](const Candidate &a, const Candidate &b) { return a.y_center < b.y_center; });
    std::vector<std::vector<Candidate>> lines;
    for (size_t i = 0; i < cands.size(); ++i) {
        const Candidate &c = cands[i];
        if (i > 0) {
            const Candidate &prev = cands[i - 1];
            float mh = 0.5f * (c.height + prev.height);
            if (std::abs(c.y_center - prev.y_center) <= params_.ycenter_ths * mh) {
                lines.back().push_back(c);
                continue;
            }
        }
        lines.push_back({c});
    }
    return lines;
}

// 行内任意两框高度相近且水平间隙足够小即相连，取连通分量
// 阈值变大或行变宽都只会增加连边，分组只会变粗
std::vector<std::vector<BoxGrouper::Candidate>> BoxGrouper::split_words(std::vector<Candidate> line) const {
    std::stable_sort(line.begin(), line.end(), [](const Candidate &a, const Candidate &b) { return a.x_min < b.x_min; });
    const size_t n = line.size();
    std::vector<size_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);
    auto root = [&parent](size_t i) {
        while (parent[i] != i)
            i = parent[i] = parent[parent[i]];
        return i;
    };

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const Candidate &a = line[i], &b = line[j];
            float mh = 0.5f * (a.height + b.height);
            bool same_height = std::abs(a.height - b.height) <= params_.height_ths * mh;
            float gap = std::max(a.x_min, b.x_min) - std::min(a.x_max, b.x_max);
            bool close_enough = gap <= params_.width_ths * mh;
            if (same_height && close_enough) {
                size_t ra = root(i), rb = root(j);
                // 根取较小下标，保证分组按最左框排序
                if (ra != rb)
                    parent[std::max(ra, rb)] = std::min(ra, rb);
            }
        }
    }

    std::vector<std::vector<Candidate>> groups;
    std::vector<int> slot(n, -1);
    for (size_t i = 0; i < n; ++i) {
        size_t r = root(i);
        if (slot[r] < 0) {
            slot[r] = (int) groups.size();
            groups.emplace_back();
        }
        groups[slot[r]].push_back(line[i]);
    }
    return groups;
}

GroupedBoxes BoxGrouper::group(const std::vector<RawRegion> &regions) const {
    GroupedBoxes out;
    std::vector<Candidate> cands;
    cands.reserve(regions.size());

    for (int i = 0; i < (int) regions.size(); ++i) {
        Quad q = region_quad(regions[i].points);
        if (!is_horizontal(q)) {
            out.free.push_back(make_free_box(q, i));
            continue;
        }
        cv::Rect2f r = quad_bounds(q);
        cands.push_back({r.x, r.x + r.width, r.y, r.y + r.height, r.y + 0.5f * r.height, r.height, i});
    }

    if (!params_.merge_horizontal) {
        for (const auto &c: cands)
            out.horizontal.push_back(enclose({c}));
        return out;
    }

    for (auto &line: split_lines(std::move(cands))) {
        for (auto &members: split_words(std::move(line)))
            out.horizontal.push_back(enclose(members));
    }
    return out;
}
