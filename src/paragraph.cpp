#include "paragraph.h"
#include "bidi.h"
#include "errors.h"
#include <algorithm>
#include <numeric>

ParagraphBuilder::ParagraphBuilder() : params_() {}

ParagraphBuilder::ParagraphBuilder(const Params &p) : params_(p) {
    if (!(p.row_ths > 0.f))
        throw ConfigurationError("paragraph row_ths must be positive");
}

static inline bool ranges_touch(float a0, float a1, float b0, float b1) {
    return a0 <= b1 && a1 >= b0;
}

std::string ParagraphBuilder::join_group(std::vector<const Item *> members) const {
    float mean_h = 0.f;
    for (const Item *it: members)
        mean_h += it->height;
    mean_h /= (float) members.size();
    bool rtl = params_.mode == ReadingDirection::RightToLeft;

    std::string text;
    bool first_row = true;
    while (!members.empty()) {
        float highest = (*std::min_element(members.begin(), members.end(), [](const Item *a, const Item *b) {
            return a->y_center < b->y_center;
        }))->y_center;

        // 取出当前行，最高的一项总在其中
        std::vector<const Item *> row;
        auto split = std::stable_partition(members.begin(), members.end(), [&](const Item *it) {
            return it->y_center <= highest + params_.row_ths * mean_h;
        });
        row.assign(members.begin(), split);
        members.erase(members.begin(), split);

        std::stable_sort(row.begin(), row.end(), [rtl](const Item *a, const Item *b) {
            return rtl ? a->x1 > b->x1 : a->x0 < b->x0;
        });
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0)
                text += ' ';
            else if (!first_row)
                text += params_.line_separator;
            text += (rtl && params_.reorder_rtl) ? bidi_display(row[i]->text) : row[i]->text;
        }
        first_row = false;
    }
    return text;
}

std::vector<Paragraph> ParagraphBuilder::build(std::vector<RecognitionResult> lines) const {
    std::vector<Item> items;
    items.reserve(lines.size());
    for (const auto &r: lines) {
        cv::Rect2f b = quad_bounds(r.box);
        items.push_back({r.text, b.x, b.x + b.width, b.y, b.y + b.height, b.height, b.y + 0.5f * b.height, 0});
    }
    std::stable_sort(items.begin(), items.end(), [](const Item &a, const Item &b) { return a.y0 < b.y0; });

    // 逐个吸收邻近框，吸收不动时开新组
    int current = 1;
    size_t unassigned = items.size();
    while (unassigned > 0) {
        std::vector<Item *> group;
        for (auto &it: items)
            if (it.group == current)
                group.push_back(&it);

        if (group.empty()) {
            for (auto &it: items) {
                if (it.group == 0) {
                    it.group = current;
                    break;
                }
            }
            --unassigned;
            continue;
        }

        float mean_h = 0.f, gx0 = group[0]->x0, gx1 = group[0]->x1, gy0 = group[0]->y0, gy1 = group[0]->y1;
        for (const Item *g: group) {
            mean_h += g->height;
            gx0 = std::min(gx0, g->x0);
            gx1 = std::max(gx1, g->x1);
            gy0 = std::min(gy0, g->y0);
            gy1 = std::max(gy1, g->y1);
        }
        mean_h /= (float) group.size();
        gx0 -= params_.x_ths * mean_h;
        gx1 += params_.x_ths * mean_h;
        gy0 -= params_.y_ths * mean_h;
        gy1 += params_.y_ths * mean_h;

        bool added = false;
        for (auto &it: items) {
            if (it.group != 0)
                continue;
            if (ranges_touch(it.x0, it.x1, gx0, gx1) && ranges_touch(it.y0, it.y1, gy0, gy1)) {
                it.group = current;
                --unassigned;
                added = true;
                break;
            }
        }
        if (!added)
            ++current;
    }

    std::vector<Paragraph> out;
    for (int g = 1; g <= current; ++g) {
        std::vector<const Item *> members;
        for (const auto &it: items)
            if (it.group == g)
                members.push_back(&it);
        if (members.empty())
            continue;

        float x0 = members[0]->x0, x1 = members[0]->x1, y0 = members[0]->y0, y1 = members[0]->y1;
        for (const Item *m: members) {
            x0 = std::min(x0, m->x0);
            x1 = std::max(x1, m->x1);
            y0 = std::min(y0, m->y0);
            y1 = std::max(y1, m->y1);
        }
        Paragraph p;
        p.box = {cv::Point2f(x0, y0), cv::Point2f(x1, y0), cv::Point2f(x1, y1), cv::Point2f(x0, y1)};
        p.text = join_group(std::move(members));
        out.push_back(std::move(p));
    }
    return out;
}
