#pragma once
#include <vector>
#include "geometry.h"

// 把检测到的原始区域分成水平行框与自由四边形框
class BoxGrouper {
public:
    struct Params {
        float slope_ths   = 0.1f;  // 上/下边斜率阈值，超过则视为自由框
        float ycenter_ths = 0.5f;  // 行中心差 / 平均高度
        float height_ths  = 0.5f;  // 高度差 / 平均高度
        float width_ths   = 0.5f;  // 水平间隙 / 平均高度
        float add_margin  = 0.1f;  // 外扩比例（相对框高）
        bool  merge_horizontal = true;
    };

    BoxGrouper();
    explicit BoxGrouper(const Params& p);
    GroupedBoxes group(const std::vector<RawRegion>& regions) const;

private:
    struct Candidate {
        float x_min, x_max, y_min, y_max;
        float y_center, height;
        int source;
    };

    Params params_;
    bool is_horizontal(const Quad& q) const;
    FreeBox make_free_box(const Quad& q, int source) const;
    HorizontalBox enclose(const std::vector<Candidate>& members) const;
    std::vector<std::vector<Candidate>> split_lines(std::vector<Candidate> cands) const;
    std::vector<std::vector<Candidate>> split_words(std::vector<Candidate> line) const;
};
