#pragma once
#include <string>
#include <vector>
#include "results.h"

enum class ReadingDirection { LeftToRight, RightToLeft };

// 按空间邻近把识别出的行合并成段落
class ParagraphBuilder {
public:
    struct Params {
        float x_ths = 1.0f;   // 水平扩展 / 平均行高
        float y_ths = 0.5f;   // 垂直扩展 / 平均行高
        float row_ths = 0.4f; // 同一行判定：中心差 / 平均行高
        ReadingDirection mode = ReadingDirection::LeftToRight;
        std::string line_separator = " ";
        bool reorder_rtl = true; // rtl 模式下对每行做双向重排
    };

    ParagraphBuilder();
    explicit ParagraphBuilder(const Params& p);
    std::vector<Paragraph> build(std::vector<RecognitionResult> lines) const;

private:
    struct Item {
        std::string text;
        float x0, x1, y0, y1;
        float height, y_center;
        int group;
    };

    Params params_;
    std::string join_group(std::vector<const Item*> members) const;
};
