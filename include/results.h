#pragma once
#include <string>
#include <vector>
#include "geometry.h"

struct RecognitionResult {
    Quad box;
    std::string text;
    float confidence{0.f};
    int box_id{-1};
    int angle{0};
};

struct Paragraph {
    Quad box;
    std::string text;
};

// detail 模式下二选一：逐行结果或段落
struct ReadResult {
    std::vector<RecognitionResult> lines;
    std::vector<Paragraph> paragraphs;
    bool is_paragraph{false};

    std::vector<std::string> texts() const;
};
