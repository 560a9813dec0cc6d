#pragma once
#include <string>

// 逻辑顺序 -> 显示顺序（UTF-8）。段落方向由第一个强方向字符决定，默认 LTR；
// 内嵌的 LTR 片段（拉丁字母、数字）保持原有顺序
std::string bidi_display(const std::string& logical);
