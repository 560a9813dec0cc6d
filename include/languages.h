#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "charset.h"

// 一个识别模型覆盖的语言组
struct LanguageGroup {
    std::string key;
    std::string model_id;                // <model_dir>/<model_id>.onnx 与 <model_id>.txt
    std::vector<std::string> languages;  // 与 en 一起可用的语言
    bool rtl{false};
    bool greedy_only{false};             // 大字符集模型只做贪心解码
    std::vector<std::string> separators; // 模型保留的分词符，解码时去掉
};

// 按优先级排列，latin 在最后兜底
const std::vector<LanguageGroup>& language_groups();

// 语言不存在或组合不兼容时抛 ConfigurationError
const LanguageGroup& select_language_group(const std::vector<std::string>& lang_list);

// 构造后只读
struct LanguageProfile {
    LanguageGroup group;
    std::vector<std::string> lang_list;
    std::vector<std::string> model_chars; // 不含 blank
    CharSet lang_chars;                   // 各语言本地字符 + 数字 + 符号
};

LanguageProfile load_language_profile(const std::vector<std::string>& lang_list,
                                      const std::filesystem::path& char_dir,
                                      const std::filesystem::path& model_dir);

// 每行一个条目，去掉 BOM 与 \r
std::vector<std::string> load_keys(const std::filesystem::path& path);

extern const char* const kNumberChars;
extern const char* const kSymbolChars;
