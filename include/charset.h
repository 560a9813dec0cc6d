#pragma once
#include <set>
#include <string>
#include <vector>

// 以 UTF-8 编码的单个码点为元素
using CharSet = std::set<std::string>;

std::vector<std::string> split_utf8(const std::string& s);
CharSet to_char_set(const std::string& s);

// 识别时需要屏蔽的字符：
//   allowlist 非空 -> 模型字符集 - allowlist
//   blocklist 非空 -> blocklist
//   否则          -> 模型字符集 - 语言本地字符
CharSet build_ignore_set(const std::vector<std::string>& model_chars, const CharSet& lang_chars,
                         const std::string& allowlist, const std::string& blocklist);
