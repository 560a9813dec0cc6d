#include "charset.h"
#include "errors.h"
#include <unicode/utf8.h>

std::vector<std::string> split_utf8(const std::string &s) {
    std::vector<std::string> out;
    const auto *p = reinterpret_cast<const uint8_t *>(s.data());
    int32_t len = (int32_t) s.size();
    int32_t i = 0;
    while (i < len) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(p, i, len, c);
        if (c < 0)
            continue; // 非法序列直接丢弃
        out.emplace_back(s, (size_t) start, (size_t) (i - start));
    }
    return out;
}

CharSet to_char_set(const std::string &s) {
    auto cps = split_utf8(s);
    return CharSet(cps.begin(), cps.end());
}

CharSet build_ignore_set(const std::vector<std::string> &model_chars, const CharSet &lang_chars,
                         const std::string &allowlist, const std::string &blocklist) {
    if (!allowlist.empty() && !blocklist.empty())
        throw ConfigurationError("allowlist and blocklist cannot be used together");

    CharSet ignore;
    if (!allowlist.empty()) {
        CharSet allow = to_char_set(allowlist);
        bool any = false;
        for (const auto &c: model_chars) {
            if (allow.count(c))
                any = true;
            else
                ignore.insert(c);
        }
        if (!any)
            throw ConfigurationError("allowlist shares no character with the recognition model");
        return ignore;
    }
    if (!blocklist.empty())
        return to_char_set(blocklist);

    for (const auto &c: model_chars) {
        if (!lang_chars.count(c))
            ignore.insert(c);
    }
    return ignore;
}
