#include "languages.h"
#include "errors.h"
#include <algorithm>
#include <fstream>
#include <set>
#include <spdlog/spdlog.h>

const char *const kNumberChars = "0123456789";
const char *const kSymbolChars = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~ \xE2\x82\xAC";

const std::vector<LanguageGroup> &language_groups() {
    static const std::vector<LanguageGroup> groups = {
        {"thai", "thai", {"th"}, false, false, {"\xC2\xA2", "\xC2\xA3", "\xC2\xA4", "\xC2\xA5"}},
        {"chinese_tra", "chinese", {"ch_tra"}, false, true, {}},
        {"chinese_sim", "chinese_sim", {"ch_sim"}, false, true, {}},
        {"japanese", "japanese", {"ja"}, false, true, {}},
        {"korean", "korean", {"ko"}, false, true, {}},
        {"tamil", "tamil", {"ta"}, false, false, {}},
        {"telugu", "telugu", {"te"}, false, false, {}},
        {"kannada", "kannada", {"kn"}, false, false, {}},
        {"bengali", "bengali", {"bn", "as", "mni"}, false, false, {}},
        {"arabic", "arabic", {"ar", "fa", "ug", "ur"}, true, false, {}},
        {"devanagari", "devanagari",
         {"hi", "mr", "ne", "bh", "mai", "ang", "bho", "mah", "sck", "new", "gom", "sa", "bgc"}, false, false, {}},
        {"cyrillic", "cyrillic",
         {"ru", "rs_cyrillic", "be", "bg", "uk", "mn", "abq", "ady", "kbd", "ava", "dar", "inh", "che", "lbe", "lez",
          "tab", "tjk"},
         false, false, {}},
        {"latin", "latin",
         {"af", "az", "bs", "cs", "cy", "da", "de", "en", "es", "et", "fr", "ga", "hr", "hu", "id", "is", "it",
          "ku", "la", "lt", "lv", "mi", "ms", "mt", "nl", "no", "oc", "pi", "pl", "pt", "ro", "rs_latin", "sk",
          "sl", "sq", "sv", "sw", "tl", "tr", "uz", "vi"},
         false, false, {}},
    };
    return groups;
}

static bool group_has(const LanguageGroup &g, const std::string &lang) {
    return lang == "en" || std::find(g.languages.begin(), g.languages.end(), lang) != g.languages.end();
}

const LanguageGroup &select_language_group(const std::vector<std::string> &lang_list) {
    const auto &groups = language_groups();
    if (lang_list.empty())
        throw ConfigurationError("lang_list is empty");

    std::string unknown;
    for (const auto &lang: lang_list) {
        bool known = std::any_of(groups.begin(), groups.end(), [&](const LanguageGroup &g) { return group_has(g, lang); });
        if (!known)
            unknown += (unknown.empty() ? "" : ", ") + lang;
    }
    if (!unknown.empty())
        throw ConfigurationError("{" + unknown + "} is not supported");

    for (const auto &g: groups) {
        bool hit = std::any_of(lang_list.begin(), lang_list.end(), [&](const std::string &l) {
            return l != "en" && group_has(g, l);
        });
        if (!hit && g.key != "latin")
            continue;
        for (const auto &lang: lang_list) {
            if (group_has(g, lang))
                continue;
            std::string hint;
            for (const auto &l: g.languages)
                hint += "\"" + l + "\",";
            throw ConfigurationError(g.key + " is only compatible with English, try lang_list=[" + hint + "\"en\"]");
        }
        return g;
    }
    throw ConfigurationError("no recognition model covers the requested languages");
}

std::vector<std::string> load_keys(const std::filesystem::path &path) {
    std::ifstream ifs(path);
    if (!ifs)
        throw ConfigurationError("cannot open character file " + path.string());
    std::vector<std::string> ks;
    std::string line;
    bool first = true;
    while (std::getline(ifs, line)) {
        if (first && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);
        first = false;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            ks.push_back(line);
    }
    return ks;
}

LanguageProfile load_language_profile(const std::vector<std::string> &lang_list, const std::filesystem::path &char_dir,
                                      const std::filesystem::path &model_dir) {
    LanguageProfile prof;
    prof.group = select_language_group(lang_list);
    prof.lang_list = lang_list;

    // 模型字典：每行一个字符
    auto keys = load_keys(model_dir / (prof.group.model_id + ".txt"));
    for (const auto &k: keys) {
        for (auto &c: split_utf8(k))
            prof.model_chars.push_back(std::move(c));
    }
    if (prof.model_chars.empty())
        throw ConfigurationError("character list of model '" + prof.group.model_id + "' is empty");

    prof.lang_chars = to_char_set(std::string(kNumberChars) + kSymbolChars);
    for (const auto &lang: lang_list) {
        for (const auto &line: load_keys(char_dir / (lang + "_char.txt"))) {
            for (auto &c: split_utf8(line))
                prof.lang_chars.insert(std::move(c));
        }
    }
    spdlog::info("language group '{}' ({} model chars, {} native chars)", prof.group.key, prof.model_chars.size(),
                 prof.lang_chars.size());
    return prof;
}
