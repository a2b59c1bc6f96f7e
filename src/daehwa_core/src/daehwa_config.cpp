#include "daehwa_config.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Daehwa {

std::string normalizeLocale(const std::string& locale) {
    std::string result = locale;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    return result;
}

// --- 기본 로케일 테이블 ---
EngineConfig EngineConfig::defaults() {
    EngineConfig config;

    auto format = [](const char* sep, const char* orWord, const char* orMore) {
        ChoiceFormat f;
        f.separator = sep;
        f.inlineOr = orWord;
        f.inlineOrMore = orMore;
        f.includeNumbers = true;
        return f;
    };
    config.choiceFormats["es"] = format(", ", " o ", ", o ");
    config.choiceFormats["nl"] = format(", ", " of ", ", of ");
    config.choiceFormats["en"] = format(", ", " or ", ", or ");
    config.choiceFormats["fr"] = format(", ", " ou ", ", ou ");
    config.choiceFormats["de"] = format(", ", " oder ", ", oder ");
    config.choiceFormats["ja"] = format("、 ", " または ", "、 または ");
    config.choiceFormats["pt"] = format(", ", " ou ", ", ou ");
    config.choiceFormats["zh"] = format("， ", " 要么 ", "， 要么 ");

    auto words = [](std::vector<std::string> yes, std::vector<std::string> no,
                    const char* yesLabel, const char* noLabel) {
        ConfirmWords w;
        w.yes = std::move(yes);
        w.no = std::move(no);
        w.yesLabel = yesLabel;
        w.noLabel = noLabel;
        return w;
    };
    config.confirmWords["en"] = words({"yes", "y", "yep", "yeah", "sure", "ok", "true"},
                                      {"no", "n", "nope", "nah", "false"}, "Yes", "No");
    config.confirmWords["es"] = words({"sí", "si"}, {"no"}, "Sí", "No");
    config.confirmWords["nl"] = words({"ja"}, {"nee"}, "Ja", "Nee");
    config.confirmWords["fr"] = words({"oui"}, {"non"}, "Oui", "Non");
    config.confirmWords["de"] = words({"ja"}, {"nein"}, "Ja", "Nein");
    config.confirmWords["ja"] = words({"はい"}, {"いいえ"}, "はい", "いいえ");
    config.confirmWords["pt"] = words({"sim"}, {"não", "nao"}, "Sim", "Não");
    config.confirmWords["zh"] = words({"是", "是的"}, {"不"}, "是的", "不");
    return config;
}

// --- 로케일 조회 ---
template <typename T>
static const T* lookupLocale(const std::map<std::string, T>& table,
                             const std::string& locale, const std::string& defaultLocale) {
    std::string key = normalizeLocale(locale);
    auto it = table.find(key);
    if (it != table.end()) return &it->second;

    auto dash = key.find('-');
    if (dash != std::string::npos) {
        it = table.find(key.substr(0, dash));
        if (it != table.end()) return &it->second;
    }

    std::string def = normalizeLocale(defaultLocale);
    if (def != key) {
        it = table.find(def);
        if (it != table.end()) return &it->second;
        dash = def.find('-');
        if (dash != std::string::npos) {
            it = table.find(def.substr(0, dash));
            if (it != table.end()) return &it->second;
        }
    }

    it = table.find("en");
    if (it != table.end()) return &it->second;
    return nullptr;
}

const ChoiceFormat& EngineConfig::choiceFormatFor(const std::string& locale) const {
    static const ChoiceFormat fallback;
    const ChoiceFormat* f = lookupLocale(choiceFormats, locale, defaultLocale);
    return f ? *f : fallback;
}

const ConfirmWords& EngineConfig::confirmWordsFor(const std::string& locale) const {
    static const ConfirmWords fallback = [] {
        ConfirmWords w;
        w.yes = {"yes"};
        w.no = {"no"};
        return w;
    }();
    const ConfirmWords* w = lookupLocale(confirmWords, locale, defaultLocale);
    return w ? *w : fallback;
}

// --- 설정 파일 로드 ---
static bool applyConfigJson(const json& root, EngineConfig& config, std::string& error) {
    if (!root.is_object()) {
        error = "config root must be an object";
        return false;
    }

    if (root.contains("defaultLocale")) {
        config.defaultLocale = normalizeLocale(root["defaultLocale"].get<std::string>());
    }
    if (root.contains("recognizerThreshold")) {
        config.recognizerThreshold = root["recognizerThreshold"].get<double>();
    }
    if (root.contains("maxStepsPerTurn")) {
        int64_t maxSteps = root["maxStepsPerTurn"].get<int64_t>();
        if (maxSteps <= 0) {
            error = "maxStepsPerTurn must be positive";
            return false;
        }
        config.maxStepsPerTurn = static_cast<size_t>(maxSteps);
    }

    if (root.contains("choiceFormats")) {
        const auto& formats = root["choiceFormats"];
        if (!formats.is_object()) {
            error = "choiceFormats must be an object";
            return false;
        }
        for (auto it = formats.begin(); it != formats.end(); ++it) {
            ChoiceFormat f = config.choiceFormatFor(it.key());
            const auto& entry = it.value();
            f.separator = entry.value("separator", f.separator);
            f.inlineOr = entry.value("or", f.inlineOr);
            f.inlineOrMore = entry.value("orMore", f.inlineOrMore);
            f.includeNumbers = entry.value("includeNumbers", f.includeNumbers);
            config.choiceFormats[normalizeLocale(it.key())] = f;
        }
    }

    if (root.contains("confirmWords")) {
        const auto& table = root["confirmWords"];
        if (!table.is_object()) {
            error = "confirmWords must be an object";
            return false;
        }
        for (auto it = table.begin(); it != table.end(); ++it) {
            ConfirmWords w;
            const auto& entry = it.value();
            w.yes = entry.value("yes", std::vector<std::string>{});
            w.no = entry.value("no", std::vector<std::string>{});
            w.yesLabel = entry.value("yesLabel", std::string("Yes"));
            w.noLabel = entry.value("noLabel", std::string("No"));
            if (w.yes.empty() || w.no.empty()) {
                error = "confirmWords." + it.key() + " needs both 'yes' and 'no' lists";
                return false;
            }
            config.confirmWords[normalizeLocale(it.key())] = std::move(w);
        }
    }

    if (root.contains("settings")) {
        if (!root["settings"].is_object()) {
            error = "settings must be an object";
            return false;
        }
        config.settings = root["settings"];
    }
    return true;
}

bool loadConfigString(const std::string& source, EngineConfig& config, std::string& error) {
    EngineConfig updated = config;
    try {
        json root = json::parse(source);
        if (!applyConfigJson(root, updated, error)) return false;
    } catch (const json::exception& e) {
        error = std::string("invalid config: ") + e.what();
        return false;
    }
    config = std::move(updated);
    return true;
}

bool loadConfigFile(const std::string& path, EngineConfig& config, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "cannot open config file: " + path;
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    if (!loadConfigString(ss.str(), config, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace Daehwa
