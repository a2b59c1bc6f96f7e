#pragma once
#include "daehwa_memory.h"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace Daehwa {

// 선택지 인라인 목록 서식 ("(1) red, (2) green, or (3) blue")
struct ChoiceFormat {
    std::string separator = ", ";
    std::string inlineOr = " or ";
    std::string inlineOrMore = ", or ";
    bool includeNumbers = true;
};

struct ConfirmWords {
    std::vector<std::string> yes;
    std::vector<std::string> no;
    std::string yesLabel = "Yes";
    std::string noLabel = "No";
};

// --- 엔진 설정 (생성 후 불변) ---
struct EngineConfig {
    std::string defaultLocale = "en-us";
    double recognizerThreshold = 0.5;
    size_t maxStepsPerTurn = 1000;

    // 로케일 키는 소문자 ("en-us", "en", "ja" ...)
    std::map<std::string, ChoiceFormat> choiceFormats;
    std::map<std::string, ConfirmWords> confirmWords;

    // settings 스코프 (읽기 전용)
    Value settings = Value::object();

    static EngineConfig defaults();

    // 정확한 로케일 → 언어 접두어 → defaultLocale → "en" 순으로 조회
    const ChoiceFormat& choiceFormatFor(const std::string& locale) const;
    const ConfirmWords& confirmWordsFor(const std::string& locale) const;
};

// JSON 파일/문자열을 기본값 위에 덮어쓴다.
bool loadConfigFile(const std::string& path, EngineConfig& config, std::string& error);
bool loadConfigString(const std::string& source, EngineConfig& config, std::string& error);

std::string normalizeLocale(const std::string& locale);

} // namespace Daehwa
