#pragma once
#include "daehwa_memory.h"
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace Daehwa {

struct RecognizerResult {
    std::string intent;        // 비어 있으면 인식 실패
    double score = 0.0;
    Value entities = Value::object();
};

// --- 인식기 인터페이스 ---
class Recognizer {
public:
    virtual ~Recognizer() = default;
    virtual RecognizerResult recognize(const std::string& utterance,
                                       const std::string& locale) const = 0;
};

// --- 정규식 인식기: 등록 순서대로 검사, 첫 매치가 score 1.0 ---
class RegexRecognizer : public Recognizer {
public:
    // "(?i)" 접두어는 대소문자 무시로 변환. 잘못된 패턴이면 false.
    bool addIntent(const std::string& intent, const std::string& pattern, std::string* error = nullptr);
    size_t size() const { return patterns_.size(); }

    RecognizerResult recognize(const std::string& utterance,
                               const std::string& locale) const override;

    // 컴파일러 검증용
    static bool compilePattern(const std::string& pattern, std::regex& out, std::string* error);

private:
    std::vector<std::pair<std::string, std::regex>> patterns_;
};

} // namespace Daehwa
