#pragma once
#include "daehwa_generated.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Daehwa {

// --- 봇 정의(JSON) → .dhb 컴파일러 ---
class Compiler {
public:
    // .json 파일을 파싱하여 내부 BotT 객체 생성
    bool parse(const std::string& filepath);

    // 문자열에서 직접 파싱 (테스트 / 임베딩용)
    bool parseString(const std::string& source, const std::string& filename = "<string>");

    // 파싱된 결과를 .dhb 바이너리로 저장
    bool compile(const std::string& outputPath);

    // 파싱된 결과를 메모리 버퍼로 컴파일. 에러가 있으면 빈 버퍼.
    std::vector<uint8_t> compileToBuffer();

    // 첫 번째 에러
    const std::string& getError() const { return error_; }

    // 수집된 모든 에러 ("<file>:<json path>: message")
    const std::vector<std::string>& getErrors() const { return errors_; }
    bool hasErrors() const { return !errors_.empty(); }

    // 경고 (컴파일은 성공)
    const std::vector<std::string>& getWarnings() const { return warnings_; }
    bool hasWarnings() const { return !warnings_.empty(); }

    const ICPDev::Daehwa::Schema::BotT& getBot() const { return bot_; }

private:
    using json = nlohmann::json;

    ICPDev::Daehwa::Schema::BotT bot_;
    std::string error_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    std::string filename_;

    // 다이얼로그 참조 (begin/replaceDialog): 대상 id, JSON 경로, 참조하는 다이얼로그
    struct DialogRef {
        std::string target;
        std::string path;
        std::string from;
    };
    std::vector<DialogRef> dialogRefs_;
    std::string currentDialogId_;

    void reset();
    void addError(const std::string& path, const std::string& msg);
    void addWarning(const std::string& path, const std::string& msg);

    // 파싱 헬퍼
    bool parseRoot(const json& root);
    void parseDialog(const json& j, const std::string& path);
    void parseRecognizer(ICPDev::Daehwa::Schema::DialogT& dialog, const json& j, const std::string& path);
    void parseRule(ICPDev::Daehwa::Schema::DialogT& dialog, const json& j, const std::string& path);

    // 스텝 리스트를 다이얼로그 아레나에 넣고 인덱스 반환 (비어 있으면 -1)
    int32_t parseStepList(ICPDev::Daehwa::Schema::DialogT& dialog, const json& j, const std::string& path);
    std::unique_ptr<ICPDev::Daehwa::Schema::StepT> parseStep(ICPDev::Daehwa::Schema::DialogT& dialog,
                                                             const json& j, const std::string& path);
    bool parseInput(const std::string& kind, const json& j, const std::string& path,
                    ICPDev::Daehwa::Schema::InputT& out);

    // 필드 읽기
    bool requireString(const json& j, const char* key, const std::string& path, std::string& out);
    std::string optionalString(const json& j, const char* key, const std::string& path);
    std::string expressionField(const json& j, const char* key);
    bool propertyField(const json& j, const char* key, const std::string& path, bool required,
                       std::string& out);

    // 검증 패스
    void validateDialogRefs();
    void checkReachability();
};

} // namespace Daehwa
