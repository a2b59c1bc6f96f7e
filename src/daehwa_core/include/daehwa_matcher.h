#pragma once
#include "daehwa_bot.h"
#include "daehwa_expression.h"
#include <string>

namespace Daehwa {

// --- 다이얼로그 이벤트 ---
namespace Events {
constexpr const char* RecognizedIntent = "recognizedIntent";
constexpr const char* UnknownIntent = "unknownIntent";
constexpr const char* BeginDialog = "beginDialog";
constexpr const char* ConversationUpdate = "conversationUpdate";
}

struct DialogEvent {
    std::string name;
    std::string intent;     // recognizedIntent 전용
    Value value;
    bool bubble = false;

    Value toJson() const;
};

struct MatchOptions {
    bool excludeCatchAll = false;   // 진행 중인 계획이 있으면 구체적 규칙만
};

struct RuleMatch {
    int32_t index = -1;     // Dialog.rules 인덱스, -1 = 매치 없음
    int32_t list = -1;      // 매치된 규칙의 스텝 리스트
    std::string error;      // 조건 평가 실패 (EvaluationError)

    bool matched() const { return index >= 0; }
    bool failed() const { return !error.empty(); }
};

// 트리거 종류/이름만 검사 (조건 제외)
bool ruleAcceptsEvent(const Schema::Rule* rule, const DialogEvent& event);

// 구체적 이름 +2, 조건 +1
int ruleSpecificity(const Schema::Rule* rule);
bool isCatchAllRule(const Schema::Rule* rule);

// 우선순위 → 구체성 → 등록 순서
RuleMatch selectRule(const Schema::Dialog* dialog, const DialogEvent& event,
                     const Memory& memory, const ExpressionEvaluator& evaluator,
                     const MatchOptions& options = MatchOptions());

} // namespace Daehwa
