#pragma once
#include "daehwa_bot.h"
#include "daehwa_state.h"
#include <cstddef>
#include <string>
#include <vector>

namespace ICPDev { namespace Daehwa { namespace Schema {
struct Input;
} } }

namespace Daehwa {

class DialogContext;

// --- 실행 결과 ---
enum class ExecStatus {
    Completed,      // 요청 범위의 커서를 모두 소진
    Suspended,      // 입력 대기 / endTurn
    StackChanged,   // 다이얼로그 스택이 바뀜 → 최상위부터 다시 구동
    Faulted         // 오류 (DialogContext::lastFault 참조)
};

// --- 스텝 실행기 ---
// 하나의 DialogInstance 커서를 해석한다. 스택 조작은 DialogContext에 위임.
class StepExecutor {
public:
    explicit StepExecutor(DialogContext& ctx) : ctx_(ctx) {}

    // index 인스턴스의 커서 깊이가 stopDepth 이하가 될 때까지 실행
    ExecStatus run(size_t index, size_t stopDepth);

    // 선택지 목록 서식 ("(1) red, (2) green, or (3) blue")
    static std::string formatChoices(const std::vector<std::string>& choices,
                                     const std::string& separator,
                                     const std::string& inlineOr,
                                     const std::string& inlineOrMore,
                                     bool includeNumbers);

    // foreachPage 슬라이스 (마지막 페이지는 짧을 수 있음)
    static size_t pageCount(size_t itemCount, size_t pageSize);
    static Value pageSlice(const Value& items, size_t page, size_t pageSize);

private:
    DialogContext& ctx_;

    ExecStatus executeStep(size_t index, const Schema::Dialog* dialog, const Schema::Step* step);
    ExecStatus continueLoop(size_t index, const Schema::Dialog* dialog);
    ExecStatus executeInput(size_t index, const Schema::Input* input);

    void advance(size_t index);
    void pushFrame(size_t index, int32_t list, FrameKind kind, uint32_t iteration = 0);

    // 실패 시 EvaluationError로 fault 기록
    bool evaluate(size_t index, const std::string& expression, Value& out);
    bool writeProperty(size_t index, const std::string& path, const Value& value);
};

} // namespace Daehwa
