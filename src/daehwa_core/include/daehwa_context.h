#pragma once
#include "daehwa_channel.h"
#include "daehwa_config.h"
#include "daehwa_executor.h"
#include "daehwa_matcher.h"
#include "daehwa_recognizer.h"
#include "daehwa_state.h"
#include "daehwa_template.h"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace Daehwa {

class DialogManager;

enum class ErrorKind { None, Configuration, Evaluation, Transport, Storage, Cancelled };

const char* errorKindName(ErrorKind kind);

struct Fault {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

// --- 턴 컨텍스트 (턴마다 새로 생성) ---
struct TurnContext {
    Activity activity;
    std::string locale;
    bool activityConsumed = false;
    DialogEvent currentEvent;
    RecognizerResult recognized;
    size_t stepsExecuted = 0;
    size_t activitiesSent = 0;
    const std::atomic<bool>* cancel = nullptr;
    std::vector<std::string> unhandledEvents;

    // turn 스코프 (turn.activity, turn.recognized, turn.dialogEvent, turn.value ...)
    Value scope = Value::object();

    bool isCancelled() const { return cancel && cancel->load(); }
};

// --- DialogContext ---
// 한 턴 동안 한 대화의 스택을 조작한다. 수명 주기, 이벤트 전달, 버블링, 구동 루프.
class DialogContext {
public:
    DialogContext(const DialogManager& manager, ConversationState& state, TurnContext& turn);

    // --- 접근자 ---
    std::vector<DialogInstance>& stack() { return state_.stack; }
    TurnContext& turn() { return turn_; }
    const EngineConfig& config() const;
    const ExpressionEvaluator& evaluator() const;
    const TemplateResolver& templates() const;
    const Schema::Dialog* dialogAt(size_t index) const;
    const Schema::Dialog* findDialog(const std::string& id) const;
    bool isTop(size_t index) const { return index + 1 == state_.stack.size(); }

    // index 인스턴스 관점의 메모리 (this = 최상위 커서 프레임)
    Memory memoryFor(size_t index);

    // --- 수명 주기 ---
    ExecStatus beginDialog(const std::string& dialogId, const Value& options,
                           const std::string& resultProperty);
    ExecStatus replaceDialog(size_t index, const std::string& dialogId, const Value& options);
    ExecStatus endDialog(size_t index, const Value& result);
    ExecStatus repeatDialog(size_t index);
    void cancelAbove(size_t index);

    // --- 이벤트 ---
    ExecStatus deliverActivity(size_t index, bool allowBubble);
    ExecStatus bubbleEvent(const DialogEvent& event, size_t fromIndex, bool& consumed);
    void setCurrentEvent(const DialogEvent& event);

    // --- 구동 ---
    ExecStatus drive();
    bool sendActivity(Activity activity);
    ExecStatus fail(ErrorKind kind, const std::string& message);
    const Fault& lastFault() const { return fault_; }

    StepExecutor& executor() { return executor_; }

private:
    const DialogManager& manager_;
    ConversationState& state_;
    TurnContext& turn_;
    StepExecutor executor_;
    Fault fault_;
    uint64_t nextSerial_ = 0;
    uint64_t idleSerial_ = 0;           // repeatDialog 후 다음 액티비티를 기다리는 인스턴스
    Value scratch_ = Value::object();

    bool queueOwnSteps(DialogInstance& inst, const Schema::Dialog* dialog);
    void pushSequence(size_t index, int32_t list);
    DialogEvent eventFromActivity(size_t index);
};

} // namespace Daehwa
