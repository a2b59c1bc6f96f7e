#include "daehwa_context.h"
#include "daehwa_manager.h"
#include "daehwa_generated.h"
#include <iostream>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "None";
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Evaluation:    return "EvaluationError";
        case ErrorKind::Transport:     return "TransportError";
        case ErrorKind::Storage:       return "StorageError";
        case ErrorKind::Cancelled:     return "Cancelled";
    }
    return "Unknown";
}

DialogContext::DialogContext(const DialogManager& manager, ConversationState& state, TurnContext& turn)
    : manager_(manager), state_(state), turn_(turn), executor_(*this) {
    // 로드된 인스턴스에 턴 내부 식별자 부여
    for (auto& inst : state_.stack) {
        inst.serial = ++nextSerial_;
    }
}

const EngineConfig& DialogContext::config() const { return manager_.config(); }
const ExpressionEvaluator& DialogContext::evaluator() const { return manager_.evaluator(); }
const TemplateResolver& DialogContext::templates() const { return manager_.templates(); }

const Schema::Dialog* DialogContext::findDialog(const std::string& id) const {
    return manager_.bot().findDialog(id);
}

const Schema::Dialog* DialogContext::dialogAt(size_t index) const {
    if (index >= state_.stack.size()) return nullptr;
    return findDialog(state_.stack[index].dialogId);
}

Memory DialogContext::memoryFor(size_t index) {
    auto& inst = state_.stack[index];
    Value* step = &scratch_;
    if (inst.cursor.empty()) {
        scratch_ = Value::object();
    } else {
        step = &inst.cursor.back().stepState;
    }
    return Memory(&state_.user, &state_.conversation, &inst.state,
                  &turn_.scope, step, &manager_.config().settings);
}

ExecStatus DialogContext::fail(ErrorKind kind, const std::string& message) {
    fault_.kind = kind;
    fault_.message = message;
    return ExecStatus::Faulted;
}

bool DialogContext::sendActivity(Activity activity) {
    if (activity.locale.empty()) activity.locale = turn_.locale;
    std::string error;
    if (!manager_.channel().sendActivity(activity, error)) {
        fail(ErrorKind::Transport, "send failed: " + error);
        return false;
    }
    turn_.activitiesSent++;
    return true;
}

void DialogContext::setCurrentEvent(const DialogEvent& event) {
    turn_.currentEvent = event;
    turn_.scope["dialogEvent"] = event.toJson();
}

// --- 커서 헬퍼 ---
bool DialogContext::queueOwnSteps(DialogInstance& inst, const Schema::Dialog* dialog) {
    const auto* own = getStepList(dialog, dialog->steps_list());
    if (!own || !own->steps() || own->steps()->size() == 0) return false;

    CursorFrame frame;
    frame.list = dialog->steps_list();
    frame.kind = FrameKind::Sequence;
    inst.cursor.push_back(std::move(frame));
    return true;
}

void DialogContext::pushSequence(size_t index, int32_t list) {
    CursorFrame frame;
    frame.list = list;
    frame.kind = FrameKind::Sequence;
    state_.stack[index].cursor.push_back(std::move(frame));
}

void DialogContext::cancelAbove(size_t index) {
    while (state_.stack.size() > index + 1) {
        state_.stack.pop_back();
    }
}

// --- 수명 주기 ---
ExecStatus DialogContext::beginDialog(const std::string& dialogId, const Value& options,
                                      const std::string& resultProperty) {
    const auto* dialog = findDialog(dialogId);
    if (!dialog) {
        return fail(ErrorKind::Configuration, "unknown dialog '" + dialogId + "'");
    }

    DialogInstance inst;
    inst.dialogId = dialogId;
    inst.resultProperty = resultProperty;
    inst.serial = ++nextSerial_;
    if (!options.is_null()) inst.state["options"] = options;
    bool hasOwnSteps = queueOwnSteps(inst, dialog);

    state_.stack.push_back(std::move(inst));
    size_t index = state_.stack.size() - 1;

    // beginDialog 이벤트는 자기 규칙에만 (버블링 없음)
    DialogEvent event;
    event.name = Events::BeginDialog;
    event.value = options;
    setCurrentEvent(event);

    RuleMatch match = selectRule(dialog, event, memoryFor(index), evaluator());
    if (match.failed()) return fail(ErrorKind::Evaluation, match.error);
    if (match.matched()) {
        pushSequence(index, match.list);
        return ExecStatus::Completed;
    }

    // 자기 스텝도 규칙도 없으면 이번 턴의 액티비티를 첫 이벤트로 받는다
    if (!hasOwnSteps) {
        return deliverActivity(index, false);
    }
    return ExecStatus::Completed;
}

ExecStatus DialogContext::replaceDialog(size_t index, const std::string& dialogId, const Value& options) {
    if (!findDialog(dialogId)) {
        return fail(ErrorKind::Configuration, "unknown dialog '" + dialogId + "'");
    }
    cancelAbove(index);

    // 호출자 쪽 결과 바인딩은 유지, dialog 스코프는 폐기
    std::string resultProperty = state_.stack[index].resultProperty;
    state_.stack.pop_back();

    ExecStatus status = beginDialog(dialogId, options, resultProperty);
    return status == ExecStatus::Faulted ? status : ExecStatus::StackChanged;
}

ExecStatus DialogContext::endDialog(size_t index, const Value& result) {
    if (index >= state_.stack.size()) return ExecStatus::StackChanged;
    cancelAbove(index);

    std::string resultProperty = state_.stack[index].resultProperty;
    state_.stack.pop_back();

    if (!state_.stack.empty() && !resultProperty.empty()) {
        std::string error;
        Memory parent = memoryFor(state_.stack.size() - 1);
        if (!parent.set(resultProperty, result, &error)) {
            return fail(ErrorKind::Configuration, "endDialog result: " + error);
        }
    }
    return ExecStatus::StackChanged;
}

ExecStatus DialogContext::repeatDialog(size_t index) {
    if (index >= state_.stack.size()) return ExecStatus::StackChanged;
    cancelAbove(index);

    auto& inst = state_.stack[index];
    const auto* dialog = dialogAt(index);
    if (!dialog) {
        return fail(ErrorKind::Configuration, "unknown dialog '" + inst.dialogId + "'");
    }
    // dialog 스코프는 유지, 계획만 처음부터
    inst.cursor.clear();
    if (queueOwnSteps(inst, dialog)) return ExecStatus::StackChanged;

    // 자기 스텝이 없으면 beginDialog 규칙을 다시 발동
    DialogEvent event;
    event.name = Events::BeginDialog;
    if (inst.state.is_object() && inst.state.contains("options")) event.value = inst.state["options"];
    setCurrentEvent(event);

    RuleMatch match = selectRule(dialog, event, memoryFor(index), evaluator());
    if (match.failed()) return fail(ErrorKind::Evaluation, match.error);
    if (match.matched()) {
        pushSequence(index, match.list);
    } else {
        // 규칙만 있는 대화: 다음 액티비티를 기다린다 (자동 종료 안 함)
        idleSerial_ = inst.serial;
    }
    return ExecStatus::StackChanged;
}

// --- 이벤트 전달 ---
DialogEvent DialogContext::eventFromActivity(size_t index) {
    DialogEvent event;
    const Activity& activity = turn_.activity;

    if (activity.type == "message") {
        const Recognizer* recognizer = manager_.recognizerFor(state_.stack[index].dialogId);
        RecognizerResult result;
        if (recognizer) {
            result = recognizer->recognize(activity.text, turn_.locale);
        }

        Value recognized = Value::object();
        recognized["text"] = activity.text;
        recognized["intent"] = result.intent;
        recognized["score"] = result.score;
        recognized["entities"] = result.entities;
        turn_.recognized = result;
        turn_.scope["recognized"] = recognized;

        if (!result.intent.empty() && result.score >= config().recognizerThreshold) {
            event.name = Events::RecognizedIntent;
            event.intent = result.intent;
            event.value = recognized;
        } else {
            event.name = Events::UnknownIntent;
            event.value = recognized;
        }
    } else if (activity.type == "event") {
        event.name = activity.name;
        event.value = activity.value;
    } else {
        event.name = activity.type;
        event.value = activity.value;
    }
    return event;
}

ExecStatus DialogContext::deliverActivity(size_t index, bool allowBubble) {
    DialogEvent event = eventFromActivity(index);
    setCurrentEvent(event);

    bool planInProgress = !state_.stack[index].cursor.empty();

    MatchOptions options;
    options.excludeCatchAll = planInProgress;
    RuleMatch match = selectRule(dialogAt(index), event, memoryFor(index), evaluator(), options);
    if (match.failed()) return fail(ErrorKind::Evaluation, match.error);

    if (match.matched()) {
        // 끼어든 규칙이 먼저 실행되고, 중단된 계획은 그 뒤에 이어진다
        turn_.activityConsumed = true;
        pushSequence(index, match.list);
        return ExecStatus::Completed;
    }

    if (planInProgress) {
        // 대기 중인 입력이 있으면 입력 스텝이 액티비티를 소비한다
        if (!state_.stack[index].cursor.back().inputPending) {
            turn_.activityConsumed = true;
        }
        return ExecStatus::Completed;
    }

    if (!allowBubble) return ExecStatus::Completed;

    bool consumed = false;
    ExecStatus status = bubbleEvent(event, index, consumed);
    if (consumed) turn_.activityConsumed = true;
    return status;
}

// --- 버블링 ---
ExecStatus DialogContext::bubbleEvent(const DialogEvent& event, size_t fromIndex, bool& consumed) {
    consumed = false;

    for (size_t k = fromIndex; k-- > 0;) {
        RuleMatch match = selectRule(dialogAt(k), event, memoryFor(k), evaluator());
        if (match.failed()) return fail(ErrorKind::Evaluation, match.error);
        if (!match.matched()) continue;

        // 위쪽 프레임은 그대로 두고 이 프레임에서 규칙 실행
        consumed = true;
        size_t depthBefore = state_.stack[k].cursor.size();
        pushSequence(k, match.list);
        return executor_.run(k, depthBefore);
    }

    std::cerr << "[Daehwa] Event '" << event.name << "' reached the root unhandled" << std::endl;
    turn_.unhandledEvents.push_back(event.name);
    return ExecStatus::Completed;
}

// --- 구동 루프 ---
ExecStatus DialogContext::drive() {
    while (true) {
        if (turn_.isCancelled()) {
            return fail(ErrorKind::Cancelled, "turn cancelled");
        }
        if (state_.stack.empty()) return ExecStatus::Completed;

        size_t top = state_.stack.size() - 1;
        if (!state_.stack[top].cursor.empty()) {
            ExecStatus status = executor_.run(top, 0);
            if (status == ExecStatus::Suspended || status == ExecStatus::Faulted) return status;
            continue;
        }

        // 계획이 바닥난 프레임
        const auto* dialog = dialogAt(top);
        if (!dialog) {
            return fail(ErrorKind::Configuration,
                        "unknown dialog '" + state_.stack[top].dialogId + "'");
        }
        if (!dialog->auto_end_dialog()) return ExecStatus::Suspended;
        if (state_.stack[top].serial == idleSerial_) return ExecStatus::Suspended;

        ExecStatus status = endDialog(top, Value());
        if (status == ExecStatus::Faulted) return status;
    }
}

} // namespace Daehwa
