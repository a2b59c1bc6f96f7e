#include "daehwa_executor.h"
#include "daehwa_context.h"
#include "daehwa_expression.h"
#include "daehwa_generated.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

// --- 문자열 헬퍼 ---
static std::string fbStr(const flatbuffers::String* s) {
    return s ? s->str() : std::string();
}

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

static std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// --- 서식 / 슬라이스 ---
std::string StepExecutor::formatChoices(const std::vector<std::string>& choices,
                                        const std::string& separator,
                                        const std::string& inlineOr,
                                        const std::string& inlineOrMore,
                                        bool includeNumbers) {
    std::string result;
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0) {
            bool last = (i + 1 == choices.size());
            if (!last) {
                result += separator;
            } else {
                result += (choices.size() == 2) ? inlineOr : inlineOrMore;
            }
        }
        if (includeNumbers) {
            result += "(" + std::to_string(i + 1) + ") ";
        }
        result += choices[i];
    }
    return result;
}

size_t StepExecutor::pageCount(size_t itemCount, size_t pageSize) {
    if (pageSize == 0) return 0;
    return (itemCount + pageSize - 1) / pageSize;
}

Value StepExecutor::pageSlice(const Value& items, size_t page, size_t pageSize) {
    Value slice = Value::array();
    size_t start = page * pageSize;
    size_t end = std::min(items.size(), start + pageSize);
    for (size_t i = start; i < end; ++i) {
        slice.push_back(items[i]);
    }
    return slice;
}

// --- 커서 헬퍼 ---
void StepExecutor::advance(size_t index) {
    auto& frame = ctx_.stack()[index].cursor.back();
    frame.pos++;
    frame.inputPending = false;
    frame.inputAttempts = 0;
    frame.stepState = Value::object();
}

void StepExecutor::pushFrame(size_t index, int32_t list, FrameKind kind, uint32_t iteration) {
    CursorFrame frame;
    frame.list = list;
    frame.kind = kind;
    frame.iteration = iteration;
    ctx_.stack()[index].cursor.push_back(std::move(frame));
}

bool StepExecutor::evaluate(size_t index, const std::string& expression, Value& out) {
    std::string error;
    if (!ctx_.evaluator().evaluate(expression, ctx_.memoryFor(index), out, error)) {
        ctx_.fail(ErrorKind::Evaluation, error);
        return false;
    }
    return true;
}

bool StepExecutor::writeProperty(size_t index, const std::string& path, const Value& value) {
    std::string error;
    if (!ctx_.memoryFor(index).set(path, value, &error)) {
        ctx_.fail(ErrorKind::Configuration, error);
        return false;
    }
    return true;
}

// --- 실행 루프 ---
ExecStatus StepExecutor::run(size_t index, size_t stopDepth) {
    auto& stack = ctx_.stack();
    if (index >= stack.size()) return ExecStatus::StackChanged;
    const uint64_t serial = stack[index].serial;

    while (true) {
        if (ctx_.turn().isCancelled()) {
            return ctx_.fail(ErrorKind::Cancelled, "turn cancelled");
        }
        // 이 인스턴스가 제거되었으면 구동 루프로 복귀
        if (index >= stack.size() || stack[index].serial != serial) {
            return ExecStatus::StackChanged;
        }

        auto& inst = stack[index];
        if (inst.cursor.size() <= stopDepth) return ExecStatus::Completed;

        const auto* dialog = ctx_.dialogAt(index);
        if (!dialog) {
            return ctx_.fail(ErrorKind::Configuration, "unknown dialog '" + inst.dialogId + "'");
        }

        auto& frame = inst.cursor.back();
        const auto* list = getStepList(dialog, frame.list);
        uint32_t count = (list && list->steps()) ? list->steps()->size() : 0;

        if (frame.pos >= count) {
            if (frame.kind == FrameKind::Loop) {
                ExecStatus status = continueLoop(index, dialog);
                if (status == ExecStatus::Faulted) return status;
                continue;
            }
            inst.cursor.pop_back();
            continue;
        }

        auto& turn = ctx_.turn();
        if (++turn.stepsExecuted > ctx_.config().maxStepsPerTurn) {
            return ctx_.fail(ErrorKind::Evaluation,
                             "step budget exceeded (" + std::to_string(ctx_.config().maxStepsPerTurn) +
                             " steps) in dialog '" + inst.dialogId + "'");
        }

        ExecStatus status = executeStep(index, dialog, list->steps()->Get(frame.pos));
        if (status != ExecStatus::Completed) return status;
    }
}

// --- 루프 본문 소진 시: 다음 요소 바인딩 또는 루프 종료 ---
ExecStatus StepExecutor::continueLoop(size_t index, const Schema::Dialog* dialog) {
    auto& cursor = ctx_.stack()[index].cursor;
    if (cursor.size() < 2) {
        cursor.pop_back();
        return ExecStatus::Completed;
    }

    const CursorFrame& parent = cursor[cursor.size() - 2];
    const auto* parentList = getStepList(dialog, parent.list);
    if (!parentList || !parentList->steps() || parent.pos >= parentList->steps()->size()) {
        return ctx_.fail(ErrorKind::Configuration, "loop frame lost its loop step");
    }
    const auto* step = parentList->steps()->Get(parent.pos);
    uint32_t next = cursor.back().iteration + 1;

    auto finishLoop = [&]() {
        ctx_.stack()[index].cursor.pop_back();
        advance(index);
        return ExecStatus::Completed;
    };
    auto restartBody = [&]() {
        auto& loop = ctx_.stack()[index].cursor.back();
        loop.iteration = next;
        loop.pos = 0;
        loop.inputPending = false;
        loop.inputAttempts = 0;
        loop.stepState = Value::object();
    };

    if (step->data_type() == StepData::Foreach) {
        const auto* foreach = step->data_as_Foreach();
        std::string listProperty = fbStr(foreach->list_property());
        Value items = ctx_.memoryFor(index).get(listProperty);
        if (!items.is_array()) {
            return ctx_.fail(ErrorKind::Evaluation, "foreach: '" + listProperty + "' is not a list");
        }
        if (next >= items.size()) return finishLoop();

        restartBody();
        std::string indexProperty = foreach->index_property() ? foreach->index_property()->str() : "dialog.index";
        std::string valueProperty = foreach->value_property() ? foreach->value_property()->str() : "dialog.value";
        if (!writeProperty(index, indexProperty, next)) return ExecStatus::Faulted;
        if (!writeProperty(index, valueProperty, items[next])) return ExecStatus::Faulted;
        return ExecStatus::Completed;
    }

    if (step->data_type() == StepData::ForeachPage) {
        const auto* foreachPage = step->data_as_ForeachPage();
        std::string listProperty = fbStr(foreachPage->list_property());
        Value items = ctx_.memoryFor(index).get(listProperty);
        if (!items.is_array()) {
            return ctx_.fail(ErrorKind::Evaluation, "foreachPage: '" + listProperty + "' is not a list");
        }
        size_t pageSize = static_cast<size_t>(std::max(foreachPage->page_size(), 0));
        if (next >= pageCount(items.size(), pageSize)) return finishLoop();

        restartBody();
        std::string valueProperty = foreachPage->value_property() ? foreachPage->value_property()->str() : "dialog.page";
        if (!writeProperty(index, valueProperty, pageSlice(items, next, pageSize))) return ExecStatus::Faulted;
        return ExecStatus::Completed;
    }

    return ctx_.fail(ErrorKind::Configuration, "loop frame parent is not a loop step");
}

// --- switch case 비교 ---
static bool caseMatches(const Value& value, const std::string& caseText) {
    Value literal = Value::parse(caseText, nullptr, false);
    if (!literal.is_discarded() && literal == value) return true;

    if (value.is_boolean()) {
        std::string lower = toLower(trim(caseText));
        return (value.get<bool>() && lower == "true") || (!value.get<bool>() && lower == "false");
    }
    if (value.is_string()) {
        return value.get<std::string>() == caseText;
    }
    return !value.is_null() && valueToText(value) == caseText;
}

// --- 스텝 디스패치 ---
ExecStatus StepExecutor::executeStep(size_t index, const Schema::Dialog* dialog, const Schema::Step* step) {
    switch (step->data_type()) {
        case StepData::SendActivity: {
            const auto* send = step->data_as_SendActivity();
            std::string text;
            std::string error;
            if (!ctx_.templates().resolve(fbStr(send->text()), ctx_.memoryFor(index), text, error)) {
                return ctx_.fail(ErrorKind::Evaluation, error);
            }
            if (!ctx_.sendActivity(Activity::Message(text))) return ExecStatus::Faulted;
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::TraceActivity: {
            const auto* trace = step->data_as_TraceActivity();
            Activity activity;
            activity.type = "trace";
            activity.name = fbStr(trace->name());
            activity.valueType = fbStr(trace->value_type());
            std::string expr = fbStr(trace->value());
            if (expr.empty()) {
                activity.value = ctx_.memoryFor(index).snapshot();
            } else if (!evaluate(index, expr, activity.value)) {
                return ExecStatus::Faulted;
            }
            if (!ctx_.sendActivity(activity)) return ExecStatus::Faulted;
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::SetProperty: {
            const auto* set = step->data_as_SetProperty();
            Value value;
            if (!evaluate(index, fbStr(set->value()), value)) return ExecStatus::Faulted;
            if (!writeProperty(index, fbStr(set->property()), value)) return ExecStatus::Faulted;
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::InitProperty: {
            const auto* init = step->data_as_InitProperty();
            Value initial = (init->type() == PropertyType::Array) ? Value::array() : Value::object();
            if (!writeProperty(index, fbStr(init->property()), initial)) return ExecStatus::Faulted;
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::DeleteProperty: {
            const auto* del = step->data_as_DeleteProperty();
            std::string error;
            if (!ctx_.memoryFor(index).remove(fbStr(del->property()), &error)) {
                return ctx_.fail(ErrorKind::Configuration, error);
            }
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::EditArray: {
            const auto* edit = step->data_as_EditArray();
            std::string arrayProperty = fbStr(edit->array_property());
            Value items = ctx_.memoryFor(index).get(arrayProperty);
            if (items.is_null()) items = Value::array();
            if (!items.is_array()) {
                return ctx_.fail(ErrorKind::Evaluation, "editArray: '" + arrayProperty + "' is not an array");
            }

            Value removed;
            bool hasRemoved = false;
            switch (edit->change()) {
                case ArrayChange::Push: {
                    Value value;
                    if (!evaluate(index, fbStr(edit->value()), value)) return ExecStatus::Faulted;
                    items.push_back(value);
                    break;
                }
                case ArrayChange::Pop:
                    if (!items.empty()) {
                        removed = items.back();
                        items.erase(items.size() - 1);
                        hasRemoved = true;
                    }
                    break;
                case ArrayChange::Take:
                    if (!items.empty()) {
                        removed = items.front();
                        items.erase(0);
                        hasRemoved = true;
                    }
                    break;
                case ArrayChange::Remove: {
                    Value value;
                    if (!evaluate(index, fbStr(edit->value()), value)) return ExecStatus::Faulted;
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (items[i] == value) {
                            removed = items[i];
                            items.erase(i);
                            hasRemoved = true;
                            break;
                        }
                    }
                    break;
                }
                case ArrayChange::Clear:
                    items = Value::array();
                    break;
            }

            if (!writeProperty(index, arrayProperty, items)) return ExecStatus::Faulted;
            std::string resultProperty = fbStr(edit->result_property());
            if (hasRemoved && !resultProperty.empty()) {
                if (!writeProperty(index, resultProperty, removed)) return ExecStatus::Faulted;
            }
            advance(index);
            return ExecStatus::Completed;
        }

        case StepData::IfCondition: {
            const auto* cond = step->data_as_IfCondition();
            Value result;
            if (!evaluate(index, fbStr(cond->condition()), result)) return ExecStatus::Faulted;
            int32_t chosen = ExpressionEvaluator::isTruthy(result) ? cond->steps_list() : cond->else_list();

            advance(index);
            const auto* branch = getStepList(dialog, chosen);
            if (branch && branch->steps() && branch->steps()->size() > 0) {
                pushFrame(index, chosen, FrameKind::Block);
            }
            return ExecStatus::Completed;
        }

        case StepData::SwitchCondition: {
            const auto* sw = step->data_as_SwitchCondition();
            Value result;
            if (!evaluate(index, fbStr(sw->condition()), result)) return ExecStatus::Faulted;

            int32_t chosen = sw->default_list();
            if (sw->cases()) {
                for (const auto* c : *sw->cases()) {
                    if (caseMatches(result, fbStr(c->value()))) {
                        chosen = c->list();
                        break;
                    }
                }
            }

            advance(index);
            const auto* branch = getStepList(dialog, chosen);
            if (branch && branch->steps() && branch->steps()->size() > 0) {
                pushFrame(index, chosen, FrameKind::Block);
            }
            return ExecStatus::Completed;
        }

        case StepData::Foreach: {
            const auto* foreach = step->data_as_Foreach();
            std::string listProperty = fbStr(foreach->list_property());
            Value items = ctx_.memoryFor(index).get(listProperty);
            if (!items.is_array()) {
                return ctx_.fail(ErrorKind::Evaluation, "foreach: '" + listProperty + "' is not a list");
            }
            if (items.empty()) {
                advance(index);
                return ExecStatus::Completed;
            }

            // 부모는 루프 스텝에 머문다
            ctx_.stack()[index].cursor.back().stepState = Value::object();
            pushFrame(index, foreach->body_list(), FrameKind::Loop, 0);
            std::string indexProperty = foreach->index_property() ? foreach->index_property()->str() : "dialog.index";
            std::string valueProperty = foreach->value_property() ? foreach->value_property()->str() : "dialog.value";
            if (!writeProperty(index, indexProperty, Value(static_cast<uint32_t>(0)))) return ExecStatus::Faulted;
            if (!writeProperty(index, valueProperty, items[0])) return ExecStatus::Faulted;
            return ExecStatus::Completed;
        }

        case StepData::ForeachPage: {
            const auto* foreachPage = step->data_as_ForeachPage();
            std::string listProperty = fbStr(foreachPage->list_property());
            if (foreachPage->page_size() <= 0) {
                return ctx_.fail(ErrorKind::Configuration, "foreachPage: pageSize must be positive");
            }
            Value items = ctx_.memoryFor(index).get(listProperty);
            if (!items.is_array()) {
                return ctx_.fail(ErrorKind::Evaluation, "foreachPage: '" + listProperty + "' is not a list");
            }
            size_t pageSize = static_cast<size_t>(foreachPage->page_size());
            if (pageCount(items.size(), pageSize) == 0) {
                advance(index);
                return ExecStatus::Completed;
            }

            pushFrame(index, foreachPage->body_list(), FrameKind::Loop, 0);
            std::string valueProperty = foreachPage->value_property() ? foreachPage->value_property()->str() : "dialog.page";
            if (!writeProperty(index, valueProperty, pageSlice(items, 0, pageSize))) return ExecStatus::Faulted;
            return ExecStatus::Completed;
        }

        case StepData::BeginDialog: {
            const auto* begin = step->data_as_BeginDialog();
            std::string dialogId = fbStr(begin->dialog());
            if (!ctx_.findDialog(dialogId)) {
                return ctx_.fail(ErrorKind::Configuration, "beginDialog: unknown dialog '" + dialogId + "'");
            }
            Value options;
            std::string optionsExpr = fbStr(begin->options());
            if (!optionsExpr.empty() && !evaluate(index, optionsExpr, options)) return ExecStatus::Faulted;

            advance(index);
            ctx_.cancelAbove(index);
            ExecStatus status = ctx_.beginDialog(dialogId, options, fbStr(begin->result_property()));
            return status == ExecStatus::Faulted ? status : ExecStatus::StackChanged;
        }

        case StepData::ReplaceDialog: {
            const auto* replace = step->data_as_ReplaceDialog();
            Value options;
            std::string optionsExpr = fbStr(replace->options());
            if (!optionsExpr.empty() && !evaluate(index, optionsExpr, options)) return ExecStatus::Faulted;
            return ctx_.replaceDialog(index, fbStr(replace->dialog()), options);
        }

        case StepData::EndDialog: {
            const auto* end = step->data_as_EndDialog();
            Value result;
            std::string resultExpr = fbStr(end->result());
            if (!resultExpr.empty() && !evaluate(index, resultExpr, result)) return ExecStatus::Faulted;
            return ctx_.endDialog(index, result);
        }

        case StepData::RepeatDialog:
            return ctx_.repeatDialog(index);

        case StepData::EndTurn:
            advance(index);
            return ExecStatus::Suspended;

        case StepData::EmitEvent: {
            const auto* emit = step->data_as_EmitEvent();
            DialogEvent event;
            event.name = fbStr(emit->event_name());
            event.bubble = emit->bubble();
            std::string valueExpr = fbStr(emit->value());
            if (!valueExpr.empty() && !evaluate(index, valueExpr, event.value)) return ExecStatus::Faulted;

            advance(index);
            ctx_.setCurrentEvent(event);

            // 자기 규칙 먼저, 매치되면 다음 스텝으로 실행
            RuleMatch match = selectRule(dialog, event, ctx_.memoryFor(index), ctx_.evaluator());
            if (match.failed()) return ctx_.fail(ErrorKind::Evaluation, match.error);
            if (match.matched()) {
                pushFrame(index, match.list, FrameKind::Sequence);
                return ExecStatus::Completed;
            }

            if (!event.bubble) return ExecStatus::Completed;

            bool consumed = false;
            ExecStatus status = ctx_.bubbleEvent(event, index, consumed);
            return status;
        }

        case StepData::EditSteps: {
            const auto* edit = step->data_as_EditSteps();
            int32_t list = edit->list();
            const auto* steps = getStepList(dialog, list);
            bool hasSteps = steps && steps->steps() && steps->steps()->size() > 0;

            switch (edit->change()) {
                case StepChange::InsertSteps:
                    advance(index);
                    if (hasSteps) pushFrame(index, list, FrameKind::Sequence);
                    return ExecStatus::Completed;

                case StepChange::AppendSteps: {
                    advance(index);
                    if (hasSteps) {
                        auto& cursor = ctx_.stack()[index].cursor;
                        CursorFrame frame;
                        frame.list = list;
                        frame.kind = FrameKind::Sequence;
                        cursor.insert(cursor.begin(), std::move(frame));
                    }
                    return ExecStatus::Completed;
                }

                case StepChange::EndSequence:
                case StepChange::ReplaceSequence: {
                    bool wasTop = ctx_.isTop(index);
                    ctx_.cancelAbove(index);
                    ctx_.stack()[index].cursor.clear();
                    if (edit->change() == StepChange::ReplaceSequence && hasSteps) {
                        pushFrame(index, list, FrameKind::Sequence);
                    }
                    return wasTop ? ExecStatus::Completed : ExecStatus::StackChanged;
                }
            }
            return ctx_.fail(ErrorKind::Configuration, "editSteps: unknown change type");
        }

        case StepData::Input:
            return executeInput(index, step->data_as_Input());

        case StepData::NONE:
            break;
    }
    return ctx_.fail(ErrorKind::Configuration, "step has no data");
}

// --- 입력 인식 ---
static bool recognizeNumber(const std::string& text, bool outputInteger, Value& out) {
    std::string s = trim(text);
    if (s.empty()) return false;
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(d)) return false;

    if (outputInteger || (std::floor(d) == d && std::fabs(d) < 1e15)) {
        // 정수 출력인데 int64 범위 밖이면 인식 실패
        int64_t i = 0;
        if (!doubleToInt64(d, i)) return false;
        out = i;
    } else {
        out = d;
    }
    return true;
}

static bool recognizeConfirm(const std::string& text, const ConfirmWords& words, Value& out) {
    std::string s = toLower(trim(text));
    if (s.empty()) return false;
    if (s == "1" || s == toLower(words.yesLabel)) { out = true; return true; }
    if (s == "2" || s == toLower(words.noLabel)) { out = false; return true; }
    for (const auto& w : words.yes) {
        if (s == toLower(w)) { out = true; return true; }
    }
    for (const auto& w : words.no) {
        if (s == toLower(w)) { out = false; return true; }
    }
    return false;
}

static bool recognizeChoice(const std::string& text, const std::vector<std::string>& choices, Value& out) {
    std::string s = toLower(trim(text));
    if (s.empty()) return false;
    for (const auto& choice : choices) {
        if (toLower(choice) == s) { out = choice; return true; }
    }
    char* end = nullptr;
    long n = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() && *end == '\0' && n >= 1 && static_cast<size_t>(n) <= choices.size()) {
        out = choices[static_cast<size_t>(n - 1)];
        return true;
    }
    return false;
}

// --- 입력 스텝 ---
ExecStatus StepExecutor::executeInput(size_t index, const Schema::Input* input) {
    std::string property = fbStr(input->property());
    auto& turn = ctx_.turn();

    // 선택지 목록 (스텝 정의 또는 메모리)
    std::vector<std::string> choices;
    const ConfirmWords& words = ctx_.config().confirmWordsFor(turn.locale);
    if (input->kind() == InputKind::Choice) {
        if (input->choices()) {
            for (const auto* c : *input->choices()) choices.push_back(c->str());
        }
        std::string choicesProperty = fbStr(input->choices_property());
        if (!choicesProperty.empty()) {
            Value fromMemory = ctx_.memoryFor(index).get(choicesProperty);
            if (!fromMemory.is_array()) {
                return ctx_.fail(ErrorKind::Evaluation,
                                 "choiceInput: '" + choicesProperty + "' is not a list");
            }
            for (const auto& item : fromMemory) {
                if (item.is_object() && item.contains("value")) {
                    choices.push_back(valueToText(item["value"]));
                } else {
                    choices.push_back(valueToText(item));
                }
            }
        }
    } else if (input->kind() == InputKind::Confirm) {
        choices = {words.yesLabel, words.noLabel};
    }

    auto sendPrompt = [&](const flatbuffers::String* primary) -> bool {
        std::string tmpl = fbStr(primary);
        if (tmpl.empty()) tmpl = fbStr(input->prompt());
        std::string text;
        std::string error;
        if (!ctx_.templates().resolve(tmpl, ctx_.memoryFor(index), text, error)) {
            ctx_.fail(ErrorKind::Evaluation, error);
            return false;
        }
        if (!choices.empty()) {
            const ChoiceFormat& format = ctx_.config().choiceFormatFor(turn.locale);
            std::string list = formatChoices(choices, format.separator, format.inlineOr,
                                             format.inlineOrMore, format.includeNumbers);
            text = text.empty() ? list : text + " " + list;
        }
        return ctx_.sendActivity(Activity::Message(text));
    };

    // 첫 도착: 값이 이미 있으면 건너뛰고, 없으면 프롬프트 후 대기
    if (!ctx_.stack()[index].cursor.back().inputPending) {
        if (!input->always_prompt() && ctx_.memoryFor(index).has(property)) {
            advance(index);
            return ExecStatus::Completed;
        }
        if (!sendPrompt(input->prompt())) return ExecStatus::Faulted;
        auto& frame = ctx_.stack()[index].cursor.back();
        frame.inputPending = true;
        frame.inputAttempts = 0;
        return ExecStatus::Suspended;
    }

    // 재개: 이미 소비된 액티비티거나 메시지가 아니면 다시 묻는다
    if (turn.activityConsumed || turn.activity.type != "message") {
        if (!sendPrompt(input->prompt())) return ExecStatus::Faulted;
        return ExecStatus::Suspended;
    }
    turn.activityConsumed = true;

    const std::string& text = turn.activity.text;
    Value candidate;
    bool recognized = false;
    switch (input->kind()) {
        case InputKind::Text:
            recognized = !trim(text).empty();
            if (recognized) candidate = text;
            break;
        case InputKind::Number:
            recognized = recognizeNumber(text, input->output_integer(), candidate);
            break;
        case InputKind::Confirm:
            recognized = recognizeConfirm(text, words, candidate);
            break;
        case InputKind::Choice:
            recognized = recognizeChoice(text, choices, candidate);
            break;
    }

    bool valid = recognized;
    if (recognized) {
        turn.scope["value"] = candidate;
        ctx_.stack()[index].cursor.back().stepState["value"] = candidate;

        if (input->validations()) {
            for (const auto* validation : *input->validations()) {
                Value result;
                if (!evaluate(index, validation->str(), result)) return ExecStatus::Faulted;
                if (!ExpressionEvaluator::isTruthy(result)) {
                    valid = false;
                    break;
                }
            }
        }
    }

    if (valid) {
        if (!writeProperty(index, property, candidate)) return ExecStatus::Faulted;
        advance(index);
        return ExecStatus::Completed;
    }

    auto& frame = ctx_.stack()[index].cursor.back();
    frame.inputAttempts++;
    if (input->max_turn_count() > 0 && frame.inputAttempts >= input->max_turn_count()) {
        std::string defaultExpr = fbStr(input->default_value());
        if (!defaultExpr.empty()) {
            Value fallback;
            if (!evaluate(index, defaultExpr, fallback)) return ExecStatus::Faulted;
            if (!writeProperty(index, property, fallback)) return ExecStatus::Faulted;
        }
        advance(index);
        return ExecStatus::Completed;
    }

    // 인식 실패: unrecognizedPrompt, 검증 실패: invalidPrompt (없으면 unrecognizedPrompt)
    const flatbuffers::String* retry = input->unrecognized_prompt();
    if (recognized && input->invalid_prompt() && input->invalid_prompt()->size() > 0) {
        retry = input->invalid_prompt();
    }
    if (!sendPrompt(retry)) return ExecStatus::Faulted;
    return ExecStatus::Suspended;
}

} // namespace Daehwa
