#include "daehwa_manager.h"
#include "daehwa_generated.h"
#include <iostream>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

const char* turnOutcomeName(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Suspended:      return "Suspended";
        case TurnOutcome::StackCompleted: return "StackCompleted";
        case TurnOutcome::Aborted:        return "Aborted";
    }
    return "Unknown";
}

DialogManager::DialogManager(const Bot& bot, Storage& storage, Channel& channel, const EngineConfig& config)
    : bot_(bot), storage_(storage), channel_(channel), config_(config),
      evaluator_(std::make_unique<SimpleEvaluator>()) {
    templates_ = std::make_unique<TemplateEngine>(*evaluator_);
    buildRecognizers();
}

// --- 협력자 교체 ---
void DialogManager::setEvaluator(std::unique_ptr<ExpressionEvaluator> evaluator) {
    if (!evaluator) return;
    evaluator_ = std::move(evaluator);
    // 기본 템플릿 엔진은 평가기를 참조하므로 새로 만든다
    if (!customTemplates_) {
        templates_ = std::make_unique<TemplateEngine>(*evaluator_);
    }
}

void DialogManager::setTemplateResolver(std::unique_ptr<TemplateResolver> resolver) {
    if (!resolver) return;
    templates_ = std::move(resolver);
    customTemplates_ = true;
}

void DialogManager::setRecognizer(const std::string& dialogId, std::unique_ptr<Recognizer> recognizer) {
    if (recognizer) {
        recognizers_[dialogId] = std::move(recognizer);
    } else {
        recognizers_.erase(dialogId);
    }
}

const Recognizer* DialogManager::recognizerFor(const std::string& dialogId) const {
    auto it = recognizers_.find(dialogId);
    return it != recognizers_.end() ? it->second.get() : nullptr;
}

// 봇에 선언된 intent 패턴으로 다이얼로그별 정규식 인식기 구성
void DialogManager::buildRecognizers() {
    if (!bot_.isLoaded()) return;

    for (const auto& id : bot_.getDialogIds()) {
        const auto* dialog = bot_.findDialog(id);
        if (!dialog || !dialog->intents() || dialog->intents()->size() == 0) continue;

        auto recognizer = std::make_unique<RegexRecognizer>();
        for (const auto* intent : *dialog->intents()) {
            std::string name = intent->intent() ? intent->intent()->str() : "";
            std::string pattern = intent->pattern() ? intent->pattern()->str() : "";
            std::string error;
            if (!recognizer->addIntent(name, pattern, &error)) {
                std::cerr << "[Daehwa] Dialog '" << id << "': skipping intent '" << name
                          << "': " << error << std::endl;
            }
        }
        if (recognizer->size() > 0) {
            recognizers_[id] = std::move(recognizer);
        }
    }
}

// --- 턴 처리 ---
TurnResult DialogManager::processTurn(const std::string& conversationKey, const Activity& activity,
                                      const std::atomic<bool>* cancel) const {
    TurnResult result;

    if (!bot_.isLoaded()) {
        result.error = ErrorKind::Configuration;
        result.message = "no bot loaded";
        std::cerr << "[Daehwa] Turn aborted: " << result.message << std::endl;
        return result;
    }

    ConversationState state;
    std::string error;
    if (storage_.load(conversationKey, state, error) == LoadResult::Error) {
        result.error = ErrorKind::Storage;
        result.message = "load failed: " + error;
        std::cerr << "[Daehwa] Turn aborted: " << result.message << std::endl;
        return result;
    }

    TurnContext turn;
    turn.activity = activity;
    turn.locale = normalizeLocale(activity.locale.empty() ? config_.defaultLocale : activity.locale);
    turn.cancel = cancel;
    turn.scope["activity"] = activity.toJson();
    turn.scope["locale"] = turn.locale;

    DialogContext ctx(*this, state, turn);

    // 빈 스택이면 루트 다이얼로그 시작, 아니면 최상위 다이얼로그에 전달
    ExecStatus status;
    if (state.stack.empty()) {
        status = ctx.beginDialog(bot_.rootDialogId(), Value(), "");
    } else {
        status = ctx.deliverActivity(state.stack.size() - 1, true);
    }
    if (status != ExecStatus::Faulted && status != ExecStatus::Suspended) {
        status = ctx.drive();
    }

    result.unhandledEvents = turn.unhandledEvents;
    result.activitiesSent = turn.activitiesSent;

    if (status == ExecStatus::Faulted) {
        // 실패한 턴은 저장하지 않는다 (이전 상태 유지)
        const Fault& fault = ctx.lastFault();
        result.outcome = TurnOutcome::Aborted;
        result.error = fault.kind;
        result.message = fault.message;
        std::cerr << "[Daehwa] Turn aborted (" << errorKindName(fault.kind) << "): "
                  << fault.message << std::endl;
        return result;
    }

    if (!storage_.save(conversationKey, state, error)) {
        result.outcome = TurnOutcome::Aborted;
        result.error = ErrorKind::Storage;
        result.message = "save failed: " + error;
        std::cerr << "[Daehwa] Turn aborted: " << result.message << std::endl;
        return result;
    }

    result.stackDepth = state.stack.size();
    result.outcome = state.stack.empty() ? TurnOutcome::StackCompleted : TurnOutcome::Suspended;
    return result;
}

// --- 스택 조회 ---
size_t DialogManager::getStackDepth(const std::string& conversationKey) const {
    ConversationState state;
    std::string error;
    if (storage_.load(conversationKey, state, error) != LoadResult::Found) return 0;
    return state.stack.size();
}

std::vector<std::string> DialogManager::getActiveDialogs(const std::string& conversationKey) const {
    std::vector<std::string> ids;
    ConversationState state;
    std::string error;
    if (storage_.load(conversationKey, state, error) != LoadResult::Found) return ids;
    for (const auto& inst : state.stack) {
        ids.push_back(inst.dialogId);
    }
    return ids;
}

bool DialogManager::resetConversation(const std::string& conversationKey, std::string& error) const {
    // 사용자/대화 스코프는 유지하고 스택만 비운다
    ConversationState state;
    if (storage_.load(conversationKey, state, error) == LoadResult::Error) return false;
    state.stack.clear();
    return storage_.save(conversationKey, state, error);
}

} // namespace Daehwa
