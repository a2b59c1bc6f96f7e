#pragma once
#include "daehwa_bot.h"
#include "daehwa_channel.h"
#include "daehwa_config.h"
#include "daehwa_context.h"
#include "daehwa_expression.h"
#include "daehwa_recognizer.h"
#include "daehwa_storage.h"
#include "daehwa_template.h"
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Daehwa {

enum class TurnOutcome { Suspended, StackCompleted, Aborted };

const char* turnOutcomeName(TurnOutcome outcome);

struct TurnResult {
    TurnOutcome outcome = TurnOutcome::Aborted;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<std::string> unhandledEvents;   // 루트까지 버블링되고도 처리되지 않은 이벤트
    size_t activitiesSent = 0;
    size_t stackDepth = 0;

    bool ok() const { return error == ErrorKind::None; }
};

// --- DialogManager ---
// 봇, 설정, 협력자만 보유 (턴 상태 없음). 서로 다른 대화는 여러 스레드에서 동시에 처리할 수 있다.
// 같은 대화 키의 턴 직렬화는 호출자 책임.
class DialogManager {
public:
    DialogManager(const Bot& bot, Storage& storage, Channel& channel,
                  const EngineConfig& config = EngineConfig::defaults());

    // --- 협력자 교체 (첫 턴 이전에만) ---
    void setEvaluator(std::unique_ptr<ExpressionEvaluator> evaluator);
    void setTemplateResolver(std::unique_ptr<TemplateResolver> resolver);
    void setRecognizer(const std::string& dialogId, std::unique_ptr<Recognizer> recognizer);

    // 한 턴 처리: 로드 → 전달/시작 → 구동 → (Suspended/StackCompleted일 때만) 저장
    TurnResult processTurn(const std::string& conversationKey, const Activity& activity,
                           const std::atomic<bool>* cancel = nullptr) const;

    // --- 호스트/테스트용 스택 조회 ---
    size_t getStackDepth(const std::string& conversationKey) const;
    std::vector<std::string> getActiveDialogs(const std::string& conversationKey) const;
    bool resetConversation(const std::string& conversationKey, std::string& error) const;

    // --- DialogContext 용 접근자 ---
    const Bot& bot() const { return bot_; }
    const EngineConfig& config() const { return config_; }
    const ExpressionEvaluator& evaluator() const { return *evaluator_; }
    const TemplateResolver& templates() const { return *templates_; }
    Channel& channel() const { return channel_; }
    const Recognizer* recognizerFor(const std::string& dialogId) const;

private:
    const Bot& bot_;
    Storage& storage_;
    Channel& channel_;
    EngineConfig config_;

    std::unique_ptr<ExpressionEvaluator> evaluator_;
    std::unique_ptr<TemplateResolver> templates_;
    bool customTemplates_ = false;
    std::unordered_map<std::string, std::unique_ptr<Recognizer>> recognizers_;

    void buildRecognizers();
};

} // namespace Daehwa
