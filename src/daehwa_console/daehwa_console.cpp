#include "daehwa_console.h"
#include "daehwa_file_storage.h"
#include <iostream>

namespace Daehwa {

Console::Console() : config_(EngineConfig::defaults()) {}

bool Console::loadBot(const std::string& path) {
    return bot_.loadFromFile(path);
}

bool Console::loadConfig(const std::string& path) {
    std::string error;
    if (!loadConfigFile(path, config_, error)) {
        std::cerr << "[Daehwa] " << error << std::endl;
        return false;
    }
    return true;
}

void Console::run() {
    if (stateDir_.empty()) {
        storage_ = std::make_unique<MemoryStorage>();
    } else {
        storage_ = std::make_unique<FileStorage>(stateDir_);
    }
    channel_ = std::make_unique<ConsoleChannel>(std::cout, showTraces_);
    manager_ = std::make_unique<DialogManager>(bot_, *storage_, *channel_, config_);

    std::cout << "=== Daehwa Console ===" << std::endl;
    std::cout << "Type a message, or :help for commands" << std::endl;
    std::cout << std::endl;

    // 새 대화면 conversationUpdate 로 루트 다이얼로그 시작
    if (manager_->getStackDepth(conversationKey_) == 0) {
        sendActivity(Activity::ConversationUpdate());
    }

    std::string input;
    while (true) {
        std::cout << "you> ";
        if (!std::getline(std::cin, input)) {
            break;  // EOF
        }
        if (!processLine(input)) break;
    }
    std::cout << "=== END ===" << std::endl;
}

bool Console::processLine(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return true;
    std::string text = line.substr(start);

    if (text[0] == ':') {
        if (text == ":q" || text == ":quit") return false;
        if (text == ":h" || text == ":help") {
            cmdHelp();
        } else if (text == ":stack") {
            cmdStack();
        } else if (text == ":reset") {
            cmdReset();
        } else {
            std::cout << "Unknown command: " << text << " (try :help)" << std::endl;
        }
        return true;
    }

    Activity activity = Activity::Message(text);
    activity.locale = locale_;
    sendActivity(activity);
    return true;
}

void Console::sendActivity(const Activity& activity) {
    TurnResult result = manager_->processTurn(conversationKey_, activity);
    if (!result.ok()) {
        std::cout << "  !! " << errorKindName(result.error) << ": " << result.message << std::endl;
        return;
    }
    for (const auto& name : result.unhandledEvents) {
        std::cout << "  (unhandled event: " << name << ")" << std::endl;
    }
    if (result.outcome == TurnOutcome::StackCompleted) {
        std::cout << "  (conversation completed)" << std::endl;
    }
}

void Console::cmdHelp() {
    std::cout << "Commands:\n"
              << "  :stack   Show active dialogs (bottom to top)\n"
              << "  :reset   Clear the dialog stack (user/conversation memory is kept)\n"
              << "  :quit    Exit\n";
}

void Console::cmdStack() {
    auto dialogs = manager_->getActiveDialogs(conversationKey_);
    if (dialogs.empty()) {
        std::cout << "  (empty stack)" << std::endl;
        return;
    }
    for (size_t i = 0; i < dialogs.size(); ++i) {
        std::cout << "  #" << i << " " << dialogs[i] << std::endl;
    }
}

void Console::cmdReset() {
    std::string error;
    if (!manager_->resetConversation(conversationKey_, error)) {
        std::cout << "  !! reset failed: " << error << std::endl;
        return;
    }
    std::cout << "  (stack cleared)" << std::endl;
}

} // namespace Daehwa
