#pragma once
#include "daehwa_bot.h"
#include "daehwa_channel.h"
#include "daehwa_config.h"
#include "daehwa_manager.h"
#include "daehwa_storage.h"
#include <memory>
#include <string>

namespace Daehwa {

// --- 대화형 콘솔: 한 줄 = 한 턴 ---
class Console {
public:
    Console();

    bool loadBot(const std::string& path);
    bool loadConfig(const std::string& path);
    void setStateDirectory(const std::string& dir) { stateDir_ = dir; }
    void setLocale(const std::string& locale) { locale_ = locale; }
    void setShowTraces(bool show) { showTraces_ = show; }

    // stdin 루프 (:quit 또는 EOF 까지)
    void run();

private:
    Bot bot_;
    EngineConfig config_;
    std::string stateDir_;
    std::string locale_;
    bool showTraces_ = false;
    std::string conversationKey_ = "console";

    std::unique_ptr<Storage> storage_;
    std::unique_ptr<Channel> channel_;
    std::unique_ptr<DialogManager> manager_;

    bool processLine(const std::string& line);
    void sendActivity(const Activity& activity);
    void cmdHelp();
    void cmdStack();
    void cmdReset();
};

} // namespace Daehwa
