#pragma once
#include "daehwa_memory.h"
#include <ostream>
#include <string>

namespace Daehwa {

// --- 액티비티 ---
struct Activity {
    std::string type = "message";   // message / trace / event / conversationUpdate
    std::string text;
    std::string locale;
    std::string name;               // event, trace 이름
    Value value;
    std::string valueType;          // trace 전용

    static Activity Message(const std::string& text) {
        Activity a; a.type = "message"; a.text = text; return a;
    }
    static Activity Event(const std::string& name, const Value& value = Value()) {
        Activity a; a.type = "event"; a.name = name; a.value = value; return a;
    }
    static Activity ConversationUpdate() {
        Activity a; a.type = "conversationUpdate"; return a;
    }

    Value toJson() const;
};

// --- 전송 인터페이스 ---
// false 반환 = TransportError. 코어는 재시도하지 않는다.
class Channel {
public:
    virtual ~Channel() = default;
    virtual bool sendActivity(const Activity& activity, std::string& error) = 0;
};

// 콘솔 출력 채널 (DaehwaConsole)
class ConsoleChannel : public Channel {
public:
    explicit ConsoleChannel(std::ostream& out, bool showTraces = false)
        : out_(out), showTraces_(showTraces) {}

    bool sendActivity(const Activity& activity, std::string& error) override;

private:
    std::ostream& out_;
    bool showTraces_;
};

} // namespace Daehwa
