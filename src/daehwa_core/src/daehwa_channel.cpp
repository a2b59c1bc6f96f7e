#include "daehwa_channel.h"

namespace Daehwa {

Value Activity::toJson() const {
    Value j = Value::object();
    j["type"] = type;
    if (!text.empty()) j["text"] = text;
    if (!locale.empty()) j["locale"] = locale;
    if (!name.empty()) j["name"] = name;
    if (!value.is_null()) j["value"] = value;
    if (!valueType.empty()) j["valueType"] = valueType;
    return j;
}

bool ConsoleChannel::sendActivity(const Activity& activity, std::string& error) {
    if (!out_) {
        error = "console output stream is not writable";
        return false;
    }

    if (activity.type == "message") {
        out_ << "  bot> " << activity.text << "\n";
    } else if (activity.type == "trace") {
        if (showTraces_) {
            out_ << "  [trace " << activity.name << "] " << activity.value.dump() << "\n";
        }
    } else {
        out_ << "  [" << activity.type << "] " << activity.name << "\n";
    }
    out_.flush();
    return true;
}

} // namespace Daehwa
