#include "daehwa_bot.h"
#include "daehwa_generated.h"
#include <fstream>
#include <iostream>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

bool Bot::loadFromFile(const std::string& filepath) {
    std::ifstream ifs(filepath, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        std::cerr << "[Daehwa] Failed to open file: " << filepath << std::endl;
        return false;
    }

    auto size = ifs.tellg();
    ifs.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    ifs.read(reinterpret_cast<char*>(data.data()), size);
    ifs.close();

    if (!loadFromBuffer(data.data(), data.size())) {
        std::cerr << "[Daehwa] Invalid .dhb file: " << filepath << std::endl;
        return false;
    }
    return true;
}

bool Bot::loadFromBuffer(const uint8_t* data, size_t size) {
    buffer_.clear();
    dialogs_.clear();
    if (!data || size == 0) return false;

    // FlatBuffers 버퍼 검증
    flatbuffers::Verifier verifier(data, size);
    if (!VerifyBotBuffer(verifier)) {
        std::cerr << "[Daehwa] Bot buffer failed verification" << std::endl;
        return false;
    }

    buffer_.assign(data, data + size);
    if (!indexDialogs()) {
        buffer_.clear();
        dialogs_.clear();
        return false;
    }
    return true;
}

bool Bot::indexDialogs() {
    const auto* bot = GetBot(buffer_.data());
    if (!bot->dialogs()) {
        std::cerr << "[Daehwa] Bot has no dialogs" << std::endl;
        return false;
    }
    for (flatbuffers::uoffset_t i = 0; i < bot->dialogs()->size(); ++i) {
        const auto* dialog = bot->dialogs()->Get(i);
        if (!dialog->id()) continue;
        dialogs_[dialog->id()->str()] = dialog;
    }
    if (!bot->root_dialog() || dialogs_.find(bot->root_dialog()->str()) == dialogs_.end()) {
        std::cerr << "[Daehwa] Root dialog not found in bot" << std::endl;
        return false;
    }
    return true;
}

std::string Bot::version() const {
    if (buffer_.empty()) return "";
    const auto* bot = GetBot(buffer_.data());
    return bot->version() ? bot->version()->str() : "";
}

std::string Bot::rootDialogId() const {
    if (buffer_.empty()) return "";
    const auto* bot = GetBot(buffer_.data());
    return bot->root_dialog() ? bot->root_dialog()->str() : "";
}

const Schema::Dialog* Bot::findDialog(const std::string& id) const {
    auto it = dialogs_.find(id);
    return it != dialogs_.end() ? it->second : nullptr;
}

std::vector<std::string> Bot::getDialogIds() const {
    std::vector<std::string> ids;
    if (buffer_.empty()) return ids;
    const auto* bot = GetBot(buffer_.data());
    for (flatbuffers::uoffset_t i = 0; i < bot->dialogs()->size(); ++i) {
        const auto* dialog = bot->dialogs()->Get(i);
        if (dialog->id()) ids.push_back(dialog->id()->str());
    }
    return ids;
}

const Schema::StepList* getStepList(const Schema::Dialog* dialog, int32_t index) {
    if (!dialog || !dialog->lists() || index < 0 ||
        index >= static_cast<int32_t>(dialog->lists()->size())) {
        return nullptr;
    }
    return dialog->lists()->Get(static_cast<flatbuffers::uoffset_t>(index));
}

void Bot::printBot() const {
    if (buffer_.empty()) {
        std::cerr << "[Daehwa] No bot loaded." << std::endl;
        return;
    }

    const auto* bot = GetBot(buffer_.data());

    // --- 기본 정보 ---
    std::cout << "=== Daehwa Bot ===" << std::endl;
    std::cout << "Version: " << (bot->version() ? bot->version()->c_str() : "?") << std::endl;
    std::cout << "Root Dialog: " << (bot->root_dialog() ? bot->root_dialog()->c_str() : "?")
              << std::endl;

    // --- Dialogs ---
    for (flatbuffers::uoffset_t i = 0; i < bot->dialogs()->size(); ++i) {
        const auto* dialog = bot->dialogs()->Get(i);
        std::cout << "\n--- Dialog: " << (dialog->id() ? dialog->id()->c_str() : "?")
                  << (dialog->auto_end_dialog() ? "" : " [no auto-end]") << " ---" << std::endl;

        const auto* own = getStepList(dialog, dialog->steps_list());
        size_t ownCount = (own && own->steps()) ? own->steps()->size() : 0;
        std::cout << "  steps: " << ownCount
                  << ", lists: " << (dialog->lists() ? dialog->lists()->size() : 0) << std::endl;

        if (dialog->intents()) {
            for (const auto* intent : *dialog->intents()) {
                std::cout << "  intent " << (intent->intent() ? intent->intent()->c_str() : "?")
                          << " = /" << (intent->pattern() ? intent->pattern()->c_str() : "")
                          << "/" << std::endl;
            }
        }

        if (dialog->rules()) {
            for (const auto* rule : *dialog->rules()) {
                std::cout << "  rule " << EnumNameRuleKind(rule->kind());
                if (rule->names()) {
                    for (const auto* name : *rule->names()) {
                        std::cout << " " << name->c_str();
                    }
                }
                if (rule->condition()) {
                    std::cout << " when (" << rule->condition()->c_str() << ")";
                }
                std::cout << " priority=" << rule->priority()
                          << " -> list " << rule->list() << std::endl;
            }
        }
    }
}

} // namespace Daehwa
