#include "daehwa_file_storage.h"
#include "daehwa_generated.h"
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace ICPDev::Daehwa::Schema;

namespace Daehwa {

static const char* kSaveFormatVersion = "1.0";

// --- Value ↔ SavedValue ---
static std::unique_ptr<SavedValueT> packValue(const Value& v) {
    auto sv = std::make_unique<SavedValueT>();
    switch (v.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            sv->kind = ValueKind::Null;
            break;
        case Value::value_t::boolean:
            sv->kind = ValueKind::Bool;
            sv->bool_val = v.get<bool>();
            break;
        case Value::value_t::number_integer:
            sv->kind = ValueKind::Integer;
            sv->int_val = v.get<int64_t>();
            break;
        case Value::value_t::number_unsigned:
            sv->kind = ValueKind::Unsigned;
            sv->uint_val = v.get<uint64_t>();
            break;
        case Value::value_t::number_float:
            sv->kind = ValueKind::Number;
            sv->number_val = v.get<double>();
            break;
        case Value::value_t::string:
            sv->kind = ValueKind::String;
            sv->string_val = v.get<std::string>();
            break;
        case Value::value_t::array:
            sv->kind = ValueKind::Array;
            for (const auto& item : v) {
                sv->items.push_back(packValue(item));
            }
            break;
        case Value::value_t::object:
            sv->kind = ValueKind::Object;
            for (auto it = v.begin(); it != v.end(); ++it) {
                sv->keys.push_back(it.key());
                sv->items.push_back(packValue(it.value()));
            }
            break;
        default:
            // binary 값은 저장 대상이 아님
            sv->kind = ValueKind::Null;
            break;
    }
    return sv;
}

static bool unpackValue(const SavedValue* sv, Value& out, std::string& error) {
    if (!sv) {
        out = Value();
        return true;
    }
    switch (sv->kind()) {
        case ValueKind::Null:
            out = Value();
            return true;
        case ValueKind::Bool:
            out = sv->bool_val();
            return true;
        case ValueKind::Integer:
            out = sv->int_val();
            return true;
        case ValueKind::Unsigned:
            out = sv->uint_val();
            return true;
        case ValueKind::Number:
            out = sv->number_val();
            return true;
        case ValueKind::String:
            out = sv->string_val() ? sv->string_val()->str() : std::string();
            return true;
        case ValueKind::Array: {
            out = Value::array();
            if (!sv->items()) return true;
            for (const auto* item : *sv->items()) {
                Value v;
                if (!unpackValue(item, v, error)) return false;
                out.push_back(std::move(v));
            }
            return true;
        }
        case ValueKind::Object: {
            out = Value::object();
            uint32_t keyCount = sv->keys() ? sv->keys()->size() : 0;
            uint32_t itemCount = sv->items() ? sv->items()->size() : 0;
            if (keyCount != itemCount) {
                error = "object keys/items length mismatch";
                return false;
            }
            for (uint32_t i = 0; i < keyCount; ++i) {
                Value v;
                if (!unpackValue(sv->items()->Get(i), v, error)) return false;
                out[sv->keys()->Get(i)->str()] = std::move(v);
            }
            return true;
        }
    }
    error = "unknown value kind";
    return false;
}

static SavedFrameKind packFrameKind(FrameKind kind) {
    switch (kind) {
        case FrameKind::Sequence: return SavedFrameKind::Sequence;
        case FrameKind::Block:    return SavedFrameKind::Block;
        case FrameKind::Loop:     return SavedFrameKind::Loop;
    }
    return SavedFrameKind::Sequence;
}

static FrameKind unpackFrameKind(SavedFrameKind kind) {
    switch (kind) {
        case SavedFrameKind::Sequence: return FrameKind::Sequence;
        case SavedFrameKind::Block:    return FrameKind::Block;
        case SavedFrameKind::Loop:     return FrameKind::Loop;
    }
    return FrameKind::Sequence;
}

// --- 직렬화 ---
std::vector<uint8_t> FileStorage::serialize(const ConversationState& state) {
    SavedConversationT saved;
    saved.version = kSaveFormatVersion;
    saved.user = packValue(state.user);
    saved.conversation = packValue(state.conversation);

    for (const auto& inst : state.stack) {
        auto si = std::make_unique<SavedInstanceT>();
        si->dialog_id = inst.dialogId;
        si->state = packValue(inst.state);
        si->result_property = inst.resultProperty;

        for (const auto& frame : inst.cursor) {
            auto sf = std::make_unique<SavedCursorFrameT>();
            sf->list = frame.list;
            sf->pos = frame.pos;
            sf->kind = packFrameKind(frame.kind);
            sf->iteration = frame.iteration;
            sf->input_pending = frame.inputPending;
            sf->input_attempts = frame.inputAttempts;
            sf->step_state = packValue(frame.stepState);
            si->cursor.push_back(std::move(sf));
        }
        saved.stack.push_back(std::move(si));
    }

    flatbuffers::FlatBufferBuilder fbb;
    auto offset = SavedConversation::Pack(fbb, &saved);
    fbb.Finish(offset);
    return std::vector<uint8_t>(fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize());
}

bool FileStorage::deserialize(const uint8_t* data, size_t size, ConversationState& state, std::string& error) {
    flatbuffers::Verifier verifier(data, size);
    if (!verifier.VerifyBuffer<SavedConversation>(nullptr)) {
        error = "invalid save data";
        return false;
    }
    auto* saved = flatbuffers::GetRoot<SavedConversation>(data);

    ConversationState loaded;
    if (!unpackValue(saved->user(), loaded.user, error)) return false;
    if (!unpackValue(saved->conversation(), loaded.conversation, error)) return false;
    if (loaded.user.is_null()) loaded.user = Value::object();
    if (loaded.conversation.is_null()) loaded.conversation = Value::object();

    if (saved->stack()) {
        for (const auto* si : *saved->stack()) {
            DialogInstance inst;
            inst.dialogId = si->dialog_id() ? si->dialog_id()->str() : "";
            inst.resultProperty = si->result_property() ? si->result_property()->str() : "";
            if (!unpackValue(si->state(), inst.state, error)) return false;
            if (!inst.state.is_object()) inst.state = Value::object();

            if (si->cursor()) {
                for (const auto* sf : *si->cursor()) {
                    CursorFrame frame;
                    frame.list = sf->list();
                    frame.pos = sf->pos();
                    frame.kind = unpackFrameKind(sf->kind());
                    frame.iteration = sf->iteration();
                    frame.inputPending = sf->input_pending();
                    frame.inputAttempts = sf->input_attempts();
                    if (!unpackValue(sf->step_state(), frame.stepState, error)) return false;
                    if (!frame.stepState.is_object()) frame.stepState = Value::object();
                    inst.cursor.push_back(std::move(frame));
                }
            }
            loaded.stack.push_back(std::move(inst));
        }
    }

    state = std::move(loaded);
    return true;
}

// --- 파일 입출력 ---
FileStorage::FileStorage(const std::string& directory) : directory_(directory) {
    if (!directory_.empty() && directory_.back() == '/') directory_.pop_back();
}

std::string FileStorage::pathFor(const std::string& key) const {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : key) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    // "." / ".." 같은 키가 디렉터리를 가리키지 않도록
    if (encoded.empty() || encoded[0] == '.') encoded = "%" + encoded;
    return (directory_.empty() ? std::string(".") : directory_) + "/" + encoded + ".dhs";
}

LoadResult FileStorage::load(const std::string& key, ConversationState& state, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = pathFor(key);

    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        state = ConversationState();
        return LoadResult::Empty;
    }

    auto size = ifs.tellg();
    if (size <= 0) {
        error = "empty save file: " + path;
        return LoadResult::Error;
    }
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    if (!ifs.read(reinterpret_cast<char*>(buf.data()), size)) {
        error = "failed to read save file: " + path;
        return LoadResult::Error;
    }

    if (!deserialize(buf.data(), buf.size(), state, error)) {
        error = path + ": " + error;
        std::cerr << "[Daehwa] " << error << std::endl;
        return LoadResult::Error;
    }
    return LoadResult::Found;
}

bool FileStorage::save(const std::string& key, const ConversationState& state, std::string& error) {
    std::vector<uint8_t> data = serialize(state);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = pathFor(key);
    std::string tmpPath = path + ".tmp";

    {
        std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            error = "cannot open save file: " + tmpPath;
            return false;
        }
        ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!ofs.good()) {
            error = "failed to write save file: " + tmpPath;
            return false;
        }
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        error = "failed to replace save file: " + path;
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

} // namespace Daehwa
