#include "daehwa_memory.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace Daehwa {

static const char* SCOPE_NAMES[] = {
    "user", "conversation", "dialog", "turn", "this", "settings"
};

Memory::Memory(Value* user, Value* conversation, Value* dialog,
               Value* turn, Value* step, const Value* settings)
    : user_(user), conversation_(conversation), dialog_(dialog),
      turn_(turn), step_(step), settings_(settings) {}

bool Memory::isKnownScope(const std::string& scope) {
    for (const char* name : SCOPE_NAMES) {
        if (scope == name) return true;
    }
    return false;
}

// --- 경로 파싱 ---
bool Memory::parsePath(const std::string& path, ParsedPath& out, std::string* error) {
    out.scope.clear();
    out.segments.clear();

    auto fail = [&](const std::string& msg) {
        if (error) *error = "invalid path '" + path + "': " + msg;
        return false;
    };

    size_t pos = 0;
    auto isIdentChar = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '@';
    };

    // 스코프 이름
    while (pos < path.size() && isIdentChar(path[pos])) {
        out.scope += path[pos];
        pos++;
    }
    if (out.scope.empty()) return fail("missing scope");
    if (!isKnownScope(out.scope)) return fail("unknown scope '" + out.scope + "'");

    while (pos < path.size()) {
        char c = path[pos];
        if (c == '.') {
            pos++;
            PathSegment seg;
            while (pos < path.size() && isIdentChar(path[pos])) {
                seg.key += path[pos];
                pos++;
            }
            if (seg.key.empty()) return fail("empty property name");
            out.segments.push_back(std::move(seg));
        } else if (c == '[') {
            pos++;
            PathSegment seg;
            if (pos < path.size() && (path[pos] == '\'' || path[pos] == '"')) {
                char quote = path[pos++];
                while (pos < path.size() && path[pos] != quote) {
                    seg.key += path[pos];
                    pos++;
                }
                if (pos >= path.size()) return fail("unterminated quoted key");
                pos++; // closing quote
            } else {
                std::string digits;
                while (pos < path.size() && std::isdigit(static_cast<unsigned char>(path[pos]))) {
                    digits += path[pos];
                    pos++;
                }
                if (digits.empty()) return fail("expected index or quoted key");
                seg.isIndex = true;
                errno = 0;
                unsigned long index = std::strtoul(digits.c_str(), nullptr, 10);
                if (errno == ERANGE) return fail("index out of range: " + digits);
                seg.index = static_cast<size_t>(index);
            }
            if (pos >= path.size() || path[pos] != ']') return fail("missing ']'");
            pos++;
            out.segments.push_back(std::move(seg));
        } else {
            return fail(std::string("unexpected character '") + c + "'");
        }
    }
    return true;
}

// --- 스코프 루트 ---
const Value* Memory::scopeRoot(const std::string& scope) const {
    if (scope == "user") return user_;
    if (scope == "conversation") return conversation_;
    if (scope == "dialog") return dialog_;
    if (scope == "turn") return turn_;
    if (scope == "this") return step_;
    if (scope == "settings") return settings_;
    return nullptr;
}

Value* Memory::mutableScopeRoot(const std::string& scope) {
    if (scope == "user") return user_;
    if (scope == "conversation") return conversation_;
    if (scope == "dialog") return dialog_;
    if (scope == "turn") return turn_;
    if (scope == "this") return step_;
    return nullptr; // settings는 읽기 전용
}

// --- 읽기 ---
bool Memory::tryGet(const std::string& path, Value& out) const {
    ParsedPath parsed;
    if (!parsePath(path, parsed)) return false;

    const Value* node = scopeRoot(parsed.scope);
    if (!node) return false;

    for (const auto& seg : parsed.segments) {
        if (seg.isIndex) {
            if (!node->is_array() || seg.index >= node->size()) return false;
            node = &(*node)[seg.index];
        } else {
            if (!node->is_object()) return false;
            auto it = node->find(seg.key);
            if (it == node->end()) return false;
            node = &(*it);
        }
    }
    out = *node;
    return true;
}

Value Memory::get(const std::string& path) const {
    Value v;
    if (!tryGet(path, v)) return Value();
    return v;
}

bool Memory::has(const std::string& path) const {
    Value v;
    return tryGet(path, v) && !v.is_null();
}

// --- 쓰기 ---
bool Memory::set(const std::string& path, const Value& value, std::string* error) {
    ParsedPath parsed;
    if (!parsePath(path, parsed, error)) return false;

    Value* node = mutableScopeRoot(parsed.scope);
    if (!node) {
        if (error) *error = "scope '" + parsed.scope + "' is read-only";
        return false;
    }

    // 스코프 자체를 통째로 교체
    if (parsed.segments.empty()) {
        if (!value.is_object()) {
            if (error) *error = "scope '" + parsed.scope + "' can only hold an object";
            return false;
        }
        *node = value;
        return true;
    }

    // 인덱스는 기존 원소 또는 바로 다음 자리(추가)만 허용, 쓰기 전에 확인
    const Value* cur = node;
    for (const auto& seg : parsed.segments) {
        if (seg.isIndex) {
            size_t size = (cur && cur->is_array()) ? cur->size() : 0;
            if (seg.index > size) {
                if (error) {
                    *error = "index " + std::to_string(seg.index) + " out of range (size " +
                             std::to_string(size) + ") in '" + path + "'";
                }
                return false;
            }
            cur = (seg.index < size) ? &(*cur)[seg.index] : nullptr;
        } else if (cur && cur->is_object()) {
            auto it = cur->find(seg.key);
            cur = (it != cur->end()) ? &*it : nullptr;
        } else {
            cur = nullptr;
        }
    }

    for (size_t i = 0; i < parsed.segments.size(); ++i) {
        const auto& seg = parsed.segments[i];
        bool last = (i + 1 == parsed.segments.size());

        if (seg.isIndex) {
            if (node->is_null()) *node = Value::array();
            if (!node->is_array()) {
                if (error) *error = "cannot index into non-array at '" + path + "'";
                return false;
            }
            if (seg.index == node->size()) node->push_back(nullptr);
            node = &(*node)[seg.index];
        } else {
            if (node->is_null()) *node = Value::object();
            if (!node->is_object()) {
                if (error) *error = "cannot set property '" + seg.key + "' on non-object in '" + path + "'";
                return false;
            }
            node = &(*node)[seg.key];
        }

        if (last) {
            *node = value;
        }
    }
    return true;
}

bool Memory::remove(const std::string& path, std::string* error) {
    ParsedPath parsed;
    if (!parsePath(path, parsed, error)) return false;

    Value* node = mutableScopeRoot(parsed.scope);
    if (!node) {
        if (error) *error = "scope '" + parsed.scope + "' is read-only";
        return false;
    }
    if (parsed.segments.empty()) {
        *node = Value::object();
        return true;
    }

    // 부모 노드까지 이동, 없으면 이미 삭제된 것으로 간주
    for (size_t i = 0; i + 1 < parsed.segments.size(); ++i) {
        const auto& seg = parsed.segments[i];
        if (seg.isIndex) {
            if (!node->is_array() || seg.index >= node->size()) return true;
            node = &(*node)[seg.index];
        } else {
            if (!node->is_object()) return true;
            auto it = node->find(seg.key);
            if (it == node->end()) return true;
            node = &(*it);
        }
    }

    const auto& leaf = parsed.segments.back();
    if (leaf.isIndex) {
        if (node->is_array() && leaf.index < node->size()) {
            node->erase(leaf.index);
        }
    } else if (node->is_object()) {
        node->erase(leaf.key);
    }
    return true;
}

Value Memory::snapshot() const {
    Value all = Value::object();
    for (const char* name : SCOPE_NAMES) {
        const Value* root = scopeRoot(name);
        all[name] = root ? *root : Value::object();
    }
    return all;
}

} // namespace Daehwa
