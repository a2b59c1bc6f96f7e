#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Daehwa {

// 메모리 값: JSON 트리 (null / bool / number / string / array / object)
using Value = nlohmann::json;

// --- 경로 세그먼트 ---
struct PathSegment {
    bool isIndex = false;
    std::string key;
    size_t index = 0;
};

struct ParsedPath {
    std::string scope;
    std::vector<PathSegment> segments;
};

// --- Memory (스코프 리졸버) ---
// 각 스코프는 외부가 소유한 JSON 객체를 가리킨다. Memory 자체는 가벼운 뷰.
class Memory {
public:
    Memory(Value* user, Value* conversation, Value* dialog,
           Value* turn, Value* step, const Value* settings);

    // 경로 읽기. 중간 세그먼트가 없거나 스코프가 없으면 false (에러 아님)
    bool tryGet(const std::string& path, Value& out) const;
    Value get(const std::string& path) const;  // 없으면 null
    bool has(const std::string& path) const;

    // 경로 쓰기/삭제. 중간 세그먼트는 필요 시 생성.
    bool set(const std::string& path, const Value& value, std::string* error = nullptr);
    bool remove(const std::string& path, std::string* error = nullptr);

    // 모든 스코프를 하나의 객체로 (trace 용)
    Value snapshot() const;

    // "user.list[0]['key']" 형식 파싱
    static bool parsePath(const std::string& path, ParsedPath& out, std::string* error = nullptr);
    static bool isKnownScope(const std::string& scope);

private:
    Value* user_;
    Value* conversation_;
    Value* dialog_;
    Value* turn_;
    Value* step_;
    const Value* settings_;

    const Value* scopeRoot(const std::string& scope) const;
    Value* mutableScopeRoot(const std::string& scope);
};

} // namespace Daehwa
