#pragma once
#include "daehwa_state.h"
#include <map>
#include <mutex>
#include <string>

namespace Daehwa {

enum class LoadResult { Found, Empty, Error };

// --- 저장소 인터페이스 (키 단위 원자적) ---
class Storage {
public:
    virtual ~Storage() = default;
    virtual LoadResult load(const std::string& key, ConversationState& state, std::string& error) = 0;
    virtual bool save(const std::string& key, const ConversationState& state, std::string& error) = 0;
};

// 프로세스 내 저장소. 복사로 주고받는다.
class MemoryStorage : public Storage {
public:
    LoadResult load(const std::string& key, ConversationState& state, std::string& error) override;
    bool save(const std::string& key, const ConversationState& state, std::string& error) override;

    void clear();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ConversationState> entries_;
};

} // namespace Daehwa
