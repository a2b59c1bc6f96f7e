#pragma once
#include "daehwa_storage.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace Daehwa {

// --- 파일 저장소 ---
// 대화 키마다 <directory>/<encoded key>.dhs 하나. FlatBuffers SavedConversation 형식.
// 쓰기는 임시 파일 + rename 으로 원자적.
class FileStorage : public Storage {
public:
    explicit FileStorage(const std::string& directory);

    LoadResult load(const std::string& key, ConversationState& state, std::string& error) override;
    bool save(const std::string& key, const ConversationState& state, std::string& error) override;

    // 키 → 파일 경로 (영숫자, '-', '_', '.' 이외는 %XX 인코딩)
    std::string pathFor(const std::string& key) const;

    // 직렬화 (테스트/도구용)
    static std::vector<uint8_t> serialize(const ConversationState& state);
    static bool deserialize(const uint8_t* data, size_t size, ConversationState& state, std::string& error);

private:
    std::string directory_;
    std::mutex mutex_;
};

} // namespace Daehwa
