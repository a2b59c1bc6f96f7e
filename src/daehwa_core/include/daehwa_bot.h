#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// FlatBuffers 생성 타입 전방 선언 (실제 정의는 daehwa_generated.h)
namespace ICPDev { namespace Daehwa { namespace Schema {
struct Bot;
struct Dialog;
struct StepList;
struct Step;
struct Rule;
} } }

namespace Daehwa {

namespace Schema = ICPDev::Daehwa::Schema;

// --- 컴파일된 봇 (.dhb) ---
class Bot {
public:
    Bot() = default;
    Bot(const Bot&) = delete;
    Bot& operator=(const Bot&) = delete;
    Bot(Bot&&) = default;
    Bot& operator=(Bot&&) = default;

    // .dhb 파일을 로드하고 검증한다. 성공 시 true 반환.
    bool loadFromFile(const std::string& filepath);
    bool loadFromBuffer(const uint8_t* data, size_t size);
    bool isLoaded() const { return !buffer_.empty(); }

    std::string version() const;
    std::string rootDialogId() const;
    const Schema::Dialog* findDialog(const std::string& id) const;
    std::vector<std::string> getDialogIds() const;

    // 로드된 봇 구조를 콘솔에 출력한다.
    void printBot() const;

    const uint8_t* getBuffer() const { return buffer_.data(); }
    size_t getBufferSize() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
    std::unordered_map<std::string, const Schema::Dialog*> dialogs_;

    bool indexDialogs();
};

// 다이얼로그의 리스트 아레나 조회. 범위 밖이면 nullptr.
const Schema::StepList* getStepList(const Schema::Dialog* dialog, int32_t index);

} // namespace Daehwa
