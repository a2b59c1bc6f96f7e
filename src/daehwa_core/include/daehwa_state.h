#pragma once
#include "daehwa_memory.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Daehwa {

// --- 계층형 스텝 커서 ---
// Sequence: 규칙/다이얼로그의 스텝 목록
// Block: if/switch 분기 (부모는 이미 다음 스텝으로 이동한 상태)
// Loop: foreach/foreachPage 본문 (부모는 루프 스텝에 머무른다)
enum class FrameKind { Sequence, Block, Loop };

struct CursorFrame {
    int32_t list = -1;          // Dialog.lists 인덱스
    uint32_t pos = 0;
    FrameKind kind = FrameKind::Sequence;
    uint32_t iteration = 0;     // Loop: 현재 요소/페이지 번호

    // 입력 스텝 대기 상태 (pos가 가리키는 스텝)
    bool inputPending = false;
    int32_t inputAttempts = 0;

    // this 스코프 (현재 스텝 전용, 스텝 완료 시 비워짐)
    Value stepState = Value::object();
};

struct DialogInstance {
    std::string dialogId;
    Value state = Value::object();      // dialog 스코프
    std::vector<CursorFrame> cursor;
    std::string resultProperty;         // 부모 쪽 결과 바인딩 (비어 있으면 버림)
    uint64_t serial = 0;                // 턴 내부 식별용, 저장 안 함
};

// --- 대화 상태 (저장 단위) ---
struct ConversationState {
    std::vector<DialogInstance> stack;
    Value user = Value::object();
    Value conversation = Value::object();
};

} // namespace Daehwa
