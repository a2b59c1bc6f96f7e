#include <gtest/gtest.h>
#include "test_helpers.h"
#include "daehwa_file_storage.h"
#include <cstdio>
#include <fstream>
#include <limits>

using namespace Daehwa;
using namespace DaehwaTest;
using Texts = std::vector<std::string>;

static const char* KEY = "test-storage";

// --- MemoryStorage ---

TEST(MemoryStorageTest, MissingKeyIsEmpty) {
    MemoryStorage storage;
    ConversationState state;
    state.user["stale"] = true;
    std::string error;
    EXPECT_EQ(storage.load("nobody", state, error), LoadResult::Empty);
    EXPECT_TRUE(state.user.empty());
    EXPECT_TRUE(state.stack.empty());
}

TEST(MemoryStorageTest, SaveStoresACopy) {
    MemoryStorage storage;
    ConversationState state;
    state.user["name"] = "Carlos";
    std::string error;
    ASSERT_TRUE(storage.save(KEY, state, error));

    state.user["name"] = "changed";

    ConversationState loaded;
    ASSERT_EQ(storage.load(KEY, loaded, error), LoadResult::Found);
    EXPECT_EQ(loaded.user["name"], "Carlos");
    EXPECT_EQ(storage.size(), 1u);

    storage.clear();
    EXPECT_EQ(storage.size(), 0u);
}

// --- FileStorage ---

class FileStorageTest : public ::testing::Test {
protected:
    FileStorage storage{"."};

    void TearDown() override {
        std::remove(storage.pathFor(KEY).c_str());
    }

    static ConversationState sampleState() {
        ConversationState state;
        state.user["name"] = "Carlos";
        state.user["age"] = 22;
        state.user["score"] = 1.5;
        state.user["vip"] = false;
        state.user["tags"] = Value::array({"a", "b"});
        state.user["nothing"] = nullptr;
        state.conversation["turns"] = 3;

        DialogInstance root;
        root.dialogId = "main";
        root.state["count"] = 2;
        CursorFrame seq;
        seq.list = 0;
        seq.pos = 1;
        root.cursor.push_back(seq);
        CursorFrame loop;
        loop.list = 3;
        loop.pos = 0;
        loop.kind = FrameKind::Loop;
        loop.iteration = 4;
        loop.inputPending = true;
        loop.inputAttempts = 2;
        loop.stepState["value"] = Value::object({{"nested", Value::array({1, 2})}});
        root.cursor.push_back(loop);
        state.stack.push_back(root);

        DialogInstance child;
        child.dialogId = "child";
        child.resultProperty = "dialog.answer";
        state.stack.push_back(child);
        return state;
    }
};

TEST_F(FileStorageTest, RoundTrip) {
    std::string error;
    ASSERT_TRUE(storage.save(KEY, sampleState(), error)) << error;

    ConversationState loaded;
    ASSERT_EQ(storage.load(KEY, loaded, error), LoadResult::Found) << error;

    ConversationState expected = sampleState();
    EXPECT_EQ(loaded.user, expected.user);
    EXPECT_EQ(loaded.conversation, expected.conversation);
    ASSERT_EQ(loaded.stack.size(), 2u);

    const auto& root = loaded.stack[0];
    EXPECT_EQ(root.dialogId, "main");
    EXPECT_EQ(root.state["count"], 2);
    ASSERT_EQ(root.cursor.size(), 2u);
    EXPECT_EQ(root.cursor[0].pos, 1u);
    EXPECT_EQ(root.cursor[0].kind, FrameKind::Sequence);
    EXPECT_EQ(root.cursor[1].list, 3);
    EXPECT_EQ(root.cursor[1].kind, FrameKind::Loop);
    EXPECT_EQ(root.cursor[1].iteration, 4u);
    EXPECT_TRUE(root.cursor[1].inputPending);
    EXPECT_EQ(root.cursor[1].inputAttempts, 2);
    EXPECT_EQ(root.cursor[1].stepState["value"]["nested"][1], 2);

    EXPECT_EQ(loaded.stack[1].dialogId, "child");
    EXPECT_EQ(loaded.stack[1].resultProperty, "dialog.answer");
    EXPECT_TRUE(loaded.stack[1].cursor.empty());
}

TEST_F(FileStorageTest, WideIntegersKeepTheirValue) {
    ConversationState state;
    state.user["max"] = std::numeric_limits<uint64_t>::max();
    state.user["big"] = static_cast<uint64_t>(9223372036854775808ull);
    state.user["min"] = std::numeric_limits<int64_t>::min();

    std::vector<uint8_t> data = FileStorage::serialize(state);
    ConversationState loaded;
    std::string error;
    ASSERT_TRUE(FileStorage::deserialize(data.data(), data.size(), loaded, error)) << error;

    EXPECT_EQ(loaded.user["max"].get<uint64_t>(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(loaded.user["big"].get<uint64_t>(), 9223372036854775808ull);
    EXPECT_EQ(loaded.user["min"].get<int64_t>(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(loaded.user, state.user);
}

TEST_F(FileStorageTest, MissingFileIsEmpty) {
    ConversationState state;
    std::string error;
    EXPECT_EQ(storage.load(KEY, state, error), LoadResult::Empty);
}

TEST_F(FileStorageTest, CorruptFileIsError) {
    {
        std::ofstream ofs(storage.pathFor(KEY), std::ios::binary);
        ofs << "this is not a save file";
    }
    ConversationState state;
    std::string error;
    EXPECT_EQ(storage.load(KEY, state, error), LoadResult::Error);
    EXPECT_FALSE(error.empty());
}

TEST_F(FileStorageTest, EmptyFileIsError) {
    { std::ofstream ofs(storage.pathFor(KEY), std::ios::binary); }
    ConversationState state;
    std::string error;
    EXPECT_EQ(storage.load(KEY, state, error), LoadResult::Error);
}

TEST_F(FileStorageTest, SerializeRejectsGarbage) {
    std::vector<uint8_t> data = FileStorage::serialize(sampleState());
    ASSERT_FALSE(data.empty());

    ConversationState state;
    std::string error;
    EXPECT_TRUE(FileStorage::deserialize(data.data(), data.size(), state, error)) << error;

    std::vector<uint8_t> truncated(data.begin(), data.begin() + data.size() / 3);
    EXPECT_FALSE(FileStorage::deserialize(truncated.data(), truncated.size(), state, error));
}

TEST(FileStoragePathTest, KeysAreEncoded) {
    FileStorage storage("saves/");
    EXPECT_EQ(storage.pathFor("web:user-1"), "saves/web%3Auser-1.dhs");
    EXPECT_EQ(storage.pathFor("a b/c"), "saves/a%20b%2Fc.dhs");
    EXPECT_EQ(storage.pathFor(".."), "saves/%...dhs");
    EXPECT_EQ(storage.pathFor(""), "saves/%.dhs");
}

// --- 매니저 재생성 후 대화 이어가기 ---

class ResumeTest : public ::testing::Test {
protected:
    void TearDown() override {
        FileStorage storage(".");
        std::remove(storage.pathFor(KEY).c_str());
    }
};

TEST_F(ResumeTest, ConversationSurvivesRestart) {
    const std::string source = R"({
        "dialogs": [ { "id": "main", "steps": [
            { "kind": "textInput", "property": "user.name", "prompt": "Hello, what is your name?" },
            { "kind": "sendActivity", "text": "Hello {user.name}, nice to meet you!" }
        ] } ]
    })";
    Bot bot;
    ASSERT_TRUE(loadBot(bot, source));

    {
        FileStorage storage(".");
        RecordingChannel channel;
        DialogManager manager(bot, storage, channel);
        TurnResult result = manager.processTurn(KEY, Activity::Message("hi"));
        EXPECT_EQ(result.outcome, TurnOutcome::Suspended);
        EXPECT_EQ(channel.texts(), Texts{"Hello, what is your name?"});
    }

    FileStorage storage(".");
    RecordingChannel channel;
    DialogManager manager(bot, storage, channel);
    EXPECT_EQ(manager.getActiveDialogs(KEY), Texts{"main"});

    TurnResult result = manager.processTurn(KEY, Activity::Message("Carlos"));
    EXPECT_EQ(result.outcome, TurnOutcome::StackCompleted);
    EXPECT_EQ(channel.texts(), Texts{"Hello Carlos, nice to meet you!"});
}

TEST_F(ResumeTest, CorruptStateIsStorageError) {
    Bot bot;
    ASSERT_TRUE(loadBot(bot, R"({ "dialogs": [ { "id": "main", "steps": [ { "kind": "endTurn" } ] } ] })"));

    FileStorage storage(".");
    {
        std::ofstream ofs(storage.pathFor(KEY), std::ios::binary);
        ofs << "garbage";
    }
    RecordingChannel channel;
    DialogManager manager(bot, storage, channel);
    TurnResult result = manager.processTurn(KEY, Activity::Message("hi"));
    EXPECT_EQ(result.outcome, TurnOutcome::Aborted);
    EXPECT_EQ(result.error, ErrorKind::Storage);
}
