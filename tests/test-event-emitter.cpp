#include <procshell/event_emitter.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

namespace {

using Emitter = procshell::EventEmitter<int>;
using testing::ElementsAre;
using testing::IsEmpty;

TEST(EventEmitter, EmitWithoutListeners)
{
    Emitter emitter;
    EXPECT_FALSE(emitter.emit("data", 1));
    EXPECT_EQ(emitter.listener_count("data"), 0u);
}

TEST(EventEmitter, RegistrationOrder)
{
    Emitter emitter;
    std::vector<std::string> calls;

    emitter.on("data", [&](int const x) { calls.push_back("first " + std::to_string(x)); });
    emitter.on("data", [&](int const x) { calls.push_back("second " + std::to_string(x)); });
    emitter.on("other", [&](int) { calls.push_back("other"); });

    EXPECT_TRUE(emitter.emit("data", 7));
    EXPECT_THAT(calls, ElementsAre("first 7", "second 7"));
}

TEST(EventEmitter, PrependListener)
{
    Emitter emitter;
    std::vector<int> calls;

    emitter.on("data", [&](int) { calls.push_back(2); });
    emitter.prepend_listener("data", [&](int) { calls.push_back(1); });
    emitter.prepend_once_listener("data", [&](int) { calls.push_back(0); });

    emitter.emit("data", 0);
    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre(0, 1, 2, 1, 2));
}

TEST(EventEmitter, PrependOnceOrdering)
{
    Emitter emitter;
    std::vector<std::string> calls;

    emitter.on("data", [&](int) { calls.push_back("on"); });
    emitter.prepend_once_listener("data", [&](int) { calls.push_back("once b"); });
    emitter.prepend_once_listener("data", [&](int) { calls.push_back("once a"); });
    EXPECT_EQ(emitter.listener_count("data"), 3u);

    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre("once a", "once b", "on"));
    EXPECT_EQ(emitter.listener_count("data"), 1u);
}

TEST(EventEmitter, PrependOnceUnderReentrantEmit)
{
    Emitter emitter;
    int once_calls = 0;

    // the once listener re-emits from inside its own call
    emitter.prepend_once_listener("data", [&](int const depth) {
        once_calls++;
        if (depth < 3)
        {
            emitter.emit("data", depth + 1);
        }
    });
    emitter.on("data", [&](int const depth) {
        if (depth == 0)
        {
            emitter.emit("data", 10);
        }
    });

    emitter.emit("data", 0);
    EXPECT_EQ(once_calls, 1);
    EXPECT_EQ(emitter.listener_count("data"), 1u);
}

TEST(EventEmitter, OffRemovesOnceWrapperOnlyByItsIdentity)
{
    Emitter emitter;
    int calls = 0;

    Emitter::Listener const listener = [&](int) { calls++; };
    emitter.once("data", listener);

    // once registers a wrapper, not the listener itself
    emitter.off("data", listener);
    EXPECT_EQ(emitter.listener_count("data"), 1u);
    emitter.emit("data", 0);
    EXPECT_EQ(calls, 1);
}

TEST(EventEmitter, OffBeforeEmit)
{
    Emitter emitter;
    int calls = 0;

    Emitter::Listener const listener = [&](int) { calls++; };
    emitter.on("data", listener);
    EXPECT_EQ(emitter.listener_count("data"), 1u);

    emitter.off("data", listener);
    EXPECT_EQ(emitter.listener_count("data"), 0u);
    EXPECT_FALSE(emitter.emit("data", 1));
    EXPECT_EQ(calls, 0);
}

TEST(EventEmitter, OffRemovesOnlyThatListener)
{
    Emitter emitter;
    std::vector<int> calls;

    Emitter::Listener const first = [&](int) { calls.push_back(1); };
    Emitter::Listener const twin = [&](int) { calls.push_back(1); };

    emitter.on("data", first);
    emitter.on("data", twin);
    emitter.remove_listener("data", first);

    EXPECT_EQ(emitter.listener_count("data"), 1u);
    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre(1));
}

TEST(EventEmitter, OffRemovesEveryRegistration)
{
    Emitter emitter;
    int calls = 0;

    Emitter::Listener const listener = [&](int) { calls++; };
    emitter.on("data", listener);
    emitter.add_listener("data", listener);
    EXPECT_EQ(emitter.listener_count("data"), 2u);

    emitter.off("data", listener);
    EXPECT_FALSE(emitter.emit("data", 0));
    EXPECT_EQ(calls, 0);
}

TEST(EventEmitter, OnceFiresOnce)
{
    Emitter emitter;
    std::vector<int> calls;

    emitter.once("data", [&](int const x) { calls.push_back(x); });
    EXPECT_EQ(emitter.listener_count("data"), 1u);

    EXPECT_TRUE(emitter.emit("data", 1));
    EXPECT_FALSE(emitter.emit("data", 2));
    EXPECT_THAT(calls, ElementsAre(1));
    EXPECT_EQ(emitter.listener_count("data"), 0u);
}

TEST(EventEmitter, OnceUnderReentrantEmit)
{
    Emitter emitter;
    int once_calls = 0;
    int depth = 0;

    // the first listener re-emits before the once listener runs
    emitter.on("data", [&](int) {
        if (depth++ < 3)
        {
            emitter.emit("data", 0);
        }
    });
    emitter.once("data", [&](int) { once_calls++; });

    emitter.emit("data", 0);
    EXPECT_EQ(once_calls, 1);
    EXPECT_EQ(emitter.listener_count("data"), 1u);
}

TEST(EventEmitter, OnceReentrantFromItself)
{
    Emitter emitter;
    int calls = 0;

    emitter.once("data", [&](int) {
        calls++;
        emitter.emit("data", 0);
    });

    emitter.emit("data", 0);
    EXPECT_EQ(calls, 1);
}

TEST(EventEmitter, ListenerAddedDuringEmit)
{
    Emitter emitter;
    std::vector<int> calls;

    emitter.on("data", [&](int) {
        calls.push_back(1);
        if (calls.size() == 1)
        {
            emitter.on("data", [&](int) { calls.push_back(2); });
        }
    });

    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre(1, 2));
}

TEST(EventEmitter, ListenerRemovedDuringEmitStillReached)
{
    Emitter emitter;
    std::vector<int> calls;

    Emitter::Listener const second = [&](int) { calls.push_back(2); };
    emitter.on("data", [&](int) {
        calls.push_back(1);
        emitter.off("data", second);
    });
    emitter.on("data", second);

    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre(1, 2));

    calls.clear();
    emitter.emit("data", 0);
    EXPECT_THAT(calls, ElementsAre(1));
}

TEST(EventEmitter, RemoveAllListeners)
{
    Emitter emitter;
    emitter.on("a", [](int) {});
    emitter.on("b", [](int) {});

    emitter.remove_all_listeners("a");
    EXPECT_EQ(emitter.listener_count("a"), 0u);
    EXPECT_EQ(emitter.listener_count("b"), 1u);

    emitter.remove_all_listeners();
    EXPECT_FALSE(emitter.emit("b", 0));
}

TEST(EventEmitter, ListenerCopiesCompareEqual)
{
    Emitter::Listener const a = [](int) {};
    Emitter::Listener const b = a;
    Emitter::Listener const c = [](int) {};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

} // namespace
