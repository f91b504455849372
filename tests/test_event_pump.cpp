#include <gtest/gtest.h>
#include <mui/event_pump.hpp>
#include <mui/platform.hpp>
#include <SDL2/SDL.h>
#include <cstring>
#include <memory>
#include <string>

using namespace mui;

// SDL with the dummy video driver: a real event queue without a display.
class EventPumpTest : public ::testing::Test {
protected:
    void SetUp() override {
        SDL_setenv("SDL_VIDEODRIVER", "dummy", 1);
        auto platform = Platform::Make();
        if (!platform) GTEST_SKIP() << platform.error().message;
        platform_ = platform.take();
    }

    static SDL_Event ofType(Uint32 type) {
        SDL_Event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.type = type;
        return ev;
    }

    static void push(SDL_Event ev) {
        ASSERT_EQ(SDL_PushEvent(&ev), 1) << SDL_GetError();
    }

    std::unique_ptr<Platform> platform_;
};

TEST_F(EventPumpTest, PlatformReportsVideoDriver) {
    EXPECT_STREQ(platform_->videoDriver(), "dummy");
}

TEST_F(EventPumpTest, SeedsDisplaysFromSdl) {
    EventPump pump(*platform_);
    EXPECT_EQ(pump.translator().displays().size(), size_t(SDL_GetNumVideoDisplays()));
    if (SDL_GetNumVideoDisplays() > 0) {
        EXPECT_NE(pump.display(DisplayHandle{0}), nullptr);
    }
}

TEST_F(EventPumpTest, PollIsEmptyWhenIdle) {
    EventPump pump(*platform_);
    SDL_FlushEvents(SDL_FIRSTEVENT, SDL_LASTEVENT);
    EXPECT_TRUE(pump.poll().empty());
}

TEST_F(EventPumpTest, PollPreservesArrivalOrder) {
    EventPump pump(*platform_);
    SDL_FlushEvents(SDL_FIRSTEVENT, SDL_LASTEVENT);

    SDL_Event key = ofType(SDL_KEYDOWN);
    key.key.keysym.scancode = SDL_SCANCODE_A;
    push(key);

    SDL_Event unknown = ofType(SDL_KEYDOWN);
    unknown.key.keysym.scancode = SDL_SCANCODE_UNKNOWN;
    unknown.key.repeat = 1;
    push(unknown);

    SDL_Event wheel = ofType(SDL_MOUSEWHEEL);
    wheel.wheel.y = 5;
    wheel.wheel.preciseY = 5.0f;
    push(wheel);

    SDL_Event window = ofType(SDL_WINDOWEVENT);
    window.window.event = SDL_WINDOWEVENT_MOVED;
    window.window.data1 = 12;
    window.window.data2 = 34;
    push(window);

    auto events = pump.poll();
    ASSERT_EQ(events.size(), 3u);

    EXPECT_EQ(events[0].type, Event::Type::KeyboardKeyDown);
    EXPECT_EQ(events[0].data.key.key, KeyboardKey::A);
    EXPECT_FALSE(events[0].data.key.repeat);

    EXPECT_EQ(events[1].type, Event::Type::MouseWheel);
    EXPECT_FLOAT_EQ(events[1].data.motion.y, -5.0f);

    EXPECT_EQ(events[2].type, Event::Type::WindowMoved);
    EXPECT_EQ(events[2].data.position.x, 12);
    EXPECT_EQ(events[2].data.position.y, 34);

    EXPECT_TRUE(pump.poll().empty());
}

TEST_F(EventPumpTest, DropFilePathIsCopiedOut) {
    EventPump pump(*platform_);
    SDL_FlushEvents(SDL_FIRSTEVENT, SDL_LASTEVENT);

    SDL_Event drop = ofType(SDL_DROPFILE);
    drop.drop.file = SDL_strdup("/tmp/sprite.png");
    push(drop);

    auto events = pump.poll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, Event::Type::DropFile);
    EXPECT_EQ(events[0].text, "/tmp/sprite.png");
}
