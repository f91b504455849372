#include <gtest/gtest.h>
#include <mui/keyboard.hpp>
#include <SDL2/SDL.h>

using namespace mui;

TEST(KeyboardKey, LettersAndDigits) {
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_A), KeyboardKey::A);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_Z), KeyboardKey::Z);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_1), KeyboardKey::Num1);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_0), KeyboardKey::Num0);
}

TEST(KeyboardKey, KeypadAndModifiers) {
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_KP_ENTER), KeyboardKey::KpEnter);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_KP_HEXADECIMAL), KeyboardKey::KpHexadecimal);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_LSHIFT), KeyboardKey::LShift);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_RGUI), KeyboardKey::RGui);
}

TEST(KeyboardKey, MediaKeys) {
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_AUDIOPLAY), KeyboardKey::MediaPlayPause);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_AUDIONEXT), KeyboardKey::MediaNextTrack);
    EXPECT_EQ(keyboardKeyFromScancode(SDL_SCANCODE_AC_BOOKMARKS), KeyboardKey::AcBookmarks);
}

TEST(KeyboardKey, UnknownScancodesAreUnmapped) {
    EXPECT_FALSE(keyboardKeyFromScancode(SDL_SCANCODE_UNKNOWN).has_value());
    EXPECT_FALSE(keyboardKeyFromScancode(SDL_NUM_SCANCODES - 1).has_value());
    EXPECT_FALSE(keyboardKeyFromScancode(-1).has_value());
}

TEST(KeyboardKey, Names) {
    EXPECT_STREQ(keyboardKeyName(KeyboardKey::Escape), "Escape");
    EXPECT_STREQ(keyboardKeyName(KeyboardKey::KpEqualsAs400), "KpEqualsAs400");
}
