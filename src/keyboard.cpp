#include "mui/keyboard.hpp"
#include <SDL2/SDL.h>

namespace mui {

std::optional<KeyboardKey> keyboardKeyFromScancode(i32 scancode) {
    switch (scancode) {
    case SDL_SCANCODE_A: return KeyboardKey::A;
    case SDL_SCANCODE_B: return KeyboardKey::B;
    case SDL_SCANCODE_C: return KeyboardKey::C;
    case SDL_SCANCODE_D: return KeyboardKey::D;
    case SDL_SCANCODE_E: return KeyboardKey::E;
    case SDL_SCANCODE_F: return KeyboardKey::F;
    case SDL_SCANCODE_G: return KeyboardKey::G;
    case SDL_SCANCODE_H: return KeyboardKey::H;
    case SDL_SCANCODE_I: return KeyboardKey::I;
    case SDL_SCANCODE_J: return KeyboardKey::J;
    case SDL_SCANCODE_K: return KeyboardKey::K;
    case SDL_SCANCODE_L: return KeyboardKey::L;
    case SDL_SCANCODE_M: return KeyboardKey::M;
    case SDL_SCANCODE_N: return KeyboardKey::N;
    case SDL_SCANCODE_O: return KeyboardKey::O;
    case SDL_SCANCODE_P: return KeyboardKey::P;
    case SDL_SCANCODE_Q: return KeyboardKey::Q;
    case SDL_SCANCODE_R: return KeyboardKey::R;
    case SDL_SCANCODE_S: return KeyboardKey::S;
    case SDL_SCANCODE_T: return KeyboardKey::T;
    case SDL_SCANCODE_U: return KeyboardKey::U;
    case SDL_SCANCODE_V: return KeyboardKey::V;
    case SDL_SCANCODE_W: return KeyboardKey::W;
    case SDL_SCANCODE_X: return KeyboardKey::X;
    case SDL_SCANCODE_Y: return KeyboardKey::Y;
    case SDL_SCANCODE_Z: return KeyboardKey::Z;
    case SDL_SCANCODE_1: return KeyboardKey::Num1;
    case SDL_SCANCODE_2: return KeyboardKey::Num2;
    case SDL_SCANCODE_3: return KeyboardKey::Num3;
    case SDL_SCANCODE_4: return KeyboardKey::Num4;
    case SDL_SCANCODE_5: return KeyboardKey::Num5;
    case SDL_SCANCODE_6: return KeyboardKey::Num6;
    case SDL_SCANCODE_7: return KeyboardKey::Num7;
    case SDL_SCANCODE_8: return KeyboardKey::Num8;
    case SDL_SCANCODE_9: return KeyboardKey::Num9;
    case SDL_SCANCODE_0: return KeyboardKey::Num0;
    case SDL_SCANCODE_RETURN: return KeyboardKey::Return;
    case SDL_SCANCODE_ESCAPE: return KeyboardKey::Escape;
    case SDL_SCANCODE_BACKSPACE: return KeyboardKey::Backspace;
    case SDL_SCANCODE_TAB: return KeyboardKey::Tab;
    case SDL_SCANCODE_SPACE: return KeyboardKey::Space;
    case SDL_SCANCODE_MINUS: return KeyboardKey::Minus;
    case SDL_SCANCODE_EQUALS: return KeyboardKey::Equals;
    case SDL_SCANCODE_LEFTBRACKET: return KeyboardKey::LeftBracket;
    case SDL_SCANCODE_RIGHTBRACKET: return KeyboardKey::RightBracket;
    case SDL_SCANCODE_BACKSLASH: return KeyboardKey::Backslash;
    case SDL_SCANCODE_NONUSHASH: return KeyboardKey::NonUsHash;
    case SDL_SCANCODE_SEMICOLON: return KeyboardKey::Semicolon;
    case SDL_SCANCODE_APOSTROPHE: return KeyboardKey::Apostrophe;
    case SDL_SCANCODE_GRAVE: return KeyboardKey::Grave;
    case SDL_SCANCODE_COMMA: return KeyboardKey::Comma;
    case SDL_SCANCODE_PERIOD: return KeyboardKey::Period;
    case SDL_SCANCODE_SLASH: return KeyboardKey::Slash;
    case SDL_SCANCODE_CAPSLOCK: return KeyboardKey::CapsLock;
    case SDL_SCANCODE_F1: return KeyboardKey::F1;
    case SDL_SCANCODE_F2: return KeyboardKey::F2;
    case SDL_SCANCODE_F3: return KeyboardKey::F3;
    case SDL_SCANCODE_F4: return KeyboardKey::F4;
    case SDL_SCANCODE_F5: return KeyboardKey::F5;
    case SDL_SCANCODE_F6: return KeyboardKey::F6;
    case SDL_SCANCODE_F7: return KeyboardKey::F7;
    case SDL_SCANCODE_F8: return KeyboardKey::F8;
    case SDL_SCANCODE_F9: return KeyboardKey::F9;
    case SDL_SCANCODE_F10: return KeyboardKey::F10;
    case SDL_SCANCODE_F11: return KeyboardKey::F11;
    case SDL_SCANCODE_F12: return KeyboardKey::F12;
    case SDL_SCANCODE_PRINTSCREEN: return KeyboardKey::PrintScreen;
    case SDL_SCANCODE_SCROLLLOCK: return KeyboardKey::ScrollLock;
    case SDL_SCANCODE_PAUSE: return KeyboardKey::Pause;
    case SDL_SCANCODE_INSERT: return KeyboardKey::Insert;
    case SDL_SCANCODE_HOME: return KeyboardKey::Home;
    case SDL_SCANCODE_PAGEUP: return KeyboardKey::PageUp;
    case SDL_SCANCODE_DELETE: return KeyboardKey::Delete;
    case SDL_SCANCODE_END: return KeyboardKey::End;
    case SDL_SCANCODE_PAGEDOWN: return KeyboardKey::PageDown;
    case SDL_SCANCODE_RIGHT: return KeyboardKey::Right;
    case SDL_SCANCODE_LEFT: return KeyboardKey::Left;
    case SDL_SCANCODE_DOWN: return KeyboardKey::Down;
    case SDL_SCANCODE_UP: return KeyboardKey::Up;
    case SDL_SCANCODE_NUMLOCKCLEAR: return KeyboardKey::NumLockClear;
    case SDL_SCANCODE_KP_DIVIDE: return KeyboardKey::KpDivide;
    case SDL_SCANCODE_KP_MULTIPLY: return KeyboardKey::KpMultiply;
    case SDL_SCANCODE_KP_MINUS: return KeyboardKey::KpMinus;
    case SDL_SCANCODE_KP_PLUS: return KeyboardKey::KpPlus;
    case SDL_SCANCODE_KP_ENTER: return KeyboardKey::KpEnter;
    case SDL_SCANCODE_KP_1: return KeyboardKey::Kp1;
    case SDL_SCANCODE_KP_2: return KeyboardKey::Kp2;
    case SDL_SCANCODE_KP_3: return KeyboardKey::Kp3;
    case SDL_SCANCODE_KP_4: return KeyboardKey::Kp4;
    case SDL_SCANCODE_KP_5: return KeyboardKey::Kp5;
    case SDL_SCANCODE_KP_6: return KeyboardKey::Kp6;
    case SDL_SCANCODE_KP_7: return KeyboardKey::Kp7;
    case SDL_SCANCODE_KP_8: return KeyboardKey::Kp8;
    case SDL_SCANCODE_KP_9: return KeyboardKey::Kp9;
    case SDL_SCANCODE_KP_0: return KeyboardKey::Kp0;
    case SDL_SCANCODE_KP_PERIOD: return KeyboardKey::KpPeriod;
    case SDL_SCANCODE_NONUSBACKSLASH: return KeyboardKey::NonUsBackslash;
    case SDL_SCANCODE_APPLICATION: return KeyboardKey::Application;
    case SDL_SCANCODE_POWER: return KeyboardKey::Power;
    case SDL_SCANCODE_KP_EQUALS: return KeyboardKey::KpEquals;
    case SDL_SCANCODE_F13: return KeyboardKey::F13;
    case SDL_SCANCODE_F14: return KeyboardKey::F14;
    case SDL_SCANCODE_F15: return KeyboardKey::F15;
    case SDL_SCANCODE_F16: return KeyboardKey::F16;
    case SDL_SCANCODE_F17: return KeyboardKey::F17;
    case SDL_SCANCODE_F18: return KeyboardKey::F18;
    case SDL_SCANCODE_F19: return KeyboardKey::F19;
    case SDL_SCANCODE_F20: return KeyboardKey::F20;
    case SDL_SCANCODE_F21: return KeyboardKey::F21;
    case SDL_SCANCODE_F22: return KeyboardKey::F22;
    case SDL_SCANCODE_F23: return KeyboardKey::F23;
    case SDL_SCANCODE_F24: return KeyboardKey::F24;
    case SDL_SCANCODE_EXECUTE: return KeyboardKey::Execute;
    case SDL_SCANCODE_HELP: return KeyboardKey::Help;
    case SDL_SCANCODE_MENU: return KeyboardKey::Menu;
    case SDL_SCANCODE_SELECT: return KeyboardKey::Select;
    case SDL_SCANCODE_STOP: return KeyboardKey::Stop;
    case SDL_SCANCODE_AGAIN: return KeyboardKey::Again;
    case SDL_SCANCODE_UNDO: return KeyboardKey::Undo;
    case SDL_SCANCODE_CUT: return KeyboardKey::Cut;
    case SDL_SCANCODE_COPY: return KeyboardKey::Copy;
    case SDL_SCANCODE_PASTE: return KeyboardKey::Paste;
    case SDL_SCANCODE_FIND: return KeyboardKey::Find;
    case SDL_SCANCODE_MUTE: return KeyboardKey::Mute;
    case SDL_SCANCODE_VOLUMEUP: return KeyboardKey::VolumeUp;
    case SDL_SCANCODE_VOLUMEDOWN: return KeyboardKey::VolumeDown;
    case SDL_SCANCODE_KP_COMMA: return KeyboardKey::KpComma;
    case SDL_SCANCODE_KP_EQUALSAS400: return KeyboardKey::KpEqualsAs400;
    case SDL_SCANCODE_INTERNATIONAL1: return KeyboardKey::International1;
    case SDL_SCANCODE_INTERNATIONAL2: return KeyboardKey::International2;
    case SDL_SCANCODE_INTERNATIONAL3: return KeyboardKey::International3;
    case SDL_SCANCODE_INTERNATIONAL4: return KeyboardKey::International4;
    case SDL_SCANCODE_INTERNATIONAL5: return KeyboardKey::International5;
    case SDL_SCANCODE_INTERNATIONAL6: return KeyboardKey::International6;
    case SDL_SCANCODE_INTERNATIONAL7: return KeyboardKey::International7;
    case SDL_SCANCODE_INTERNATIONAL8: return KeyboardKey::International8;
    case SDL_SCANCODE_INTERNATIONAL9: return KeyboardKey::International9;
    case SDL_SCANCODE_LANG1: return KeyboardKey::Lang1;
    case SDL_SCANCODE_LANG2: return KeyboardKey::Lang2;
    case SDL_SCANCODE_LANG3: return KeyboardKey::Lang3;
    case SDL_SCANCODE_LANG4: return KeyboardKey::Lang4;
    case SDL_SCANCODE_LANG5: return KeyboardKey::Lang5;
    case SDL_SCANCODE_LANG6: return KeyboardKey::Lang6;
    case SDL_SCANCODE_LANG7: return KeyboardKey::Lang7;
    case SDL_SCANCODE_LANG8: return KeyboardKey::Lang8;
    case SDL_SCANCODE_LANG9: return KeyboardKey::Lang9;
    case SDL_SCANCODE_ALTERASE: return KeyboardKey::AltErase;
    case SDL_SCANCODE_SYSREQ: return KeyboardKey::SysReq;
    case SDL_SCANCODE_CANCEL: return KeyboardKey::Cancel;
    case SDL_SCANCODE_CLEAR: return KeyboardKey::Clear;
    case SDL_SCANCODE_PRIOR: return KeyboardKey::Prior;
    case SDL_SCANCODE_RETURN2: return KeyboardKey::Return2;
    case SDL_SCANCODE_SEPARATOR: return KeyboardKey::Separator;
    case SDL_SCANCODE_OUT: return KeyboardKey::Out;
    case SDL_SCANCODE_OPER: return KeyboardKey::Oper;
    case SDL_SCANCODE_CLEARAGAIN: return KeyboardKey::ClearAgain;
    case SDL_SCANCODE_CRSEL: return KeyboardKey::CrSel;
    case SDL_SCANCODE_EXSEL: return KeyboardKey::ExSel;
    case SDL_SCANCODE_KP_00: return KeyboardKey::Kp00;
    case SDL_SCANCODE_KP_000: return KeyboardKey::Kp000;
    case SDL_SCANCODE_THOUSANDSSEPARATOR: return KeyboardKey::ThousandsSeparator;
    case SDL_SCANCODE_DECIMALSEPARATOR: return KeyboardKey::DecimalSeparator;
    case SDL_SCANCODE_CURRENCYUNIT: return KeyboardKey::CurrencyUnit;
    case SDL_SCANCODE_CURRENCYSUBUNIT: return KeyboardKey::CurrencySubunit;
    case SDL_SCANCODE_KP_LEFTPAREN: return KeyboardKey::KpLeftParen;
    case SDL_SCANCODE_KP_RIGHTPAREN: return KeyboardKey::KpRightParen;
    case SDL_SCANCODE_KP_LEFTBRACE: return KeyboardKey::KpLeftBrace;
    case SDL_SCANCODE_KP_RIGHTBRACE: return KeyboardKey::KpRightBrace;
    case SDL_SCANCODE_KP_TAB: return KeyboardKey::KpTab;
    case SDL_SCANCODE_KP_BACKSPACE: return KeyboardKey::KpBackspace;
    case SDL_SCANCODE_KP_A: return KeyboardKey::KpA;
    case SDL_SCANCODE_KP_B: return KeyboardKey::KpB;
    case SDL_SCANCODE_KP_C: return KeyboardKey::KpC;
    case SDL_SCANCODE_KP_D: return KeyboardKey::KpD;
    case SDL_SCANCODE_KP_E: return KeyboardKey::KpE;
    case SDL_SCANCODE_KP_F: return KeyboardKey::KpF;
    case SDL_SCANCODE_KP_XOR: return KeyboardKey::KpXor;
    case SDL_SCANCODE_KP_POWER: return KeyboardKey::KpPower;
    case SDL_SCANCODE_KP_PERCENT: return KeyboardKey::KpPercent;
    case SDL_SCANCODE_KP_LESS: return KeyboardKey::KpLess;
    case SDL_SCANCODE_KP_GREATER: return KeyboardKey::KpGreater;
    case SDL_SCANCODE_KP_AMPERSAND: return KeyboardKey::KpAmpersand;
    case SDL_SCANCODE_KP_DBLAMPERSAND: return KeyboardKey::KpDblAmpersand;
    case SDL_SCANCODE_KP_VERTICALBAR: return KeyboardKey::KpVerticalBar;
    case SDL_SCANCODE_KP_DBLVERTICALBAR: return KeyboardKey::KpDblVerticalBar;
    case SDL_SCANCODE_KP_COLON: return KeyboardKey::KpColon;
    case SDL_SCANCODE_KP_HASH: return KeyboardKey::KpHash;
    case SDL_SCANCODE_KP_SPACE: return KeyboardKey::KpSpace;
    case SDL_SCANCODE_KP_AT: return KeyboardKey::KpAt;
    case SDL_SCANCODE_KP_EXCLAM: return KeyboardKey::KpExclam;
    case SDL_SCANCODE_KP_MEMSTORE: return KeyboardKey::KpMemStore;
    case SDL_SCANCODE_KP_MEMRECALL: return KeyboardKey::KpMemRecall;
    case SDL_SCANCODE_KP_MEMCLEAR: return KeyboardKey::KpMemClear;
    case SDL_SCANCODE_KP_MEMADD: return KeyboardKey::KpMemAdd;
    case SDL_SCANCODE_KP_MEMSUBTRACT: return KeyboardKey::KpMemSubtract;
    case SDL_SCANCODE_KP_MEMMULTIPLY: return KeyboardKey::KpMemMultiply;
    case SDL_SCANCODE_KP_MEMDIVIDE: return KeyboardKey::KpMemDivide;
    case SDL_SCANCODE_KP_PLUSMINUS: return KeyboardKey::KpPlusMinus;
    case SDL_SCANCODE_KP_CLEAR: return KeyboardKey::KpClear;
    case SDL_SCANCODE_KP_CLEARENTRY: return KeyboardKey::KpClearEntry;
    case SDL_SCANCODE_KP_BINARY: return KeyboardKey::KpBinary;
    case SDL_SCANCODE_KP_OCTAL: return KeyboardKey::KpOctal;
    case SDL_SCANCODE_KP_DECIMAL: return KeyboardKey::KpDecimal;
    case SDL_SCANCODE_KP_HEXADECIMAL: return KeyboardKey::KpHexadecimal;
    case SDL_SCANCODE_LCTRL: return KeyboardKey::LCtrl;
    case SDL_SCANCODE_LSHIFT: return KeyboardKey::LShift;
    case SDL_SCANCODE_LALT: return KeyboardKey::LAlt;
    case SDL_SCANCODE_LGUI: return KeyboardKey::LGui;
    case SDL_SCANCODE_RCTRL: return KeyboardKey::RCtrl;
    case SDL_SCANCODE_RSHIFT: return KeyboardKey::RShift;
    case SDL_SCANCODE_RALT: return KeyboardKey::RAlt;
    case SDL_SCANCODE_RGUI: return KeyboardKey::RGui;
    case SDL_SCANCODE_MODE: return KeyboardKey::Mode;
    case SDL_SCANCODE_SLEEP: return KeyboardKey::Sleep;
    case SDL_SCANCODE_AUDIOPLAY: return KeyboardKey::MediaPlayPause;
    case SDL_SCANCODE_AUDIOSTOP: return KeyboardKey::MediaStop;
    case SDL_SCANCODE_AUDIONEXT: return KeyboardKey::MediaNextTrack;
    case SDL_SCANCODE_AUDIOPREV: return KeyboardKey::MediaPreviousTrack;
    case SDL_SCANCODE_AUDIOREWIND: return KeyboardKey::MediaRewind;
    case SDL_SCANCODE_AUDIOFASTFORWARD: return KeyboardKey::MediaFastForward;
    case SDL_SCANCODE_EJECT: return KeyboardKey::MediaEject;
    case SDL_SCANCODE_MEDIASELECT: return KeyboardKey::MediaSelect;
    case SDL_SCANCODE_AC_SEARCH: return KeyboardKey::AcSearch;
    case SDL_SCANCODE_AC_HOME: return KeyboardKey::AcHome;
    case SDL_SCANCODE_AC_BACK: return KeyboardKey::AcBack;
    case SDL_SCANCODE_AC_FORWARD: return KeyboardKey::AcForward;
    case SDL_SCANCODE_AC_STOP: return KeyboardKey::AcStop;
    case SDL_SCANCODE_AC_REFRESH: return KeyboardKey::AcRefresh;
    case SDL_SCANCODE_AC_BOOKMARKS: return KeyboardKey::AcBookmarks;
    default: return std::nullopt;
    }
}

const char* keyboardKeyName(KeyboardKey key) {
    switch (key) {
    case KeyboardKey::A: return "A";
    case KeyboardKey::B: return "B";
    case KeyboardKey::C: return "C";
    case KeyboardKey::D: return "D";
    case KeyboardKey::E: return "E";
    case KeyboardKey::F: return "F";
    case KeyboardKey::G: return "G";
    case KeyboardKey::H: return "H";
    case KeyboardKey::I: return "I";
    case KeyboardKey::J: return "J";
    case KeyboardKey::K: return "K";
    case KeyboardKey::L: return "L";
    case KeyboardKey::M: return "M";
    case KeyboardKey::N: return "N";
    case KeyboardKey::O: return "O";
    case KeyboardKey::P: return "P";
    case KeyboardKey::Q: return "Q";
    case KeyboardKey::R: return "R";
    case KeyboardKey::S: return "S";
    case KeyboardKey::T: return "T";
    case KeyboardKey::U: return "U";
    case KeyboardKey::V: return "V";
    case KeyboardKey::W: return "W";
    case KeyboardKey::X: return "X";
    case KeyboardKey::Y: return "Y";
    case KeyboardKey::Z: return "Z";
    case KeyboardKey::Num1: return "Num1";
    case KeyboardKey::Num2: return "Num2";
    case KeyboardKey::Num3: return "Num3";
    case KeyboardKey::Num4: return "Num4";
    case KeyboardKey::Num5: return "Num5";
    case KeyboardKey::Num6: return "Num6";
    case KeyboardKey::Num7: return "Num7";
    case KeyboardKey::Num8: return "Num8";
    case KeyboardKey::Num9: return "Num9";
    case KeyboardKey::Num0: return "Num0";
    case KeyboardKey::Return: return "Return";
    case KeyboardKey::Escape: return "Escape";
    case KeyboardKey::Backspace: return "Backspace";
    case KeyboardKey::Tab: return "Tab";
    case KeyboardKey::Space: return "Space";
    case KeyboardKey::Minus: return "Minus";
    case KeyboardKey::Equals: return "Equals";
    case KeyboardKey::LeftBracket: return "LeftBracket";
    case KeyboardKey::RightBracket: return "RightBracket";
    case KeyboardKey::Backslash: return "Backslash";
    case KeyboardKey::NonUsHash: return "NonUsHash";
    case KeyboardKey::Semicolon: return "Semicolon";
    case KeyboardKey::Apostrophe: return "Apostrophe";
    case KeyboardKey::Grave: return "Grave";
    case KeyboardKey::Comma: return "Comma";
    case KeyboardKey::Period: return "Period";
    case KeyboardKey::Slash: return "Slash";
    case KeyboardKey::CapsLock: return "CapsLock";
    case KeyboardKey::F1: return "F1";
    case KeyboardKey::F2: return "F2";
    case KeyboardKey::F3: return "F3";
    case KeyboardKey::F4: return "F4";
    case KeyboardKey::F5: return "F5";
    case KeyboardKey::F6: return "F6";
    case KeyboardKey::F7: return "F7";
    case KeyboardKey::F8: return "F8";
    case KeyboardKey::F9: return "F9";
    case KeyboardKey::F10: return "F10";
    case KeyboardKey::F11: return "F11";
    case KeyboardKey::F12: return "F12";
    case KeyboardKey::PrintScreen: return "PrintScreen";
    case KeyboardKey::ScrollLock: return "ScrollLock";
    case KeyboardKey::Pause: return "Pause";
    case KeyboardKey::Insert: return "Insert";
    case KeyboardKey::Home: return "Home";
    case KeyboardKey::PageUp: return "PageUp";
    case KeyboardKey::Delete: return "Delete";
    case KeyboardKey::End: return "End";
    case KeyboardKey::PageDown: return "PageDown";
    case KeyboardKey::Right: return "Right";
    case KeyboardKey::Left: return "Left";
    case KeyboardKey::Down: return "Down";
    case KeyboardKey::Up: return "Up";
    case KeyboardKey::NumLockClear: return "NumLockClear";
    case KeyboardKey::KpDivide: return "KpDivide";
    case KeyboardKey::KpMultiply: return "KpMultiply";
    case KeyboardKey::KpMinus: return "KpMinus";
    case KeyboardKey::KpPlus: return "KpPlus";
    case KeyboardKey::KpEnter: return "KpEnter";
    case KeyboardKey::Kp1: return "Kp1";
    case KeyboardKey::Kp2: return "Kp2";
    case KeyboardKey::Kp3: return "Kp3";
    case KeyboardKey::Kp4: return "Kp4";
    case KeyboardKey::Kp5: return "Kp5";
    case KeyboardKey::Kp6: return "Kp6";
    case KeyboardKey::Kp7: return "Kp7";
    case KeyboardKey::Kp8: return "Kp8";
    case KeyboardKey::Kp9: return "Kp9";
    case KeyboardKey::Kp0: return "Kp0";
    case KeyboardKey::KpPeriod: return "KpPeriod";
    case KeyboardKey::NonUsBackslash: return "NonUsBackslash";
    case KeyboardKey::Application: return "Application";
    case KeyboardKey::Power: return "Power";
    case KeyboardKey::KpEquals: return "KpEquals";
    case KeyboardKey::F13: return "F13";
    case KeyboardKey::F14: return "F14";
    case KeyboardKey::F15: return "F15";
    case KeyboardKey::F16: return "F16";
    case KeyboardKey::F17: return "F17";
    case KeyboardKey::F18: return "F18";
    case KeyboardKey::F19: return "F19";
    case KeyboardKey::F20: return "F20";
    case KeyboardKey::F21: return "F21";
    case KeyboardKey::F22: return "F22";
    case KeyboardKey::F23: return "F23";
    case KeyboardKey::F24: return "F24";
    case KeyboardKey::Execute: return "Execute";
    case KeyboardKey::Help: return "Help";
    case KeyboardKey::Menu: return "Menu";
    case KeyboardKey::Select: return "Select";
    case KeyboardKey::Stop: return "Stop";
    case KeyboardKey::Again: return "Again";
    case KeyboardKey::Undo: return "Undo";
    case KeyboardKey::Cut: return "Cut";
    case KeyboardKey::Copy: return "Copy";
    case KeyboardKey::Paste: return "Paste";
    case KeyboardKey::Find: return "Find";
    case KeyboardKey::Mute: return "Mute";
    case KeyboardKey::VolumeUp: return "VolumeUp";
    case KeyboardKey::VolumeDown: return "VolumeDown";
    case KeyboardKey::KpComma: return "KpComma";
    case KeyboardKey::KpEqualsAs400: return "KpEqualsAs400";
    case KeyboardKey::International1: return "International1";
    case KeyboardKey::International2: return "International2";
    case KeyboardKey::International3: return "International3";
    case KeyboardKey::International4: return "International4";
    case KeyboardKey::International5: return "International5";
    case KeyboardKey::International6: return "International6";
    case KeyboardKey::International7: return "International7";
    case KeyboardKey::International8: return "International8";
    case KeyboardKey::International9: return "International9";
    case KeyboardKey::Lang1: return "Lang1";
    case KeyboardKey::Lang2: return "Lang2";
    case KeyboardKey::Lang3: return "Lang3";
    case KeyboardKey::Lang4: return "Lang4";
    case KeyboardKey::Lang5: return "Lang5";
    case KeyboardKey::Lang6: return "Lang6";
    case KeyboardKey::Lang7: return "Lang7";
    case KeyboardKey::Lang8: return "Lang8";
    case KeyboardKey::Lang9: return "Lang9";
    case KeyboardKey::AltErase: return "AltErase";
    case KeyboardKey::SysReq: return "SysReq";
    case KeyboardKey::Cancel: return "Cancel";
    case KeyboardKey::Clear: return "Clear";
    case KeyboardKey::Prior: return "Prior";
    case KeyboardKey::Return2: return "Return2";
    case KeyboardKey::Separator: return "Separator";
    case KeyboardKey::Out: return "Out";
    case KeyboardKey::Oper: return "Oper";
    case KeyboardKey::ClearAgain: return "ClearAgain";
    case KeyboardKey::CrSel: return "CrSel";
    case KeyboardKey::ExSel: return "ExSel";
    case KeyboardKey::Kp00: return "Kp00";
    case KeyboardKey::Kp000: return "Kp000";
    case KeyboardKey::ThousandsSeparator: return "ThousandsSeparator";
    case KeyboardKey::DecimalSeparator: return "DecimalSeparator";
    case KeyboardKey::CurrencyUnit: return "CurrencyUnit";
    case KeyboardKey::CurrencySubunit: return "CurrencySubunit";
    case KeyboardKey::KpLeftParen: return "KpLeftParen";
    case KeyboardKey::KpRightParen: return "KpRightParen";
    case KeyboardKey::KpLeftBrace: return "KpLeftBrace";
    case KeyboardKey::KpRightBrace: return "KpRightBrace";
    case KeyboardKey::KpTab: return "KpTab";
    case KeyboardKey::KpBackspace: return "KpBackspace";
    case KeyboardKey::KpA: return "KpA";
    case KeyboardKey::KpB: return "KpB";
    case KeyboardKey::KpC: return "KpC";
    case KeyboardKey::KpD: return "KpD";
    case KeyboardKey::KpE: return "KpE";
    case KeyboardKey::KpF: return "KpF";
    case KeyboardKey::KpXor: return "KpXor";
    case KeyboardKey::KpPower: return "KpPower";
    case KeyboardKey::KpPercent: return "KpPercent";
    case KeyboardKey::KpLess: return "KpLess";
    case KeyboardKey::KpGreater: return "KpGreater";
    case KeyboardKey::KpAmpersand: return "KpAmpersand";
    case KeyboardKey::KpDblAmpersand: return "KpDblAmpersand";
    case KeyboardKey::KpVerticalBar: return "KpVerticalBar";
    case KeyboardKey::KpDblVerticalBar: return "KpDblVerticalBar";
    case KeyboardKey::KpColon: return "KpColon";
    case KeyboardKey::KpHash: return "KpHash";
    case KeyboardKey::KpSpace: return "KpSpace";
    case KeyboardKey::KpAt: return "KpAt";
    case KeyboardKey::KpExclam: return "KpExclam";
    case KeyboardKey::KpMemStore: return "KpMemStore";
    case KeyboardKey::KpMemRecall: return "KpMemRecall";
    case KeyboardKey::KpMemClear: return "KpMemClear";
    case KeyboardKey::KpMemAdd: return "KpMemAdd";
    case KeyboardKey::KpMemSubtract: return "KpMemSubtract";
    case KeyboardKey::KpMemMultiply: return "KpMemMultiply";
    case KeyboardKey::KpMemDivide: return "KpMemDivide";
    case KeyboardKey::KpPlusMinus: return "KpPlusMinus";
    case KeyboardKey::KpClear: return "KpClear";
    case KeyboardKey::KpClearEntry: return "KpClearEntry";
    case KeyboardKey::KpBinary: return "KpBinary";
    case KeyboardKey::KpOctal: return "KpOctal";
    case KeyboardKey::KpDecimal: return "KpDecimal";
    case KeyboardKey::KpHexadecimal: return "KpHexadecimal";
    case KeyboardKey::LCtrl: return "LCtrl";
    case KeyboardKey::LShift: return "LShift";
    case KeyboardKey::LAlt: return "LAlt";
    case KeyboardKey::LGui: return "LGui";
    case KeyboardKey::RCtrl: return "RCtrl";
    case KeyboardKey::RShift: return "RShift";
    case KeyboardKey::RAlt: return "RAlt";
    case KeyboardKey::RGui: return "RGui";
    case KeyboardKey::Mode: return "Mode";
    case KeyboardKey::Sleep: return "Sleep";
    case KeyboardKey::MediaPlayPause: return "MediaPlayPause";
    case KeyboardKey::MediaStop: return "MediaStop";
    case KeyboardKey::MediaNextTrack: return "MediaNextTrack";
    case KeyboardKey::MediaPreviousTrack: return "MediaPreviousTrack";
    case KeyboardKey::MediaRewind: return "MediaRewind";
    case KeyboardKey::MediaFastForward: return "MediaFastForward";
    case KeyboardKey::MediaEject: return "MediaEject";
    case KeyboardKey::MediaSelect: return "MediaSelect";
    case KeyboardKey::AcSearch: return "AcSearch";
    case KeyboardKey::AcHome: return "AcHome";
    case KeyboardKey::AcBack: return "AcBack";
    case KeyboardKey::AcForward: return "AcForward";
    case KeyboardKey::AcStop: return "AcStop";
    case KeyboardKey::AcRefresh: return "AcRefresh";
    case KeyboardKey::AcBookmarks: return "AcBookmarks";
    }
    return "Unknown";
}

} // namespace mui
