// Tests for hotkey matching, labels and the persisted encoding

#include "hotkey.hpp"
#include <iostream>
#include <cassert>
#include <linux/input-event-codes.h>

using namespace dictate;

void test_exact_match() {
    std::cout << "Testing keycode + modifier matching..." << std::endl;

    Hotkey toggle = Hotkey::default_toggle();
    assert(matches(toggle, KEY_SPACE, MOD_CONTROL | MOD_ALT));
    assert(!matches(toggle, KEY_SPACE, MOD_CONTROL));
    assert(!matches(toggle, KEY_SPACE, MOD_CONTROL | MOD_ALT | MOD_SHIFT));
    assert(!matches(toggle, KEY_V, MOD_CONTROL | MOD_ALT));

    // Fn is tracked: an extra Fn breaks the match
    assert(!matches(toggle, KEY_SPACE, MOD_CONTROL | MOD_ALT | MOD_FUNCTION));

    std::cout << "  PASS: Exact matches only" << std::endl;
}

void test_untracked_bits_ignored() {
    std::cout << "Testing untracked flag bits..." << std::endl;

    Hotkey toggle = Hotkey::default_toggle();
    uint32_t caps_lock_like = 1u << 16;
    assert(matches(toggle, KEY_SPACE, MOD_CONTROL | MOD_ALT | caps_lock_like));

    std::cout << "  PASS: Bits outside the tracked set are ignored" << std::endl;
}

void test_function_modifier() {
    std::cout << "Testing Fn as a modifier..." << std::endl;

    Hotkey fn_d{KEY_D, 0, true, false};
    assert(fn_d.requires_event_tap());
    assert(matches(fn_d, KEY_D, MOD_FUNCTION));
    assert(!matches(fn_d, KEY_D, 0));

    Hotkey fn = Hotkey::fn_only();
    assert(fn.requires_event_tap());
    assert(!matches(fn, 0, MOD_FUNCTION));
    assert(!matches(fn, KEY_SPACE, MOD_FUNCTION));

    assert(!Hotkey::default_toggle().requires_event_tap());

    std::cout << "  PASS: Fn modifier and Fn-only behave" << std::endl;
}

void test_display_string() {
    std::cout << "Testing display labels..." << std::endl;

    assert(display_string(Hotkey::default_toggle()) == "Ctrl+Opt+Space");
    assert(display_string(Hotkey::default_paste()) == "Ctrl+Opt+V");
    assert(display_string(Hotkey::fn_only()) == "Fn");

    Hotkey all{KEY_1, MOD_CONTROL | MOD_ALT | MOD_SHIFT | MOD_META, true, false};
    assert(display_string(all) == "Fn+Ctrl+Opt+Shift+Cmd+1");

    Hotkey odd{KEY_F5, MOD_SHIFT, false, false};
    assert(display_string(odd) == "Shift+Key" + std::to_string(KEY_F5));

    assert(key_name(KEY_ENTER) == "Return");
    assert(key_name(KEY_TAB) == "Tab");
    assert(key_name(KEY_ESC) == "Esc");

    std::cout << "  PASS: Labels in Fn, Ctrl, Opt, Shift, Cmd, key order" << std::endl;
}

void test_persistence() {
    std::cout << "Testing persisted form..." << std::endl;

    Hotkey fn_hold{KEY_R, MOD_SHIFT, true, false};
    assert(encode_hotkey(fn_hold) == std::to_string(KEY_R) + ",4,1,0");

    Hotkey decoded;
    assert(decode_hotkey(encode_hotkey(fn_hold), decoded));
    assert(decoded == fn_hold);

    assert(decode_hotkey(encode_hotkey(Hotkey::fn_only()), decoded));
    assert(decoded.function_only);

    std::cout << "  PASS: Encoded hotkeys decode to the same value" << std::endl;
}

void test_legacy_decode() {
    std::cout << "Testing entries written before the Fn fields..." << std::endl;

    Hotkey decoded = Hotkey::fn_only();
    assert(decode_hotkey("49,3", decoded));
    assert(decoded.key_code == 49);
    assert(decoded.modifier_mask == 3);
    assert(!decoded.uses_function_modifier);
    assert(!decoded.function_only);

    assert(decode_hotkey("49,3,1", decoded));
    assert(decoded.uses_function_modifier);
    assert(!decoded.function_only);

    std::cout << "  PASS: Missing flags default to false" << std::endl;
}

void test_fn_only_decode_drops_modifiers() {
    std::cout << "Testing Fn-only entries with stray fields..." << std::endl;

    Hotkey decoded;
    assert(decode_hotkey("0,3,0,1", decoded));
    assert(decoded.function_only);
    assert(decoded.modifier_mask == 0);
    assert(!decoded.uses_function_modifier);
    assert(decoded == Hotkey::fn_only());

    assert(decode_hotkey("57,8,1,1", decoded));
    assert(decoded == Hotkey::fn_only());
    assert(display_string(decoded) == "Fn");

    std::cout << "  PASS: Fn-only decodes to the bare Fn hotkey" << std::endl;
}

void test_malformed_decode() {
    std::cout << "Testing malformed entries..." << std::endl;

    Hotkey original = Hotkey::default_paste();
    Hotkey value = original;
    assert(!decode_hotkey("", value));
    assert(!decode_hotkey("57", value));
    assert(!decode_hotkey("57,x", value));
    assert(!decode_hotkey("57,3,2", value));
    assert(!decode_hotkey("-1,3", value));
    assert(!decode_hotkey("57,3,0,0,0", value));
    assert(value == original);

    std::cout << "  PASS: Bad input is rejected and leaves the value alone" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey Test Suite ===" << std::endl << std::endl;

    test_exact_match();
    test_untracked_bits_ignored();
    test_function_modifier();
    test_display_string();
    test_persistence();
    test_legacy_decode();
    test_fn_only_decode_drops_modifiers();
    test_malformed_decode();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
