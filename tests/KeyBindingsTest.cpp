#include <gtest/gtest.h>
#include "KeyBindings.hpp"

TEST(KeyBindingsTest, ParsesNamesAndCharacters) {
    EXPECT_EQ(parse_key("S").value(), 's');
    EXPECT_EQ(parse_key("s").value(), 's');
    EXPECT_EQ(parse_key("7").value(), '7');
    EXPECT_EQ(parse_key("space").value(), ' ');
    EXPECT_EQ(parse_key("Esc").value(), 27);
    EXPECT_EQ(parse_key("ENTER").value(), 13);
    EXPECT_EQ(parse_key("tab").value(), 9);
}

TEST(KeyBindingsTest, RejectsUnknownNames) {
    EXPECT_FALSE(parse_key("").has_value());
    EXPECT_FALSE(parse_key("F13").has_value());
    EXPECT_FALSE(parse_key("Ctrl+S").has_value());
    EXPECT_FALSE(parse_key(" ").has_value());
}

TEST(KeyBindingsTest, RejectsDuplicateBindings) {
    EXPECT_FALSE(KeyBindings::from_names("s", "S", "esc").has_value());
    EXPECT_FALSE(KeyBindings::from_names("s", "x", "X").has_value());
    auto keys = KeyBindings::from_names("space", "x", "q");
    ASSERT_TRUE(keys.has_value()) << keys.error();
    EXPECT_EQ(keys->start, ' ');
    EXPECT_EQ(keys->stop, 'x');
    EXPECT_EQ(keys->quit, 'q');
}

TEST(KeyBindingsTest, MapsKeysToCommands) {
    const KeyBindings keys;
    EXPECT_EQ(keys.command_for('s'), Command::Start);
    EXPECT_EQ(keys.command_for('S'), Command::Start);
    EXPECT_EQ(keys.command_for('x'), Command::Stop);
    EXPECT_EQ(keys.command_for(27), Command::Quit);
    EXPECT_EQ(keys.command_for('q'), Command::None);
    EXPECT_EQ(keys.command_for(-1), Command::None);
}

TEST(KeyBindingsTest, IgnoresSpecialKeys) {
    const KeyBindings keys;
    // Arrow and function keys share their low byte with letters
    EXPECT_EQ(keys.command_for(0xFF53), Command::None);  // Right, low byte 'S'
    EXPECT_EQ(keys.command_for(0xFF51), Command::None);  // Left
    EXPECT_EQ(keys.command_for(0xFFBE), Command::None);  // F1
    EXPECT_EQ(keys.command_for(0x100000 | 's'), Command::None);
}
