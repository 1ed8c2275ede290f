/// @file test_key_bindings.cpp
/// @brief Tests for the key to command mapping of the terminal UI

#include "tui/tui_app.hpp"

#include <gtest/gtest.h>

#include <initializer_list>

using systop::CommandType;
using systop::SortKey;
using systop::TuiApp;

TEST(KeyBindingsTest, QuitKeys)
{
    EXPECT_EQ(TuiApp::command_for_key('q').type, CommandType::Quit);
    EXPECT_EQ(TuiApp::command_for_key(3).type, CommandType::Quit);  // Ctrl-C in raw mode
}

TEST(KeyBindingsTest, NavigationKeys)
{
    EXPECT_EQ(TuiApp::command_for_key(KEY_UP).type, CommandType::NavigateUp);
    EXPECT_EQ(TuiApp::command_for_key('k').type, CommandType::NavigateUp);
    EXPECT_EQ(TuiApp::command_for_key(KEY_DOWN).type, CommandType::NavigateDown);
    EXPECT_EQ(TuiApp::command_for_key('j').type, CommandType::NavigateDown);
}

TEST(KeyBindingsTest, KillIsUppercaseK)
{
    EXPECT_EQ(TuiApp::command_for_key('K').type, CommandType::KillSelected);
}

TEST(KeyBindingsTest, SortKeys)
{
    struct Binding
    {
        int key;
        SortKey sort_key;
    };
    for (const auto& binding : {Binding{'c', SortKey::Cpu}, Binding{'m', SortKey::Memory},
                                Binding{'p', SortKey::Pid}, Binding{'n', SortKey::Name}}) {
        auto cmd = TuiApp::command_for_key(binding.key);
        EXPECT_EQ(cmd.type, CommandType::SetSort) << static_cast<char>(binding.key);
        EXPECT_EQ(cmd.sort_key, binding.sort_key) << static_cast<char>(binding.key);
    }
}

TEST(KeyBindingsTest, UnboundKeysMapToNone)
{
    for (int key : std::initializer_list<int>{'x', 'Q', 'r', '?', ' ', ERR, KEY_LEFT}) {
        EXPECT_EQ(TuiApp::command_for_key(key).type, CommandType::None) << key;
    }
}
