// tests/escape_tests.cpp
// -----------------------------------------------------------------------------
// Argument escaping: POSIX single quoting and the cmd.exe rules. Both
// algorithms are plain functions, so they are tested on every platform.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <string>

#include "prince/escape.hpp"

using prince::escape_cmd;
using prince::escape_posix;

// -----------------------------------------------------------------------------
// POSIX
// -----------------------------------------------------------------------------
TEST(EscapePosix, WrapsInSingleQuotes)
{
    EXPECT_EQ("'abc'", escape_posix("abc"));
    EXPECT_EQ("'a b'", escape_posix("a b"));
    EXPECT_EQ("''", escape_posix(""));
}

TEST(EscapePosix, EmbeddedSingleQuote)
{
    EXPECT_EQ("'it'\\''s'", escape_posix("it's"));
    EXPECT_EQ("''\\'''", escape_posix("'"));
}

TEST(EscapePosix, LeavesMetacharactersAlone)
{
    EXPECT_EQ("'$HOME & \"x\" | `y` \\'", escape_posix("$HOME & \"x\" | `y` \\"));
}

// -----------------------------------------------------------------------------
// cmd.exe: quoting
// -----------------------------------------------------------------------------
TEST(EscapeCmd, PlainArgumentUnchanged)
{
    EXPECT_EQ("abc", escape_cmd("abc"));
    EXPECT_EQ("--style=a.css", escape_cmd("--style=a.css"));
    EXPECT_EQ("C:\\dir\\", escape_cmd("C:\\dir\\"));
}

TEST(EscapeCmd, EmptyStringIsQuoted)
{
    EXPECT_EQ("\"\"", escape_cmd(""));
    EXPECT_EQ("\"\"", escape_cmd("", false));
}

TEST(EscapeCmd, WhitespaceIsQuoted)
{
    EXPECT_EQ("\"a b\"", escape_cmd("a b"));
    EXPECT_EQ("\"a\tb\"", escape_cmd("a\tb"));
}

TEST(EscapeCmd, MetaCharactersWithoutQuotesOnlyQuote)
{
    EXPECT_EQ("\"a&b\"", escape_cmd("a&b"));
    EXPECT_EQ("\"(x|y)\"", escape_cmd("(x|y)"));
    EXPECT_EQ("\"a^b<c>\"", escape_cmd("a^b<c>"));
}

TEST(EscapeCmd, MetaCharactersLeftAloneWithoutMetaFlag)
{
    EXPECT_EQ("a&b", escape_cmd("a&b", false));
}

// -----------------------------------------------------------------------------
// cmd.exe: backslashes before a double quote
// -----------------------------------------------------------------------------
TEST(EscapeCmd, BackslashRunsBeforeQuote)
{
    // n backslashes + quote -> 2n+1 backslashes + quote
    EXPECT_EQ("a\\\"b", escape_cmd("a\"b", false));                       // n = 0
    EXPECT_EQ("a\\\\\\\"b", escape_cmd("a\\\"b", false));                  // n = 1
    EXPECT_EQ("a\\\\\\\\\\\"b", escape_cmd("a\\\\\"b", false));            // n = 2
    EXPECT_EQ(std::string("a") + std::string(11, '\\') + "\"b",
              escape_cmd(std::string("a") + std::string(5, '\\') + "\"b", false)); // n = 5
}

TEST(EscapeCmd, BackslashesNotBeforeQuoteUnchanged)
{
    EXPECT_EQ("a\\\\b", escape_cmd("a\\\\b", false));
}

// -----------------------------------------------------------------------------
// cmd.exe: trailing backslashes inside quotes
// -----------------------------------------------------------------------------
TEST(EscapeCmd, TrailingBackslashesDoubledWhenQuoted)
{
    EXPECT_EQ("\"x y\"", escape_cmd("x y", false));                         // k = 0
    EXPECT_EQ("\"x y\\\\\"", escape_cmd("x y\\", false));                   // k = 1
    EXPECT_EQ("\"x y" + std::string(6, '\\') + "\"",
              escape_cmd("x y" + std::string(3, '\\'), false));             // k = 3
}

TEST(EscapeCmd, OnlyBackslashes)
{
    EXPECT_EQ("\\\\\\", escape_cmd("\\\\\\"));
    EXPECT_EQ("\" " + std::string(4, '\\') + "\"", escape_cmd(" \\\\"));
}

// -----------------------------------------------------------------------------
// cmd.exe: caret escaping
// -----------------------------------------------------------------------------
TEST(EscapeCmd, QuotesTriggerCaretEscaping)
{
    EXPECT_EQ("^\"say \\^\"hi\\^\"^\"", escape_cmd("say \"hi\""));
}

TEST(EscapeCmd, PercentExpansionTriggersCaretEscaping)
{
    EXPECT_EQ("^%PATH^%", escape_cmd("%PATH%"));
    EXPECT_EQ("^\"^%HOME^% dir^\"", escape_cmd("%HOME% dir"));
}

TEST(EscapeCmd, LonePercentIsNotAnExpansion)
{
    EXPECT_EQ("100%", escape_cmd("100%"));
    EXPECT_EQ("%%", escape_cmd("%%"));
}

TEST(EscapeCmd, QuotesAndPercentTogether)
{
    EXPECT_EQ("\\^\"^%HOME^%\\^\"", escape_cmd("\"%HOME%\""));
    EXPECT_EQ("\\^\"^%HOME^%\\^\"^&^(x^)", escape_cmd("\"%HOME%\"&(x)"));
}

// -----------------------------------------------------------------------------
// cmd.exe: executable name
// -----------------------------------------------------------------------------
TEST(EscapeCmd, ModuleWithSpacesIsOnlyQuoted)
{
    EXPECT_EQ("\"C:\\Program Files\\Prince\\prince.exe\"",
              escape_cmd("C:\\Program Files\\Prince\\prince.exe", true, true));
}

TEST(EscapeCmd, QuotedModuleSkipsCaretsForPercent)
{
    const std::string path = "C:\\%APPDIR%\\my app\\prince.exe";
    EXPECT_EQ("\"C:\\%APPDIR%\\my app\\prince.exe\"", escape_cmd(path, true, true));
    EXPECT_EQ("^\"C:\\^%APPDIR^%\\my app\\prince.exe^\"", escape_cmd(path, true, false));
}

TEST(EscapeCmd, UnquotedModuleKeepsCarets)
{
    EXPECT_EQ("C:\\^%APPDIR^%\\prince.exe", escape_cmd("C:\\%APPDIR%\\prince.exe", true, true));
}
