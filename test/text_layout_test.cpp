#include <gtest/gtest.h>

#include <diagram_render/text_layout.hpp>

#include <algorithm>
#include <string>
#include <vector>

using diagram_render::append_section;
using diagram_render::indent;

TEST(TextLayoutTest, IndentSingleLine)
{
    EXPECT_EQ("    abc", indent("abc", 4));
    EXPECT_EQ("abc", indent("abc", 0));
}

TEST(TextLayoutTest, IndentEveryLine)
{
    const std::string text = "first\nsecond\n\nfourth";
    const std::string got = indent(text, 2);
    EXPECT_EQ("  first\n  second\n  \n  fourth", got);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), std::count(got.begin(), got.end(), '\n'));
}

TEST(TextLayoutTest, IndentDropsTrailingNewline)
{
    EXPECT_EQ("   a\n   b", indent("a\nb\n", 3));
}

TEST(TextLayoutTest, IndentEmptyText)
{
    EXPECT_EQ("", indent("", 4));
}

TEST(TextLayoutTest, Banners)
{
    EXPECT_EQ("%% Entities start", diagram_render::section_banner("Entities", true));
    EXPECT_EQ("%% Entities end", diagram_render::section_banner("Entities", false));
}

TEST(TextLayoutTest, AppendSectionSkipsEmptyRange)
{
    std::string out = "header";
    append_section(out, "Items", std::vector<std::string>{}, [](const std::string& s) { return s; });
    EXPECT_EQ("header", out);
}

TEST(TextLayoutTest, AppendSectionIndentsMultiLineItems)
{
    std::string out = "header";
    const std::vector<std::string> items{ "one", "two {\n    x\n}" };
    append_section(out, "Items", items, [](const std::string& s) { return s; });
    const std::string wanted =
        "header\n"
        "    %% Items start\n"
        "    one\n"
        "    two {\n"
        "        x\n"
        "    }\n"
        "    %% Items end";
    EXPECT_EQ(wanted, out);
}
