#include "TunnelConf/Tree.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace TunnelConf;

namespace
{

Tree::Node Sample()
{
    Tree::Node root("Root:");
    root.Append("first");
    Tree::Node list("list:");
    list.Append("a");
    list.Append("b").Append("b.1");
    root.Append(std::move(list));
    root.Append("last");
    return root;
}

}

TEST(Tree, DefaultStyle)
{
    const std::vector<std::string> expected = {
        "Root:",
        "├── first",
        "├── list:",
        "    ├── a",
        "    └── b",
        "        └── b.1",
        "└── last",
    };
    EXPECT_EQ(Sample().Lines(), expected);
}

TEST(Tree, ChildLinesOmitTitle)
{
    const std::vector<std::string> lines = Sample().ChildLines();
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines.front(), "├── first");
    EXPECT_EQ(lines.back(), "└── last");
}

TEST(Tree, CustomStyleIsNotMutated)
{
    ToLinesSettings style;
    style.indent = "..";
    style.field_prefix = "+ ";
    style.last_field_prefix = "- ";
    const ToLinesSettings before = style;

    const std::vector<std::string> expected = {
        "Root:",
        "+ first",
        "+ list:",
        "..+ a",
        "..- b",
        "....- b.1",
        "- last",
    };
    EXPECT_EQ(Sample().Lines(style), expected);
    EXPECT_EQ(style, before);
}

TEST(Tree, PartialStyleFallsBackToDefaults)
{
    ToLinesSettings style;
    style.field_prefix = "|-- ";

    Tree::Node node;
    node.Append("x");
    node.Append("y");
    EXPECT_EQ(node.Lines(style), (std::vector<std::string>{"|-- x", "└── y"}));
    EXPECT_FALSE(style.last_field_prefix.has_value());
}

TEST(Tree, StringJoinsWithoutTrailingNewline)
{
    Tree::Node node("Title:");
    node.Append("only");
    EXPECT_EQ(node.String(), "Title:\n└── only");
    EXPECT_EQ(Tree::Node().String(), "");
}
