#include "TunnelConf/Tree.hpp"

#include <utility>

namespace TunnelConf
{

void ToLinesSettings::SetDefaults()
{
    if (!indent)            indent = "    ";
    if (!field_prefix)      field_prefix = "├── ";
    if (!last_field_prefix) last_field_prefix = "└── ";
}

namespace Tree
{

Node::Node(std::string title)
    : title_(std::move(title))
{
}

Node &Node::Append(std::string title)
{
    children_.emplace_back(std::move(title));
    return children_.back();
}

void Node::Append(Node child)
{
    children_.push_back(std::move(child));
}

std::vector<std::string> Node::Lines(ToLinesSettings style) const
{
    style.SetDefaults();
    std::vector<std::string> out;
    if (!title_.empty())
    {
        out.push_back(title_);
    }
    Render(style, 0, out);
    return out;
}

std::vector<std::string> Node::ChildLines(ToLinesSettings style) const
{
    style.SetDefaults();
    std::vector<std::string> out;
    Render(style, 0, out);
    return out;
}

std::string Node::String(ToLinesSettings style) const
{
    return JoinLines(Lines(std::move(style)));
}

void Node::Render(const ToLinesSettings &style,
                  std::size_t depth,
                  std::vector<std::string> &out) const
{
    std::string indent;
    for (std::size_t i = 0; i < depth; ++i)
    {
        indent += *style.indent;
    }

    for (std::size_t i = 0; i < children_.size(); ++i)
    {
        const bool last = i + 1 == children_.size();
        const Node &child = children_[i];
        out.push_back(indent + (last ? *style.last_field_prefix : *style.field_prefix) + child.title_);
        child.Render(style, depth + 1, out);
    }
}

}

std::string JoinLines(const std::vector<std::string> &lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

}
