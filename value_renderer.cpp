#include "value_renderer.hpp"
#include "settings.hpp"

#include <algorithm>

namespace lldb_cognitrace
{

namespace
{
constexpr const char* kEllipsis = "...";
constexpr size_t kEllipsisLength = 3;

size_t ToLimit(int value, size_t fallback)
{
    return value > 0 ? static_cast<size_t>(value) : fallback;
}
} // namespace

RenderLimits LimitsFromSettings(const Settings& settings)
{
    RenderLimits limits;
    limits.max_length = ToLimit(settings.max_value_length, limits.max_length);
    limits.max_depth = settings.max_depth >= 0 ? settings.max_depth : limits.max_depth;
    limits.max_children =
        static_cast<uint32_t>(ToLimit(settings.max_children, limits.max_children));
    return limits;
}

std::string Clamp(const std::string& text, size_t max)
{
    if (text.size() <= max)
        return text;
    if (max < kEllipsisLength)
        return text.substr(0, max);
    return text.substr(0, max - kEllipsisLength) + kEllipsis;
}

std::string ShortenMiddle(const std::string& text, size_t max)
{
    if (text.size() <= max)
        return text;
    if (max < kEllipsisLength)
        return text.substr(0, max);
    size_t keep = max - kEllipsisLength;
    size_t head = keep / 2;
    size_t tail = keep - head;
    return text.substr(0, head) + kEllipsis + text.substr(text.size() - tail);
}

ValueRenderer::ValueRenderer(const RenderLimits& limits) : limits_(limits) {}

std::string ValueRenderer::Render(const Value& value) const
{
    std::string out;
    std::vector<std::string> path;
    RenderNode(value, 0, path, out);
    return Clamp(out, limits_.max_length);
}

void ValueRenderer::RenderNode(const Value& value, int depth, std::vector<std::string>& path,
                               std::string& out) const
{
    if (out.size() >= limits_.max_length)
        return;

    std::string identity = value.Identity();
    if (!identity.empty() && std::find(path.begin(), path.end(), identity) != path.end())
    {
        out += "<cycle>";
        return;
    }

    std::string text = ShortenMiddle(value.Text(), limits_.max_length);
    if (value.IsString())
    {
        out += text;
        return;
    }

    bool sequence = value.IsSequence();
    const char* open = sequence ? "[" : "{";
    const char* close = sequence ? "]" : "}";

    uint32_t count = value.NumChildren();
    if (count == 0)
    {
        if (!text.empty())
            out += text;
        else
            out += std::string(open) + close;
        return;
    }

    if (depth >= limits_.max_depth)
    {
        if (!text.empty())
            out += text + " ";
        out += std::string(open) + kEllipsis + close;
        return;
    }

    // Pointers and summarized containers keep their own text before the expansion
    if (!text.empty())
        out += text + " ";
    out += open;

    if (!identity.empty())
        path.push_back(identity);

    uint32_t shown = std::min(count, limits_.max_children);
    uint32_t index = 0;
    bool first = true;
    for (; index < shown; ++index)
    {
        if (out.size() >= limits_.max_length)
            break;
        std::unique_ptr<Value> child = value.ChildAt(index);
        if (!child)
            continue;
        if (!first)
            out += ", ";
        first = false;
        if (!sequence)
            out += child->Name() + "=";
        RenderNode(*child, depth + 1, path, out);
    }
    if (index < count)
        out += std::string(first ? "" : ", ") + kEllipsis;

    if (!identity.empty())
        path.pop_back();

    out += close;
}

} // namespace lldb_cognitrace
