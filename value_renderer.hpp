#pragma once

#include "debug_session.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

struct Settings;

struct RenderLimits
{
    size_t max_length = 500;
    int max_depth = 4;
    uint32_t max_children = 16;
};

RenderLimits LimitsFromSettings(const Settings& settings);

// Cut text to at most max characters, ending in "..." when shortened
std::string Clamp(const std::string& text, size_t max);

// Cut text to at most max characters keeping its head and tail around "..."
std::string ShortenMiddle(const std::string& text, size_t max);

// Depth- and size-bounded formatter for runtime values.
//
// Output looks like {id=3, name="abc", next=0x602010 {...}} for aggregates and
// [1, 2, 3, ...] for sequences. Expansion stops at max_depth, after
// max_children children per container, and once max_length characters have
// been produced; a value reached again through its own subtree prints as
// <cycle>. The result never exceeds max_length characters.
class ValueRenderer
{
  public:
    explicit ValueRenderer(const RenderLimits& limits);

    std::string Render(const Value& value) const;

    const RenderLimits& Limits() const { return limits_; }

  private:
    void RenderNode(const Value& value, int depth, std::vector<std::string>& path,
                    std::string& out) const;

    RenderLimits limits_;
};

} // namespace lldb_cognitrace
