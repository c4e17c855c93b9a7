#pragma once

#include "console.hpp"
#include "debug_session.hpp"
#include "settings.hpp"
#include "value_renderer.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lldb_cognitrace
{

constexpr const char* kNoExceptionSummary = "Breakpoint (No Exception)";

// Lines shown on each side of the current line
constexpr uint32_t kSourceContextLines = 5;

// Bounded textual capture of one frame's diagnostic state
struct Snapshot
{
    std::string function_name;
    uint32_t line_number = 0;
    std::vector<std::string> source_window;
    std::vector<std::pair<std::string, std::string>> variables;
    std::string exception_summary = kNoExceptionSummary;
};

// "Type: message", or just the type when there is no message
std::string FormatFailure(const FailureContext& failure);

// Line cache keyed by file path. A file is re-read when its modification time
// changes between lookups.
class SourceCache
{
  public:
    // Lines [first, last] that exist in the file. Throws std::runtime_error when
    // the file cannot be read.
    std::vector<std::pair<uint32_t, std::string>> GetLines(const std::string& path,
                                                           uint32_t first, uint32_t last);

  private:
    struct Entry
    {
        std::filesystem::file_time_type modified;
        std::vector<std::string> lines;
    };

    const Entry& Load(const std::string& path);

    std::unordered_map<std::string, Entry> files_;
};

class SnapshotBuilder
{
  public:
    SnapshotBuilder(const Settings& settings, Console& console, SourceCache& sources);

    // Never throws; fields that cannot be resolved degrade to placeholders
    Snapshot Capture(const Frame& frame, const FailureContext* failure) const;

  private:
    std::vector<std::string> CaptureSource(const Frame& frame, uint32_t line) const;
    std::vector<std::pair<std::string, std::string>> CaptureVariables(const Frame& frame) const;

    ValueRenderer renderer_;
    Console& console_;
    SourceCache& sources_;
};

} // namespace lldb_cognitrace
