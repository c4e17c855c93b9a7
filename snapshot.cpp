#include "snapshot.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace lldb_cognitrace
{

namespace fs = std::filesystem;

namespace
{
std::string SourceUnavailable(const std::string& path)
{
    return "<Source not available for " + (path.empty() ? std::string("<unknown file>") : path) +
           ">";
}

std::string RightTrim(std::string text)
{
    size_t end = text.find_last_not_of(" \t\r\n");
    text.erase(end == std::string::npos ? 0 : end + 1);
    return text;
}
} // namespace

std::string FormatFailure(const FailureContext& failure)
{
    std::string type = failure.type.empty() ? "Failure" : failure.type;
    if (failure.message.empty())
        return type;
    return type + ": " + failure.message;
}

const SourceCache::Entry& SourceCache::Load(const std::string& path)
{
    std::error_code ec;
    auto modified = fs::last_write_time(path, ec);
    if (ec)
        throw std::runtime_error("cannot stat " + path + ": " + ec.message());

    auto it = files_.find(path);
    if (it != files_.end() && it->second.modified == modified)
        return it->second;

    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("cannot open " + path);

    Entry entry;
    entry.modified = modified;
    std::string line;
    while (std::getline(file, line))
        entry.lines.push_back(line);

    Entry& stored = files_[path];
    stored = std::move(entry);
    return stored;
}

std::vector<std::pair<uint32_t, std::string>> SourceCache::GetLines(const std::string& path,
                                                                    uint32_t first,
                                                                    uint32_t last)
{
    const Entry& entry = Load(path);
    std::vector<std::pair<uint32_t, std::string>> lines;
    if (first == 0)
        first = 1;
    for (uint32_t number = first; number <= last && number <= entry.lines.size(); ++number)
        lines.emplace_back(number, entry.lines[number - 1]);
    return lines;
}

SnapshotBuilder::SnapshotBuilder(const Settings& settings, Console& console,
                                 SourceCache& sources)
    : renderer_(LimitsFromSettings(settings)), console_(console), sources_(sources)
{
}

Snapshot SnapshotBuilder::Capture(const Frame& frame, const FailureContext* failure) const
{
    const size_t max = renderer_.Limits().max_length;
    Snapshot snapshot;

    try
    {
        snapshot.function_name = Clamp(frame.FunctionName(), max);
    }
    catch (const std::exception& e)
    {
        console_.OutputWarning(std::string("Could not resolve function name: ") + e.what());
        snapshot.function_name = "<unknown>";
    }

    try
    {
        snapshot.line_number = frame.Line();
    }
    catch (const std::exception& e)
    {
        console_.OutputWarning(std::string("Could not resolve line number: ") + e.what());
        snapshot.line_number = 0;
    }

    snapshot.source_window = CaptureSource(frame, snapshot.line_number);
    snapshot.variables = CaptureVariables(frame);

    if (failure)
        snapshot.exception_summary = Clamp(FormatFailure(*failure), max);
    else
        snapshot.exception_summary = kNoExceptionSummary;

    return snapshot;
}

std::vector<std::string> SnapshotBuilder::CaptureSource(const Frame& frame, uint32_t line) const
{
    const size_t max = renderer_.Limits().max_length;
    std::string path;
    try
    {
        path = frame.SourcePath();
        if (path.empty() || line == 0)
            return {Clamp(SourceUnavailable(path), max)};

        uint32_t first = line > kSourceContextLines ? line - kSourceContextLines : 1;
        uint32_t last = line <= UINT32_MAX - kSourceContextLines ? line + kSourceContextLines
                                                                 : UINT32_MAX;

        std::vector<std::string> window;
        for (const auto& [number, text] : sources_.GetLines(path, first, last))
        {
            std::string prefix = number == line ? "--> " : "    ";
            window.push_back(Clamp(prefix + std::to_string(number) + ": " + RightTrim(text), max));
        }
        if (window.empty())
        {
            // Line table points past the end of the file on disk
            console_.OutputWarning("Source for " + path + " does not contain line " +
                                   std::to_string(line));
            return {Clamp(SourceUnavailable(path), max)};
        }
        return window;
    }
    catch (const std::exception& e)
    {
        console_.OutputWarning(std::string("Could not retrieve source code: ") + e.what());
        return {Clamp(SourceUnavailable(path), max)};
    }
}

std::vector<std::pair<std::string, std::string>>
SnapshotBuilder::CaptureVariables(const Frame& frame) const
{
    const size_t max = renderer_.Limits().max_length;
    std::vector<std::pair<std::string, std::string>> variables;

    std::vector<std::unique_ptr<Value>> values;
    try
    {
        values = frame.Variables();
    }
    catch (const std::exception& e)
    {
        console_.OutputWarning(std::string("Could not read frame variables: ") + e.what());
        return variables;
    }

    // Shadowed bindings: the first (innermost) one wins
    std::unordered_set<std::string> seen;
    for (const auto& value : values)
    {
        if (!value)
            continue;

        std::string name;
        std::string text;
        try
        {
            name = Clamp(value->Name(), max);
            if (!seen.insert(name).second)
                continue;
            text = renderer_.Render(*value);
        }
        catch (const std::exception& e)
        {
            console_.OutputWarning("Could not render variable '" + name + "': " + e.what());
            if (name.empty() || !seen.count(name))
                continue;
            text = Clamp(std::string("<unavailable: ") + e.what() + ">", max);
        }
        variables.emplace_back(std::move(name), std::move(text));
    }
    return variables;
}

} // namespace lldb_cognitrace
