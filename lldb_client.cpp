#include "lldb_client.hpp"

#include <unistd.h>

namespace lldb_cognitrace
{

// ANSI color codes for terminal output
namespace colors
{
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* RED = "\033[91m";
constexpr const char* YELLOW = "\033[93m";
constexpr const char* BLUE = "\033[94m";
constexpr const char* MAGENTA = "\033[95m";
constexpr const char* CYAN = "\033[96m";
} // namespace colors

LldbClient::LldbClient(lldb::SBDebugger& debugger)
    : debugger_(debugger), out_(debugger.GetOutputFileHandle()),
      in_(debugger.GetInputFileHandle())
{
    if (!out_)
        out_ = stdout;
    if (!in_)
        in_ = stdin;
}

void LldbClient::Print(const char* color, const std::string& prefix, const std::string& message)
{
    if (SupportsColor())
        fprintf(out_, "%s%s%s%s\n", color, prefix.c_str(), colors::RESET, message.c_str());
    else
        fprintf(out_, "%s%s\n", prefix.c_str(), message.c_str());
    fflush(out_);
}

void LldbClient::Output(const std::string& message)
{
    fprintf(out_, "%s", message.c_str());
    fflush(out_);
}

void LldbClient::OutputInfo(const std::string& message)
{
    Print(colors::CYAN, "[AI-DEBUG] ", message);
}

void LldbClient::OutputWarning(const std::string& message)
{
    Print(colors::YELLOW, "[AI-DEBUG WARN] ", message);
}

void LldbClient::OutputError(const std::string& message)
{
    Print(colors::RED, "[AI-DEBUG ERROR] ", message);
}

void LldbClient::OutputHeader(const std::string& message)
{
    if (SupportsColor())
        fprintf(out_, "%s%s%s%s\n", colors::MAGENTA, colors::BOLD, message.c_str(), colors::RESET);
    else
        fprintf(out_, "%s\n", message.c_str());
    fflush(out_);
}

void LldbClient::OutputCommand(const std::string& command)
{
    Print(colors::BLUE, "-> ", command);
}

void LldbClient::OutputCommandResult(const std::string& result)
{
    fprintf(out_, "%s", result.c_str());
    if (!result.empty() && result.back() != '\n')
        fprintf(out_, "\n");
    fflush(out_);
}

std::string LldbClient::ReadLine(const std::string& prompt)
{
    if (SupportsColor())
        fprintf(out_, "%s%s%s", colors::YELLOW, prompt.c_str(), colors::RESET);
    else
        fprintf(out_, "%s", prompt.c_str());
    fflush(out_);

    std::string line;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), in_))
    {
        line += buffer;
        if (!line.empty() && line.back() == '\n')
            break;
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
    return line;
}

bool LldbClient::SupportsColor() const
{
    return debugger_.GetUseColor() && isatty(fileno(out_));
}

} // namespace lldb_cognitrace
