#pragma once

#include <string>

namespace lldb_cognitrace
{

// User-facing output and input of the agent
class Console
{
  public:
    virtual ~Console() = default;

    // Raw text, no newline added
    virtual void Output(const std::string& message) = 0;

    virtual void OutputInfo(const std::string& message) = 0;
    virtual void OutputWarning(const std::string& message) = 0;
    virtual void OutputError(const std::string& message) = 0;

    // Banner lines such as "=== AI DIAGNOSIS ==="
    virtual void OutputHeader(const std::string& message) = 0;

    // Echo of a command about to be executed
    virtual void OutputCommand(const std::string& command) = 0;

    // Blocking prompt; returns the entered line without the trailing newline,
    // or an empty string on end of input.
    virtual std::string ReadLine(const std::string& prompt) = 0;
};

} // namespace lldb_cognitrace
