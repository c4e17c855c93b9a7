#pragma once

#include "console.hpp"

#include <cstdio>
#include <lldb/API/LLDB.h>
#include <string>

namespace lldb_cognitrace
{

// Console on the LLDB terminal: coloured output to the debugger's output
// handle, answers read from its input handle
class LldbClient : public Console
{
  public:
    explicit LldbClient(lldb::SBDebugger& debugger);
    ~LldbClient() override = default;

    void Output(const std::string& message) override;
    void OutputInfo(const std::string& message) override;
    void OutputWarning(const std::string& message) override;
    void OutputError(const std::string& message) override;
    void OutputHeader(const std::string& message) override;
    void OutputCommand(const std::string& command) override;
    std::string ReadLine(const std::string& prompt) override;

    // Dimmed interpreter output of an executed command
    void OutputCommandResult(const std::string& result);

    // Query capabilities
    bool SupportsColor() const;

  private:
    void Print(const char* color, const std::string& prefix, const std::string& message);

    lldb::SBDebugger& debugger_;
    FILE* out_;
    FILE* in_;
};

} // namespace lldb_cognitrace
