#pragma once

#include "debug_session.hpp"
#include "lldb_client.hpp"

#include <lldb/API/LLDB.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

// SBValue adapter. Children are fetched on demand.
class LldbValue : public Value
{
  public:
    explicit LldbValue(lldb::SBValue value);

    std::string Name() const override;
    std::string Text() const override;
    bool IsString() const override;
    bool IsSequence() const override;
    uint32_t NumChildren() const override;
    std::unique_ptr<Value> ChildAt(uint32_t index) const override;
    std::string Identity() const override;

  private:
    bool IsNullPointer() const;

    mutable lldb::SBValue value_;
};

// SBFrame adapter
class LldbFrame : public Frame
{
  public:
    explicit LldbFrame(lldb::SBFrame frame);

    std::string FunctionName() const override;
    uint32_t Line() const override;
    std::string SourcePath() const override;
    std::vector<std::unique_ptr<Value>> Variables() const override;

  private:
    mutable lldb::SBFrame frame_;
};

// DebugSession over the LLDB command interpreter and the selected process
class LldbSession : public DebugSession
{
  public:
    LldbSession(lldb::SBDebugger& debugger, LldbClient& client);

    std::unique_ptr<Frame> CurrentFrame() override;
    std::optional<FailureContext> ActiveFailure() override;

    // Echoes the interpreter output; throws CommandExecutionError when the
    // interpreter reports failure
    void ExecuteCommand(const std::string& command) override;

    void Reset() override;
    bool StartInteraction(const FailureContext* failure) override;

  private:
    // Process of the selected target when it is stopped, otherwise invalid
    lldb::SBProcess StoppedProcess() const;

    lldb::SBDebugger& debugger_;
    LldbClient& client_;
};

// Failure described by the thread's stop reason, if it stopped on one
std::optional<FailureContext> FailureFromThread(lldb::SBProcess& process, lldb::SBThread& thread);

} // namespace lldb_cognitrace
