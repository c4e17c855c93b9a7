#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

// Active failure the target is stopped on (signal, machine exception, ...)
struct FailureContext
{
    std::string type;    // e.g. "SIGFPE"
    std::string message; // e.g. "integer divide by zero"
};

// One node of a runtime value tree. Children are produced lazily so that
// huge containers are never materialized.
class Value
{
  public:
    virtual ~Value() = default;

    virtual std::string Name() const = 0;

    // Leaf text (scalar value, pointer address or a formatter summary).
    // Empty when the value has no textual form of its own.
    virtual std::string Text() const = 0;

    // True for strings; Text() is then the quoted string contents
    virtual bool IsString() const { return false; }

    // True for arrays and sequence containers (rendered as [a, b])
    virtual bool IsSequence() const { return false; }

    virtual uint32_t NumChildren() const = 0;
    virtual std::unique_ptr<Value> ChildAt(uint32_t index) const = 0;

    // Key identifying the object this value denotes (address + type).
    // Empty when the value has no stable identity.
    virtual std::string Identity() const { return ""; }
};

// One active function invocation of the stopped target
class Frame
{
  public:
    virtual ~Frame() = default;

    virtual std::string FunctionName() const = 0;
    virtual uint32_t Line() const = 0;
    virtual std::string SourcePath() const = 0;

    // Visible bindings (arguments, then locals) in declaration order
    virtual std::vector<std::unique_ptr<Value>> Variables() const = 0;
};

// Raised by DebugSession::ExecuteCommand when the interpreter rejects a command
class CommandExecutionError : public std::runtime_error
{
  public:
    explicit CommandExecutionError(const std::string& message) : std::runtime_error(message) {}
};

// The capabilities the agent needs from an interactive debugger
class DebugSession
{
  public:
    virtual ~DebugSession() = default;

    // Selected frame of the stopped target, or nullptr if there is none
    virtual std::unique_ptr<Frame> CurrentFrame() = 0;

    // Failure the target is currently stopped on, if any
    virtual std::optional<FailureContext> ActiveFailure() = 0;

    // Run one interpreter command against the live session
    virtual void ExecuteCommand(const std::string& command) = 0;

    // Drop stale selection state (selected thread/frame)
    virtual void Reset() = 0;

    // Root the interaction at the failure's frame, or at the current stop when
    // failure is null. Returns false if there is nothing to interact with.
    virtual bool StartInteraction(const FailureContext* failure) = 0;
};

} // namespace lldb_cognitrace
