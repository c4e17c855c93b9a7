#include "lldb_session.hpp"

#include <climits>
#include <cstdio>
#include <lldb/API/SBCommandInterpreter.h>
#include <lldb/API/SBCommandReturnObject.h>
#include <lldb/API/SBUnixSignals.h>

namespace lldb_cognitrace
{

namespace
{
std::string SafeString(const char* text)
{
    return text ? text : "";
}

std::string Hex(uint64_t value)
{
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "0x%llx", static_cast<unsigned long long>(value));
    return buffer;
}

std::string StopDescription(lldb::SBThread& thread)
{
    char buffer[1024] = {0};
    thread.GetStopDescription(buffer, sizeof(buffer));
    return buffer;
}

bool SameFailure(const FailureContext& a, const FailureContext& b)
{
    return a.type == b.type && a.message == b.message;
}
} // namespace

// -- LldbValue --

LldbValue::LldbValue(lldb::SBValue value) : value_(value) {}

std::string LldbValue::Name() const
{
    return SafeString(value_.GetName());
}

bool LldbValue::IsNullPointer() const
{
    return value_.GetType().IsPointerType() && value_.GetValueAsUnsigned(0) == 0;
}

std::string LldbValue::Text() const
{
    lldb::SBError error = value_.GetError();
    if (error.Fail())
        return "<error: " + SafeString(error.GetCString()) + ">";

    std::string value = SafeString(value_.GetValue());
    std::string summary = SafeString(value_.GetSummary());
    if (IsString())
        return summary;
    if (IsNullPointer())
        return "nullptr";
    if (!value.empty() && !summary.empty())
        return value + " " + summary;
    return value.empty() ? summary : value;
}

bool LldbValue::IsString() const
{
    // char*, char[N] and std::string all summarize as a quoted literal
    const char* summary = value_.GetSummary();
    return summary && summary[0] == '"';
}

bool LldbValue::IsSequence() const
{
    if (value_.GetType().IsArrayType())
        return true;
    if (!value_.MightHaveChildren())
        return false;
    lldb::SBValue first = value_.GetChildAtIndex(0);
    const char* name = first.IsValid() ? first.GetName() : nullptr;
    return name && name[0] == '[';
}

uint32_t LldbValue::NumChildren() const
{
    if (value_.GetError().Fail() || IsNullPointer())
        return 0;
    return value_.GetNumChildren();
}

std::unique_ptr<Value> LldbValue::ChildAt(uint32_t index) const
{
    lldb::SBValue child = value_.GetChildAtIndex(index);
    if (!child.IsValid())
        return nullptr;
    return std::make_unique<LldbValue>(child);
}

std::string LldbValue::Identity() const
{
    lldb::SBType type = value_.GetType();
    if (type.IsPointerType())
    {
        uint64_t pointee = value_.GetValueAsUnsigned(0);
        if (pointee == 0)
            return "";
        return Hex(pointee) + ":" + SafeString(type.GetPointeeType().GetName());
    }

    lldb::addr_t address = value_.GetLoadAddress();
    if (address == LLDB_INVALID_ADDRESS)
        return "";
    return Hex(address) + ":" + SafeString(type.GetName());
}

// -- LldbFrame --

LldbFrame::LldbFrame(lldb::SBFrame frame) : frame_(frame) {}

std::string LldbFrame::FunctionName() const
{
    const char* name = frame_.GetDisplayFunctionName();
    if (!name)
        name = frame_.GetFunctionName();
    return name ? name : "??";
}

uint32_t LldbFrame::Line() const
{
    lldb::SBLineEntry entry = frame_.GetLineEntry();
    return entry.IsValid() ? entry.GetLine() : 0;
}

std::string LldbFrame::SourcePath() const
{
    lldb::SBLineEntry entry = frame_.GetLineEntry();
    if (!entry.IsValid())
        return "";
    char path[PATH_MAX] = {0};
    entry.GetFileSpec().GetPath(path, sizeof(path));
    return path;
}

std::vector<std::unique_ptr<Value>> LldbFrame::Variables() const
{
    // arguments, locals, no statics, in scope only
    lldb::SBValueList list = frame_.GetVariables(true, true, false, true);
    std::vector<std::unique_ptr<Value>> variables;
    for (uint32_t i = 0; i < list.GetSize(); ++i)
    {
        lldb::SBValue value = list.GetValueAtIndex(i);
        if (value.IsValid())
            variables.push_back(std::make_unique<LldbValue>(value));
    }
    return variables;
}

// -- LldbSession --

std::optional<FailureContext> FailureFromThread(lldb::SBProcess& process, lldb::SBThread& thread)
{
    FailureContext failure;
    std::string description = StopDescription(thread);

    switch (thread.GetStopReason())
    {
    case lldb::eStopReasonSignal:
    {
        int signo = static_cast<int>(thread.GetStopReasonDataAtIndex(0));
        const char* name = process.GetUnixSignals().GetSignalAsCString(signo);
        failure.type = name ? name : "signal " + std::to_string(signo);

        // "signal SIGFPE: integer divide by zero" -> "integer divide by zero"
        std::string prefix = "signal " + failure.type;
        if (description.compare(0, prefix.size(), prefix) == 0)
        {
            description.erase(0, prefix.size());
            size_t start = description.find_first_not_of(": ");
            description = start == std::string::npos ? "" : description.substr(start);
        }
        failure.message = description;
        return failure;
    }
    case lldb::eStopReasonException:
        failure.type = "Exception";
        failure.message = description;
        return failure;
    case lldb::eStopReasonInstrumentation:
        failure.type = "Instrumentation";
        failure.message = description;
        return failure;
    default:
        return std::nullopt;
    }
}

LldbSession::LldbSession(lldb::SBDebugger& debugger, LldbClient& client)
    : debugger_(debugger), client_(client)
{
}

lldb::SBProcess LldbSession::StoppedProcess() const
{
    lldb::SBTarget target = debugger_.GetSelectedTarget();
    if (!target.IsValid())
        return lldb::SBProcess();
    lldb::SBProcess process = target.GetProcess();
    if (!process.IsValid() || process.GetState() != lldb::eStateStopped)
        return lldb::SBProcess();
    return process;
}

std::unique_ptr<Frame> LldbSession::CurrentFrame()
{
    lldb::SBProcess process = StoppedProcess();
    if (!process.IsValid())
        return nullptr;
    lldb::SBThread thread = process.GetSelectedThread();
    if (!thread.IsValid())
        return nullptr;
    lldb::SBFrame frame = thread.GetSelectedFrame();
    if (!frame.IsValid())
        return nullptr;
    return std::make_unique<LldbFrame>(frame);
}

std::optional<FailureContext> LldbSession::ActiveFailure()
{
    lldb::SBProcess process = StoppedProcess();
    if (!process.IsValid())
        return std::nullopt;

    // Selected thread first, then whichever thread faulted
    lldb::SBThread selected = process.GetSelectedThread();
    if (selected.IsValid())
    {
        if (auto failure = FailureFromThread(process, selected))
            return failure;
    }

    for (uint32_t i = 0; i < process.GetNumThreads(); ++i)
    {
        lldb::SBThread thread = process.GetThreadAtIndex(i);
        if (auto failure = FailureFromThread(process, thread))
            return failure;
    }
    return std::nullopt;
}

void LldbSession::ExecuteCommand(const std::string& command)
{
    lldb::SBCommandInterpreter interp = debugger_.GetCommandInterpreter();
    lldb::SBCommandReturnObject result;
    interp.HandleCommand(command.c_str(), result);

    std::string output;
    if (result.GetOutputSize() > 0)
        output = result.GetOutput();
    if (result.GetErrorSize() > 0)
    {
        if (!output.empty() && output.back() != '\n')
            output += "\n";
        output += result.GetError();
    }
    if (!output.empty())
        client_.OutputCommandResult(output);

    if (!result.Succeeded())
    {
        std::string error = result.GetErrorSize() > 0 ? SafeString(result.GetError()) : "";
        while (!error.empty() && (error.back() == '\n' || error.back() == '\r'))
            error.pop_back();
        throw CommandExecutionError("Command '" + command + "' failed" +
                                    (error.empty() ? std::string() : ": " + error));
    }
}

void LldbSession::Reset()
{
    lldb::SBProcess process = StoppedProcess();
    if (!process.IsValid())
        return;
    lldb::SBThread thread = process.GetSelectedThread();
    if (thread.IsValid())
        thread.SetSelectedFrame(0);
}

bool LldbSession::StartInteraction(const FailureContext* failure)
{
    lldb::SBProcess process = StoppedProcess();
    if (!process.IsValid())
        return false;

    if (!failure)
        return process.GetSelectedThread().IsValid();

    for (uint32_t i = 0; i < process.GetNumThreads(); ++i)
    {
        lldb::SBThread thread = process.GetThreadAtIndex(i);
        auto stopped_on = FailureFromThread(process, thread);
        if (stopped_on && SameFailure(*stopped_on, *failure))
        {
            process.SetSelectedThread(thread);
            thread.SetSelectedFrame(0);
            return true;
        }
    }
    return false;
}

} // namespace lldb_cognitrace
