#pragma once

#include "command_driver.hpp"
#include "console.hpp"
#include "debug_session.hpp"
#include "inference_client.hpp"
#include "snapshot.hpp"

#include <string>
#include <utility>

namespace lldb_cognitrace
{

enum class SessionState
{
    Idle,
    Analyzing,
    Reporting,
    Driving
};

// "file.c:42" -> breakpoint set --file "file.c" --line 42, otherwise --name
std::string BreakpointCommand(const std::string& location);

// Binds snapshot capture, inference and the command driver into the
// analyze -> report -> (drive) cycle. Runs on the thread that owns the
// debugger session and always ends in Idle.
class SessionController
{
  public:
    SessionController(DebugSession& session, Console& console, const SnapshotBuilder& builder,
                      InferenceClient& client, CommandDriver& driver);

    // "ai [query]": analyze the current stop. Returns false if there is no frame.
    bool Analyze(const std::string& query);

    // "ai-crash [query]": analyze the failure the target is stopped on, rooted at
    // the faulting thread's innermost frame. Returns false if there is no failure.
    bool AnalyzeCrash(const std::string& query);

    // "ai-break [location]": with a location, make the target suspend there;
    // without one, open the AI session at the current stop.
    bool Break(const std::string& location);

    SessionState State() const { return state_; }

    // Replaces the console "[y/N]" prompt
    void SetConfirm(ConfirmFn confirm) { confirm_ = std::move(confirm); }

  private:
    bool RunCycle(const FailureContext* failure, const std::string& query);
    void Report(const Diagnosis& diagnosis);

    DebugSession& session_;
    Console& console_;
    const SnapshotBuilder& builder_;
    InferenceClient& client_;
    CommandDriver& driver_;
    ConfirmFn confirm_;
    SessionState state_ = SessionState::Idle;
};

} // namespace lldb_cognitrace
