#include "session_controller.hpp"

#include <cctype>

namespace lldb_cognitrace
{

namespace
{
constexpr const char* kConfirmQuestion = "Execute these commands autonomously?";

// Puts the controller back to Idle however the cycle ends
class IdleOnExit
{
  public:
    explicit IdleOnExit(SessionState& state) : state_(state) {}
    ~IdleOnExit() { state_ = SessionState::Idle; }

    IdleOnExit(const IdleOnExit&) = delete;
    IdleOnExit& operator=(const IdleOnExit&) = delete;

  private:
    SessionState& state_;
};

std::string Trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string Quote(const std::string& text)
{
    std::string quoted = "\"";
    for (char c : text)
    {
        if (c == '"' || c == '\\')
            quoted += '\\';
        quoted += c;
    }
    return quoted + "\"";
}
} // namespace

std::string BreakpointCommand(const std::string& location)
{
    std::string where = Trim(location);
    size_t colon = where.rfind(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < where.size())
    {
        std::string line = where.substr(colon + 1);
        bool numeric = true;
        for (char c : line)
            numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
        if (numeric)
            return "breakpoint set --file " + Quote(where.substr(0, colon)) + " --line " + line;
    }
    return "breakpoint set --name " + Quote(where);
}

SessionController::SessionController(DebugSession& session, Console& console,
                                     const SnapshotBuilder& builder, InferenceClient& client,
                                     CommandDriver& driver)
    : session_(session), console_(console), builder_(builder), client_(client), driver_(driver),
      confirm_(MakeConsoleConfirm(console, kConfirmQuestion))
{
}

bool SessionController::Analyze(const std::string& query)
{
    std::optional<FailureContext> failure = session_.ActiveFailure();
    return RunCycle(failure ? &*failure : nullptr, query);
}

bool SessionController::AnalyzeCrash(const std::string& query)
{
    std::optional<FailureContext> failure = session_.ActiveFailure();
    if (!failure)
    {
        console_.OutputWarning("No crash detected: the target is not stopped on a signal or "
                               "exception. Use `ai` to analyze a breakpoint.");
        return false;
    }

    console_.OutputWarning("Crash detected! Spawning AI Agent...");
    session_.Reset();
    if (!session_.StartInteraction(&*failure))
    {
        console_.OutputError("Could not select the frame of the failure: " + FormatFailure(*failure));
        return false;
    }
    return RunCycle(&*failure, query);
}

bool SessionController::Break(const std::string& location)
{
    std::string where = Trim(location);
    if (!where.empty())
    {
        session_.ExecuteCommand(BreakpointCommand(where));
        console_.OutputInfo("Execution will suspend at " + where +
                            ". Type `ai [query]` there to analyze.");
        return true;
    }

    session_.Reset();
    if (!session_.StartInteraction(nullptr))
    {
        console_.OutputError("No stopped process to break into. Launch or attach first.");
        return false;
    }
    console_.OutputInfo("AI session open at the current stop. Type `ai [query]` to analyze.");
    return true;
}

bool SessionController::RunCycle(const FailureContext* failure, const std::string& query)
{
    IdleOnExit idle(state_);
    state_ = SessionState::Analyzing;

    std::unique_ptr<Frame> frame = session_.CurrentFrame();
    if (!frame)
    {
        console_.OutputError("No frame selected. The target must be stopped.");
        return false;
    }

    Snapshot snapshot = builder_.Capture(*frame, failure);

    console_.OutputInfo("Thinking... (Analyzing Stack & Variables)");
    Diagnosis diagnosis = client_.Query(snapshot, query);

    state_ = SessionState::Reporting;
    Report(diagnosis);

    if (!diagnosis.commands.empty())
    {
        state_ = SessionState::Driving;
        driver_.Drive(diagnosis.commands, confirm_,
                      [this](const std::string& command) { session_.ExecuteCommand(command); });
    }

    console_.OutputHeader("=======================");
    console_.Output("\n");
    return true;
}

void SessionController::Report(const Diagnosis& diagnosis)
{
    console_.Output("\n");
    console_.OutputHeader("=== AI DIAGNOSIS ===");
    console_.Output("Diagnosis: " + diagnosis.diagnosis + "\n");
    console_.Output("Fix:       " + diagnosis.suggested_fix + "\n");
}

} // namespace lldb_cognitrace
