#include "command_driver.hpp"
#include "http_transport.hpp"
#include "inference_client.hpp"
#include "lldb_client.hpp"
#include "lldb_session.hpp"
#include "session_controller.hpp"
#include "settings.hpp"
#include "snapshot.hpp"

#include <functional>
#include <lldb/API/SBCommandInterpreter.h>
#include <lldb/API/SBCommandReturnObject.h>
#include <memory>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

namespace
{
constexpr const char* kVersion = "0.1.0";

// Process-wide state, created when the plugin is loaded. Settings are
// read-only afterwards.
struct PluginState
{
    PluginState() : settings(LoadSettings(&settings_warnings)) {}

    std::vector<std::string> settings_warnings;
    const Settings settings;
    SourceCache sources;
    CurlTransport transport;
};

PluginState& GetPluginState()
{
    static PluginState state;
    return state;
}

// Everything one command invocation needs, wired to this debugger
struct Agent
{
    explicit Agent(lldb::SBDebugger& debugger)
        : client(debugger), session(debugger, client),
          builder(GetPluginState().settings, client, GetPluginState().sources),
          inference(GetPluginState().settings, GetPluginState().transport, client),
          driver(client), controller(session, client, builder, inference, driver)
    {
    }

    LldbClient client;
    LldbSession session;
    SnapshotBuilder builder;
    InferenceClient inference;
    CommandDriver driver;
    SessionController controller;
};

// Runs one controller entry point. A CommandExecutionError from a suggested
// command becomes the error of the LLDB command.
bool RunAgent(lldb::SBDebugger debugger, lldb::SBCommandReturnObject& result,
              const std::function<bool(SessionController&)>& action)
{
    Agent agent(debugger);
    try
    {
        if (!action(agent.controller))
        {
            result.SetStatus(lldb::eReturnStatusFailed);
            return false;
        }
    }
    catch (const std::exception& e)
    {
        result.SetError(e.what());
        return false;
    }

    result.SetStatus(lldb::eReturnStatusSuccessFinishNoResult);
    return true;
}
} // namespace

// Helper to join command args into a string
static std::string JoinArgs(char** command)
{
    std::string result;
    for (int i = 0; command && command[i]; i++)
    {
        if (i > 0)
            result += " ";
        result += command[i];
    }
    return result;
}

// "ai [query]" - analyze the current stop
class AiCommand : public lldb::SBCommandPluginInterface
{
  public:
    bool DoExecute(lldb::SBDebugger debugger, char** command,
                   lldb::SBCommandReturnObject& result) override
    {
        std::string query = JoinArgs(command);
        return RunAgent(debugger, result,
                        [&query](SessionController& controller)
                        { return controller.Analyze(query); });
    }
};

// "ai-crash [query]" - post-mortem analysis of the signal/exception the target stopped on
class AiCrashCommand : public lldb::SBCommandPluginInterface
{
  public:
    bool DoExecute(lldb::SBDebugger debugger, char** command,
                   lldb::SBCommandReturnObject& result) override
    {
        std::string query = JoinArgs(command);
        return RunAgent(debugger, result,
                        [&query](SessionController& controller)
                        { return controller.AnalyzeCrash(query); });
    }
};

// "ai-break [location]" - suspend there, or open the AI session at the current stop
class AiBreakCommand : public lldb::SBCommandPluginInterface
{
  public:
    bool DoExecute(lldb::SBDebugger debugger, char** command,
                   lldb::SBCommandReturnObject& result) override
    {
        std::string location = JoinArgs(command);
        return RunAgent(debugger, result,
                        [&location](SessionController& controller)
                        { return controller.Break(location); });
    }
};

// "ai-config" - show the configuration loaded with the plugin
class AiConfigCommand : public lldb::SBCommandPluginInterface
{
  public:
    bool DoExecute(lldb::SBDebugger debugger, char** command,
                   lldb::SBCommandReturnObject& result) override
    {
        std::string subcmd = JoinArgs(command);
        const Settings& settings = GetPluginState().settings;

        if (subcmd.empty() || subcmd == "help")
        {
            result.Printf(
                "LLDB Cognitrace - AI-assisted root cause analysis\n\n"
                "Commands:\n"
                "  ai [query]             Analyze the current stop (default: root cause)\n"
                "  ai-crash [query]       Analyze the signal/exception the target stopped on\n"
                "  ai-break <location>    Suspend at file:line or function, then use `ai`\n"
                "  ai-break               Open the AI session at the current stop\n"
                "  ai-config help         Show this help\n"
                "  ai-config version      Show version information\n"
                "  ai-config show         Show the active configuration\n"
                "  ai-config path         Show the settings file path\n\n"
                "Environment (read when the plugin is loaded):\n"
                "  OLLAMA_URL, AID_MODEL, AID_CONTEXT_SIZE, AID_MAX_VAR_LEN, AID_TIMEOUT_MS\n\n"
                "Examples:\n"
                "  ai why is total zero?\n"
                "  ai-crash\n"
                "  ai-break main.c:42\n");
        }
        else if (subcmd == "version")
        {
            result.Printf("LLDB Cognitrace v%s\nModel: %s\n", kVersion, settings.model.c_str());
        }
        else if (subcmd == "show")
        {
            result.Printf("Endpoint:         %s\n", settings.inference_url.c_str());
            result.Printf("Model:            %s\n", settings.model.c_str());
            result.Printf("Context size:     %d\n", settings.context_size);
            result.Printf("Max value length: %d\n", settings.max_value_length);
            result.Printf("Max depth:        %d\n", settings.max_depth);
            result.Printf("Max children:     %d\n", settings.max_children);
            result.Printf("Timeout:          %d ms (%d seconds)\n", settings.response_timeout_ms,
                          settings.response_timeout_ms / 1000);
            result.Printf("Custom prompt:    %s\n",
                          settings.custom_prompt.empty() ? "(none)"
                                                         : settings.custom_prompt.c_str());
        }
        else if (subcmd == "path")
        {
            result.Printf("%s\n", GetSettingsPath().c_str());
        }
        else
        {
            result.SetError(
                ("Unknown subcommand: " + subcmd + "\nUse 'ai-config help' for usage.").c_str());
            return false;
        }

        result.SetStatus(lldb::eReturnStatusSuccessFinishResult);
        return true;
    }
};

// Register commands with LLDB
void RegisterCommands(lldb::SBDebugger& debugger)
{
    PluginState& state = GetPluginState();
    LldbClient client(debugger);
    for (const auto& warning : state.settings_warnings)
        client.OutputWarning(warning);

    lldb::SBCommandInterpreter interp = debugger.GetCommandInterpreter();

    interp.AddCommand("ai", new AiCommand(),
                      "Analyze the current stop with the local model. Usage: ai [query]");
    interp.AddCommand("ai-crash", new AiCrashCommand(),
                      "Analyze the crash the target stopped on. Usage: ai-crash [query]");
    interp.AddCommand("ai-break", new AiBreakCommand(),
                      "Suspend at a location for AI analysis. Usage: ai-break [location]");
    interp.AddCommand("ai-config", new AiConfigCommand(),
                      "Cognitrace configuration. Usage: ai-config help");
}

} // namespace lldb_cognitrace
