#pragma once

#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

// Settings stored in ~/.lldb_cognitrace/settings.json, overridden by the
// environment. Loaded once when the plugin is loaded and read-only afterwards.
struct Settings
{
    // Ollama generate endpoint
    std::string inference_url = "http://localhost:11434/api/generate";

    std::string model = "qwen3:8b";

    // Context window passed as options.num_ctx
    int context_size = 4096;

    // Upper bound on every textual field of a snapshot
    int max_value_length = 500;

    // Nesting depth the value renderer expands before eliding with "..."
    int max_depth = 4;

    // Children rendered per container before eliding with "..."
    int max_children = 16;

    // Local inference can be slow
    int response_timeout_ms = 480000;

    // User's custom prompt (additive to system prompt)
    std::string custom_prompt;
};

// Lookup used for environment overrides (std::getenv in production)
using EnvLookup = std::function<const char*(const char*)>;

// Get the settings directory path (~/.lldb_cognitrace)
std::string GetSettingsDir();

// Get the settings file path (~/.lldb_cognitrace/settings.json)
std::string GetSettingsPath();

// Load settings from disk (creates default if not exists), then apply the
// environment. Problems are collected in warnings and the defaults kept.
Settings LoadSettings(std::vector<std::string>* warnings = nullptr);

// Save settings to disk
void SaveSettings(const Settings& settings);

// Overlay the keys present in j onto settings. Throws nlohmann::json::exception
// on a key of the wrong type. Out-of-range numbers are reported in warnings and
// the previous value kept.
void ApplyJson(const nlohmann::json& j, Settings& settings,
               std::vector<std::string>* warnings = nullptr);

// Serialize every key
nlohmann::json ToJson(const Settings& settings);

// Apply OLLAMA_URL, AID_MODEL, AID_CONTEXT_SIZE, AID_MAX_VAR_LEN, AID_TIMEOUT_MS
void ApplyEnvironment(Settings& settings, const EnvLookup& getenv_fn,
                      std::vector<std::string>* warnings = nullptr);

} // namespace lldb_cognitrace
