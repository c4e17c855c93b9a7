// LLDB-specific settings implementation with cross-platform paths
#include "settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace lldb_cognitrace
{

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{
// Strict positive integer parse; the whole string must be consumed
bool ParsePositiveInt(const std::string& text, int* out)
{
    try
    {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value <= 0)
            return false;
        *out = value;
        return true;
    }
    catch (const std::logic_error&)
    {
        // invalid_argument / out_of_range
        return false;
    }
}

// Integer key of the settings file; values below minimum are reported and skipped
void ApplyIntKey(const json& j, const char* key, int minimum, int* field,
                 std::vector<std::string>* warnings)
{
    auto it = j.find(key);
    if (it == j.end())
        return;
    int value = it->get<int>();
    if (value < minimum)
    {
        if (warnings)
            warnings->push_back(std::string("Ignoring ") + key + "=" + std::to_string(value) +
                                " in settings file: expected " +
                                (minimum > 0 ? "a positive integer" : "a non-negative integer"));
        return;
    }
    *field = value;
}

void ApplyIntVariable(const EnvLookup& getenv_fn, const char* name, int* field,
                      std::vector<std::string>* warnings)
{
    const char* raw = getenv_fn(name);
    if (!raw || !*raw)
        return;
    if (!ParsePositiveInt(raw, field) && warnings)
        warnings->push_back(std::string("Ignoring ") + name + "='" + raw +
                            "': expected a positive integer");
}
} // namespace

std::string GetSettingsDir()
{
    // Get user home directory - check Unix HOME first, then Windows USERPROFILE
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return ".lldb_cognitrace";
    return std::string(home) + "/.lldb_cognitrace";
}

std::string GetSettingsPath()
{
    return GetSettingsDir() + "/settings.json";
}

void ApplyJson(const json& j, Settings& settings, std::vector<std::string>* warnings)
{
    if (j.contains("inference_url"))
        settings.inference_url = j["inference_url"].get<std::string>();
    if (j.contains("model"))
        settings.model = j["model"].get<std::string>();
    ApplyIntKey(j, "context_size", 1, &settings.context_size, warnings);
    ApplyIntKey(j, "max_value_length", 1, &settings.max_value_length, warnings);
    ApplyIntKey(j, "max_depth", 0, &settings.max_depth, warnings);
    ApplyIntKey(j, "max_children", 1, &settings.max_children, warnings);
    ApplyIntKey(j, "response_timeout_ms", 1, &settings.response_timeout_ms, warnings);
    if (j.contains("custom_prompt"))
        settings.custom_prompt = j["custom_prompt"].get<std::string>();
}

json ToJson(const Settings& settings)
{
    json j;
    j["inference_url"] = settings.inference_url;
    j["model"] = settings.model;
    j["context_size"] = settings.context_size;
    j["max_value_length"] = settings.max_value_length;
    j["max_depth"] = settings.max_depth;
    j["max_children"] = settings.max_children;
    j["response_timeout_ms"] = settings.response_timeout_ms;
    if (!settings.custom_prompt.empty())
        j["custom_prompt"] = settings.custom_prompt;
    return j;
}

void ApplyEnvironment(Settings& settings, const EnvLookup& getenv_fn,
                      std::vector<std::string>* warnings)
{
    if (const char* url = getenv_fn("OLLAMA_URL"); url && *url)
        settings.inference_url = url;
    if (const char* model = getenv_fn("AID_MODEL"); model && *model)
        settings.model = model;

    ApplyIntVariable(getenv_fn, "AID_CONTEXT_SIZE", &settings.context_size, warnings);
    ApplyIntVariable(getenv_fn, "AID_MAX_VAR_LEN", &settings.max_value_length, warnings);
    ApplyIntVariable(getenv_fn, "AID_TIMEOUT_MS", &settings.response_timeout_ms, warnings);
}

Settings LoadSettings(std::vector<std::string>* warnings)
{
    Settings settings;
    std::string path = GetSettingsPath();

    std::error_code ec;
    if (fs::exists(path, ec))
    {
        std::ifstream file(path);
        if (file.is_open())
        {
            // Parse into a copy so a bad key does not leave a half-applied file
            Settings loaded = settings;
            try
            {
                json j;
                file >> j;
                ApplyJson(j, loaded, warnings);
                settings = loaded;
            }
            catch (const json::exception& e)
            {
                if (warnings)
                    warnings->push_back("Ignoring " + path + ": " + e.what());
            }
        }
        else if (warnings)
        {
            warnings->push_back("Cannot open " + path + ", using defaults");
        }
    }
    else
    {
        // Create default settings file
        SaveSettings(settings);
    }

    ApplyEnvironment(settings, [](const char* name) { return std::getenv(name); }, warnings);
    return settings;
}

void SaveSettings(const Settings& settings)
{
    std::string dir = GetSettingsDir();
    std::error_code ec;
    if (!fs::exists(dir, ec))
        fs::create_directories(dir, ec);

    std::ofstream file(GetSettingsPath());
    if (file.is_open())
        file << ToJson(settings).dump(2);
}

} // namespace lldb_cognitrace
