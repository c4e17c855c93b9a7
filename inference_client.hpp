#pragma once

#include "console.hpp"
#include "http_transport.hpp"
#include "settings.hpp"
#include "snapshot.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

constexpr const char* kDefaultQuery = "Analyze the root cause of the current state/error.";

// suggested_fix of a diagnosis built from model output that was not JSON
constexpr const char* kUnparsedFixMarker = "Could not parse specific fix from model output.";

// Low temperature keeps the analysis close to deterministic
constexpr double kTemperature = 0.2;

// Result of one inference round-trip
struct Diagnosis
{
    std::string diagnosis;
    std::string suggested_fix;
    std::vector<std::string> commands;
};

// Full prompt: system prompt, snapshot block, user query block
std::string BuildPrompt(const Snapshot& snapshot, const std::string& user_query,
                        const std::string& custom_prompt);

// Body of the POST to the Ollama generate endpoint
nlohmann::json BuildRequest(const Settings& settings, const std::string& prompt);

// Structured decode of the model text. Empty when the text is not a JSON object.
std::optional<Diagnosis> DecodeDiagnosis(const std::string& model_text);

// Diagnosis carrying the raw model text when structured decoding failed
Diagnosis FallbackDiagnosis(const std::string& model_text);

class InferenceClient
{
  public:
    InferenceClient(const Settings& settings, HttpTransport& transport, Console& console);

    // One blocking round-trip. Never throws; every failure yields a Diagnosis
    // describing it with no commands.
    Diagnosis Query(const Snapshot& snapshot, const std::string& user_query);

  private:
    Diagnosis QueryBackend(const Snapshot& snapshot, const std::string& user_query);
    Diagnosis FromTransportError(const HttpResponse& response);

    const Settings& settings_;
    HttpTransport& transport_;
    Console& console_;
};

} // namespace lldb_cognitrace
