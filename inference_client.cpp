#include "inference_client.hpp"
#include "system_prompt.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

namespace lldb_cognitrace
{

using json = nlohmann::json;

namespace
{
// Truncated values may split a UTF-8 sequence; never let dump() throw on it
std::string DumpJson(const json& j, int indent)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string Trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// String field of the model reply; other JSON values are kept as their JSON text
std::string FieldText(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    return DumpJson(*it, -1);
}

// Ollama reports failures as {"error": "..."}
std::string ErrorText(const std::string& body)
{
    json reply = json::parse(body, nullptr, false);
    if (!reply.is_discarded() && reply.is_object())
    {
        auto it = reply.find("error");
        if (it != reply.end() && it->is_string())
            return it->get<std::string>();
    }
    return Trim(body);
}
} // namespace

std::string BuildPrompt(const Snapshot& snapshot, const std::string& user_query,
                        const std::string& custom_prompt)
{
    nlohmann::ordered_json variables = nlohmann::ordered_json::object();
    for (const auto& [name, text] : snapshot.variables)
        variables[name] = text;

    std::ostringstream prompt;
    prompt << GetFullSystemPrompt(custom_prompt) << "\n\n";
    prompt << "--- SNAPSHOT ---\n";
    prompt << "Error: " << snapshot.exception_summary << "\n";
    prompt << "Function: " << snapshot.function_name << "\n";
    prompt << "Line: " << snapshot.line_number << "\n";
    prompt << "Code Context:\n";
    for (const auto& line : snapshot.source_window)
        prompt << line << "\n";
    prompt << "\nVariables:\n";
    prompt << variables.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
           << "\n\n";
    prompt << "--- USER QUERY ---\n";
    prompt << user_query << "\n";
    return prompt.str();
}

json BuildRequest(const Settings& settings, const std::string& prompt)
{
    return json{{"model", settings.model},
                {"prompt", prompt},
                {"stream", false},
                {"format", "json"},
                {"options", {{"num_ctx", settings.context_size}, {"temperature", kTemperature}}}};
}

std::optional<Diagnosis> DecodeDiagnosis(const std::string& model_text)
{
    json reply = json::parse(model_text, nullptr, false);
    if (reply.is_discarded() || !reply.is_object())
        return std::nullopt;

    Diagnosis result;
    result.diagnosis = FieldText(reply, "diagnosis");
    result.suggested_fix = FieldText(reply, "suggested_fix");

    auto commands = reply.find("pdb_commands");
    if (commands != reply.end())
    {
        if (commands->is_array())
        {
            for (const auto& command : *commands)
                if (command.is_string())
                    result.commands.push_back(command.get<std::string>());
        }
        else if (commands->is_string() && !Trim(commands->get<std::string>()).empty())
        {
            result.commands.push_back(commands->get<std::string>());
        }
    }
    return result;
}

Diagnosis FallbackDiagnosis(const std::string& model_text)
{
    Diagnosis result;
    result.diagnosis = model_text;
    result.suggested_fix = kUnparsedFixMarker;
    return result;
}

InferenceClient::InferenceClient(const Settings& settings, HttpTransport& transport,
                                 Console& console)
    : settings_(settings), transport_(transport), console_(console)
{
}

Diagnosis InferenceClient::Query(const Snapshot& snapshot, const std::string& user_query)
{
    try
    {
        return QueryBackend(snapshot, user_query);
    }
    catch (const std::exception& e)
    {
        console_.OutputError(std::string("LLM Error: ") + e.what());
        return Diagnosis{std::string("Error: ") + e.what(), "N/A", {}};
    }
}

Diagnosis InferenceClient::QueryBackend(const Snapshot& snapshot, const std::string& user_query)
{
    std::string query = Trim(user_query).empty() ? kDefaultQuery : user_query;
    std::string body =
        DumpJson(BuildRequest(settings_, BuildPrompt(snapshot, query, settings_.custom_prompt)), -1);

    console_.OutputInfo("Connecting to " + settings_.inference_url + " using model '" +
                        settings_.model + "'...");
    HttpResponse response = transport_.PostJson(
        settings_.inference_url, body,
        std::chrono::milliseconds(settings_.response_timeout_ms > 0 ? settings_.response_timeout_ms
                                                                     : 0));

    if (!response.Ok())
        return FromTransportError(response);

    if (response.status_code < 200 || response.status_code >= 300)
    {
        std::string error = ErrorText(response.text);
        console_.OutputError("LLM Error: HTTP " + std::to_string(response.status_code) + ": " +
                             error);
        return Diagnosis{"Error: HTTP " + std::to_string(response.status_code) + ": " + error,
                         "N/A",
                         {}};
    }

    std::string model_text;
    json reply = json::parse(response.text, nullptr, false);
    if (reply.is_discarded() || !reply.is_object())
    {
        console_.OutputWarning("Backend reply is not a JSON object; using the raw text.");
        model_text = response.text;
    }
    else
    {
        model_text = FieldText(reply, "response");
    }

    if (auto decoded = DecodeDiagnosis(model_text))
        return *decoded;

    console_.OutputWarning("Model output is not valid JSON; showing it verbatim.");
    return FallbackDiagnosis(model_text);
}

Diagnosis InferenceClient::FromTransportError(const HttpResponse& response)
{
    switch (response.error)
    {
    case TransportError::Timeout:
        console_.OutputError("Timed out waiting for " + settings_.inference_url + " after " +
                             std::to_string(settings_.response_timeout_ms / 1000) + " s.");
        return Diagnosis{"Connection Error: request timed out (" + response.error_message + ")",
                         "Use a smaller model or raise AID_TIMEOUT_MS",
                         {}};
    case TransportError::ConnectionFailed:
        console_.OutputError("Could not connect to Ollama. Is it running? (run `ollama serve`)");
        return Diagnosis{"Connection Error: " + response.error_message, "Start Ollama", {}};
    default:
        console_.OutputError("LLM Error: " + response.error_message);
        return Diagnosis{"Error: " + response.error_message, "N/A", {}};
    }
}

} // namespace lldb_cognitrace
