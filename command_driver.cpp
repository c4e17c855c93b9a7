#include "command_driver.hpp"

#include <algorithm>
#include <cctype>

namespace lldb_cognitrace
{

bool IsAffirmative(const std::string& answer)
{
    size_t begin = answer.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return false;
    size_t end = answer.find_last_not_of(" \t\r\n");
    std::string word = answer.substr(begin, end - begin + 1);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return word == "y";
}

ConfirmFn MakeConsoleConfirm(Console& console, const std::string& question)
{
    return [&console, question]() { return IsAffirmative(console.ReadLine(question + " [y/N]: ")); };
}

CommandDriver::CommandDriver(Console& console) : console_(console) {}

size_t CommandDriver::Drive(const std::vector<std::string>& commands, const ConfirmFn& confirm,
                            const ExecuteFn& execute)
{
    if (commands.empty())
        return 0;

    console_.Output("\n");
    console_.OutputHeader("Suggested Autonomous Commands:");
    for (size_t i = 0; i < commands.size(); ++i)
        console_.Output(" " + std::to_string(i + 1) + ". " + commands[i] + "\n");

    if (!confirm())
    {
        console_.OutputInfo("Skipped autonomous commands.");
        return 0;
    }

    console_.OutputInfo("Taking the wheel...");
    size_t executed = 0;
    for (const auto& command : commands)
    {
        console_.OutputCommand(command);
        execute(command);
        ++executed;
    }
    return executed;
}

} // namespace lldb_cognitrace
