#pragma once

#include "console.hpp"

#include <functional>
#include <string>
#include <vector>

namespace lldb_cognitrace
{

using ConfirmFn = std::function<bool()>;
using ExecuteFn = std::function<void(const std::string&)>;

// Only a lone "y" (any case, surrounding blanks ignored) authorizes execution
bool IsAffirmative(const std::string& answer);

// Asks "<question> [y/N]: " on the console
ConfirmFn MakeConsoleConfirm(Console& console, const std::string& question);

// Runs model-suggested commands after human confirmation
class CommandDriver
{
  public:
    explicit CommandDriver(Console& console);

    // Lists the commands and asks confirm(). When granted, runs each command in
    // order through execute(), echoing it first. Exceptions from execute()
    // propagate and stop the remaining commands. Returns the number of commands
    // executed.
    size_t Drive(const std::vector<std::string>& commands, const ConfirmFn& confirm,
                 const ExecuteFn& execute);

  private:
    Console& console_;
};

} // namespace lldb_cognitrace
