#include <lldb/API/LLDB.h>
#include <lldb/API/SBDebugger.h>

namespace lldb_cognitrace
{
void RegisterCommands(lldb::SBDebugger& debugger);
}

// LLDB plugin entry point
// Called when plugin is loaded via: plugin load /path/to/liblldb_cognitrace.so
//
// LLDB resolves the Itanium-mangled symbol
//   _ZN4lldb16PluginInitializeENS_10SBDebuggerE
// which GCC and Clang produce for the definition below.

namespace lldb
{

bool PluginInitialize(SBDebugger debugger)
{
    lldb_cognitrace::RegisterCommands(debugger);
    return true;
}

} // namespace lldb
