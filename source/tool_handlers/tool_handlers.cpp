#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_expo_dev_start { void register_tool(); }
namespace tool_expo_dev_send { void register_tool(); }
namespace tool_expo_dev_read { void register_tool(); }
namespace tool_expo_dev_stop { void register_tool(); }
namespace tool_expo_build_local_start { void register_tool(); }
namespace tool_expo_build_local_read { void register_tool(); }
namespace tool_expo_build_local_stop { void register_tool(); }
namespace tool_expo_session_list { void register_tool(); }
namespace tool_expo_session_remove { void register_tool(); }

namespace tool_handlers {

void register_all_tools() {
    tool_expo_dev_start::register_tool();
    tool_expo_dev_send::register_tool();
    tool_expo_dev_read::register_tool();
    tool_expo_dev_stop::register_tool();
    tool_expo_build_local_start::register_tool();
    tool_expo_build_local_read::register_tool();
    tool_expo_build_local_stop::register_tool();
    tool_expo_session_list::register_tool();
    tool_expo_session_remove::register_tool();
}

} // namespace tool_handlers
