#pragma once
#include "lifecycle.hpp"
#include <string>

namespace mcphub {
int cmd_init();
int cmd_list();
int cmd_remove(const std::string& name);
int cmd_install(const std::string& name);
int cmd_run(const std::string& name, StartOptions opts, bool restart = false);
int cmd_stop(const std::string& name);
int cmd_kill(int pid, bool force);
int cmd_ps();
int cmd_status(const std::string& name);
int cmd_scan();
int cmd_tools(const std::string& name, bool no_cache);
int cmd_call(const std::string& name, const std::string& tool, const std::string& args_json);
} // namespace mcphub
