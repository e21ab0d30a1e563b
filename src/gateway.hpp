#pragma once
#include <string>

namespace mcphub {
int cmd_serve(const std::string& host, int port);
} // namespace mcphub
