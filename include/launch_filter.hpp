#pragma once
#include <string>
#include <vector>

// Coarse check for Pump.fun creation events: any log line mentioning "create",
// ignoring case. Non-creations that slip through fail mint resolution later.
bool isLaunchEvent(const std::vector<std::string>& log_lines);
