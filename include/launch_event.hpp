#pragma once
#include <string>
#include <vector>

// One logsNotification from the subscription feed
struct LaunchEvent {
  std::string signature;
  std::vector<std::string> log_lines;
};

struct ResolvedLaunch {
  std::string signature;
  std::string creator;
  std::string mint;
};
