#include "launch_filter.hpp"
#include "detection_config.hpp"
#include <algorithm>
#include <cctype>

namespace {

bool containsIgnoreCase(const std::string &line, std::string_view needle) {
  auto it = std::search(line.begin(), line.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != line.end();
}

} // namespace

bool isLaunchEvent(const std::vector<std::string> &log_lines) {
  return std::any_of(log_lines.begin(), log_lines.end(),
                     [](const std::string &line) {
                       return containsIgnoreCase(line,
                                                 DetectionConfig::launch_marker);
                     });
}
