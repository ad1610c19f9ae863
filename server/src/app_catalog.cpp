/*
 * 설명: 허용 앱 목록과 이름 정규화 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/app_catalog_test.cpp
 */
#include "screenrank/app_catalog.hpp"

#include <algorithm>
#include <cctype>

namespace screenrank {
namespace {
std::string Trim(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

const std::vector<std::string>& AllowedApps() {
  static const std::vector<std::string> apps{kTotalAppName, "YouTube", "TikTok",  "Instagram", "Safari",
                                             "Chrome",      "Messages", "Mail", "Other"};
  return apps;
}

std::optional<std::string> CanonicalizeAppName(const std::string& raw_name) {
  std::string candidate = Trim(raw_name);
  if (candidate.empty()) {
    return std::string(kTotalAppName);
  }
  std::string lowered = Lower(candidate);
  for (const auto& allowed : AllowedApps()) {
    if (Lower(allowed) == lowered) {
      return allowed;
    }
  }
  return std::nullopt;
}

std::optional<TargetApp> ParseTargetApp(const std::string& raw_target) {
  std::string candidate = Trim(raw_target);
  if (candidate.empty()) {
    return std::nullopt;
  }
  std::string lowered = Lower(candidate);
  if (lowered == "all" || lowered == "__total__") {
    return TargetApp{AllApps{}};
  }
  auto canonical = CanonicalizeAppName(candidate);
  if (!canonical) {
    return std::nullopt;
  }
  return TargetApp{SpecificApp{*canonical}};
}

}  // namespace screenrank
