/*
 * 설명: 로그 가능한 앱 목록과 앱 이름/챌린지 대상 정규화를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/app_catalog_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "screenrank/models.hpp"

namespace screenrank {

// 하루 전체 사용량을 기록하는 센티널 앱 이름.
inline constexpr const char* kTotalAppName = "Total";

const std::vector<std::string>& AllowedApps();

// 대소문자를 무시하고 표준 표기로 바꾼다. 빈 값은 Total, 목록에 없으면 nullopt.
std::optional<std::string> CanonicalizeAppName(const std::string& raw_name);

// "ALL"과 "__TOTAL__"은 전체 앱 합산 대상이다.
std::optional<TargetApp> ParseTargetApp(const std::string& raw_target);

}  // namespace screenrank
