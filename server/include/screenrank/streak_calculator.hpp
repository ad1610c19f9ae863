/*
 * 설명: 목표 기반 연속 기록일(스트릭) 계산과 일별 사용량 집계를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/streak_calculator_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <vector>

#include "screenrank/date.hpp"
#include "screenrank/models.hpp"

namespace screenrank {

// days는 오래된 날짜부터 정렬되어 있어야 한다. 창 안에서 가장 긴 연속 구간을 돌려준다.
// 하루가 인정되려면 기록이 0분보다 크고, 목표가 있으면 목표 이하여야 한다.
int LongestStreak(const std::vector<Date>& days, const std::map<Date, int>& minutes_by_day,
                  std::optional<int> daily_goal);

// 날짜별 사용량. Total 행이 있는 날은 그 값을, 없으면 앱별 행의 합을 쓴다.
std::map<Date, int> DailyUsage(const std::vector<ScreenTimeLog>& logs);

// first부터 last까지(포함) 날짜 목록. first > last면 비어 있다.
std::vector<Date> DaysBetween(Date first, Date last);

}  // namespace screenrank
