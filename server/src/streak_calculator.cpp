/*
 * 설명: 스트릭 계산과 일별 사용량 집계 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/streak_calculator_test.cpp
 */
#include "screenrank/streak_calculator.hpp"

#include <algorithm>
#include <set>

#include "screenrank/app_catalog.hpp"

namespace screenrank {

int LongestStreak(const std::vector<Date>& days, const std::map<Date, int>& minutes_by_day,
                  std::optional<int> daily_goal) {
  int longest = 0;
  int current = 0;
  for (const auto& day : days) {
    auto it = minutes_by_day.find(day);
    int minutes = it == minutes_by_day.end() ? 0 : it->second;
    bool counts = minutes > 0 && (!daily_goal || minutes <= *daily_goal);
    if (counts) {
      ++current;
      longest = std::max(longest, current);
    } else {
      current = 0;
    }
  }
  return longest;
}

std::map<Date, int> DailyUsage(const std::vector<ScreenTimeLog>& logs) {
  std::map<Date, int> app_sums;
  std::map<Date, int> totals;
  std::set<Date> total_days;
  for (const auto& log : logs) {
    if (log.app_name == kTotalAppName) {
      totals[log.date] += log.minutes;
      total_days.insert(log.date);
    } else {
      app_sums[log.date] += log.minutes;
    }
  }
  std::map<Date, int> usage = app_sums;
  for (const auto& day : total_days) {
    usage[day] = totals[day];
  }
  return usage;
}

std::vector<Date> DaysBetween(Date first, Date last) {
  std::vector<Date> days;
  for (boost::gregorian::day_iterator it(first.ToGregorian()); *it <= last.ToGregorian(); ++it) {
    days.push_back(Date::FromGregorian(*it));
  }
  return days;
}

}  // namespace screenrank
