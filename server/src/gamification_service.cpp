/*
 * 설명: 스트릭/포인트 캐시 계산 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gamification_service_test.cpp
 */
#include "screenrank/gamification_service.hpp"

#include <map>
#include <set>

#include "screenrank/streak_calculator.hpp"

namespace screenrank {

int TrailingStreak(const std::vector<Date>& logged_days, Date today) {
  std::set<Date> days(logged_days.begin(), logged_days.end());
  int streak = 0;
  for (Date day = today; streak < kMaxTrailingStreak && days.count(day) > 0; day = day.AddDays(-1)) {
    ++streak;
  }
  return streak;
}

GamificationStats ComputeGamificationStats(const std::vector<ScreenTimeLog>& logs, std::optional<int> daily_goal,
                                           std::optional<int> weekly_goal, Date today) {
  std::map<Date, int> usage = DailyUsage(logs);
  std::vector<Date> logged_days;
  std::map<int, int> weekly_totals;
  int points = 0;
  for (const auto& [day, minutes] : usage) {
    logged_days.push_back(day);
    points += kPointsPerDayLogged;
    if (daily_goal && minutes <= *daily_goal) {
      points += kPointsDailyGoalMet;
    }
    weekly_totals[day.IsoWeekKey()] += minutes;
  }
  if (weekly_goal) {
    for (const auto& [week, minutes] : weekly_totals) {
      if (minutes <= *weekly_goal) {
        points += kPointsWeeklyGoalMet;
      }
    }
  }
  int streak = TrailingStreak(logged_days, today);
  points += streak * kPointsPerStreakDay;
  return GamificationStats{streak, points};
}

GamificationService::GamificationService(std::shared_ptr<ChallengeStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::optional<GamificationStats> GamificationService::Refresh(int user_id) {
  if (!store_->FindUser(user_id)) {
    return std::nullopt;
  }
  Date today = clock_.Today();
  auto logs = store_->ListLogs(user_id, Date(), today);
  std::optional<int> daily_goal;
  std::optional<int> weekly_goal;
  if (auto goal = store_->FindGoal(user_id, GoalType::kDaily)) {
    daily_goal = goal->target_minutes;
  }
  if (auto goal = store_->FindGoal(user_id, GoalType::kWeekly)) {
    weekly_goal = goal->target_minutes;
  }
  GamificationStats stats = ComputeGamificationStats(logs, daily_goal, weekly_goal, today);
  store_->UpdateUserCache(user_id, stats.streak_count, stats.total_points);
  return stats;
}

}  // namespace screenrank
