/*
 * 설명: 월간 전역 리더보드 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp
 */
#include "screenrank/leaderboard_service.hpp"

#include <map>

#include "screenrank/errors.hpp"
#include "screenrank/streak_calculator.hpp"

namespace screenrank {

LeaderboardService::LeaderboardService(std::shared_ptr<ChallengeStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::vector<LeaderboardEntry> LeaderboardService::GlobalLeaderboard(int limit) {
  if (limit < kLeaderboardMinLimit || limit > kLeaderboardMaxLimit) {
    throw ValidationError("leaderboard_range", "limit은 1 이상 100 이하여야 합니다");
  }
  Date today = clock_.Today();
  Date month_start = today.FirstOfMonth();

  std::map<int, std::vector<ScreenTimeLog>> logs_by_user;
  for (auto& log : store_->ListLogsInRange(month_start, today)) {
    logs_by_user[log.user_id].push_back(std::move(log));
  }

  std::vector<LeaderboardCandidate> candidates;
  for (const auto& [user_id, logs] : logs_by_user) {
    if (auto candidate = BuildCandidate(user_id, logs, month_start, today)) {
      candidates.push_back(std::move(*candidate));
    }
  }

  auto ordered = OrderLeaderboard(std::move(candidates));
  if (ordered.size() > static_cast<std::size_t>(limit)) {
    ordered.resize(static_cast<std::size_t>(limit));
  }
  return ordered;
}

std::optional<LeaderboardCandidate> LeaderboardService::MonthlyStats(int user_id) {
  Date today = clock_.Today();
  Date month_start = today.FirstOfMonth();
  return BuildCandidate(user_id, store_->ListLogs(user_id, month_start, today), month_start, today);
}

std::pair<Date, Date> LeaderboardService::CurrentMonth() const {
  Date today = clock_.Today();
  return {today.FirstOfMonth(), today.LastOfMonth()};
}

std::optional<LeaderboardCandidate> LeaderboardService::BuildCandidate(int user_id,
                                                                       const std::vector<ScreenTimeLog>& logs,
                                                                       Date month_start, Date today) {
  std::map<Date, int> usage;
  for (const auto& [day, minutes] : DailyUsage(logs)) {
    if (minutes > 0) {
      usage.emplace(day, minutes);
    }
  }
  if (usage.empty()) {
    return std::nullopt;
  }

  int total = 0;
  for (const auto& [day, minutes] : usage) {
    total += minutes;
  }
  int days_logged = static_cast<int>(usage.size());

  std::optional<int> daily_goal;
  if (auto goal = store_->FindGoal(user_id, GoalType::kDaily)) {
    daily_goal = goal->target_minutes;
  }
  int streak = LongestStreak(DaysBetween(month_start, today), usage, daily_goal);

  auto user = store_->FindUser(user_id);
  return LeaderboardCandidate{user_id,
                              user ? user->username : std::string(),
                              streak,
                              static_cast<double>(total) / static_cast<double>(days_logged),
                              total,
                              days_logged};
}

}  // namespace screenrank
