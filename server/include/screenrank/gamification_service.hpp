/*
 * 설명: 사용자 streak_count/total_points 캐시를 로그로부터 다시 계산해 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gamification_service_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "screenrank/challenge_store.hpp"
#include "screenrank/date.hpp"

namespace screenrank {

inline constexpr int kPointsPerDayLogged = 10;
inline constexpr int kPointsDailyGoalMet = 50;
inline constexpr int kPointsWeeklyGoalMet = 200;
inline constexpr int kPointsPerStreakDay = 5;
inline constexpr int kMaxTrailingStreak = 365;

struct GamificationStats {
  int streak_count;
  int total_points;
};

// 오늘부터 거꾸로 기록이 있는 날이 이어지는 일수.
int TrailingStreak(const std::vector<Date>& logged_days, Date today);

GamificationStats ComputeGamificationStats(const std::vector<ScreenTimeLog>& logs, std::optional<int> daily_goal,
                                           std::optional<int> weekly_goal, Date today);

class GamificationService {
 public:
  GamificationService(std::shared_ptr<ChallengeStore> store, Clock clock);

  // 사용자가 없으면 nullopt.
  std::optional<GamificationStats> Refresh(int user_id);

 private:
  std::shared_ptr<ChallengeStore> store_;
  Clock clock_;
};

}  // namespace screenrank
