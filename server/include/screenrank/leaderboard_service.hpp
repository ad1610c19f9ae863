/*
 * 설명: 이번 달(오늘까지) 로그로 전역 리더보드를 만든다. 스트릭 내림차순, 평균 오름차순.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "screenrank/challenge_store.hpp"
#include "screenrank/date.hpp"
#include "screenrank/ranking_engine.hpp"

namespace screenrank {

inline constexpr int kLeaderboardMinLimit = 1;
inline constexpr int kLeaderboardMaxLimit = 100;

class LeaderboardService {
 public:
  LeaderboardService(std::shared_ptr<ChallengeStore> store, Clock clock);

  // limit이 [1, 100]을 벗어나면 ValidationError.
  std::vector<LeaderboardEntry> GlobalLeaderboard(int limit);
  // 이번 달 기록이 없으면 nullopt.
  std::optional<LeaderboardCandidate> MonthlyStats(int user_id);
  // 이번 달의 첫날과 마지막 날.
  std::pair<Date, Date> CurrentMonth() const;

 private:
  std::optional<LeaderboardCandidate> BuildCandidate(int user_id, const std::vector<ScreenTimeLog>& logs,
                                                     Date month_start, Date today);

  std::shared_ptr<ChallengeStore> store_;
  Clock clock_;
};

}  // namespace screenrank
