/*
 * 설명: 챌린지 종료 순위(동순위 공유, 1,2,2,4)와 전역 리더보드 정렬 규칙을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_engine_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace screenrank {

// 기록이 없는 참가자 처리 방식. 두 동작을 모두 유지하고 설정으로 고른다.
enum class ZeroLogPolicy {
  kIncludeAsZero,  // 평균 0으로 순위에 포함
  kExclude,        // 순위와 우승에서 제외
};

std::optional<ZeroLogPolicy> ParseZeroLogPolicy(const std::string& text);
std::string ToString(ZeroLogPolicy policy);

struct RankingEntry {
  int id;
  int total_minutes;
  int days_logged;
};

struct RankedEntry {
  int id;
  double average;
  std::optional<int> rank;
  bool is_winner;
};

// 평균 오름차순(안정 정렬). 제외된 항목은 rank 없이 입력 순서대로 뒤에 붙는다.
std::vector<RankedEntry> RankChallenge(const std::vector<RankingEntry>& entries, ZeroLogPolicy policy);

struct LeaderboardCandidate {
  int user_id;
  std::string username;
  int streak;
  double average_per_day;
  int total_minutes;
  int days_logged;
};

struct LeaderboardEntry {
  int rank;
  LeaderboardCandidate stats;
};

// 스트릭 내림차순, 평균 오름차순, 사용자명, user_id 순. 순위는 1..N으로 모두 다르다.
std::vector<LeaderboardEntry> OrderLeaderboard(std::vector<LeaderboardCandidate> candidates);

}  // namespace screenrank
