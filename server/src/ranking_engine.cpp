/*
 * 설명: 챌린지 경쟁 순위와 리더보드 정렬 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_engine_test.cpp
 */
#include "screenrank/ranking_engine.hpp"

#include <algorithm>

namespace screenrank {

std::optional<ZeroLogPolicy> ParseZeroLogPolicy(const std::string& text) {
  if (text == "include") {
    return ZeroLogPolicy::kIncludeAsZero;
  }
  if (text == "exclude") {
    return ZeroLogPolicy::kExclude;
  }
  return std::nullopt;
}

std::string ToString(ZeroLogPolicy policy) {
  return policy == ZeroLogPolicy::kIncludeAsZero ? "include" : "exclude";
}

std::vector<RankedEntry> RankChallenge(const std::vector<RankingEntry>& entries, ZeroLogPolicy policy) {
  std::vector<RankedEntry> ranked;
  std::vector<RankedEntry> excluded;
  ranked.reserve(entries.size());
  for (const auto& entry : entries) {
    if (entry.days_logged <= 0) {
      if (policy == ZeroLogPolicy::kExclude) {
        excluded.push_back(RankedEntry{entry.id, 0.0, std::nullopt, false});
        continue;
      }
      ranked.push_back(RankedEntry{entry.id, 0.0, std::nullopt, false});
      continue;
    }
    double average = static_cast<double>(entry.total_minutes) / static_cast<double>(entry.days_logged);
    ranked.push_back(RankedEntry{entry.id, average, std::nullopt, false});
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedEntry& a, const RankedEntry& b) { return a.average < b.average; });

  for (std::size_t i = 0; i < ranked.size(); ++i) {
    if (i > 0 && ranked[i].average == ranked[i - 1].average) {
      ranked[i].rank = ranked[i - 1].rank;
    } else {
      ranked[i].rank = static_cast<int>(i) + 1;
    }
    ranked[i].is_winner = ranked[i].average == ranked.front().average;
  }

  ranked.insert(ranked.end(), excluded.begin(), excluded.end());
  return ranked;
}

std::vector<LeaderboardEntry> OrderLeaderboard(std::vector<LeaderboardCandidate> candidates) {
  std::sort(candidates.begin(), candidates.end(), [](const LeaderboardCandidate& a, const LeaderboardCandidate& b) {
    if (a.streak != b.streak) {
      return a.streak > b.streak;
    }
    if (a.average_per_day != b.average_per_day) {
      return a.average_per_day < b.average_per_day;
    }
    if (a.username != b.username) {
      return a.username < b.username;
    }
    return a.user_id < b.user_id;
  });

  std::vector<LeaderboardEntry> ordered;
  ordered.reserve(candidates.size());
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    ordered.push_back(LeaderboardEntry{static_cast<int>(i) + 1, std::move(candidates[i])});
  }
  return ordered;
}

}  // namespace screenrank
