/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace screenrank {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

// 알 수 없는 값은 info로 취급한다.
LogLevel ParseLogLevel(const std::string& text);
std::string ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<int> user_id;
  std::string name;
  long latency_ms{0};
  unsigned status{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t logs_written{0};
  std::uint64_t aggregation_failures{0};
  std::uint64_t finalization_failures{0};
  std::uint64_t achievement_failures{0};
  std::uint64_t challenges_finalized{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementLogWritten();
  void IncrementAggregationFailure();
  void IncrementFinalizationFailure();
  void IncrementAchievementFailure();
  void IncrementChallengeFinalized();
  MetricsSnapshot Snapshot() const;

  // 요청 완료 로그.
  void Log(const LogContext& ctx) const;
  // 도메인 이벤트 로그. min_level보다 낮은 이벤트는 버린다.
  void LogEvent(const std::string& name, LogLevel level, std::optional<int> user_id,
                const nlohmann::json& detail = nullptr) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> logs_written_{0};
  std::atomic<std::uint64_t> aggregation_failures_{0};
  std::atomic<std::uint64_t> finalization_failures_{0};
  std::atomic<std::uint64_t> achievement_failures_{0};
  std::atomic<std::uint64_t> challenges_finalized_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace screenrank
