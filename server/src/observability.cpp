/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace screenrank {
namespace {
// 여러 워커 스레드가 같은 줄에 섞여 쓰지 않도록 한다.
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

void WriteLine(const nlohmann::json& log_json) {
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementLogWritten() { logs_written_.fetch_add(1); }

void Observability::IncrementAggregationFailure() { aggregation_failures_.fetch_add(1); }

void Observability::IncrementFinalizationFailure() { finalization_failures_.fetch_add(1); }

void Observability::IncrementAchievementFailure() { achievement_failures_.fetch_add(1); }

void Observability::IncrementChallengeFinalized() { challenges_finalized_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.logs_written = logs_written_.load();
  snapshot.aggregation_failures = aggregation_failures_.load();
  snapshot.finalization_failures = finalization_failures_.load();
  snapshot.achievement_failures = achievement_failures_.load();
  snapshot.challenges_finalized = challenges_finalized_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  log_json["level"] = ctx.status >= 500 ? "error" : "info";
  if (ctx.status != 0) {
    log_json["status"] = ctx.status;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  WriteLine(log_json);
}

void Observability::LogEvent(const std::string& name, LogLevel level, std::optional<int> user_id,
                             const nlohmann::json& detail) const {
  if (level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = nullptr;
  log_json["eventName"] = name;
  log_json["latencyMs"] = 0;
  log_json["level"] = ToString(level);
  if (user_id) {
    log_json["userId"] = *user_id;
  }
  if (!detail.is_null()) {
    log_json["detail"] = detail;
  }
  WriteLine(log_json);
}

}  // namespace screenrank
