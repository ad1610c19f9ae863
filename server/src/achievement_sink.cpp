/*
 * 설명: 배지 지급 로그 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp
 */
#include "screenrank/achievement_sink.hpp"

namespace screenrank {

LoggingAchievementSink::LoggingAchievementSink(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

void LoggingAchievementSink::Award(int user_id, const std::string& badge) {
  if (!observability_) {
    return;
  }
  observability_->LogEvent("achievement_awarded", LogLevel::kInfo, user_id, nlohmann::json{{"badge", badge}});
}

}  // namespace screenrank
