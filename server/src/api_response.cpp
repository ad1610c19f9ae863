/*
 * 설명: JSON 응답 엔벨로프를 생성하고 도메인 객체를 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "screenrank/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace screenrank {
namespace {
std::string CurrentTimestamp() { return ToIsoString(std::chrono::system_clock::now()); }

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json ToJson(const ScreenTimeLog& log) {
  return nlohmann::json{{"logId", log.log_id},
                        {"userId", log.user_id},
                        {"appName", log.app_name},
                        {"date", log.date.ToString()},
                        {"minutes", log.minutes}};
}

nlohmann::json ToJson(const ParticipantStats& stats) {
  return nlohmann::json{{"daysLogged", stats.days_logged},
                        {"totalScreenTimeMinutes", stats.total_screen_time_minutes},
                        {"daysPassed", stats.days_passed},
                        {"daysFailed", stats.days_failed},
                        {"todayMinutes", stats.today_minutes},
                        {"todayPassed", OptionalJson(stats.today_passed)}};
}

nlohmann::json ToJson(const ChallengeParticipant& participant) {
  return nlohmann::json{{"participantId", participant.participant_id},
                        {"challengeId", participant.challenge_id},
                        {"userId", participant.user_id},
                        {"invitationStatus", ToString(participant.invitation_status)},
                        {"joinedAt", ToIsoString(participant.joined_at)},
                        {"stats", ToJson(participant.stats)},
                        {"finalRank", OptionalJson(participant.final_rank)},
                        {"isWinner", participant.is_winner},
                        {"challengeCompleted", participant.challenge_completed}};
}

nlohmann::json ToJson(const Challenge& challenge) {
  nlohmann::json completed_at = nullptr;
  if (challenge.completed_at) {
    completed_at = ToIsoString(*challenge.completed_at);
  }
  return nlohmann::json{{"challengeId", challenge.challenge_id},
                        {"name", challenge.name},
                        {"description", OptionalJson(challenge.description)},
                        {"ownerId", challenge.owner_id},
                        {"targetApp", TargetLabel(challenge.target_app)},
                        {"targetMinutes", challenge.target_minutes},
                        {"startDate", challenge.start_date.ToString()},
                        {"endDate", challenge.end_date.ToString()},
                        {"status", ToString(challenge.status)},
                        {"createdAt", ToIsoString(challenge.created_at)},
                        {"completedAt", completed_at}};
}

nlohmann::json ToJson(const ChallengeView& view) {
  nlohmann::json j = ToJson(view.challenge);
  j["membership"] = view.membership ? ToJson(*view.membership) : nlohmann::json(nullptr);
  nlohmann::json participants = nlohmann::json::array();
  for (const auto& participant : view.participants) {
    participants.push_back(ToJson(participant));
  }
  j["participants"] = participants;
  return j;
}

nlohmann::json ToJson(const ChallengeStanding& standing) {
  return nlohmann::json{{"participantId", standing.participant_id},
                        {"userId", standing.user_id},
                        {"username", standing.username},
                        {"stats", ToJson(standing.stats)},
                        {"averageMinutes", standing.average},
                        {"rank", OptionalJson(standing.rank)},
                        {"isWinner", standing.is_winner}};
}

nlohmann::json ToJson(const LeaderboardCandidate& stats) {
  return nlohmann::json{{"userId", stats.user_id},
                        {"username", stats.username},
                        {"streak", stats.streak},
                        {"averagePerDay", stats.average_per_day},
                        {"totalMinutes", stats.total_minutes},
                        {"daysLogged", stats.days_logged}};
}

nlohmann::json ToJson(const LeaderboardEntry& entry) {
  auto json = ToJson(entry.stats);
  json["rank"] = entry.rank;
  return json;
}

nlohmann::json ToJson(const GamificationStats& stats) {
  return nlohmann::json{{"streakCount", stats.streak_count}, {"totalPoints", stats.total_points}};
}

}  // namespace screenrank
