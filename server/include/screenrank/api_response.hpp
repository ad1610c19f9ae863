/*
 * 설명: REST 응답 엔벨로프와 도메인 객체 JSON 변환을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "screenrank/challenge_service.hpp"
#include "screenrank/gamification_service.hpp"
#include "screenrank/ranking_engine.hpp"

namespace screenrank {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const ScreenTimeLog& log);
nlohmann::json ToJson(const ParticipantStats& stats);
nlohmann::json ToJson(const ChallengeParticipant& participant);
nlohmann::json ToJson(const Challenge& challenge);
nlohmann::json ToJson(const ChallengeView& view);
nlohmann::json ToJson(const ChallengeStanding& standing);
nlohmann::json ToJson(const LeaderboardCandidate& stats);
nlohmann::json ToJson(const LeaderboardEntry& entry);
nlohmann::json ToJson(const GamificationStats& stats);

}  // namespace screenrank
