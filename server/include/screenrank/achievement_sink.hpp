/*
 * 설명: 배지 지급/알림 같은 부수 효과의 출구. 호출자는 실패를 삼키고 로그만 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "screenrank/observability.hpp"

namespace screenrank {

inline constexpr const char* kBadgeChallengeAccepted = "Challenge Accepted";
inline constexpr const char* kBadgeCommunityChampion = "Community Champion";

class AchievementSink {
 public:
  virtual ~AchievementSink() = default;
  virtual void Award(int user_id, const std::string& badge) = 0;
};

// 배지 지급을 구조화 로그 이벤트로 남긴다.
class LoggingAchievementSink : public AchievementSink {
 public:
  explicit LoggingAchievementSink(std::shared_ptr<Observability> observability);
  void Award(int user_id, const std::string& badge) override;

 private:
  std::shared_ptr<Observability> observability_;
};

}  // namespace screenrank
