/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <string>

#include "screenrank/observability.hpp"
#include "screenrank/ranking_engine.hpp"

namespace screenrank {

enum class StoreBackend { kMariaDb, kMemory };

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  LogLevel log_level;
  StoreBackend store_backend;
  ZeroLogPolicy zero_log_policy;
  int leaderboard_default_limit;
};

// 잘못된 값은 std::invalid_argument로 알린다.
AppConfig LoadConfigFromEnv();

}  // namespace screenrank
