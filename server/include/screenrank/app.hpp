/*
 * 설명: 서버 전체 수명주기와 서비스 조립을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "screenrank/achievement_sink.hpp"
#include "screenrank/challenge_service.hpp"
#include "screenrank/challenge_store.hpp"
#include "screenrank/config.hpp"
#include "screenrank/date.hpp"
#include "screenrank/gamification_service.hpp"
#include "screenrank/leaderboard_service.hpp"
#include "screenrank/observability.hpp"
#include "screenrank/screen_time_service.hpp"
#include "screenrank/stats_aggregator.hpp"

namespace screenrank {

class Listener;

// HTTP 세션이 공유하는 서비스 묶음.
struct Services {
  AppConfig config;
  std::shared_ptr<ChallengeStore> store;
  std::shared_ptr<ChallengeService> challenges;
  std::shared_ptr<ScreenTimeService> screen_time;
  std::shared_ptr<LeaderboardService> leaderboard;
  std::shared_ptr<GamificationService> gamification;
  std::shared_ptr<Observability> observability;
};

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config, Clock clock = Clock());
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ChallengeStore> GetStore() { return services_->store; }
  std::shared_ptr<ChallengeService> GetChallengeService() { return services_->challenges; }
  std::shared_ptr<Observability> GetObservability() { return services_->observability; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Services> services_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace screenrank
