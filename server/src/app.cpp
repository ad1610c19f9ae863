/*
 * 설명: 서버 수명주기, 저장소 선택, 서비스 조립과 리스닝 스레드를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "screenrank/db_client.hpp"
#include "screenrank/http_session.hpp"
#include "screenrank/mariadb_store.hpp"
#include "screenrank/memory_store.hpp"

namespace screenrank {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<Services> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<Services> services_;
};

ServerApp::ServerApp(const AppConfig& config, Clock clock)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  services_ = std::make_shared<Services>();
  services_->config = config;
  services_->observability = std::make_shared<Observability>(config.log_level);
  if (config.store_backend == StoreBackend::kMemory) {
    services_->store = std::make_shared<MemoryChallengeStore>();
  } else {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto db_client = std::make_shared<MariaDbClient>(db_config);
    services_->store = std::make_shared<MariaDbChallengeStore>(db_client);
  }
  auto aggregator = std::make_shared<StatsAggregator>(services_->store, clock);
  auto achievements = std::make_shared<LoggingAchievementSink>(services_->observability);
  services_->challenges = std::make_shared<ChallengeService>(services_->store, aggregator, achievements,
                                                             services_->observability, clock, config.zero_log_policy);
  services_->gamification = std::make_shared<GamificationService>(services_->store, clock);
  services_->screen_time = std::make_shared<ScreenTimeService>(services_->store, services_->challenges,
                                                               services_->gamification, services_->observability, clock);
  services_->leaderboard = std::make_shared<LeaderboardService>(services_->store, clock);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, services_);
    listener_->Run();
    services_->observability->LogEvent(
        "server_started", LogLevel::kInfo, std::nullopt,
        nlohmann::json{{"port", config_.port},
                       {"store", config_.store_backend == StoreBackend::kMemory ? "memory" : "mariadb"},
                       {"zeroLogPolicy", ToString(config_.zero_log_policy)}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    services_->observability->LogEvent("server_failure", LogLevel::kError, std::nullopt,
                                       nlohmann::json{{"error", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = ParseLogLevel(get_env("LOG_LEVEL", "info"));

  std::string backend = get_env("STORE_BACKEND", "mariadb");
  if (backend == "mariadb") {
    cfg.store_backend = StoreBackend::kMariaDb;
  } else if (backend == "memory") {
    cfg.store_backend = StoreBackend::kMemory;
  } else {
    throw std::invalid_argument("STORE_BACKEND 값이 올바르지 않습니다: " + backend);
  }

  std::string policy = get_env("RANKING_ZERO_LOG_POLICY", "include");
  auto parsed_policy = ParseZeroLogPolicy(policy);
  if (!parsed_policy) {
    throw std::invalid_argument("RANKING_ZERO_LOG_POLICY 값이 올바르지 않습니다: " + policy);
  }
  cfg.zero_log_policy = *parsed_policy;

  cfg.leaderboard_default_limit = std::stoi(get_env("LEADERBOARD_DEFAULT_LIMIT", "50"));
  if (cfg.leaderboard_default_limit < kLeaderboardMinLimit || cfg.leaderboard_default_limit > kLeaderboardMaxLimit) {
    throw std::invalid_argument("LEADERBOARD_DEFAULT_LIMIT는 1 이상 100 이하여야 합니다");
  }
  return cfg;
}

}  // namespace screenrank
