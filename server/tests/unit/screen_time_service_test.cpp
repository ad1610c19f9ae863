#include <gtest/gtest.h>

#include <memory>

#include "screenrank/errors.hpp"
#include "screenrank/memory_store.hpp"
#include "screenrank/screen_time_service.hpp"
#include "failing_store.hpp"

namespace {

screenrank::Date Day(int offset) { return screenrank::Date::FromCivil(2025, 9, 15).AddDays(offset); }

class ScreenTimeServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<screenrank::MemoryChallengeStore>();
    store_->EnsureUser(1, "owner");
    store_->EnsureUser(2, "friend");
    observability_ = std::make_shared<screenrank::Observability>(screenrank::LogLevel::kError);
    auto clock = screenrank::Clock::Fixed(Day(0));
    auto aggregator = std::make_shared<screenrank::StatsAggregator>(store_, clock);
    challenges_ = std::make_shared<screenrank::ChallengeService>(store_, aggregator, nullptr, observability_, clock,
                                                                 screenrank::ZeroLogPolicy::kIncludeAsZero);
    auto gamification = std::make_shared<screenrank::GamificationService>(store_, clock);
    service_ = std::make_shared<screenrank::ScreenTimeService>(store_, challenges_, gamification, observability_,
                                                               clock);
  }

  std::string ErrorCode(const std::string& app, std::optional<screenrank::Date> date, int minutes) {
    try {
      service_->LogScreenTime(1, app, date, minutes);
    } catch (const screenrank::ValidationError& ex) {
      return ex.code;
    }
    return "none";
  }

  std::shared_ptr<screenrank::MemoryChallengeStore> store_;
  std::shared_ptr<screenrank::Observability> observability_;
  std::shared_ptr<screenrank::ChallengeService> challenges_;
  std::shared_ptr<screenrank::ScreenTimeService> service_;
};

TEST_F(ScreenTimeServiceTest, ValidatesAppMinutesAndDate) {
  EXPECT_EQ(ErrorCode("Fortnite", std::nullopt, 10), "unknown_app");
  EXPECT_EQ(ErrorCode("TikTok", std::nullopt, -1), "bad_request");
  EXPECT_EQ(ErrorCode("TikTok", std::nullopt, 1441), "bad_request");
  EXPECT_EQ(ErrorCode("TikTok", Day(1), 10), "bad_request");
  EXPECT_EQ(ErrorCode("TikTok", Day(-366), 10), "bad_request");
  EXPECT_EQ(ErrorCode("TikTok", Day(-365), 10), "none");
  EXPECT_EQ(ErrorCode("TikTok", std::nullopt, 1440), "none");
}

TEST_F(ScreenTimeServiceTest, UpsertOverwritesSameDayAndCanonicalizes) {
  auto first = service_->LogScreenTime(1, "tiktok", std::nullopt, 30);
  EXPECT_EQ(first.log.app_name, "TikTok");
  EXPECT_EQ(first.log.date, Day(0));

  auto second = service_->LogScreenTime(1, "TIKTOK", Day(0), 50);
  EXPECT_EQ(second.log.log_id, first.log.log_id);
  EXPECT_EQ(second.log.minutes, 50);

  auto total = service_->LogScreenTime(1, "", std::nullopt, 120);
  EXPECT_EQ(total.log.app_name, "Total");
  EXPECT_EQ(observability_->Snapshot().logs_written, 3u);
}

TEST_F(ScreenTimeServiceTest, LoggingUpdatesChallengesAndUserCache) {
  screenrank::CreateChallengeInput input{"틱톡 줄이기", std::nullopt, 1, screenrank::SpecificApp{"TikTok"}, 60,
                                         Day(0), Day(6), {}};
  int challenge_id = challenges_->CreateChallenge(input).challenge.challenge_id;

  auto result = service_->LogScreenTime(1, "TikTok", std::nullopt, 45);
  EXPECT_EQ(result.challenges_updated, 1);
  EXPECT_EQ(service_->LogScreenTime(1, "Instagram", std::nullopt, 999).challenges_updated, 0);
  EXPECT_EQ(store_->FindParticipant(challenge_id, 1)->stats.total_screen_time_minutes, 45);

  auto user = store_->FindUser(1);
  ASSERT_TRUE(user.has_value());
  EXPECT_EQ(user->streak_count, 1);
  EXPECT_GT(user->total_points, 0);
}

TEST_F(ScreenTimeServiceTest, ListEntriesFiltersAndClampsLimit) {
  for (int offset = 0; offset < 5; ++offset) {
    service_->LogScreenTime(1, "YouTube", Day(-offset), 10 + offset);
  }
  service_->LogScreenTime(1, "Safari", Day(-1), 5);
  service_->LogScreenTime(2, "YouTube", Day(0), 99);

  auto all = service_->ListEntries(1, screenrank::EntryFilter{});
  ASSERT_EQ(all.size(), 6u);
  EXPECT_EQ(all.front().date, Day(0));

  screenrank::EntryFilter by_app;
  by_app.app_name = "tube";
  EXPECT_EQ(service_->ListEntries(1, by_app).size(), 5u);

  screenrank::EntryFilter by_day;
  by_day.date = Day(-1);
  EXPECT_EQ(service_->ListEntries(1, by_day).size(), 2u);

  screenrank::EntryFilter range;
  range.start_date = Day(-3);
  range.end_date = Day(-2);
  EXPECT_EQ(service_->ListEntries(1, range).size(), 2u);

  screenrank::EntryFilter tiny;
  tiny.limit = 0;
  EXPECT_EQ(service_->ListEntries(1, tiny).size(), 1u);

  screenrank::EntryFilter inverted;
  inverted.start_date = Day(0);
  inverted.end_date = Day(-1);
  EXPECT_THROW(service_->ListEntries(1, inverted), screenrank::ValidationError);
}

TEST_F(ScreenTimeServiceTest, FailingChallengeDoesNotFailTheLog) {
  screenrank::CreateChallengeInput input{"전체 줄이기", std::nullopt, 1, screenrank::AllApps{}, 200,
                                         Day(0), Day(6), {}};
  int broken = challenges_->CreateChallenge(input).challenge.challenge_id;
  int healthy = challenges_->CreateChallenge(input).challenge.challenge_id;

  auto failing = std::make_shared<screenrank_test::FailingChallengeStore>(store_);
  failing->failing_stats.insert(broken);
  auto clock = screenrank::Clock::Fixed(Day(0));
  auto aggregator = std::make_shared<screenrank::StatsAggregator>(failing, clock);
  auto challenges = std::make_shared<screenrank::ChallengeService>(failing, aggregator, nullptr, observability_, clock,
                                                                   screenrank::ZeroLogPolicy::kIncludeAsZero);
  auto gamification = std::make_shared<screenrank::GamificationService>(failing, clock);
  screenrank::ScreenTimeService service(failing, challenges, gamification, observability_, clock);

  auto result = service.LogScreenTime(1, "YouTube", std::nullopt, 80);
  EXPECT_EQ(result.log.minutes, 80);
  EXPECT_EQ(result.challenges_updated, 1);
  EXPECT_EQ(store_->FindParticipant(healthy, 1)->stats.total_screen_time_minutes, 80);
  EXPECT_EQ(store_->FindParticipant(broken, 1)->stats.total_screen_time_minutes, 0);
  EXPECT_EQ(store_->FindUser(1)->streak_count, 1);
  EXPECT_EQ(observability_->Snapshot().aggregation_failures, 1u);
}

}  // namespace
