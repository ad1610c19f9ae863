#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "screenrank/challenge_service.hpp"
#include "screenrank/errors.hpp"
#include "screenrank/memory_store.hpp"
#include "failing_store.hpp"

namespace {

screenrank::Date Day(int offset) { return screenrank::Date::FromCivil(2025, 4, 7).AddDays(offset); }

class RecordingSink : public screenrank::AchievementSink {
 public:
  void Award(int user_id, const std::string& badge) override { awards.emplace_back(user_id, badge); }
  std::vector<std::pair<int, std::string>> awards;
};

class ThrowingSink : public screenrank::AchievementSink {
 public:
  void Award(int, const std::string&) override { throw std::runtime_error("sink unavailable"); }
};

class ChallengeServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    today_ = std::make_shared<screenrank::Date>(Day(0));
    store_ = std::make_shared<screenrank::MemoryChallengeStore>();
    sink_ = std::make_shared<RecordingSink>();
    observability_ = std::make_shared<screenrank::Observability>(screenrank::LogLevel::kError);
    for (int user_id = 1; user_id <= 4; ++user_id) {
      store_->EnsureUser(user_id, "user" + std::to_string(user_id));
    }
    service_ = MakeService(sink_, screenrank::ZeroLogPolicy::kIncludeAsZero);
  }

  std::shared_ptr<screenrank::ChallengeService> MakeService(std::shared_ptr<screenrank::AchievementSink> sink,
                                                            screenrank::ZeroLogPolicy policy) {
    auto today = today_;
    screenrank::Clock clock([today]() { return screenrank::Clock::Fixed(*today).Now(); });
    auto aggregator = std::make_shared<screenrank::StatsAggregator>(store_, clock);
    return std::make_shared<screenrank::ChallengeService>(store_, aggregator, std::move(sink), observability_, clock,
                                                          policy);
  }

  screenrank::ChallengeView Create(screenrank::TargetApp target, int target_minutes, int start, int end,
                                   std::vector<int> invited = {}) {
    screenrank::CreateChallengeInput input{"주간 절제", std::nullopt, 1, std::move(target), target_minutes,
                                           Day(start), Day(end), std::move(invited)};
    return service_->CreateChallenge(input);
  }

  int LogAndRecompute(int user_id, const std::string& app, int offset, int minutes) {
    auto log = store_->UpsertLog(user_id, app, Day(offset), minutes);
    return service_->RecomputeForLog(log);
  }

  int ParticipantId(int challenge_id, int user_id) {
    auto participant = store_->FindParticipant(challenge_id, user_id);
    if (!participant) {
      throw std::runtime_error("participant missing");
    }
    return participant->participant_id;
  }

  std::shared_ptr<screenrank::Date> today_;
  std::shared_ptr<screenrank::MemoryChallengeStore> store_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<screenrank::Observability> observability_;
  std::shared_ptr<screenrank::ChallengeService> service_;
};

std::string ErrorCode(const std::function<void()>& action) {
  try {
    action();
  } catch (const screenrank::ValidationError& ex) {
    return ex.code;
  }
  return "none";
}

TEST_F(ChallengeServiceTest, CreateStartsActiveTodayAndUpcomingLater) {
  auto today_view = Create(screenrank::SpecificApp{"TikTok"}, 60, 0, 6);
  EXPECT_EQ(today_view.challenge.status, screenrank::ChallengeStatus::kActive);
  ASSERT_TRUE(today_view.membership.has_value());
  EXPECT_EQ(today_view.membership->invitation_status, screenrank::InvitationStatus::kAccepted);

  auto later_view = Create(screenrank::AllApps{}, 120, 3, 9);
  EXPECT_EQ(later_view.challenge.status, screenrank::ChallengeStatus::kUpcoming);

  *today_ = Day(3);
  auto refreshed = service_->GetChallenge(later_view.challenge.challenge_id, 1);
  EXPECT_EQ(refreshed.challenge.status, screenrank::ChallengeStatus::kActive);
}

TEST_F(ChallengeServiceTest, CreateRejectsInvalidInput) {
  EXPECT_EQ(ErrorCode([&] { Create(screenrank::AllApps{}, 60, -1, 3); }), "bad_request");
  EXPECT_EQ(ErrorCode([&] { Create(screenrank::AllApps{}, 60, 3, 2); }), "bad_request");
  EXPECT_EQ(ErrorCode([&] { Create(screenrank::AllApps{}, -5, 0, 2); }), "bad_request");
  EXPECT_EQ(ErrorCode([&] {
              screenrank::CreateChallengeInput input{"   ", std::nullopt, 1, screenrank::AllApps{}, 60,
                                                     Day(0), Day(1), {}};
              service_->CreateChallenge(input);
            }),
            "bad_request");
}

TEST_F(ChallengeServiceTest, CreateDeduplicatesInviteesAndDropsOwner) {
  auto view = Create(screenrank::AllApps{}, 60, 0, 3, {2, 2, 1, 3});
  ASSERT_EQ(view.participants.size(), 3u);
  EXPECT_EQ(store_->FindParticipant(view.challenge.challenge_id, 2)->invitation_status,
            screenrank::InvitationStatus::kPending);
  EXPECT_EQ(store_->FindParticipant(view.challenge.challenge_id, 3)->invitation_status,
            screenrank::InvitationStatus::kPending);
}

TEST_F(ChallengeServiceTest, OnlyTargetAppLogsCountTowardStats) {
  auto view = Create(screenrank::SpecificApp{"TikTok"}, 60, 0, 6);
  int challenge_id = view.challenge.challenge_id;

  EXPECT_EQ(LogAndRecompute(1, "TikTok", 0, 45), 1);
  EXPECT_EQ(LogAndRecompute(1, "Instagram", 0, 999), 0);

  auto standings = service_->GetLeaderboard(challenge_id, 1);
  ASSERT_EQ(standings.size(), 1u);
  EXPECT_EQ(standings[0].user_id, 1);
  EXPECT_EQ(standings[0].username, "user1");
  EXPECT_EQ(standings[0].stats.total_screen_time_minutes, 45);
  EXPECT_EQ(standings[0].stats.days_logged, 1);
  EXPECT_EQ(standings[0].stats.days_passed, 1);
  EXPECT_DOUBLE_EQ(standings[0].average, 45.0);
  EXPECT_EQ(standings[0].rank, 1);
}

TEST_F(ChallengeServiceTest, LogOutsideActiveWindowIsNotDistributed) {
  auto view = Create(screenrank::AllApps{}, 60, 2, 4);
  EXPECT_EQ(LogAndRecompute(1, "TikTok", 0, 30), 0);

  *today_ = Day(2);
  EXPECT_EQ(LogAndRecompute(1, "TikTok", 1, 30), 0);
  EXPECT_EQ(LogAndRecompute(1, "TikTok", 2, 30), 1);
  EXPECT_EQ(store_->FindParticipant(view.challenge.challenge_id, 1)->stats.days_logged, 1);
}

TEST_F(ChallengeServiceTest, AcceptRecomputesStatsFromExistingLogs) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2});
  int challenge_id = view.challenge.challenge_id;
  store_->UpsertLog(2, "YouTube", Day(0), 70);

  auto accepted = service_->RespondToInvitation(ParticipantId(challenge_id, 2), 2, true);
  EXPECT_EQ(accepted.invitation_status, screenrank::InvitationStatus::kAccepted);
  EXPECT_EQ(accepted.stats.total_screen_time_minutes, 70);
  ASSERT_EQ(sink_->awards.size(), 1u);
  EXPECT_EQ(sink_->awards[0], std::make_pair(2, std::string(screenrank::kBadgeChallengeAccepted)));
}

TEST_F(ChallengeServiceTest, InvitationResponseRules) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2, 3});
  int challenge_id = view.challenge.challenge_id;
  int invite_2 = ParticipantId(challenge_id, 2);
  int invite_3 = ParticipantId(challenge_id, 3);

  EXPECT_EQ(ErrorCode([&] { service_->RespondToInvitation(invite_2, 3, true); }), "not_invitee");
  EXPECT_THROW(service_->RespondToInvitation(9999, 2, true), screenrank::NotFoundError);

  service_->RespondToInvitation(invite_2, 2, true);
  EXPECT_EQ(ErrorCode([&] { service_->RespondToInvitation(invite_2, 2, false); }), "invitation_closed");

  auto declined = service_->RespondToInvitation(invite_3, 3, false);
  EXPECT_EQ(declined.invitation_status, screenrank::InvitationStatus::kDeclined);
  EXPECT_TRUE(service_->ListChallenges(3).empty());
  EXPECT_EQ(service_->ListChallenges(2).size(), 1u);
  EXPECT_EQ(sink_->awards.size(), 1u);
}

TEST_F(ChallengeServiceTest, InviteRequiresOwnerAndSkipsExistingParticipants) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2});
  int challenge_id = view.challenge.challenge_id;

  EXPECT_EQ(ErrorCode([&] { service_->InviteUsers(challenge_id, 2, {3}); }), "not_owner");
  EXPECT_EQ(service_->InviteUsers(challenge_id, 1, {2, 3, 3, 1, 4}), 2);
  EXPECT_EQ(service_->GetChallenge(challenge_id, 1).participants.size(), 4u);
  EXPECT_EQ(ErrorCode([&] { service_->InviteUsers(challenge_id, 1, {0}); }), "bad_request");
}

TEST_F(ChallengeServiceTest, LeaveRules) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2});
  int challenge_id = view.challenge.challenge_id;

  EXPECT_EQ(ErrorCode([&] { service_->LeaveChallenge(challenge_id, 1); }), "owner_cannot_leave");
  EXPECT_EQ(ErrorCode([&] { service_->LeaveChallenge(challenge_id, 4); }), "not_participant");

  service_->LeaveChallenge(challenge_id, 2);
  EXPECT_FALSE(store_->FindParticipant(challenge_id, 2).has_value());
  EXPECT_EQ(ErrorCode([&] { service_->GetChallenge(challenge_id, 2); }), "not_participant");
}

TEST_F(ChallengeServiceTest, DeleteIsOwnerOnlyAndHidesChallenge) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2});
  int challenge_id = view.challenge.challenge_id;

  EXPECT_EQ(ErrorCode([&] { service_->DeleteChallenge(challenge_id, 2); }), "not_owner");
  service_->DeleteChallenge(challenge_id, 1);

  EXPECT_THROW(service_->GetChallenge(challenge_id, 1), screenrank::NotFoundError);
  EXPECT_THROW(service_->GetLeaderboard(challenge_id, 1), screenrank::NotFoundError);
  EXPECT_TRUE(service_->ListChallenges(1).empty());
  EXPECT_EQ(ErrorCode([&] { service_->DeleteChallenge(challenge_id, 1); }), "challenge_closed");
  EXPECT_EQ(ErrorCode([&] { service_->LeaveChallenge(challenge_id, 2); }), "challenge_closed");
  EXPECT_THROW(service_->DeleteChallenge(9999, 1), screenrank::NotFoundError);
}

TEST_F(ChallengeServiceTest, RenameTrimsAndRequiresOwner) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6, {2});
  int challenge_id = view.challenge.challenge_id;

  auto renamed = service_->RenameChallenge(challenge_id, 1, "  새 이름  ");
  EXPECT_EQ(renamed.challenge.name, "새 이름");
  EXPECT_EQ(store_->FindChallenge(challenge_id)->name, "새 이름");
  EXPECT_EQ(ErrorCode([&] { service_->RenameChallenge(challenge_id, 2, "x"); }), "not_owner");
}

TEST_F(ChallengeServiceTest, ExpiredChallengeFinalizesOnReadWithStoredRanks) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 1, {2});
  int challenge_id = view.challenge.challenge_id;
  service_->RespondToInvitation(ParticipantId(challenge_id, 2), 2, true);
  sink_->awards.clear();

  LogAndRecompute(1, "TikTok", 0, 40);
  LogAndRecompute(2, "TikTok", 0, 60);
  LogAndRecompute(1, "TikTok", 1, 40);
  LogAndRecompute(2, "TikTok", 1, 60);

  *today_ = Day(2);
  auto completed = service_->GetChallenge(challenge_id, 2);
  EXPECT_EQ(completed.challenge.status, screenrank::ChallengeStatus::kCompleted);
  EXPECT_TRUE(completed.challenge.completed_at.has_value());

  auto standings = service_->GetLeaderboard(challenge_id, 1);
  ASSERT_EQ(standings.size(), 2u);
  EXPECT_EQ(standings[0].user_id, 1);
  EXPECT_EQ(standings[0].rank, 1);
  EXPECT_TRUE(standings[0].is_winner);
  EXPECT_DOUBLE_EQ(standings[0].average, 40.0);
  EXPECT_EQ(standings[1].user_id, 2);
  EXPECT_EQ(standings[1].rank, 2);
  EXPECT_FALSE(standings[1].is_winner);

  auto owner_row = store_->FindParticipant(challenge_id, 1);
  EXPECT_TRUE(owner_row->challenge_completed);
  EXPECT_EQ(owner_row->final_rank, 1);

  service_->ListChallenges(1);
  service_->GetChallenge(challenge_id, 1);
  ASSERT_EQ(sink_->awards.size(), 1u);
  EXPECT_EQ(sink_->awards[0], std::make_pair(1, std::string(screenrank::kBadgeCommunityChampion)));
  EXPECT_EQ(observability_->Snapshot().challenges_finalized, 1u);

  EXPECT_EQ(LogAndRecompute(1, "TikTok", 1, 500), 0);
  EXPECT_EQ(store_->FindParticipant(challenge_id, 1)->stats.total_screen_time_minutes, 80);
}

TEST_F(ChallengeServiceTest, TiedWinnersBothReceiveChampionBadge) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 0, {2});
  int challenge_id = view.challenge.challenge_id;
  service_->RespondToInvitation(ParticipantId(challenge_id, 2), 2, true);
  sink_->awards.clear();

  *today_ = Day(1);
  service_->GetLeaderboard(challenge_id, 1);
  EXPECT_EQ(sink_->awards.size(), 2u);
  EXPECT_TRUE(store_->FindParticipant(challenge_id, 1)->is_winner);
  EXPECT_TRUE(store_->FindParticipant(challenge_id, 2)->is_winner);
}

TEST_F(ChallengeServiceTest, OwnerCanCompleteEarlyOnce) {
  auto view = Create(screenrank::AllApps{}, 100, 0, 6);
  int challenge_id = view.challenge.challenge_id;
  LogAndRecompute(1, "Safari", 0, 20);

  auto completed = service_->CompleteChallenge(challenge_id, 1);
  EXPECT_EQ(completed.challenge.status, screenrank::ChallengeStatus::kCompleted);
  EXPECT_EQ(ErrorCode([&] { service_->CompleteChallenge(challenge_id, 1); }), "challenge_closed");
  EXPECT_EQ(ErrorCode([&] { service_->InviteUsers(challenge_id, 1, {2}); }), "challenge_closed");
  EXPECT_EQ(ErrorCode([&] { service_->DeleteChallenge(challenge_id, 1); }), "challenge_closed");
}

TEST_F(ChallengeServiceTest, ExcludePolicyLeavesSilentParticipantUnranked) {
  auto service = MakeService(sink_, screenrank::ZeroLogPolicy::kExclude);
  screenrank::CreateChallengeInput input{"조용한 참가자", std::nullopt, 1, screenrank::AllApps{}, 100,
                                         Day(0), Day(3), {2}};
  int challenge_id = service->CreateChallenge(input).challenge.challenge_id;
  service->RespondToInvitation(ParticipantId(challenge_id, 2), 2, true);
  service->RecomputeForLog(store_->UpsertLog(2, "Mail", Day(0), 90));

  auto standings = service->GetLeaderboard(challenge_id, 1);
  ASSERT_EQ(standings.size(), 2u);
  EXPECT_EQ(standings[0].user_id, 2);
  EXPECT_EQ(standings[0].rank, 1);
  EXPECT_EQ(standings[1].user_id, 1);
  EXPECT_FALSE(standings[1].rank.has_value());
  EXPECT_FALSE(standings[1].is_winner);
}

TEST_F(ChallengeServiceTest, AchievementFailureDoesNotBreakAccept) {
  auto service = MakeService(std::make_shared<ThrowingSink>(), screenrank::ZeroLogPolicy::kIncludeAsZero);
  screenrank::CreateChallengeInput input{"배지 실패", std::nullopt, 1, screenrank::AllApps{}, 100,
                                         Day(0), Day(3), {2}};
  int challenge_id = service->CreateChallenge(input).challenge.challenge_id;

  auto accepted = service->RespondToInvitation(ParticipantId(challenge_id, 2), 2, true);
  EXPECT_EQ(accepted.invitation_status, screenrank::InvitationStatus::kAccepted);
  EXPECT_EQ(observability_->Snapshot().achievement_failures, 1u);
}

TEST_F(ChallengeServiceTest, ListChallengesNewestFirst) {
  int first = Create(screenrank::AllApps{}, 100, 0, 6).challenge.challenge_id;
  int second = Create(screenrank::AllApps{}, 100, 0, 6).challenge.challenge_id;

  auto views = service_->ListChallenges(1);
  ASSERT_EQ(views.size(), 2u);
  EXPECT_EQ(views[0].challenge.challenge_id, second);
  EXPECT_EQ(views[1].challenge.challenge_id, first);
  EXPECT_TRUE(service_->ListChallenges(4).empty());
}

TEST_F(ChallengeServiceTest, CreateBackfillsOwnerStatsFromTodaysLog) {
  store_->UpsertLog(1, "TikTok", Day(0), 45);
  auto view = Create(screenrank::SpecificApp{"TikTok"}, 60, 0, 6);

  auto owner = store_->FindParticipant(view.challenge.challenge_id, 1);
  ASSERT_TRUE(owner.has_value());
  EXPECT_EQ(owner->stats.days_logged, 1);
  EXPECT_EQ(owner->stats.total_screen_time_minutes, 45);
  ASSERT_TRUE(owner->stats.today_passed.has_value());
  EXPECT_TRUE(*owner->stats.today_passed);
}

TEST_F(ChallengeServiceTest, UpcomingCreateLeavesStatsEmpty) {
  store_->UpsertLog(1, "TikTok", Day(0), 45);
  auto view = Create(screenrank::SpecificApp{"TikTok"}, 60, 1, 6);
  EXPECT_EQ(store_->FindParticipant(view.challenge.challenge_id, 1)->stats.days_logged, 0);
}

TEST_F(ChallengeServiceTest, FailedRecomputeDoesNotStopOtherChallenges) {
  int broken = Create(screenrank::AllApps{}, 100, 0, 6).challenge.challenge_id;
  int healthy = Create(screenrank::AllApps{}, 100, 0, 6).challenge.challenge_id;

  auto failing = std::make_shared<screenrank_test::FailingChallengeStore>(store_);
  failing->failing_stats.insert(broken);
  auto today = today_;
  screenrank::Clock clock([today]() { return screenrank::Clock::Fixed(*today).Now(); });
  auto aggregator = std::make_shared<screenrank::StatsAggregator>(failing, clock);
  screenrank::ChallengeService service(failing, aggregator, sink_, observability_, clock,
                                       screenrank::ZeroLogPolicy::kIncludeAsZero);

  auto log = store_->UpsertLog(1, "TikTok", Day(0), 30);
  EXPECT_EQ(service.RecomputeForLog(log), 1);
  EXPECT_EQ(store_->FindParticipant(healthy, 1)->stats.total_screen_time_minutes, 30);
  EXPECT_EQ(store_->FindParticipant(broken, 1)->stats.total_screen_time_minutes, 0);
  EXPECT_EQ(observability_->Snapshot().aggregation_failures, 1u);
}

TEST_F(ChallengeServiceTest, FailedFinalizationStillListsEveryChallenge) {
  int broken = Create(screenrank::AllApps{}, 100, 0, 1).challenge.challenge_id;
  int healthy = Create(screenrank::AllApps{}, 100, 0, 1).challenge.challenge_id;
  LogAndRecompute(1, "TikTok", 0, 30);

  auto failing = std::make_shared<screenrank_test::FailingChallengeStore>(store_);
  failing->failing_finalize.insert(broken);
  auto today = today_;
  screenrank::Clock clock([today]() { return screenrank::Clock::Fixed(*today).Now(); });
  auto aggregator = std::make_shared<screenrank::StatsAggregator>(failing, clock);
  screenrank::ChallengeService service(failing, aggregator, sink_, observability_, clock,
                                       screenrank::ZeroLogPolicy::kIncludeAsZero);

  *today_ = Day(2);
  auto views = service.ListChallenges(1);
  ASSERT_EQ(views.size(), 2u);
  EXPECT_EQ(views[0].challenge.challenge_id, healthy);
  EXPECT_EQ(views[0].challenge.status, screenrank::ChallengeStatus::kCompleted);
  EXPECT_EQ(views[1].challenge.challenge_id, broken);
  EXPECT_EQ(views[1].challenge.status, screenrank::ChallengeStatus::kActive);

  EXPECT_EQ(store_->FindChallenge(healthy)->status, screenrank::ChallengeStatus::kCompleted);
  EXPECT_EQ(store_->FindChallenge(broken)->status, screenrank::ChallengeStatus::kActive);
  auto winner = store_->FindParticipant(healthy, 1);
  ASSERT_TRUE(winner->final_rank.has_value());
  EXPECT_EQ(*winner->final_rank, 1);
  EXPECT_EQ(observability_->Snapshot().finalization_failures, 1u);
}

}  // namespace
