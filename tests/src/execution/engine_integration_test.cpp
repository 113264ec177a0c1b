#include <gtest/gtest.h>
#include <warden/schema/key/keys.hpp>
#include <warden/testing/engine_fixture.hpp>

using namespace warden::schema;
using warden::testing::engine_fixture;
using warden::testing::make_organization;
using warden::testing::make_user;

namespace {

warden::lifecycle::transition_request request_for(
    const status_type_t type,
    std::optional<std::string> reason = std::nullopt) {
  auto request = warden::lifecycle::transition_request{};
  request.status_type = type;
  request.reason = std::move(reason);
  return request;
}

/// Administrator engine registered through bootstrap.
warden::execution::engine& bootstrap(engine_fixture& fixture,
                                     const entity_ref_t& entity) {
  auto& admin = fixture.add_agent();
  auto registered = admin.bootstrap_administrator(entity, {admin.agent()});
  EXPECT_TRUE(registered.ok()) << registered.log;
  return admin;
}

hash32_t latest_hash(const warden::execution::engine& engine,
                     const entity_ref_t& entity) {
  auto latest = engine.get_latest_status(entity);
  EXPECT_TRUE(latest.ok()) << latest.log;
  return latest.value->hash;
}

}  // namespace

TEST(engine_integration, new_entity_starts_pending) {
  auto fixture = engine_fixture{"warden_engine_pending"};
  auto& agent = fixture.add_agent();
  auto user = make_user(5);

  auto created = agent.create_status(user, {agent.agent()});
  ASSERT_TRUE(created.ok()) << created.log;

  auto latest = agent.get_latest_status(user);
  ASSERT_TRUE(latest.ok());
  EXPECT_EQ(latest.value->hash, *created.value);
  EXPECT_EQ(latest.value->record.payload.status_type, status_type_t::pending);
  EXPECT_EQ(latest.value->record.original_hash, *created.value);
  EXPECT_EQ(latest.value->record.previous_hash, *created.value);
  EXPECT_EQ(latest.value->record.author, agent.agent());

  auto link = agent.get_status_link(user);
  ASSERT_TRUE(link.ok());
  EXPECT_EQ(link.value->status_original_hash, *created.value);
  ASSERT_EQ(link.value->agent_keys.size(), 1u);

  auto accepted = agent.is_entity_accepted(user);
  ASSERT_TRUE(accepted.ok());
  EXPECT_FALSE(*accepted.value);

  auto pending = agent.list_entities_by_category(entity_kind_t::users,
                                                 status_category_t::pending);
  ASSERT_TRUE(pending.ok());
  ASSERT_EQ(pending.value->size(), 1u);
  EXPECT_EQ((*pending.value)[0], user.hash);
}

TEST(engine_integration, second_status_for_an_entity_is_refused) {
  auto fixture = engine_fixture{"warden_engine_twice"};
  auto& agent = fixture.add_agent();
  ASSERT_TRUE(agent.create_status(make_user(5), {}).ok());
  auto again = agent.create_status(make_user(5), {});
  EXPECT_EQ(again.code, error_code_t::already_has_status);
  EXPECT_EQ(again.codespace, kStatusCodespace);
}

TEST(engine_integration, unknown_entity_reports_not_found) {
  auto fixture = engine_fixture{"warden_engine_unknown"};
  auto& agent = fixture.add_agent();
  EXPECT_EQ(agent.get_latest_status(make_user(9)).code,
            error_code_t::not_found);
  EXPECT_EQ(agent.get_status_history(make_user(9)).code,
            error_code_t::not_found);
  auto accepted = agent.is_entity_accepted(make_user(9));
  ASSERT_TRUE(accepted.ok());
  EXPECT_FALSE(*accepted.value);
}

TEST(engine_integration, administrator_accepts_an_entity) {
  auto fixture = engine_fixture{"warden_engine_accept"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto user = make_user(5);
  auto original = admin.create_status(user, {});
  ASSERT_TRUE(original.ok());

  auto accepted = admin.update_status(user, *original.value, *original.value,
                                      request_for(status_type_t::accepted));
  ASSERT_TRUE(accepted.ok()) << accepted.log;

  EXPECT_TRUE(*admin.is_entity_accepted(user).value);
  EXPECT_EQ(latest_hash(admin, user), *accepted.value);
  EXPECT_TRUE(admin
                  .list_entities_by_category(entity_kind_t::users,
                                             status_category_t::pending)
                  .value->empty());
  EXPECT_EQ(admin
                .list_entities_by_category(entity_kind_t::users,
                                           status_category_t::accepted)
                .value->size(),
            1u);
}

TEST(engine_integration, rejection_requires_a_reason) {
  auto fixture = engine_fixture{"warden_engine_reason"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto user = make_user(5);
  auto original = *admin.create_status(user, {}).value;

  auto refused =
      admin.update_status(user, original, original,
                          request_for(status_type_t::rejected));
  EXPECT_EQ(refused.code, error_code_t::invalid_transition);
  EXPECT_EQ(latest_hash(admin, user), original);

  auto rejected = admin.update_status(
      user, original, original,
      request_for(status_type_t::rejected, std::string{"spam"}));
  ASSERT_TRUE(rejected.ok());
  auto latest = admin.get_latest_status(user);
  EXPECT_EQ(latest.value->record.payload.reason, "spam");
}

TEST(engine_integration, temporary_suspension_expires) {
  auto fixture = engine_fixture{"warden_engine_expiry"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto user = make_user(5);
  auto original = *admin.create_status(user, {}).value;
  auto accepted = *admin
                       .update_status(user, original, original,
                                      request_for(status_type_t::accepted))
                       .value;

  auto suspended =
      admin.suspend_temporarily(user, original, accepted, "cooling off", 7);
  ASSERT_TRUE(suspended.ok()) << suspended.log;
  auto latest = admin.get_latest_status(user);
  EXPECT_EQ(latest.value->record.payload.status_type,
            status_type_t::suspended_temporarily);
  EXPECT_EQ(latest.value->record.payload.suspended_until,
            fixture.clock().now() + 7 * kMillisecondsPerDay);
  EXPECT_EQ(admin
                .list_entities_by_category(entity_kind_t::users,
                                           status_category_t::suspended)
                .value->size(),
            1u);

  fixture.clock().advance_days(6);
  auto early = admin.unsuspend_if_expired(user, original, *suspended.value);
  ASSERT_TRUE(early.ok());
  EXPECT_FALSE(*early.value);
  EXPECT_EQ(latest_hash(admin, user), *suspended.value);

  fixture.clock().advance_days(1);
  auto expired = admin.unsuspend_if_expired(user, original, *suspended.value);
  ASSERT_TRUE(expired.ok()) << expired.log;
  EXPECT_TRUE(*expired.value);
  EXPECT_TRUE(*admin.is_entity_accepted(user).value);

  auto again =
      admin.unsuspend_if_expired(user, original, latest_hash(admin, user));
  ASSERT_TRUE(again.ok());
  EXPECT_FALSE(*again.value);

  auto history = admin.get_status_history(user);
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->size(), 4u);
  EXPECT_EQ((*history.value)[0].record.payload.status_type,
            status_type_t::pending);
  EXPECT_EQ((*history.value)[3].record.payload.status_type,
            status_type_t::accepted);
}

TEST(engine_integration, manual_acceptance_ends_a_running_suspension) {
  auto fixture = engine_fixture{"warden_engine_manual"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto user = make_user(5);
  auto original = *admin.create_status(user, {}).value;

  auto suspended =
      admin.suspend_temporarily(user, original, original, "violation", 7);
  ASSERT_TRUE(suspended.ok());
  EXPECT_FALSE(
      *admin.unsuspend_if_expired(user, original, *suspended.value).value);

  auto accepted = admin.update_status(user, original, *suspended.value,
                                      request_for(status_type_t::accepted));
  ASSERT_TRUE(accepted.ok());

  auto history = admin.get_status_history(user);
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->size(), 3u);
  for (std::size_t i = 1; i < history.value->size(); ++i) {
    EXPECT_EQ((*history.value)[i].record.previous_hash,
              (*history.value)[i - 1].hash);
    EXPECT_EQ((*history.value)[i].record.original_hash, original);
  }
  auto listed = admin.list_entities_by_category(entity_kind_t::users,
                                                status_category_t::accepted);
  ASSERT_EQ(listed.value->size(), 1u);
  EXPECT_EQ((*listed.value)[0], user.hash);
  EXPECT_TRUE(admin
                  .list_entities_by_category(entity_kind_t::users,
                                             status_category_t::suspended)
                  .value->empty());
}

TEST(engine_integration, indefinite_suspension_and_unsuspend) {
  auto fixture = engine_fixture{"warden_engine_indefinite"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto organization = make_organization(7);
  auto original = *admin.create_status(organization, {}).value;

  auto suspended =
      admin.suspend_indefinitely(organization, original, original, "audit");
  ASSERT_TRUE(suspended.ok());
  fixture.clock().advance_days(365);
  EXPECT_FALSE(
      *admin.unsuspend_if_expired(organization, original, *suspended.value)
           .value);

  auto restored = admin.unsuspend(organization, original, *suspended.value);
  ASSERT_TRUE(restored.ok());
  EXPECT_TRUE(*admin.is_entity_accepted(organization).value);
  EXPECT_EQ(admin.get_status_history(organization).value->size(), 3u);
}

TEST(engine_integration, concurrent_administrators_get_stale_reference) {
  auto fixture = engine_fixture{"warden_engine_stale"};
  auto& first = bootstrap(fixture, make_user(1));
  auto& second = fixture.add_agent();
  ASSERT_TRUE(
      first.register_administrator(make_user(2), {second.agent()}).ok());

  auto user = make_user(5);
  auto original = *first.create_status(user, {}).value;

  auto winner = first.update_status(user, original, original,
                                    request_for(status_type_t::accepted));
  ASSERT_TRUE(winner.ok());
  auto loser = second.update_status(
      user, original, original,
      request_for(status_type_t::rejected, std::string{"duplicate"}));
  EXPECT_EQ(loser.code, error_code_t::stale_reference);

  EXPECT_EQ(latest_hash(second, user), *winner.value);
  EXPECT_TRUE(second.get_status_forks(user).value->empty());
  EXPECT_EQ(second.get_status_history(user).value->size(), 2u);

  auto retried = second.update_status(
      user, original, *winner.value,
      request_for(status_type_t::rejected, std::string{"duplicate"}));
  EXPECT_TRUE(retried.ok()) << retried.log;
}

TEST(engine_integration, non_administrators_cannot_change_status) {
  auto fixture = engine_fixture{"warden_engine_non_admin"};
  bootstrap(fixture, make_user(1));
  auto& outsider = fixture.add_agent();
  auto user = make_user(5);
  auto original = *outsider.create_status(user, {}).value;

  auto result = outsider.update_status(user, original, original,
                                       request_for(status_type_t::accepted));
  EXPECT_EQ(result.code, error_code_t::unauthorized);
  EXPECT_EQ(outsider.suspend_indefinitely(user, original, original, "x").code,
            error_code_t::unauthorized);
  EXPECT_EQ(outsider.register_administrator(make_user(3), {outsider.agent()})
                .code,
            error_code_t::unauthorized);
  EXPECT_EQ(latest_hash(outsider, user), original);
}

TEST(engine_integration, administrators_cannot_change_their_own_status) {
  auto fixture = engine_fixture{"warden_engine_self"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto original = *admin.create_status(make_user(1), {admin.agent()}).value;

  auto result =
      admin.suspend_indefinitely(make_user(1), original, original, "break");
  EXPECT_EQ(result.code, error_code_t::unauthorized);
  EXPECT_EQ(admin.remove_administrator(make_user(1), {}).code,
            error_code_t::unauthorized);
}

TEST(engine_integration, administrators_cannot_change_any_of_their_profiles) {
  auto fixture = engine_fixture{"warden_engine_profiles"};
  auto& admin = fixture.add_agent();
  auto user = make_user(5);
  auto organization = make_organization(6);
  auto user_root = *admin.create_status(user, {admin.agent()}).value;
  ASSERT_TRUE(admin.create_status(organization, {admin.agent()}).ok());
  ASSERT_TRUE(
      admin.bootstrap_administrator(organization, {admin.agent()}).ok());

  auto result = admin.update_status(user, user_root, user_root,
                                    request_for(status_type_t::accepted));
  EXPECT_EQ(result.code, error_code_t::unauthorized);
  EXPECT_EQ(latest_hash(admin, user), user_root);
}

TEST(engine_integration, bootstrap_only_once) {
  auto fixture = engine_fixture{"warden_engine_bootstrap"};
  auto& first = fixture.add_agent();
  auto& second = fixture.add_agent();
  ASSERT_TRUE(first.bootstrap_administrator(make_user(1), {first.agent()}).ok());
  EXPECT_EQ(
      second.bootstrap_administrator(make_user(2), {second.agent()}).code,
      error_code_t::unauthorized);
  EXPECT_TRUE(*second.is_agent_administrator(first.agent()).value);
  EXPECT_FALSE(*second.is_agent_administrator(second.agent()).value);
}

TEST(engine_integration, bootstrap_restricted_to_the_progenitor) {
  auto fixture = engine_fixture{"warden_engine_progenitor"};
  auto& progenitor = fixture.add_progenitor();
  auto& impostor = fixture.add_agent(progenitor.agent());

  EXPECT_EQ(
      impostor.bootstrap_administrator(make_user(2), {impostor.agent()}).code,
      error_code_t::unauthorized);
  EXPECT_TRUE(progenitor
                  .bootstrap_administrator(make_user(1), {progenitor.agent()})
                  .ok());
}

TEST(engine_integration, administrators_manage_each_other) {
  auto fixture = engine_fixture{"warden_engine_admins"};
  auto& first = bootstrap(fixture, make_user(1));
  auto& second = fixture.add_agent();
  ASSERT_TRUE(
      first.register_administrator(make_user(2), {second.agent()}).ok());
  EXPECT_EQ(first.register_administrator(make_user(2), {second.agent()}).code,
            error_code_t::already_administrator);
  EXPECT_EQ(first.list_administrators(entity_kind_t::users).value->size(), 2u);

  auto removed =
      second.remove_administrator(make_user(1), {}, std::string{"retired"});
  ASSERT_TRUE(removed.ok()) << removed.log;
  EXPECT_FALSE(*second.is_agent_administrator(first.agent()).value);
  EXPECT_FALSE(*second.is_entity_administrator(make_user(1)).value);

  auto history = second.get_administrator_history(make_user(1));
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->size(), 2u);
  EXPECT_EQ((*history.value)[1].record.payload.reason, "retired");

  // The removed administrator lost every privilege.
  auto user = make_user(5);
  auto original = *first.create_status(user, {}).value;
  EXPECT_EQ(first
                .update_status(user, original, original,
                               request_for(status_type_t::accepted))
                .code,
            error_code_t::unauthorized);
}

TEST(engine_integration, rebuild_restores_wiped_categories) {
  auto fixture = engine_fixture{"warden_engine_rebuild"};
  auto& admin = bootstrap(fixture, make_user(1));
  auto pending_user = make_user(5);
  auto accepted_user = make_user(6);
  auto rejected_organization = make_organization(7);
  ASSERT_TRUE(admin.create_status(pending_user, {}).ok());
  auto accepted_root = *admin.create_status(accepted_user, {}).value;
  auto rejected_root = *admin.create_status(rejected_organization, {}).value;
  ASSERT_TRUE(admin
                  .update_status(accepted_user, accepted_root, accepted_root,
                                 request_for(status_type_t::accepted))
                  .ok());
  ASSERT_TRUE(admin
                  .update_status(rejected_organization, rejected_root,
                                 rejected_root,
                                 request_for(status_type_t::rejected,
                                             std::string{"fraud"}))
                  .ok());

  for (auto kind : kAllEntityKinds) {
    auto categories = key::make_index_prefix(kind);
    fixture.storage().replace_by_prefix(bytes_view_t{categories}, {});
    auto all = key::make_all_entities_prefix(kind);
    fixture.storage().replace_by_prefix(bytes_view_t{all}, {});
  }
  EXPECT_TRUE(admin.list_all_entities(entity_kind_t::users).value->empty());

  auto rebuilt = admin.rebuild_index_from_chains();
  ASSERT_TRUE(rebuilt.ok());
  EXPECT_EQ(*rebuilt.value, 3u);
  EXPECT_EQ(admin.list_all_entities(entity_kind_t::users).value->size(), 2u);
  EXPECT_EQ(admin
                .list_entities_by_category(entity_kind_t::users,
                                           status_category_t::pending)
                .value->size(),
            1u);
  EXPECT_EQ(admin
                .list_entities_by_category(entity_kind_t::users,
                                           status_category_t::accepted)
                .value->size(),
            1u);
  auto rejected = admin.list_entities_by_category(
      entity_kind_t::organizations, status_category_t::rejected);
  ASSERT_EQ(rejected.value->size(), 1u);
  EXPECT_EQ((*rejected.value)[0], rejected_organization.hash);
}
