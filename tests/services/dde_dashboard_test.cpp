/**
 * @file dde_dashboard_test.cpp
 * @brief Unit tests for dde_dashboard
 */

#include <catch2/catch_test_macros.hpp>

#include "../mocks/dde_test_fixture.hpp"

#include <dde/services/dde_dashboard.hpp>

using namespace dde;
using namespace dde::services;
using dde::core::form_status;
using dde::test::dde_fixture;
using namespace std::chrono_literals;

namespace {

void backdate_first_entry(dde_fixture& fx, int64_t id, std::chrono::hours age) {
    auto form = fx.storage->get_form_instance(id).value();
    form.first_entry_at = std::chrono::system_clock::now() - age;
    fx.storage->put_form(form);
}

void backdate_second_entry(dde_fixture& fx, int64_t id, std::chrono::hours age) {
    auto form = fx.storage->get_form_instance(id).value();
    form.second_entry_at = std::chrono::system_clock::now() - age;
    fx.storage->put_form(form);
}

}  // namespace

// ============================================================================
// Pending Second Entry
// ============================================================================

TEST_CASE("dde_dashboard pending second entry", "[dashboard][pending]") {
    dde_fixture fx;
    auto recent = fx.seed_first_entry_complete("alice");
    auto oldest = fx.seed_first_entry_complete("alice");
    auto other_site = fx.seed_first_entry_complete("alice", true, "SITE02");
    fx.seed_first_entry_complete("alice", false);
    fx.seed_vitals();

    backdate_first_entry(fx, recent, 1h);
    backdate_first_entry(fx, oldest, 72h + 1h);
    backdate_first_entry(fx, other_site, 24h);

    SECTION("all sites, longest waiting first") {
        auto pending = fx.engine.dashboard().pending_second_entry();
        REQUIRE(pending.is_ok());
        REQUIRE(pending.value().size() == 3);
        CHECK(pending.value()[0].form_instance_id == oldest);
        CHECK(pending.value()[1].form_instance_id == other_site);
        CHECK(pending.value()[2].form_instance_id == recent);

        CHECK(pending.value()[0].days_waiting == 3);
        CHECK(pending.value()[0].first_entry_by == "alice");
        CHECK(pending.value()[0].wait_time >= 73h);
        CHECK(pending.value()[2].days_waiting == 0);
    }

    SECTION("filtered by site") {
        auto pending = fx.engine.dashboard().pending_second_entry(std::string("SITE02"));
        REQUIRE(pending.is_ok());
        REQUIRE(pending.value().size() == 1);
        CHECK(pending.value()[0].form_instance_id == other_site);
        CHECK(pending.value()[0].site_id == "SITE02");
    }

    SECTION("submitted forms drop off") {
        REQUIRE(fx.engine.lifecycle()
                    .submit_second_entry(oldest, "bob", dde_fixture::all_match())
                    .is_ok());
        auto pending = fx.engine.dashboard().pending_second_entry();
        REQUIRE(pending.is_ok());
        CHECK(pending.value().size() == 2);
    }
}

TEST_CASE("dde_dashboard respects the row limit", "[dashboard][limit]") {
    auto storage = std::make_shared<test::memory_dde_storage>();
    workflow::dde_workflow_config config;
    config.dashboard_limit = 2;
    workflow::dde_engine engine(storage, config);

    for (int i = 0; i < 4; ++i) {
        auto id = storage->add_form("S-" + std::to_string(i), "SITE01");
        REQUIRE(engine.lifecycle().mark_first_entry_complete(id, "alice").is_ok());
    }

    auto pending = engine.dashboard().pending_second_entry();
    REQUIRE(pending.is_ok());
    CHECK(pending.value().size() == 2);
}

// ============================================================================
// Pending Resolution
// ============================================================================

TEST_CASE("dde_dashboard pending resolution", "[dashboard][resolution]") {
    dde_fixture fx;
    auto with_open = fx.seed_first_entry_complete("alice");
    auto older_open = fx.seed_first_entry_complete("alice");
    auto matched = fx.seed_first_entry_complete("alice");

    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(with_open, "bob", dde_fixture::diabp_mismatch())
                .is_ok());
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(older_open, "bob",
                                     {{test::vitals::sysbp, "999"},
                                      {test::vitals::diabp, "85"},
                                      {test::vitals::sex, "Male"}})
                .is_ok());
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(matched, "bob", dde_fixture::all_match())
                .is_ok());
    backdate_second_entry(fx, older_open, 48h);

    auto pending = fx.engine.dashboard().pending_resolution();
    REQUIRE(pending.is_ok());
    REQUIRE(pending.value().size() == 2);
    CHECK(pending.value()[0].form_instance_id == older_open);
    CHECK(pending.value()[0].open_discrepancies == 2);
    CHECK(pending.value()[0].days_waiting == 2);
    CHECK(pending.value()[1].form_instance_id == with_open);
    CHECK(pending.value()[1].open_discrepancies == 1);

    SECTION("resolved forms drop off") {
        auto discrepancy =
            fx.engine.discrepancies().list_for_form_instance(with_open).value()[0];
        workflow::resolution_request request;
        request.discrepancy_id = discrepancy.discrepancy_id;
        request.strategy = storage::resolution_strategy::first_correct;
        request.resolver_id = "carol";
        REQUIRE(fx.engine.discrepancies().resolve(request).is_ok());

        auto after = fx.engine.dashboard().pending_resolution();
        REQUIRE(after.is_ok());
        REQUIRE(after.value().size() == 1);
        CHECK(after.value()[0].form_instance_id == older_open);
    }
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE("dde_dashboard statistics", "[dashboard][statistics]") {
    dde_fixture fx;
    fx.seed_vitals();
    fx.seed_first_entry_complete("alice");
    fx.seed_first_entry_complete("alice");
    auto open = fx.seed_first_entry_complete("alice");
    auto done = fx.seed_first_entry_complete("alice");
    fx.seed_first_entry_complete("alice", false);

    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(open, "bob", dde_fixture::diabp_mismatch())
                .is_ok());
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(done, "bob", dde_fixture::all_match())
                .is_ok());

    auto stats = fx.engine.dashboard().statistics();
    REQUIRE(stats.is_ok());
    CHECK(stats.value().pending == 2);
    CHECK(stats.value().discrepancies == 1);
    CHECK(stats.value().complete == 1);
    CHECK(stats.value().total == 4);
    CHECK(stats.value().total ==
          stats.value().pending + stats.value().discrepancies + stats.value().complete);
    CHECK(stats.value().by_status.at(form_status::not_started) == 1);
}

TEST_CASE("dde_dashboard overview combines all views", "[dashboard][overview]") {
    dde_fixture fx;
    auto waiting = fx.seed_first_entry_complete("alice", true, "SITE01");
    auto open = fx.seed_first_entry_complete("alice", true, "SITE02");
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(open, "bob", dde_fixture::diabp_mismatch())
                .is_ok());

    auto overview = fx.engine.dashboard().overview();
    REQUIRE(overview.is_ok());
    REQUIRE(overview.value().pending_second_entry.size() == 1);
    CHECK(overview.value().pending_second_entry[0].form_instance_id == waiting);
    REQUIRE(overview.value().pending_resolution.size() == 1);
    CHECK(overview.value().pending_resolution[0].form_instance_id == open);
    CHECK(overview.value().statistics.total == 2);

    auto site_one = fx.engine.dashboard().overview(std::string("SITE01"));
    REQUIRE(site_one.is_ok());
    CHECK(site_one.value().pending_second_entry.size() == 1);
    CHECK(site_one.value().pending_resolution.empty());
}
