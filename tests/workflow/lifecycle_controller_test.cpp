/**
 * @file lifecycle_controller_test.cpp
 * @brief Unit tests for lifecycle_controller
 */

#include <catch2/catch_test_macros.hpp>

#include "../mocks/dde_test_fixture.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace dde;
using namespace dde::workflow;
using dde::core::form_status;
using dde::test::dde_fixture;
namespace vitals = dde::test::vitals;

// ============================================================================
// First Entry
// ============================================================================

TEST_CASE("lifecycle_controller first entry", "[lifecycle][first]") {
    dde_fixture fx;
    auto id = fx.seed_vitals();

    SECTION("start then complete") {
        REQUIRE(fx.engine.lifecycle().start_first_entry(id, "alice").is_ok());
        CHECK(fx.status_of(id) == form_status::first_entry_in_progress);

        REQUIRE(fx.engine.lifecycle().mark_first_entry_complete(id, "alice").is_ok());
        CHECK(fx.status_of(id) == form_status::first_entry_complete);

        auto form = fx.storage->get_form_instance(id).value();
        CHECK(form.first_entry_by == "alice");
        CHECK(form.first_entry_at != std::chrono::system_clock::time_point{});

        auto audit = fx.storage->audit_entries();
        REQUIRE(audit.size() == 2);
        CHECK(audit[0].entity_name == storage::audit_entity::first_entry_started);
        CHECK(audit[0].old_value == "not_started");
        CHECK(audit[0].new_value == "first_entry_in_progress");
        CHECK(audit[1].entity_name == storage::audit_entity::first_entry_complete);
        CHECK(audit[1].new_value == "first_entry_complete");
        CHECK(audit[1].audit_table == storage::audit_table::form_instance);
    }

    SECTION("complete without explicit start") {
        REQUIRE(fx.engine.lifecycle().mark_first_entry_complete(id, "alice").is_ok());
        CHECK(fx.status_of(id) == form_status::first_entry_complete);
    }

    SECTION("start twice") {
        REQUIRE(fx.engine.lifecycle().start_first_entry(id, "alice").is_ok());
        auto again = fx.engine.lifecycle().start_first_entry(id, "alice");
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::invalid_state);
    }

    SECTION("complete twice") {
        REQUIRE(fx.engine.lifecycle().mark_first_entry_complete(id, "alice").is_ok());
        auto again = fx.engine.lifecycle().mark_first_entry_complete(id, "bob");
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::invalid_state);
        CHECK(fx.storage->get_form_instance(id).value().first_entry_by == "alice");
    }

    SECTION("acting user is required") {
        auto result = fx.engine.lifecycle().mark_first_entry_complete(id, "");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
    }

    SECTION("unknown form instance") {
        auto result = fx.engine.lifecycle().start_first_entry(999, "alice");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::record_not_found);
    }
}

// ============================================================================
// Second Entry
// ============================================================================

TEST_CASE("lifecycle_controller second entry that matches", "[lifecycle][second]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");

    auto outcome = fx.engine.lifecycle().submit_second_entry(id, "bob",
                                                             dde_fixture::all_match());
    REQUIRE(outcome.is_ok());
    CHECK(outcome.value().status == form_status::reconciled);
    CHECK(outcome.value().comparison.matched == 3);

    auto form = fx.storage->get_form_instance(id).value();
    CHECK(form.status == form_status::reconciled);
    CHECK(form.second_entry_by == "bob");
    CHECK(form.second_entry_values == dde_fixture::all_match());
    CHECK(form.completed_at != std::chrono::system_clock::time_point{});

    auto audit = fx.storage->audit_entries();
    REQUIRE(audit.size() == 3);
    CHECK(audit[1].entity_name == storage::audit_entity::second_entry_submitted);
    CHECK(audit[2].entity_name == storage::audit_entity::auto_reconciled);
    CHECK(audit[2].new_value == "reconciled");
}

TEST_CASE("lifecycle_controller second entry with mismatches", "[lifecycle][second]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");

    auto outcome = fx.engine.lifecycle().submit_second_entry(
        id, "bob", dde_fixture::diabp_mismatch());
    REQUIRE(outcome.is_ok());
    CHECK(outcome.value().status == form_status::second_entry_in_progress);
    CHECK(outcome.value().comparison.mismatched == 1);
    CHECK(outcome.value().comparison.created == 1);
    CHECK(fx.status_of(id) == form_status::second_entry_in_progress);
    CHECK(fx.engine.discrepancies().count_open(id).value() == 1);
}

TEST_CASE("lifecycle_controller second entry denials", "[lifecycle][second][gate]") {
    dde_fixture fx;

    SECTION("same user as first entry") {
        auto id = fx.seed_first_entry_complete("alice");
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "alice", dde_fixture::all_match());
        REQUIRE(outcome.is_err());
        CHECK(outcome.error().code == error_codes::dde_same_entrant);
        CHECK(classify(outcome.error().code) == error_kind::authorization_denied);
        CHECK(fx.status_of(id) == form_status::first_entry_complete);
        CHECK(fx.storage->audit_entries().size() == 1);
    }

    SECTION("form does not require double entry") {
        auto id = fx.seed_first_entry_complete("alice", false);
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "bob", dde_fixture::all_match());
        REQUIRE(outcome.is_err());
        CHECK(outcome.error().code == error_codes::dde_not_required);
    }

    SECTION("second entry already submitted") {
        auto id = fx.seed_first_entry_complete("alice");
        REQUIRE(fx.engine.lifecycle()
                    .submit_second_entry(id, "bob", dde_fixture::diabp_mismatch())
                    .is_ok());
        auto again = fx.engine.lifecycle().submit_second_entry(
            id, "carol", dde_fixture::all_match());
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::dde_already_complete);
        CHECK(fx.storage->get_form_instance(id).value().second_entry_by == "bob");
    }

    SECTION("first entry not complete") {
        auto id = fx.seed_vitals();
        REQUIRE(fx.engine.lifecycle().start_first_entry(id, "alice").is_ok());
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "bob", dde_fixture::all_match());
        REQUIRE(outcome.is_err());
        CHECK(outcome.error().code == error_codes::invalid_state);
        CHECK(fx.status_of(id) == form_status::first_entry_in_progress);
    }
}

TEST_CASE("lifecycle_controller second entry is atomic", "[lifecycle][second][atomicity]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");
    auto audit_before = fx.storage->audit_entries().size();

    SECTION("audit failure") {
        fx.storage->fail_audit_writes(true);
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "bob", dde_fixture::diabp_mismatch());
        fx.storage->fail_audit_writes(false);
        REQUIRE(outcome.is_err());
        CHECK(outcome.error().code == error_codes::audit_write_failed);
    }

    SECTION("form update failure") {
        fx.storage->fail_form_updates(true);
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "bob", dde_fixture::diabp_mismatch());
        fx.storage->fail_form_updates(false);
        REQUIRE(outcome.is_err());
    }

    auto form = fx.storage->get_form_instance(id).value();
    CHECK(form.status == form_status::first_entry_complete);
    CHECK_FALSE(form.has_second_entry());
    CHECK(form.second_entry_values.empty());
    CHECK(fx.storage->discrepancy_count() == 0);
    CHECK(fx.storage->audit_entries().size() == audit_before);
    CHECK_FALSE(fx.engine.locks().is_locked(entity_lock_manager::form_instance_key(id)));

    SECTION("a later submission still succeeds") {
        auto outcome = fx.engine.lifecycle().submit_second_entry(
            id, "bob", dde_fixture::all_match());
        REQUIRE(outcome.is_ok());
        CHECK(outcome.value().status == form_status::reconciled);
    }
}

TEST_CASE("lifecycle_controller concurrent second entries", "[lifecycle][concurrency]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");

    constexpr int contenders = 6;
    std::atomic<int> accepted{0};
    std::atomic<int> already_complete{0};
    std::atomic<int> other{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < contenders; ++i) {
        threads.emplace_back([&, i] {
            auto outcome = fx.engine.lifecycle().submit_second_entry(
                id, "user-" + std::to_string(i), dde_fixture::diabp_mismatch());
            if (outcome.is_ok()) {
                ++accepted;
            } else if (outcome.error().code == error_codes::dde_already_complete) {
                ++already_complete;
            } else {
                ++other;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(accepted == 1);
    CHECK(accepted + already_complete + other == contenders);
    CHECK(fx.storage->discrepancy_count() == 1);

    std::size_t submissions = 0;
    for (const auto& entry : fx.storage->audit_entries()) {
        if (entry.entity_name == storage::audit_entity::second_entry_submitted) {
            ++submissions;
        }
    }
    CHECK(submissions == 1);
}

// ============================================================================
// Finalize
// ============================================================================

TEST_CASE("lifecycle_controller finalize", "[lifecycle][finalize]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");
    auto outcome = fx.engine.lifecycle().submit_second_entry(
        id, "bob", dde_fixture::diabp_mismatch());
    REQUIRE(outcome.is_ok());

    SECTION("blocked by open discrepancies") {
        auto result = fx.engine.lifecycle().finalize(id, "carol");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::precondition_failed);
        CHECK(result.error().message ==
              "Cannot finalize: 1 unresolved discrepancies remain");
        CHECK(fx.status_of(id) == form_status::second_entry_in_progress);
    }

    SECTION("succeeds once everything is resolved") {
        auto discrepancies = fx.engine.discrepancies().list_for_form_instance(id).value();
        REQUIRE(discrepancies.size() == 1);

        resolution_request request;
        request.discrepancy_id = discrepancies[0].discrepancy_id;
        request.strategy = storage::resolution_strategy::first_correct;
        request.resolver_id = "carol";
        REQUIRE(fx.engine.discrepancies().resolve(request).is_ok());

        REQUIRE(fx.engine.lifecycle().finalize(id, "carol").is_ok());
        CHECK(fx.status_of(id) == form_status::reconciled);
        CHECK(fx.storage->audit_entries().back().entity_name ==
              storage::audit_entity::finalized);

        auto again = fx.engine.lifecycle().finalize(id, "carol");
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::invalid_state);
    }
}

TEST_CASE("lifecycle_controller finalize before second entry", "[lifecycle][finalize]") {
    dde_fixture fx;
    auto id = fx.seed_first_entry_complete("alice");

    auto result = fx.engine.lifecycle().finalize(id, "carol");
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_state);
}

// ============================================================================
// Status View
// ============================================================================

TEST_CASE("lifecycle_controller status view", "[lifecycle][status]") {
    dde_fixture fx;
    auto id = fx.seed_vitals();

    auto fresh = fx.engine.lifecycle().get_status(id);
    REQUIRE(fresh.is_ok());
    CHECK(fresh.value().first_entry == entry_phase::pending);
    CHECK(fresh.value().second_entry == entry_phase::pending);
    CHECK(fresh.value().comparison == comparison_phase::pending);
    CHECK(fresh.value().total_items == 3);
    CHECK_FALSE(fresh.value().complete);

    REQUIRE(fx.engine.lifecycle().start_first_entry(id, "alice").is_ok());
    CHECK(fx.engine.lifecycle().get_status(id).value().first_entry ==
          entry_phase::in_progress);

    REQUIRE(fx.engine.lifecycle().mark_first_entry_complete(id, "alice").is_ok());
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(id, "bob", dde_fixture::diabp_mismatch())
                .is_ok());

    auto with_open = fx.engine.lifecycle().get_status(id).value();
    CHECK(with_open.first_entry == entry_phase::complete);
    CHECK(with_open.first_entry_by == "alice");
    CHECK(with_open.second_entry == entry_phase::complete);
    CHECK(with_open.second_entry_by == "bob");
    CHECK(with_open.comparison == comparison_phase::discrepancies);
    CHECK(with_open.open_discrepancies == 1);

    auto discrepancy = fx.engine.discrepancies().list_for_form_instance(id).value()[0];
    resolution_request request;
    request.discrepancy_id = discrepancy.discrepancy_id;
    request.strategy = storage::resolution_strategy::second_correct;
    request.resolver_id = "carol";
    REQUIRE(fx.engine.discrepancies().resolve(request).is_ok());

    auto resolved = fx.engine.lifecycle().get_status(id).value();
    CHECK(resolved.comparison == comparison_phase::resolved);
    CHECK(resolved.open_discrepancies == 0);
    CHECK(resolved.resolved_discrepancies == 1);

    REQUIRE(fx.engine.lifecycle().finalize(id, "carol").is_ok());
    auto done = fx.engine.lifecycle().get_status(id).value();
    CHECK(done.complete);
    CHECK(done.status == form_status::reconciled);
    CHECK(to_string(done.comparison) == "resolved");

    auto missing = fx.engine.lifecycle().get_status(999);
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::record_not_found);
}
