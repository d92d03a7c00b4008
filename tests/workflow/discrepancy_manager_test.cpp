/**
 * @file discrepancy_manager_test.cpp
 * @brief Unit tests for discrepancy_manager
 */

#include <catch2/catch_test_macros.hpp>

#include "../mocks/dde_test_fixture.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace dde;
using namespace dde::workflow;
using dde::storage::resolution_strategy;
using dde::test::dde_fixture;
namespace vitals = dde::test::vitals;

namespace {

/// Submit a second entry with a DIABP mismatch and return the discrepancy id
auto open_diabp_discrepancy(dde_fixture& fx, int64_t& form_id) -> int64_t {
    form_id = fx.seed_first_entry_complete("alice");
    auto outcome = fx.engine.lifecycle().submit_second_entry(
        form_id, "bob", dde_fixture::diabp_mismatch());
    REQUIRE(outcome.is_ok());
    for (const auto& field : outcome.value().comparison.fields) {
        if (field.item_id == vitals::diabp) {
            REQUIRE(field.discrepancy_id.has_value());
            return *field.discrepancy_id;
        }
    }
    FAIL("DIABP discrepancy not created");
    return 0;
}

auto request_for(int64_t discrepancy_id, resolution_strategy strategy,
                 std::optional<std::string> new_value = std::nullopt)
    -> resolution_request {
    resolution_request request;
    request.discrepancy_id = discrepancy_id;
    request.strategy = strategy;
    request.new_value = std::move(new_value);
    request.resolver_id = "carol";
    return request;
}

}  // namespace

// ============================================================================
// Strategies
// ============================================================================

TEST_CASE("discrepancy_manager resolution strategies", "[discrepancy][resolve]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);

    SECTION("first_correct keeps the first value") {
        REQUIRE(fx.engine.discrepancies()
                    .resolve(request_for(discrepancy_id, resolution_strategy::first_correct))
                    .is_ok());
        CHECK(fx.field_value(form_id, vitals::diabp) == "80");
        auto record = fx.storage->get_discrepancy(discrepancy_id).value();
        CHECK(record.resolved_value == "80");
    }

    SECTION("second_correct takes the second value") {
        REQUIRE(fx.engine.discrepancies()
                    .resolve(request_for(discrepancy_id, resolution_strategy::second_correct))
                    .is_ok());
        CHECK(fx.field_value(form_id, vitals::diabp) == "85");
    }

    SECTION("new_value writes the supplied value") {
        REQUIRE(fx.engine.discrepancies()
                    .resolve(request_for(discrepancy_id, resolution_strategy::new_value,
                                         std::string("83")))
                    .is_ok());
        CHECK(fx.field_value(form_id, vitals::diabp) == "83");
    }

    SECTION("adjudicated writes the supplied value") {
        REQUIRE(fx.engine.discrepancies()
                    .resolve(request_for(discrepancy_id, resolution_strategy::adjudicated,
                                         std::string("82")))
                    .is_ok());
        CHECK(fx.field_value(form_id, vitals::diabp) == "82");

        auto record = fx.storage->get_discrepancy(discrepancy_id).value();
        CHECK_FALSE(record.is_open());
        CHECK(record.strategy == resolution_strategy::adjudicated);
        CHECK(record.resolved_value == "82");
        CHECK(record.resolved_by == "carol");
        CHECK(record.resolved_at != std::chrono::system_clock::time_point{});
    }

    CHECK(fx.engine.discrepancies().count_open(form_id).value() == 0);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("discrepancy_manager validates requests", "[discrepancy][validation]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);

    SECTION("new_value without a value") {
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::new_value));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
    }

    SECTION("adjudicated without a value") {
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::adjudicated));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
    }

    SECTION("new_value with an empty value") {
        auto audit_before = fx.storage->audit_entries().size();
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::new_value, std::string()));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
        CHECK(fx.field_value(form_id, vitals::diabp) == "80");
        CHECK(fx.storage->get_discrepancy(discrepancy_id).value().is_open());
        CHECK(fx.storage->audit_entries().size() == audit_before);
    }

    SECTION("validation happens before lookup") {
        auto result = fx.engine.discrepancies().resolve(
            request_for(999, resolution_strategy::adjudicated));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
    }

    SECTION("missing resolver") {
        auto request = request_for(discrepancy_id, resolution_strategy::first_correct);
        request.resolver_id.clear();
        auto result = fx.engine.discrepancies().resolve(request);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_error);
    }

    SECTION("unknown discrepancy") {
        auto result = fx.engine.discrepancies().resolve(
            request_for(999, resolution_strategy::first_correct));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::record_not_found);
    }

    CHECK(fx.engine.discrepancies().count_open(form_id).value() == 1);
}

TEST_CASE("discrepancy_manager rejects a second resolution", "[discrepancy][resolve]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);

    REQUIRE(fx.engine.discrepancies()
                .resolve(request_for(discrepancy_id, resolution_strategy::second_correct))
                .is_ok());

    auto again = fx.engine.discrepancies().resolve(
        request_for(discrepancy_id, resolution_strategy::first_correct));
    REQUIRE(again.is_err());
    CHECK(again.error().code == error_codes::invalid_state);
    CHECK(fx.field_value(form_id, vitals::diabp) == "85");
}

TEST_CASE("discrepancy_manager concurrent resolutions", "[discrepancy][concurrency]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);

    constexpr int contenders = 6;
    std::atomic<int> resolved{0};
    std::atomic<int> already_resolved{0};
    std::atomic<int> other{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < contenders; ++i) {
        threads.emplace_back([&, i] {
            auto request = request_for(discrepancy_id, resolution_strategy::new_value,
                                       std::to_string(80 + i));
            request.resolver_id = "resolver-" + std::to_string(i);
            auto result = fx.engine.discrepancies().resolve(request);
            if (result.is_ok()) {
                ++resolved;
            } else if (result.error().code == error_codes::invalid_state) {
                ++already_resolved;
            } else {
                ++other;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(resolved == 1);
    CHECK(already_resolved == contenders - 1);
    CHECK(other == 0);

    std::size_t resolutions = 0;
    for (const auto& entry : fx.storage->audit_entries()) {
        if (entry.entity_name == storage::audit_entity::resolution) {
            ++resolutions;
        }
    }
    CHECK(resolutions == 1);

    auto record = fx.storage->get_discrepancy(discrepancy_id).value();
    CHECK_FALSE(record.is_open());
    CHECK(fx.field_value(form_id, vitals::diabp) == record.resolved_value);
}

// ============================================================================
// Audit
// ============================================================================

TEST_CASE("discrepancy_manager audits each resolution", "[discrepancy][audit]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);
    auto before = fx.storage->audit_entries().size();

    SECTION("default reason names the strategy") {
        REQUIRE(fx.engine.discrepancies()
                    .resolve(request_for(discrepancy_id, resolution_strategy::second_correct))
                    .is_ok());

        auto audit = fx.storage->audit_entries();
        REQUIRE(audit.size() == before + 1);
        const auto& entry = audit.back();
        CHECK(entry.user_id == "carol");
        CHECK(entry.audit_table == storage::audit_table::field_data);
        CHECK(entry.entity_name == storage::audit_entity::resolution);
        CHECK(entry.old_value == "80");
        CHECK(entry.new_value == "85");
        CHECK(entry.reason == "DDE resolved as second_correct");
        CHECK(entry.form_instance_id == form_id);
    }

    SECTION("notes become the reason") {
        auto request = request_for(discrepancy_id, resolution_strategy::first_correct);
        request.notes = "Verified against source document";
        REQUIRE(fx.engine.discrepancies().resolve(request).is_ok());

        CHECK(fx.storage->audit_entries().back().reason ==
              "Verified against source document");
        CHECK(fx.storage->get_discrepancy(discrepancy_id).value().resolution_notes ==
              "Verified against source document");
    }
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_CASE("discrepancy_manager leaves nothing behind on failure", "[discrepancy][atomicity]") {
    dde_fixture fx;
    int64_t form_id = 0;
    auto discrepancy_id = open_diabp_discrepancy(fx, form_id);
    auto audit_before = fx.storage->audit_entries().size();

    SECTION("audit write fails") {
        fx.storage->fail_audit_writes(true);
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::second_correct));
        fx.storage->fail_audit_writes(false);

        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::audit_write_failed);
    }

    SECTION("discrepancy update fails") {
        fx.storage->fail_discrepancy_updates(true);
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::second_correct));
        fx.storage->fail_discrepancy_updates(false);

        REQUIRE(result.is_err());
    }

    SECTION("commit fails") {
        fx.storage->fail_commits(true);
        auto result = fx.engine.discrepancies().resolve(
            request_for(discrepancy_id, resolution_strategy::second_correct));
        fx.storage->fail_commits(false);

        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::database_transaction_error);
    }

    CHECK(fx.field_value(form_id, vitals::diabp) == "80");
    CHECK(fx.storage->get_discrepancy(discrepancy_id).value().is_open());
    CHECK(fx.storage->audit_entries().size() == audit_before);
    CHECK_FALSE(fx.engine.locks().is_locked(
        entity_lock_manager::form_instance_key(form_id)));
    CHECK_FALSE(fx.engine.locks().is_locked(
        entity_lock_manager::discrepancy_key(discrepancy_id)));
}

TEST_CASE("discrepancy_manager lists discrepancies", "[discrepancy]") {
    dde_fixture fx;
    auto form_id = fx.seed_first_entry_complete("alice");
    REQUIRE(fx.engine.lifecycle()
                .submit_second_entry(form_id, "bob",
                                     {{vitals::sysbp, "121"}, {vitals::diabp, "85"},
                                      {vitals::sex, "Male"}})
                .is_ok());

    auto list = fx.engine.discrepancies().list_for_form_instance(form_id);
    REQUIRE(list.is_ok());
    REQUIRE(list.value().size() == 2);
    CHECK(list.value()[0].item_id == vitals::sysbp);
    CHECK(list.value()[1].item_id == vitals::diabp);
    CHECK(fx.engine.discrepancies().count_open(form_id).value() == 2);
}
