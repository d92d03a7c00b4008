/**
 * @file dde_test_fixture.hpp
 * @brief Engine wired to an in-memory store, with seeding helpers
 */

#pragma once

#include "memory_dde_storage.hpp"

#include <dde/workflow/dde_engine.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dde::test {

/// Item identifiers seeded by dde_fixture::seed_vitals()
namespace vitals {
    constexpr int64_t sysbp = 101;
    constexpr int64_t diabp = 102;
    constexpr int64_t sex = 103;
}  // namespace vitals

struct dde_fixture {
    std::shared_ptr<memory_dde_storage> storage{std::make_shared<memory_dde_storage>()};
    workflow::dde_engine engine;

    dde_fixture() : engine(storage, make_config()) {}

    static auto make_config() -> workflow::dde_workflow_config {
        workflow::dde_workflow_config config;
        config.lock_wait_timeout = std::chrono::milliseconds{200};
        return config;
    }

    /// Form instance with SYSBP=120, DIABP=80, SEX=Male as first-entry values
    auto seed_vitals(bool double_entry_required = true,
                     const std::string& site_id = "SITE01") -> int64_t {
        auto id = storage->add_form(site_id + "-0001", site_id, double_entry_required);
        storage->add_field(id, vitals::sysbp, "SYSBP", std::string("120"));
        storage->add_field(id, vitals::diabp, "DIABP", std::string("80"));
        storage->add_field(id, vitals::sex, "SEX", std::string("Male"));
        return id;
    }

    /// Seed a form instance and mark its first entry complete
    auto seed_first_entry_complete(const std::string& first_user = "alice",
                                   bool double_entry_required = true,
                                   const std::string& site_id = "SITE01") -> int64_t {
        auto id = seed_vitals(double_entry_required, site_id);
        auto done = engine.lifecycle().mark_first_entry_complete(id, first_user);
        if (done.is_err()) {
            return 0;
        }
        return id;
    }

    auto status_of(int64_t form_instance_id) -> core::form_status {
        return storage->get_form_instance(form_instance_id).value().status;
    }

    auto field_value(int64_t form_instance_id, int64_t item_id) -> std::string {
        auto fields = storage->get_field_values(form_instance_id).value();
        for (const auto& field : fields) {
            if (field.item_id == item_id) {
                return field.value.value_or("");
            }
        }
        return {};
    }

    /// Second entry matching the seeded values except for DIABP
    static auto diabp_mismatch() -> storage::second_entry_snapshot {
        return {{vitals::sysbp, "120"}, {vitals::diabp, "85"}, {vitals::sex, "male "}};
    }

    static auto all_match() -> storage::second_entry_snapshot {
        return {{vitals::sysbp, "120"}, {vitals::diabp, "80"}, {vitals::sex, " MALE"}};
    }
};

}  // namespace dde::test
