#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "unisrv/api/instances.hpp"
#include "unisrv/api/resolve.hpp"

namespace {

namespace api = unisrv::api;

std::vector<api::ServiceSummary> sample_services() {
  return {
      {.id = "aaaa1111-0000-4000-8000-000000000001", .name = "web", .type = "http"},
      {.id = "aaaa2222-0000-4000-8000-000000000002", .name = "api", .type = "http"},
      {.id = "bbbb3333-0000-4000-8000-000000000003", .name = "dup", .type = "http"},
      {.id = "cccc4444-0000-4000-8000-000000000004", .name = "dup", .type = "tcp"},
  };
}

api::Instance instance(const std::string &id, const std::string &name, api::InstanceState state) {
  api::Instance i;
  i.id = id;
  i.name = name;
  i.state = state;
  return i;
}

} // namespace

void register_resolve_tests(std::vector<unisrv::tests::TestCase> &tests) {
  using unisrv::tests::require;

  tests.push_back({"resolve_full_uuid_is_returned_normalized", [] {
                     const auto r = api::resolve_id("AAAA1111000040008000000000000001",
                                                    sample_services(), "service");
                     require(r.ok(), r.error());
                     require(r.value() == "aaaa1111-0000-4000-8000-000000000001", r.value());
                   }});

  tests.push_back({"resolve_unknown_uuid_passes_through", [] {
                     const auto r = api::resolve_id("dddd5555-0000-4000-8000-000000000005",
                                                    sample_services(), "service");
                     require(r.ok(), r.error());
                     require(r.value() == "dddd5555-0000-4000-8000-000000000005", r.value());
                   }});

  tests.push_back({"resolve_exact_name", [] {
                     const auto r = api::resolve_id("api", sample_services(), "service");
                     require(r.ok(), r.error());
                     require(r.value() == "aaaa2222-0000-4000-8000-000000000002", r.value());
                   }});

  tests.push_back({"resolve_name_wins_over_prefix", [] {
                     std::vector<api::ServiceSummary> items = sample_services();
                     items.push_back({.id = "abcd0000-0000-4000-8000-000000000009",
                                      .name = "aaaa",
                                      .type = "http"});
                     const auto r = api::resolve_id("aaaa", items, "service");
                     require(r.ok(), r.error());
                     require(r.value() == "abcd0000-0000-4000-8000-000000000009", r.value());
                   }});

  tests.push_back({"resolve_shared_name_falls_back_to_prefix", [] {
                     const std::vector<api::Instance> items = {
                         instance("cafe0000-0000-4000-8000-000000000001", "worker",
                                  api::InstanceState::Active),
                         instance("1234aaaa-0000-4000-8000-000000000002", "cafe",
                                  api::InstanceState::Active),
                         instance("5678bbbb-0000-4000-8000-000000000003", "cafe",
                                  api::InstanceState::Active),
                     };
                     const auto r = api::resolve_id("cafe", items, "instance");
                     require(r.ok(), r.error());
                     require(r.value() == "cafe0000-0000-4000-8000-000000000001", r.value());
                   }});

  tests.push_back({"resolve_shared_non_hex_name_is_not_found", [] {
                     const auto r = api::resolve_id("dup", sample_services(), "service");
                     require(!r.ok(), "a shared name alone does not pick an item");
                     require(r.error() == "No service found with name or id 'dup'", r.error());
                   }});

  tests.push_back({"resolve_unique_prefix", [] {
                     const auto r = api::resolve_id("BBBB", sample_services(), "service");
                     require(r.ok(), r.error());
                     require(r.value() == "bbbb3333-0000-4000-8000-000000000003", r.value());
                   }});

  tests.push_back({"resolve_ambiguous_prefix", [] {
                     const auto r = api::resolve_id("aaaa", sample_services(), "service");
                     require(!r.ok(), "shared prefix should not resolve");
                     require(r.error() ==
                                 "Ambiguous: 2 services match prefix 'aaaa'. Be more specific.",
                             r.error());
                   }});

  tests.push_back({"resolve_prefix_without_match", [] {
                     const auto r = api::resolve_id("ffff", sample_services(), "service");
                     require(!r.ok(), "unknown prefix should fail");
                     require(r.error() == "No service found matching 'ffff'", r.error());
                   }});

  tests.push_back({"resolve_unknown_name", [] {
                     const auto r = api::resolve_id(" checkout ", sample_services(), "network");
                     require(!r.ok(), "unknown name should fail");
                     require(r.error() == "No network found with name or id 'checkout'", r.error());
                   }});

  tests.push_back({"resolve_active_instance_ignores_stopped", [] {
                     const std::vector<api::Instance> all = {
                         instance("1111aaaa-0000-4000-8000-000000000001", "web_default_ab12_0",
                                  api::InstanceState::Stopped),
                         instance("1111bbbb-0000-4000-8000-000000000002", "web_default_cd34_0",
                                  api::InstanceState::Active),
                     };
                     const auto prefix = api::resolve_active_instance("1111", all);
                     require(prefix.ok(), prefix.error());
                     require(prefix.value() == "1111bbbb-0000-4000-8000-000000000002",
                             prefix.value());

                     const auto stopped = api::resolve_active_instance("web_default_ab12_0", all);
                     require(!stopped.ok(), "stopped instance should not resolve by name");
                     require(stopped.error() ==
                                 "No instance found with name or id 'web_default_ab12_0'",
                             stopped.error());
                   }});
}
