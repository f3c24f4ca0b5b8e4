#include "test_framework.hpp"

#include "leakguard/records/factory.hpp"
#include "leakguard/records/json_codec.hpp"
#include "leakguard/records/json_source.hpp"
#include "leakguard/records/sqlite_source.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

constexpr const char *kCompanyDatabase = R"({
  "Acme Robotics": {
    "internal": {
      "industry": "Industrial Automation",
      "products": [
        {"name": "Falcon Arm", "revenue_contribution": "40% of revenue"},
        {"name": "Nimbus Controller"}
      ],
      "partnerships": [
        {"partner_name": "Orion Logistics", "relationship_type": "Strategic",
         "details": "Joint warehouse automation pilot"}
      ],
      "methodologies": ["Lean Sprint Mapping"],
      "kpis": ["Customer retention 94%"],
      "client_profiles": [],
      "financial_estimates": "$50M ARR",
      "expertise_areas": ["Computer vision"],
      "risk_category": "High",
      "notes": null
    },
    "external": {"website": "https://acme.example"}
  },
  "Bare Holdings": {"external": {"website": "https://bare.example"}}
})";

} // namespace

void register_records_tests(std::vector<leakguard::tests::TestCase> &tests) {
  using leakguard::tests::require;
  namespace records = leakguard::records;
  namespace testing = leakguard::testing;

  tests.push_back({"records_parse_company_database", [] {
                     const auto store = records::parse_company_database(kCompanyDatabase);
                     require(store.ok(), store.error());
                     require(store.value().size() == 2, "expected two entities");
                     require(store.value().names()[0] == "Acme Robotics", "order should be kept");

                     const auto *acme = store.value().find("Acme Robotics");
                     require(acme != nullptr, "acme should load");
                     require(acme->products.size() == 2, "expected two products");
                     require(acme->products[0].revenue_note.has_value() &&
                                 *acme->products[0].revenue_note == "40% of revenue",
                             "revenue note mismatch");
                     require(!acme->products[1].revenue_note.has_value(),
                             "missing revenue note should be absent");
                     require(acme->partnerships.size() == 1 &&
                                 acme->partnerships[0].partner_name == "Orion Logistics",
                             "partnership mismatch");
                     require(acme->client_profiles.empty(), "empty list should stay empty");
                     require(!acme->notes.has_value(), "null notes should be absent");
                     require(acme->financial_estimates.value_or("") == "$50M ARR",
                             "financial estimate mismatch");

                     const auto *bare = store.value().find("Bare Holdings");
                     require(bare != nullptr, "entity without internal should still load");
                     require(bare->products.empty() && !bare->risk_category.has_value(),
                             "entity without internal should be empty");
                   }});

  tests.push_back({"records_parse_rejects_non_objects", [] {
                     require(!records::parse_company_database("[1, 2]").ok(),
                             "array top level should fail");
                     require(!records::parse_company_database(R"({"Acme": "text"})").ok(),
                             "string entry should fail");
                     require(!records::parse_record_json("Acme", "[]").ok(),
                             "non-object record should fail");
                   }});

  tests.push_back({"records_json_codec_preserves_fields", [] {
                     const auto original = testing::sample_record();
                     const auto json = records::record_to_json(original);
                     const auto parsed = records::parse_record_json(original.entity_name, json);
                     require(parsed.ok(), parsed.error());
                     const auto &copy = parsed.value();
                     require(copy.industry == original.industry, "industry mismatch");
                     require(copy.products.size() == original.products.size(), "products mismatch");
                     require(copy.partnerships[0].details == original.partnerships[0].details,
                             "details mismatch");
                     require(copy.kpis == original.kpis, "kpis mismatch");
                     require(copy.notes == original.notes, "notes mismatch");
                   }});

  tests.push_back({"records_store_replaces_in_place", [] {
                     records::RecordStore store;
                     records::ConfidentialRecord first;
                     first.entity_name = "One";
                     records::ConfidentialRecord second;
                     second.entity_name = "Two";
                     store.add(first);
                     store.add(second);

                     records::ConfidentialRecord replacement;
                     replacement.entity_name = "One";
                     replacement.notes = "updated";
                     store.add(replacement);

                     require(store.size() == 2, "replacement should not grow the store");
                     require(store.names()[0] == "One", "replacement keeps position");
                     require(store.find("One")->notes.value_or("") == "updated",
                             "replacement should win");
                     require(store.find("Missing") == nullptr, "unknown entity is null");
                   }});

  tests.push_back({"records_known_risk_categories", [] {
                     require(records::is_known_risk_category("High"), "High is known");
                     require(records::is_known_risk_category(" critical "), "critical is known");
                     require(!records::is_known_risk_category("Severe"), "Severe is not known");
                   }});

  tests.push_back({"records_json_source_save_and_load", [] {
                     testing::TempWorkspace workspace;
                     records::JsonRecordSource missing(workspace.path() / "missing.json");
                     require(!missing.load().ok(), "missing database should fail");

                     records::JsonRecordSource source(workspace.path() / "db" / "company.json");
                     const records::RecordStore store({testing::sample_record()});
                     const auto saved = source.save(store);
                     require(saved.ok(), saved.error());

                     const auto loaded = source.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().size() == 1, "expected one record");
                     require(loaded.value().records()[0].risk_category.value_or("") == "High",
                             "risk category should survive");
                   }});

  tests.push_back({"records_sqlite_source_put_load_remove", [] {
                     testing::TempWorkspace workspace;
                     records::SqliteRecordSource source(workspace.path() / "records.db");

                     records::ConfidentialRecord beta;
                     beta.entity_name = "Beta";
                     beta.methodologies = {"Beta Method"};
                     records::ConfidentialRecord alpha;
                     alpha.entity_name = "Alpha";

                     require(source.put(beta).ok(), "put beta");
                     require(source.put(alpha).ok(), "put alpha");
                     beta.methodologies = {"Beta Method v2"};
                     require(source.put(beta).ok(), "update beta");

                     const auto count = source.count();
                     require(count.ok() && count.value() == 2, "expected two rows");

                     const auto loaded = source.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().names()[0] == "Beta", "insertion order expected");
                     require(loaded.value().records()[0].methodologies[0] == "Beta Method v2",
                             "update should be visible");

                     const auto removed = source.remove("Beta");
                     require(removed.ok() && removed.value(), "beta should be removed");
                     const auto removed_again = source.remove("Beta");
                     require(removed_again.ok() && !removed_again.value(),
                             "second remove is a no-op");
                     require(!source.put(records::ConfidentialRecord{}).ok(),
                             "unnamed record should be rejected");
                   }});

  tests.push_back({"records_sqlite_put_all_imports_store", [] {
                     testing::TempWorkspace workspace;
                     const auto parsed = records::parse_company_database(kCompanyDatabase);
                     require(parsed.ok(), parsed.error());

                     records::SqliteRecordSource source(workspace.path() / "import.sqlite");
                     const auto status = source.put_all(parsed.value());
                     require(status.ok(), status.error());
                     const auto loaded = source.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().names() == parsed.value().names(),
                             "imported names should match");
                   }});

  tests.push_back({"records_factory_selects_backend", [] {
                     require(records::backend_for_path("/tmp/x.db") == "sqlite", ".db is sqlite");
                     require(records::backend_for_path("/tmp/x.SQLITE3") == "sqlite",
                             "suffix check is case-insensitive");
                     require(records::backend_for_path("/tmp/x.json") == "json", ".json is json");

                     testing::TempWorkspace workspace;
                     leakguard::config::RecordsConfig config;
                     config.backend = "sqlite";
                     config.path = (workspace.path() / "factory.db").string();
                     auto source = records::create_record_source(config);
                     require(source.ok(), source.error());
                     require(source.value()->name() == "sqlite", "expected sqlite source");

                     config.backend = "csv";
                     require(!records::create_record_source(config).ok(),
                             "unknown backend should fail");
                   }});
}
