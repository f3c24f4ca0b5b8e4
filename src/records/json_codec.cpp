#include "leakguard/records/json_codec.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/common/json_util.hpp"

#include <sstream>

namespace leakguard::records {

namespace {

bool is_object(const std::string &json) {
  const std::string trimmed = common::trim(json);
  return !trimmed.empty() && trimmed.front() == '{' && trimmed.back() == '}';
}

std::optional<std::string> optional_string(const common::JsonEntries &entries,
                                           const std::string &field) {
  const auto *member = common::json_find_member(entries, field);
  if (member == nullptr || !member->is_string || member->value.empty()) {
    return std::nullopt;
  }
  return member->value;
}

std::string required_string(const common::JsonEntries &entries, const std::string &field) {
  return optional_string(entries, field).value_or("");
}

std::vector<std::string> string_list(const common::JsonEntries &entries,
                                     const std::string &field) {
  const auto *member = common::json_find_member(entries, field);
  if (member == nullptr || member->is_string) {
    return {};
  }
  return common::json_parse_string_array(member->value);
}

std::vector<std::string> object_list(const common::JsonEntries &entries,
                                     const std::string &field) {
  const auto *member = common::json_find_member(entries, field);
  if (member == nullptr || member->is_string) {
    return {};
  }
  return common::json_split_top_level_objects(common::trim(member->value));
}

void write_string(std::ostringstream &out, const std::string &value) {
  out << '"' << common::json_escape(value) << '"';
}

void write_string_list(std::ostringstream &out, const std::vector<std::string> &values) {
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    write_string(out, values[i]);
  }
  out << ']';
}

} // namespace

common::Result<ConfidentialRecord> parse_record_json(const std::string &entity_name,
                                                     const std::string &internal_json) {
  if (!is_object(internal_json)) {
    return common::Result<ConfidentialRecord>::failure("record for '" + entity_name +
                                                       "' is not a JSON object");
  }

  const auto entries = common::json_object_entries(internal_json);

  ConfidentialRecord record;
  record.entity_name = entity_name;
  record.industry = optional_string(entries, "industry");

  for (const auto &product_json : object_list(entries, "products")) {
    const auto product_entries = common::json_object_entries(product_json);
    Product product;
    product.name = required_string(product_entries, "name");
    product.revenue_note = optional_string(product_entries, "revenue_contribution");
    record.products.push_back(std::move(product));
  }

  for (const auto &partnership_json : object_list(entries, "partnerships")) {
    const auto partnership_entries = common::json_object_entries(partnership_json);
    Partnership partnership;
    partnership.partner_name = required_string(partnership_entries, "partner_name");
    partnership.relationship_type = optional_string(partnership_entries, "relationship_type");
    partnership.details = optional_string(partnership_entries, "details");
    record.partnerships.push_back(std::move(partnership));
  }

  record.methodologies = string_list(entries, "methodologies");
  record.kpis = string_list(entries, "kpis");
  record.client_profiles = string_list(entries, "client_profiles");
  record.financial_estimates = optional_string(entries, "financial_estimates");
  record.expertise_areas = string_list(entries, "expertise_areas");
  record.risk_category = optional_string(entries, "risk_category");
  record.notes = optional_string(entries, "notes");

  return common::Result<ConfidentialRecord>::success(std::move(record));
}

std::string record_to_json(const ConfidentialRecord &record) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  const auto key = [&](const char *name) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << name << "\":";
  };

  if (record.industry.has_value()) {
    key("industry");
    write_string(out, *record.industry);
  }

  key("products");
  out << '[';
  for (std::size_t i = 0; i < record.products.size(); ++i) {
    const auto &product = record.products[i];
    if (i > 0) {
      out << ',';
    }
    out << "{\"name\":";
    write_string(out, product.name);
    if (product.revenue_note.has_value()) {
      out << ",\"revenue_contribution\":";
      write_string(out, *product.revenue_note);
    }
    out << '}';
  }
  out << ']';

  key("partnerships");
  out << '[';
  for (std::size_t i = 0; i < record.partnerships.size(); ++i) {
    const auto &partnership = record.partnerships[i];
    if (i > 0) {
      out << ',';
    }
    out << "{\"partner_name\":";
    write_string(out, partnership.partner_name);
    if (partnership.relationship_type.has_value()) {
      out << ",\"relationship_type\":";
      write_string(out, *partnership.relationship_type);
    }
    if (partnership.details.has_value()) {
      out << ",\"details\":";
      write_string(out, *partnership.details);
    }
    out << '}';
  }
  out << ']';

  key("methodologies");
  write_string_list(out, record.methodologies);
  key("kpis");
  write_string_list(out, record.kpis);
  key("client_profiles");
  write_string_list(out, record.client_profiles);
  key("expertise_areas");
  write_string_list(out, record.expertise_areas);

  if (record.financial_estimates.has_value()) {
    key("financial_estimates");
    write_string(out, *record.financial_estimates);
  }
  if (record.risk_category.has_value()) {
    key("risk_category");
    write_string(out, *record.risk_category);
  }
  if (record.notes.has_value()) {
    key("notes");
    write_string(out, *record.notes);
  }

  out << '}';
  return out.str();
}

common::Result<RecordStore> parse_company_database(const std::string &json) {
  if (!is_object(json)) {
    return common::Result<RecordStore>::failure("company database must be a JSON object");
  }

  RecordStore store;
  for (const auto &company : common::json_object_entries(json)) {
    if (company.is_string || !is_object(company.value)) {
      return common::Result<RecordStore>::failure("entry '" + company.key +
                                                  "' is not a JSON object");
    }

    const auto company_entries = common::json_object_entries(company.value);
    const auto *internal = common::json_find_member(company_entries, "internal");
    if (internal == nullptr || internal->is_string || !is_object(internal->value)) {
      ConfidentialRecord empty;
      empty.entity_name = company.key;
      store.add(std::move(empty));
      continue;
    }

    auto record = parse_record_json(company.key, internal->value);
    if (!record.ok()) {
      return common::Result<RecordStore>::failure(record.error());
    }
    store.add(std::move(record.value()));
  }

  return common::Result<RecordStore>::success(std::move(store));
}

std::string company_database_to_json(const RecordStore &store) {
  std::ostringstream out;
  out << "{\n";
  const auto &records = store.records();
  for (std::size_t i = 0; i < records.size(); ++i) {
    out << "  \"" << common::json_escape(records[i].entity_name)
        << "\": {\"internal\": " << record_to_json(records[i]) << '}';
    if (i + 1 < records.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "}\n";
  return out.str();
}

} // namespace leakguard::records
