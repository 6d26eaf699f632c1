#include "internal/indexing/payload_sanitizer.hpp"

#include <cmath>
#include <optional>

namespace tasktree::indexing {

namespace {

using google::protobuf::Value;

std::optional<Value> Clean(const Value& v, bool null_allowed);

google::protobuf::Struct CleanStruct(const google::protobuf::Struct& in, const std::set<std::string>* nullable) {
  google::protobuf::Struct out;
  for (const auto& [key, value] : in.fields()) {
    const bool null_allowed = nullable != nullptr && nullable->count(key) > 0;
    if (auto cleaned = Clean(value, null_allowed)) {
      (*out.mutable_fields())[key] = std::move(*cleaned);
    }
  }
  return out;
}

std::optional<Value> Clean(const Value& v, bool null_allowed) {
  switch (v.kind_case()) {
    case Value::KIND_NOT_SET:
      return std::nullopt;
    case Value::kNullValue:
      if (!null_allowed) return std::nullopt;
      return v;
    case Value::kStringValue:
      if (v.string_value().empty()) return std::nullopt;
      return v;
    case Value::kNumberValue:
      if (!std::isfinite(v.number_value())) return std::nullopt;
      return v;
    case Value::kBoolValue:
      return v;
    case Value::kStructValue: {
      Value out;
      *out.mutable_struct_value() = CleanStruct(v.struct_value(), nullptr);
      return out;
    }
    case Value::kListValue: {
      Value out;
      auto* list = out.mutable_list_value();
      for (const auto& item : v.list_value().values()) {
        if (auto cleaned = Clean(item, false)) {
          *list->add_values() = std::move(*cleaned);
        }
      }
      return out;
    }
  }
  return std::nullopt;
}

} // namespace

const std::set<std::string>& NullableRelationshipFields() {
  static const std::set<std::string> kFields = {"parent_task_id", "root_task_id"};
  return kFields;
}

google::protobuf::Struct SanitizePayload(const google::protobuf::Struct& payload, const std::set<std::string>& nullable) {
  return CleanStruct(payload, &nullable);
}

} // namespace tasktree::indexing
