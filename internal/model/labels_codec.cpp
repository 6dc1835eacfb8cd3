#include "labels_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace labelq::model {

std::string LabelsToJson(const Labels& labels, bool pretty) {
  google::protobuf::Struct object;
  for (const auto& [category, values] : labels) {
    if (values.empty()) continue;
    auto* list = (*object.mutable_fields())[category].mutable_list_value();
    for (const auto& value : values) {
      list->add_values()->set_string_value(value);
    }
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize labels: " + std::string(status.message()));
  }
  return json;
}

Labels LabelsFromJson(const std::string& json) {
  if (json.empty()) {
    return {};
  }

  google::protobuf::Struct object;
  auto status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw std::runtime_error("Corrupt labels column: " + std::string(status.message()));
  }

  Labels labels;
  for (const auto& [category, value] : object.fields()) {
    if (value.kind_case() != google::protobuf::Value::kListValue) {
      throw std::runtime_error("Corrupt labels column: category '" + category + "' is not a list");
    }
    for (const auto& label : value.list_value().values()) {
      if (label.kind_case() != google::protobuf::Value::kStringValue) {
        throw std::runtime_error("Corrupt labels column: non-string label in '" + category + "'");
      }
      labels[category].insert(label.string_value());
    }
  }
  return labels;
}

labelq::queue::v1::LabelSelection ToProto(const Labels& labels) {
  labelq::queue::v1::LabelSelection selection;
  for (const auto& [category, values] : labels) {
    if (values.empty()) continue;
    auto& out = (*selection.mutable_categories())[category];
    for (const auto& value : values) {
      out.add_values(value);
    }
  }
  return selection;
}

Labels FromProto(const labelq::queue::v1::LabelSelection& selection) {
  Labels labels;
  for (const auto& [category, values] : selection.categories()) {
    if (values.values().empty()) continue;
    auto& out = labels[category];
    for (const auto& value : values.values()) {
      out.insert(value);
    }
  }
  return labels;
}

} // namespace labelq::model
