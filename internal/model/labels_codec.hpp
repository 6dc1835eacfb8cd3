#pragma once

#include <string>

#include "internal/model/item.hpp"
#include "labelq/queue/v1.hpp"

namespace labelq::model {

/*
  Labels <-> JSON / protobuf.

  Persisted form is a JSON object of category id -> array of label ids,
  e.g. {"hands":["disfigured hand"]}. Categories with no labels are dropped.
*/

// pretty adds indentation and newlines, for files meant to be read by people.
std::string LabelsToJson(const Labels& labels, bool pretty = false);
Labels      LabelsFromJson(const std::string& json);

labelq::queue::v1::LabelSelection ToProto(const Labels& labels);
Labels                            FromProto(const labelq::queue::v1::LabelSelection& selection);

} // namespace labelq::model
