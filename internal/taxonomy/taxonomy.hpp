#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/item.hpp"
#include "labelq/queue/v1.hpp"

namespace labelq::taxonomy {

/*
  Immutable view of the configured label categories.

  Categories keep their configured order. Validate() only checks ids;
  names and shortcuts are presentation data.
*/
class Taxonomy {
 public:
  Taxonomy() = default;
  explicit Taxonomy(const labelq::runtime::config::RuntimeConfig& config);

  const std::vector<labelq::queue::v1::Category>& Categories() const { return categories_; }

  bool Empty() const { return categories_.empty(); }

  bool Contains(const std::string& category_id, const std::string& label_id) const;

  // Throws util::ValidationError naming the first unknown category or label.
  void Validate(const labelq::model::Labels& labels) const;

 private:
  std::vector<labelq::queue::v1::Category>     categories_;
  std::map<std::string, std::set<std::string>> label_ids_;
};

} // namespace labelq::taxonomy
