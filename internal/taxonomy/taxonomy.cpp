#include "taxonomy.hpp"

#include "internal/util/errors.hpp"

namespace labelq::taxonomy {

Taxonomy::Taxonomy(const labelq::runtime::config::RuntimeConfig& config) {
  categories_.reserve(static_cast<size_t>(config.categories_size()));
  for (const auto& category_config : config.categories()) {
    labelq::queue::v1::Category category;
    category.set_id(category_config.id());
    category.set_name(category_config.name());

    auto& ids = label_ids_[category_config.id()];
    for (const auto& label_config : category_config.labels()) {
      auto* label = category.add_labels();
      label->set_id(label_config.id());
      label->set_name(label_config.name());
      label->set_shortcut(label_config.shortcut());
      ids.insert(label_config.id());
    }

    categories_.push_back(std::move(category));
  }
}

bool Taxonomy::Contains(const std::string& category_id, const std::string& label_id) const {
  auto it = label_ids_.find(category_id);
  return it != label_ids_.end() && it->second.contains(label_id);
}

void Taxonomy::Validate(const labelq::model::Labels& labels) const {
  for (const auto& [category_id, values] : labels) {
    if (!label_ids_.contains(category_id)) {
      throw labelq::util::ValidationError("unknown label category '" + category_id + "'");
    }
    for (const auto& value : values) {
      if (!Contains(category_id, value)) {
        throw labelq::util::ValidationError("unknown label '" + value + "' in category '" + category_id + "'");
      }
    }
  }
}

} // namespace labelq::taxonomy
