#include "sidecar_exporter.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/model/labels_codec.hpp"
#include "internal/observability/logging.hpp"

namespace labelq::exporter {

using namespace labelq::queue::v1;

std::filesystem::path SidecarPath(const std::filesystem::path& image_dir, const std::string& name) {
  std::filesystem::path relative(name);
  if (name.empty() || relative.is_absolute() || relative.has_root_name()) return {};
  for (const auto& part : relative) {
    if (part == "..") return {};
  }
  relative.replace_extension(".json");
  return image_dir / relative;
}

namespace {

// AdminService.ListItems never returns more than this per page.
constexpr uint32_t kMaxPageSize = 1000;

void WriteSidecar(const std::filesystem::path& path, const std::string& json) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open " + path.string() + " for writing");
  }
  out << json;
  if (json.empty() || json.back() != '\n') out << '\n';
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to write " + path.string());
  }
}

} // namespace

SidecarSummary ExportLabelSidecars(const ListPageFn& list_page, const SidecarOptions& options) {
  if (!list_page) throw std::invalid_argument("export sidecars: list function is required");
  if (options.image_dir.empty()) throw std::invalid_argument("export sidecars: image directory is required");

  SidecarSummary summary;

  ListItemsRequest req;
  req.set_status(ITEM_STATUS_DONE);
  req.set_limit(options.page_size == 0 ? 500 : std::min(options.page_size, kMaxPageSize));

  for (;;) {
    const auto page = list_page(req);

    for (const auto& record : page.records()) {
      const auto labels = labelq::model::FromProto(record.labels());
      if (record.skipped() || !labelq::model::HasSelection(labels)) {
        ++summary.skipped;
        continue;
      }

      const auto path = SidecarPath(options.image_dir, record.name());
      if (path.empty()) {
        LABELQ_LOG_WARN("sidecar skipped: unsafe item name", {labelq::observability::IntField("item_id", static_cast<int64_t>(record.id())),
                                                             labelq::observability::StringField("name", record.name())});
        ++summary.skipped;
        continue;
      }

      if (!options.overwrite && std::filesystem::exists(path)) {
        ++summary.skipped;
        continue;
      }

      WriteSidecar(path, labelq::model::LabelsToJson(labels, true));
      ++summary.written;
    }

    // done items never change state, so offset paging is stable
    if (static_cast<uint32_t>(page.records_size()) < req.limit()) break;
    req.set_offset(req.offset() + req.limit());
  }

  LABELQ_LOG_INFO("label sidecars exported", {labelq::observability::StringField("image_dir", options.image_dir.string()),
                                              labelq::observability::IntField("written", static_cast<int64_t>(summary.written)),
                                              labelq::observability::IntField("skipped", static_cast<int64_t>(summary.skipped))});
  return summary;
}

} // namespace labelq::exporter
