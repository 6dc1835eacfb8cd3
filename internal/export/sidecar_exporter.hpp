#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "labelq/queue/v1.hpp"

namespace labelq::exporter {

// Fetches one page of item records, from a local AdminService or over gRPC.
using ListPageFn = std::function<labelq::queue::v1::ListItemsResponse(const labelq::queue::v1::ListItemsRequest&)>;

struct SidecarOptions {
  std::filesystem::path image_dir;
  bool                  overwrite = true;
  std::uint32_t         page_size = 500;
};

struct SidecarSummary {
  std::uint64_t written = 0;
  std::uint64_t skipped = 0;
};

/*
  Writes the labels of every finished item next to its image, as
  <image_dir>/<name without extension>.json.

  Items finished with Skip carry no labels and get no file. With
  overwrite off an existing sidecar is left untouched and counted as
  skipped. Names that would escape image_dir are skipped as well.

  Throws std::runtime_error when a file cannot be written.
*/
SidecarSummary ExportLabelSidecars(const ListPageFn& list_page, const SidecarOptions& options);

// <image_dir>/a/b.png -> <image_dir>/a/b.json; empty if name is not a safe relative path.
std::filesystem::path SidecarPath(const std::filesystem::path& image_dir, const std::string& name);

} // namespace labelq::exporter
