#include "image_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace labelq::discovery {

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

ImageScanner::ImageScanner(std::shared_ptr<labelq::store::ItemStore> store, std::filesystem::path directory,
                           const std::vector<std::string>& extensions)
    : store_(std::move(store)), directory_(std::move(directory)) {
  if (!store_) throw std::invalid_argument("image scanner: item store is required");
  if (directory_.empty()) throw std::invalid_argument("image scanner: directory is required");

  for (const auto& ext : extensions) {
    auto normalized = Lower(ext);
    if (!normalized.empty() && normalized.front() == '.') normalized.erase(0, 1);
    if (!normalized.empty()) extensions_.insert(std::move(normalized));
  }
}

bool ImageScanner::Matches(const std::filesystem::path& file) const {
  auto ext = file.extension().string();
  if (ext.size() < 2) return false;
  return extensions_.contains(Lower(ext.substr(1)));
}

std::vector<std::string> ImageScanner::ListImages() const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("image scanner: cannot create " + directory_.string() + ": " + ec.message());
  }

  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;
    if (!Matches(entry.path())) continue;
    names.push_back(entry.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

size_t ImageScanner::Scan() {
  std::lock_guard lock(scan_mutex_);

  const auto names = ListImages();
  const auto known = store_->KnownNames();

  size_t added = 0;
  for (const auto& name : names) {
    if (known.contains(name)) continue;
    store_->UpsertIfAbsent(name);
    ++added;
  }

  if (added > 0) {
    LABELQ_LOG_INFO("image scan added items", {labelq::observability::StringField("directory", directory_.string()),
                                                labelq::observability::IntField("added", static_cast<int64_t>(added)),
                                                labelq::observability::IntField("seen", static_cast<int64_t>(names.size()))});
  }
  return added;
}

} // namespace labelq::discovery
