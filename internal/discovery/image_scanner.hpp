#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/store/item_store.hpp"

namespace labelq::discovery {

/*
  ImageScanner

  Lists regular files directly inside the image directory whose extension
  is in the configured set (compared case-insensitively) and registers the
  ones the store has not seen yet. New names are inserted in sorted order,
  so ids follow file name order within a scan.

  Scans are serialized; a caller arriving during a scan waits for it and
  then runs its own (cheap, it finds nothing new).
*/
class ImageScanner {
 public:
  ImageScanner(std::shared_ptr<labelq::store::ItemStore> store, std::filesystem::path directory, const std::vector<std::string>& extensions);

  // Returns the number of items added.
  size_t Scan();

  // Sorted file names eligible for registration; creates the directory when missing.
  std::vector<std::string> ListImages() const;

  const std::filesystem::path& Directory() const { return directory_; }

 private:
  bool Matches(const std::filesystem::path& file) const;

  std::shared_ptr<labelq::store::ItemStore> store_;
  std::filesystem::path                     directory_;
  std::set<std::string>                     extensions_; // lower-case, without dot

  std::mutex scan_mutex_;
};

} // namespace labelq::discovery
