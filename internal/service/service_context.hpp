#pragma once

#include <memory>
#include <string>

namespace labelq::store { class ItemStore; }
namespace labelq::lease { class LeaseManager; }
namespace labelq::taxonomy { class Taxonomy; }
namespace labelq::discovery { class ImageScanner; }

namespace labelq::service {

/*
  Dependency container shared by all services.

  scanner is null when no image directory is configured.
*/
struct ServiceContext {
  std::shared_ptr<labelq::store::ItemStore> store;
  std::shared_ptr<labelq::lease::LeaseManager> leases;
  std::shared_ptr<const labelq::taxonomy::Taxonomy> taxonomy;
  std::shared_ptr<labelq::discovery::ImageScanner> scanner;

  std::string url_prefix = "/images/";
  bool rescan_on_next = false;
  bool strict_taxonomy = false;
};

}
