#pragma once

#include "prodsim/core/ids.h"
#include "prodsim/core/time.h"

#include <string>

namespace prodsim::domain {

// Catalog item. Read-only to prodsim: the catalog owns it.
struct Item {
  core::ItemId item_id;
  std::string name;
  std::string category;
  double price{0.0};
  std::string description;
  std::string image_ref;
  core::Timestamp last_modified{};
};

// Raw review aggregate row. sentiment_raw is the text score produced upstream and is untrusted.
struct ReviewRecord {
  core::ItemId item_id;
  double rating{0.0};
  std::string sentiment_raw;
};

}  // namespace prodsim::domain
