#include "prodsim/storage/inmemory_repositories.h"
#include "prodsim/storage/sqlite/sqlite_db.h"
#include "prodsim/storage/sqlite/sqlite_repositories.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <memory>

using namespace prodsim;

namespace {

struct Repos {
  std::unique_ptr<storage::ICatalogRepository> catalog;
  std::unique_ptr<storage::IReviewRepository> reviews;
};

Repos make_repos(bool sqlite) {
  if (!sqlite) {
    return {std::make_unique<storage::InMemoryCatalogRepository>(),
            std::make_unique<storage::InMemoryReviewRepository>()};
  }
  auto db = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db.has_value());
  REQUIRE(db.value()->ensure_schema().has_value());
  return {std::make_unique<storage::sqlite::SqliteCatalogRepository>(db.value()),
          std::make_unique<storage::sqlite::SqliteReviewRepository>(db.value())};
}

domain::Item make_item(const std::string& id, const std::string& name, std::int64_t modified_ms) {
  domain::Item item;
  item.item_id = core::ItemId{id};
  item.name = name;
  item.category = "kitchen";
  item.price = 19.5;
  item.description = name + " for everyday use";
  item.last_modified = core::from_unix_millis(modified_ms);
  return item;
}

}  // namespace

TEST_CASE("catalog upsert replaces and list_all orders by item_id", "[storage][catalog]") {
  const bool sqlite = GENERATE(false, true);
  auto repos = make_repos(sqlite);

  repos.catalog->upsert(make_item("sku-2", "Kettle", 1000));
  repos.catalog->upsert(make_item("sku-1", "Toaster", 1000));
  repos.catalog->upsert(make_item("sku-2", "Electric Kettle", 2000));

  const auto all = repos.catalog->list_all();
  REQUIRE(all.size() == 2);
  CHECK(all[0].item_id.value == "sku-1");
  CHECK(all[1].name == "Electric Kettle");

  const auto kettle = repos.catalog->get(core::ItemId{"sku-2"});
  REQUIRE(kettle.has_value());
  CHECK(kettle->price == Catch::Approx(19.5));
  CHECK(core::to_unix_millis(kettle->last_modified) == 2000);
  CHECK_FALSE(repos.catalog->get(core::ItemId{"sku-3"}).has_value());
}

TEST_CASE("reviews are listed by item then insertion order", "[storage][reviews]") {
  const bool sqlite = GENERATE(false, true);
  auto repos = make_repos(sqlite);

  repos.reviews->append({core::ItemId{"b"}, 5.0, "0.9"});
  repos.reviews->append({core::ItemId{"a"}, 1.0, "terrible"});
  repos.reviews->append({core::ItemId{"b"}, 2.0, "0.1"});

  const auto all = repos.reviews->list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].item_id.value == "a");
  CHECK(all[0].sentiment_raw == "terrible");
  CHECK(all[1].rating == Catch::Approx(5.0));
  CHECK(all[2].rating == Catch::Approx(2.0));
}
