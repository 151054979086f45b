#include "prodsim/adapters/embedding_provider.h"
#include "prodsim/adapters/text_generator.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

using namespace prodsim;
using namespace std::chrono_literals;
using domain::Modality;

static domain::Item make_item(const std::string& id, const std::string& name,
                              const std::string& category, const std::string& description) {
  domain::Item item;
  item.item_id = core::ItemId{id};
  item.name = name;
  item.category = category;
  item.description = description;
  return item;
}

static double norm(const vector::Vector& v) {
  double sum = 0.0;
  for (const float x : v) {
    sum += static_cast<double>(x) * x;
  }
  return std::sqrt(sum);
}

TEST_CASE("embedding content per modality", "[adapters][embedding]") {
  auto item = make_item("sku-1", "Kettle", "kitchen", "steel kettle");
  CHECK(domain::make_embedding_content(item, Modality::kText).text == "Kettle kitchen steel kettle");

  const auto described = domain::make_embedding_content(item, Modality::kImage);
  CHECK(described.image_ref.empty());
  CHECK(described.text == "Product image: Kettle in kitchen");

  item.image_ref = "img/kitchen/kettle.jpg";
  const auto referenced = domain::make_embedding_content(item, Modality::kImage);
  CHECK(referenced.image_ref == "img/kitchen/kettle.jpg");
  CHECK(referenced.text.empty());
}

TEST_CASE("stub provider is deterministic and normalized", "[adapters][embedding]") {
  adapters::DeterministicStubEmbeddingProvider provider(32, 8);
  const domain::EmbeddingContent content{"steel kettle for the kitchen", ""};

  const auto first = provider.embed(content, Modality::kText, 100ms);
  const auto second = provider.embed(content, Modality::kText, 100ms);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value() == second.value());
  CHECK(first.value().size() == 32);
  CHECK(norm(first.value()) == Catch::Approx(1.0).epsilon(1e-5));

  const auto image = provider.embed({"", "img/a.jpg"}, Modality::kImage, 100ms);
  REQUIRE(image.has_value());
  CHECK(image.value().size() == 8);
}

TEST_CASE("stub provider without a dimension fails", "[adapters][embedding]") {
  adapters::DeterministicStubEmbeddingProvider provider(16, 0);
  const auto result = provider.embed({"x", ""}, Modality::kImage, 100ms);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::ErrorCode::kExternalServiceError);
}

TEST_CASE("explanation prompts fall back to ids", "[adapters][text]") {
  const auto anchor = make_item("a", "Desk Lamp", "lighting", "led lamp");
  const auto known = adapters::recommendation_context("a", &anchor, "b", nullptr, 0.125);
  CHECK(known.kind == adapters::ExplanationKind::kRecommendation);
  CHECK(known.prompt.find("Desk Lamp in the lighting category") != std::string::npos);
  CHECK(known.prompt.find("item b") != std::string::npos);
  CHECK(known.prompt.find("0.125") != std::string::npos);

  domain::QualityAlert alert;
  alert.item_id = core::ItemId{"z"};
  alert.risk_level = domain::RiskLevel::kHighRisk;
  const auto quality = adapters::quality_alert_context(alert, nullptr);
  CHECK(quality.subject_id == "z");
  CHECK(quality.related_id.empty());
  CHECK(quality.prompt.find("HIGH_RISK") != std::string::npos);

  adapters::TemplateTextGenerator generator;
  const auto text = generator.explain(known, 10ms);
  REQUIRE(text.has_value());
  CHECK(text.value().find("a") != std::string::npos);
}
