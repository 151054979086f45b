#include "prodsim/domain/embedding.h"

namespace prodsim::domain {

std::string modality_to_string(const Modality m) {
  switch (m) {
    case Modality::kText:
      return "text";
    case Modality::kImage:
      return "image";
  }
  return "unknown";
}

std::optional<Modality> modality_from_string(const std::string_view s) {
  if (s == "text") {
    return Modality::kText;
  }
  if (s == "image") {
    return Modality::kImage;
  }
  return std::nullopt;
}

EmbeddingContent make_embedding_content(const Item& item, const Modality modality) {
  EmbeddingContent content;
  if (modality == Modality::kText) {
    content.text = item.name + " " + item.category + " " + item.description;
    return content;
  }

  if (!item.image_ref.empty()) {
    content.image_ref = item.image_ref;
  } else {
    content.text = "Product image: " + item.name + " in " + item.category;
  }
  return content;
}

}  // namespace prodsim::domain
