#include <kensa/core/error.hpp>

namespace kensa::core {

std::string_view to_string(InspectionError error) noexcept {
  switch (error) {
    case InspectionError::None:
      return "None";
    case InspectionError::DecodeError:
      return "DecodeError";
    case InspectionError::FeatureExtractionError:
      return "FeatureExtractionError";
    case InspectionError::ClassifierError:
      return "ClassifierError";
    case InspectionError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace kensa::core
