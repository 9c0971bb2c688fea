#include <kensa/app/config.hpp>
#include <kensa/core/score_result.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace ka = kensa::app;
namespace kc = kensa::core;

namespace {

std::filesystem::path write_temp_config(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path);
  f << body;
  return path;
}

}  // namespace

TEST(Config, DefaultsAreValid) {
  const ka::InspectionConfig c = ka::default_config();
  EXPECT_EQ(c.scoring_mode, kc::ScoringMode::Geometric);
  EXPECT_EQ(c.features.blur_kernel_size, 5);
  EXPECT_DOUBLE_EQ(c.min_region_area, 10.0);
  EXPECT_DOUBLE_EQ(c.scoring.max_defect_fraction, 0.1);
  EXPECT_DOUBLE_EQ(c.decision.uncertain_lower, 0.45);
  EXPECT_DOUBLE_EQ(c.decision.uncertain_upper, 0.55);
  EXPECT_EQ(c.classifier_input_width, 224u);
  EXPECT_EQ(c.gatekeeper.backend, ka::ClassifierBackendType::None);
  EXPECT_TRUE(ka::validate_config(c).has_value());
}

TEST(Config, LoadsKeysAndSkipsCommentsAndUnknowns) {
  const auto path = write_temp_config("kensa_config_test.cfg",
                                      "# station 3\n"
                                      "scoring_mode = edge_density\n"
                                      "use_clahe=true\n"
                                      "min_region_area=25\n"
                                      "health_floor = 15\n"
                                      "max_allowed_defects=8\n"
                                      "gatekeeper_backend=mock\n"
                                      "gatekeeper_mock_probability=0.9\n"
                                      "no_such_key=1\n"
                                      "blur_kernel_size=not_a_number\n");
  const ka::InspectionConfig c = ka::load_config(path.string());
  std::filesystem::remove(path);

  EXPECT_EQ(c.scoring_mode, kc::ScoringMode::EdgeDensity);
  EXPECT_TRUE(c.features.use_clahe);
  EXPECT_DOUBLE_EQ(c.min_region_area, 25.0);
  EXPECT_DOUBLE_EQ(c.scoring.health_floor, 15.0);
  EXPECT_EQ(c.decision.max_allowed_defects, 8u);
  EXPECT_EQ(c.gatekeeper.backend, ka::ClassifierBackendType::Mock);
  EXPECT_DOUBLE_EQ(c.gatekeeper.mock_probability, 0.9);
  EXPECT_EQ(c.features.blur_kernel_size, 5);  // bad value left the default
}

TEST(Config, MissingFileGivesDefaults) {
  const ka::InspectionConfig c = ka::load_config("/nonexistent/kensa.cfg");
  EXPECT_EQ(c.scoring_mode, kc::ScoringMode::Geometric);
  EXPECT_TRUE(ka::validate_config(c).has_value());
}

TEST(Config, ValidateRejectsInvertedBand) {
  ka::InspectionConfig c = ka::default_config();
  c.decision.uncertain_lower = 0.6;
  c.decision.uncertain_upper = 0.4;
  auto r = ka::validate_config(c);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), kc::InspectionError::InvalidConfig);
}

TEST(Config, ValidateRejectsBadKernelAndFraction) {
  ka::InspectionConfig even_kernel = ka::default_config();
  even_kernel.features.closing_kernel_size = 2;
  EXPECT_FALSE(ka::validate_config(even_kernel).has_value());

  ka::InspectionConfig zero_fraction = ka::default_config();
  zero_fraction.scoring.max_defect_fraction = 0.0;
  EXPECT_FALSE(ka::validate_config(zero_fraction).has_value());
}

TEST(Config, ParseScoringMode) {
  EXPECT_EQ(ka::parse_scoring_mode("geometric"), kc::ScoringMode::Geometric);
  EXPECT_EQ(ka::parse_scoring_mode("classifier"), kc::ScoringMode::Classifier);
  EXPECT_FALSE(ka::parse_scoring_mode("magic").has_value());
}

TEST(Config, NegativeCountsAreRejected) {
  const auto path = write_temp_config("kensa_config_negative.cfg",
                                      "max_allowed_defects=-1\n"
                                      "classifier_input_width= -224\n"
                                      "classifier_input_height=99999999999\n");
  const ka::InspectionConfig c = ka::load_config(path.string());
  std::filesystem::remove(path);
  EXPECT_EQ(c.decision.max_allowed_defects, 5u);
  EXPECT_EQ(c.classifier_input_width, 224u);
  EXPECT_EQ(c.classifier_input_height, 224u);
}
