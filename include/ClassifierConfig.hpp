#ifndef ART_FORMAT_CLASSIFIER_CONFIG_HPP
#define ART_FORMAT_CLASSIFIER_CONFIG_HPP

#include <string>
#include <utility>
#include <vector>

namespace artfmt {

/**
 * @brief Tuning of the area-based coverage measurements
 */
struct CoverageConfig {
  double hairlineWidth = 0.25; ///< Unfilled strokes thinner than this are noise
  double panelAreaFraction = 0.15; ///< Clip fraction at which a shape is a panel
  int panelMaxItems = 5;       ///< Max path items of a filled unstroked panel
  double panelWeight = 0.05;   ///< Weight of background panels
  double rectangleWeight = 0.15; ///< Weight of smaller rectangle shapes
  double straightShapeWeight = 0.30; ///< Weight of line-only shapes
  double curvedShapeWeight = 0.40;   ///< Weight of shapes containing curves
  double drawingWeight = 0.5; ///< Damping of drawings in vector coverage
};

/**
 * @brief Tuning of the structural vector segment count
 */
struct SegmentConfig {
  double hairlineWidth = 0.25; ///< Unfilled strokes thinner than this are noise
  double minAreaFraction = 0.0005; ///< Ignore drawings smaller than this
  bool skipPanels = true;          ///< Skip large low-detail rectangles
  double panelAreaFraction = 0.15; ///< Clip fraction at which a rect is a panel
  int panelMaxItems = 8;           ///< Panels have fewer path items than this
};

/**
 * @brief Thresholds of the raster/vector decision cascade
 */
struct DecisionThresholds {
  // No-raster guard
  double noRasterMax = 0.02;
  double noRasterVectorMin = 0.03;
  double noRasterTextMin = 0.025;
  int noRasterSegmentsMin = 20;

  // Margin comparisons
  double rasterMargin = 0.01;
  double vectorMargin = 0.12;

  // Raster dominant but close
  double closeRasterMin = 0.15;
  double closeVectorMax = 0.30;

  // Pure vector safeguard
  double pureVectorRasterMax = 0.03;
  int pureVectorSegmentsMin = 40;

  // Low-detail raster override
  int lowDetailSegmentsMin = 18;
  double lowDetailDpiMax = 40.0;
  double lowDetailRasterMin = 0.10;
};

/**
 * @brief Complete configuration of the region classifier
 */
struct ClassifierConfig {
  CoverageConfig coverage;
  SegmentConfig segments;
  DecisionThresholds decision;
};

/**
 * @brief Override a configuration value by its dotted name
 *
 * Names are "<group>.<field>" with group one of coverage, segments or
 * decision, e.g. "decision.vectorMargin". Boolean fields accept true/false/1/0.
 *
 * @param config Configuration to modify
 * @param name Dotted parameter name
 * @param value Textual value
 * @param errorMessage Set when the override is rejected
 * @return true if the value was applied
 */
bool setConfigValue(ClassifierConfig &config, const std::string &name,
                    const std::string &value, std::string &errorMessage);

/**
 * @brief List every parameter name with its current value
 */
std::vector<std::pair<std::string, std::string>>
listConfigValues(const ClassifierConfig &config);

} // namespace artfmt

#endif // ART_FORMAT_CLASSIFIER_CONFIG_HPP
