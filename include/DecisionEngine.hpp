#ifndef ART_FORMAT_DECISION_ENGINE_HPP
#define ART_FORMAT_DECISION_ENGINE_HPP

#include "ClassifierConfig.hpp"
#include "NativeResolution.hpp"
#include "RegionGeometry.hpp"

#include <optional>
#include <string>

namespace artfmt {

/**
 * @brief Format classification of a region
 */
enum class Label {
  HasRaster, ///< Region is dominated by bitmap content
  HasVector  ///< Region is dominated by vector art or text
};

/**
 * @brief Rule of the decision cascade that produced a label
 */
enum class DecisionRule {
  NoRasterGuard,           ///< Essentially no raster, any vector signal
  ClearRasterMargin,       ///< Raster ahead of vector by a small margin
  ClearVectorMargin,       ///< Vector ahead of raster by a large margin
  RasterDominantClose,     ///< Substantial raster, modest vector
  PureVectorSafeguard,     ///< Negligible raster, many vector segments
  LowDetailRasterOverride, ///< Low-DPI raster against real vector structure
  DefaultRaster            ///< Tie-break
};

/**
 * @brief Measurements taken over the analysis region
 */
struct CoverageMetrics {
  cv::Rect2d clip;                                ///< Analysed region
  RegionSource regionSource = RegionSource::BottomHalf;
  double rasterCoverage = 0;                      ///< [0, 1]
  double textCoverage = 0;                        ///< [0, 1]
  double drawingCoverage = 0;                     ///< [0, 1], weighted
  double effectiveVectorCoverage = 0;             ///< [0, 1]
  int vectorSegments = 0;                         ///< Vector operators in clip
  int rasterCount = 0;                            ///< Rasters on the page
  std::optional<NativeRasterInfo> nativeRaster;   ///< Dominant raster DPI

  /// Minimum placed DPI of the dominant raster, 0 if unknown
  double nativeDpiMin() const {
    return nativeRaster ? nativeRaster->dpiMin : 0.0;
  }
};

/**
 * @brief Label and the rule that produced it
 */
struct Decision {
  Label label = Label::HasRaster;
  DecisionRule rule = DecisionRule::DefaultRaster;
};

/**
 * @brief Decide the region label from its metrics
 *
 * Evaluates the rules in DecisionRule order and returns the first match.
 * Total and deterministic: every input yields exactly one rule.
 */
Decision decide(const CoverageMetrics &metrics,
                const DecisionThresholds &thresholds);

std::string toString(Label label);
std::string toString(DecisionRule rule);

} // namespace artfmt

#endif // ART_FORMAT_DECISION_ENGINE_HPP
