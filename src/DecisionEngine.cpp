#include "DecisionEngine.hpp"

namespace artfmt {

namespace {

Decision make(Label label, DecisionRule rule) {
  Decision decision;
  decision.label = label;
  decision.rule = rule;
  return decision;
}

} // anonymous namespace

Decision decide(const CoverageMetrics &metrics,
                const DecisionThresholds &t) {
  const double raster = metrics.rasterCoverage;
  const double vector = metrics.effectiveVectorCoverage;
  const int segments = metrics.vectorSegments;
  const double dpiMin = metrics.nativeDpiMin();

  // With essentially no image, any vector or text signal (or no image on the
  // page at all) means vector. Covers empty regions too.
  if (raster <= t.noRasterMax &&
      (vector >= t.noRasterVectorMin ||
       metrics.textCoverage >= t.noRasterTextMin || metrics.rasterCount == 0 ||
       segments >= t.noRasterSegmentsMin)) {
    return make(Label::HasVector, DecisionRule::NoRasterGuard);
  }

  // Raster only needs a small margin; vector coverage is overstated by panels
  if (raster >= vector + t.rasterMargin) {
    return make(Label::HasRaster, DecisionRule::ClearRasterMargin);
  }

  if (vector >= raster + t.vectorMargin) {
    return make(Label::HasVector, DecisionRule::ClearVectorMargin);
  }

  if (raster >= t.closeRasterMin && vector <= t.closeVectorMax) {
    return make(Label::HasRaster, DecisionRule::RasterDominantClose);
  }

  if (raster <= t.pureVectorRasterMax && segments >= t.pureVectorSegmentsMin) {
    return make(Label::HasVector, DecisionRule::PureVectorSafeguard);
  }

  // Flat mock-up placeholders: big but low resolution
  if (segments >= t.lowDetailSegmentsMin && dpiMin > 0 &&
      dpiMin < t.lowDetailDpiMax && raster >= t.lowDetailRasterMin) {
    return make(Label::HasVector, DecisionRule::LowDetailRasterOverride);
  }

  // Text shouldn't override a big photo
  return make(Label::HasRaster, DecisionRule::DefaultRaster);
}

std::string toString(Label label) {
  switch (label) {
  case Label::HasRaster:
    return "has raster";
  case Label::HasVector:
    return "has vector";
  }
  return "has raster";
}

std::string toString(DecisionRule rule) {
  switch (rule) {
  case DecisionRule::NoRasterGuard:
    return "no-raster-guard";
  case DecisionRule::ClearRasterMargin:
    return "clear-raster-margin";
  case DecisionRule::ClearVectorMargin:
    return "clear-vector-margin";
  case DecisionRule::RasterDominantClose:
    return "raster-dominant-close";
  case DecisionRule::PureVectorSafeguard:
    return "pure-vector-safeguard";
  case DecisionRule::LowDetailRasterOverride:
    return "low-detail-raster-override";
  case DecisionRule::DefaultRaster:
    return "default-raster";
  }
  return "default-raster";
}

} // namespace artfmt
