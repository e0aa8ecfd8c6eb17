#include "Coverage.hpp"
#include "RegionGeometry.hpp"

#include <algorithm>

namespace artfmt {

bool isHairline(const DrawingObject &drawing, double hairlineWidth) {
  return !drawing.filled && drawing.strokeWidth < hairlineWidth;
}

bool hasRectOp(const DrawingObject &drawing) {
  return std::find(drawing.ops.begin(), drawing.ops.end(), PathOp::Rect) !=
         drawing.ops.end();
}

double rasterCoverage(const PageContent &page, const cv::Rect2d &clip) {
  double covered = 0.0;
  for (const auto &image : page.images) {
    covered += intersectionArea(image.placement, clip);
  }
  return clamp01(covered / coverageDenominator(clip));
}

double textCoverage(const PageContent &page, const cv::Rect2d &clip) {
  double covered = 0.0;
  for (const auto &block : page.textBlocks) {
    if (block.kind != BlockKind::Text) {
      continue;
    }
    covered += intersectionArea(block.bounds, clip);
  }
  return clamp01(covered / coverageDenominator(clip));
}

double drawingWeightFor(const DrawingObject &drawing, double intersectFraction,
                        const CoverageConfig &config) {
  bool isRectShape = hasRectOp(drawing);
  bool isLarge = intersectFraction >= config.panelAreaFraction;

  // Background panels: big rectangles, or big plain fills with few items
  bool isPanel =
      (isRectShape && isLarge) ||
      (drawing.filled && drawing.strokeWidth <= 0.0 &&
       static_cast<int>(drawing.ops.size()) <= config.panelMaxItems && isLarge);

  if (isPanel) {
    return config.panelWeight;
  }
  if (isRectShape) {
    return config.rectangleWeight;
  }

  bool hasCurves = std::find(drawing.ops.begin(), drawing.ops.end(),
                             PathOp::Curve) != drawing.ops.end();
  return hasCurves ? config.curvedShapeWeight : config.straightShapeWeight;
}

double drawingCoverage(const PageContent &page, const cv::Rect2d &clip,
                       const CoverageConfig &config) {
  double clipArea = coverageDenominator(clip);
  double weighted = 0.0;

  for (const auto &drawing : page.drawings) {
    double area = intersectionArea(drawing.bounds, clip);
    if (area <= 0.0)
      continue;

    if (isHairline(drawing, config.hairlineWidth))
      continue;

    weighted += area * drawingWeightFor(drawing, area / clipArea, config);
  }

  return clamp01(weighted / clipArea);
}

double effectiveVectorCoverage(double textCov, double drawingCov,
                               const CoverageConfig &config) {
  return clamp01(textCov + config.drawingWeight * drawingCov);
}

int countVectorSegments(const PageContent &page, const cv::Rect2d &clip,
                        const SegmentConfig &config) {
  double clipArea = coverageDenominator(clip);
  int segments = 0;

  for (const auto &drawing : page.drawings) {
    // Quick reject: bounds outside the clip
    if (!rectsTouch(drawing.bounds, clip))
      continue;

    // Ultra-thin template lines
    if (isHairline(drawing, config.hairlineWidth))
      continue;

    // Geometry that is tiny compared to the clip
    double fraction = intersectionArea(drawing.bounds, clip) / clipArea;
    if (fraction < config.minAreaFraction)
      continue;

    // Template chrome: big rectangles with almost no detail
    if (config.skipPanels && hasRectOp(drawing) &&
        fraction >= config.panelAreaFraction &&
        static_cast<int>(drawing.ops.size()) < config.panelMaxItems)
      continue;

    for (PathOp op : drawing.ops) {
      if (op == PathOp::Rect && !drawing.filled)
        continue;
      segments++;
    }
  }

  return segments;
}

} // namespace artfmt
