#ifndef ART_FORMAT_COVERAGE_HPP
#define ART_FORMAT_COVERAGE_HPP

#include "ClassifierConfig.hpp"
#include "PageContent.hpp"

namespace artfmt {

/**
 * @brief Fraction of the clip covered by placed raster images
 *
 * Sums the intersection of every image placement with the clip. Overlapping
 * images are not deduplicated; the sum is clamped to 1.
 */
double rasterCoverage(const PageContent &page, const cv::Rect2d &clip);

/**
 * @brief Fraction of the clip covered by text blocks
 *
 * Only blocks of kind BlockKind::Text are counted.
 */
double textCoverage(const PageContent &page, const cv::Rect2d &clip);

/**
 * @brief Weighted fraction of the clip covered by vector drawings
 *
 * Each drawing contributes its intersection area with the clip times a weight
 * chosen by shape class (see drawingWeightFor()). Hairline unfilled strokes
 * and drawings outside the clip contribute nothing.
 */
double drawingCoverage(const PageContent &page, const cv::Rect2d &clip,
                       const CoverageConfig &config);

/**
 * @brief Weight a single drawing contributes with
 *
 * Large filled or rectangular panels get config.panelWeight, other rectangles
 * config.rectangleWeight and all remaining shapes a straight or curved shape
 * weight.
 *
 * @param drawing The drawing to classify
 * @param intersectFraction Intersection area of the drawing with the clip,
 * divided by the clip area
 * @param config Coverage configuration
 */
double drawingWeightFor(const DrawingObject &drawing, double intersectFraction,
                        const CoverageConfig &config);

/**
 * @brief Text coverage plus damped drawing coverage, clamped to [0, 1]
 */
double effectiveVectorCoverage(double textCov, double drawingCov,
                               const CoverageConfig &config);

/**
 * @brief Count vector path operators of drawings touching the clip
 *
 * Hairline unfilled strokes, tiny drawings and (optionally) large low-detail
 * rectangular panels are skipped. Rect operators only count for filled
 * drawings.
 */
int countVectorSegments(const PageContent &page, const cv::Rect2d &clip,
                        const SegmentConfig &config);

/**
 * @brief Whether a drawing is an unfilled stroke thinner than the threshold
 */
bool isHairline(const DrawingObject &drawing, double hairlineWidth);

/**
 * @brief Whether a drawing contains a rectangle operator
 */
bool hasRectOp(const DrawingObject &drawing);

} // namespace artfmt

#endif // ART_FORMAT_COVERAGE_HPP
