#ifndef ART_FORMAT_REGION_GEOMETRY_HPP
#define ART_FORMAT_REGION_GEOMETRY_HPP

#include <opencv2/core.hpp>

#include <string>

namespace artfmt {

/// Points per inch in PDF user space
constexpr double kPointsPerInch = 72.0;

/**
 * @brief Build a rectangle from its corner coordinates
 *
 * Edges are swapped if given in reverse order, so the result always has a
 * non-negative width and height.
 */
cv::Rect2d rectFromCorners(double x0, double y0, double x1, double y1);

/**
 * @brief Area of a rectangle, 0 for degenerate rectangles
 */
double rectArea(const cv::Rect2d &rect);

/**
 * @brief Intersection of two rectangles
 * @return The overlapping box, or an empty rectangle if they do not overlap
 */
cv::Rect2d intersectRects(const cv::Rect2d &a, const cv::Rect2d &b);

/**
 * @brief Area of the intersection of two rectangles
 */
double intersectionArea(const cv::Rect2d &a, const cv::Rect2d &b);

/**
 * @brief Whether two rectangles touch or overlap (edges inclusive)
 *
 * Unlike intersectionArea() > 0, a zero-height line lying inside the other
 * rectangle is reported as touching.
 */
bool rectsTouch(const cv::Rect2d &a, const cv::Rect2d &b);

/**
 * @brief Area used as the denominator of every coverage ratio
 *
 * Never smaller than 1 square point, so degenerate clips cannot divide by zero.
 */
double coverageDenominator(const cv::Rect2d &clip);

/**
 * @brief Clamp a ratio into [0, 1]
 */
double clamp01(double value);

/**
 * @brief Region request as received from a form or command line
 *
 * Fields are kept as text so that missing or non-numeric values can be
 * detected by the selector.
 */
struct RegionRequest {
  std::string coordsOrigin; ///< Must be kPageSpaceOrigin to use x/y/w/h
  std::string x;            ///< Left edge in points
  std::string y;            ///< Top edge in points
  std::string width;        ///< Width in points
  std::string height;       ///< Height in points

  /// Marker selecting page-space coordinates
  static constexpr const char *kPageSpaceOrigin = "pdf";

  /**
   * @brief Build a page-space request from numeric values
   */
  static RegionRequest fromPageRect(double x, double y, double width,
                                    double height);
};

/**
 * @brief Where the analysed region came from
 */
enum class RegionSource {
  Explicit,  ///< User rectangle clamped to the page
  BottomHalf ///< Default bottom half of the page
};

/**
 * @brief Resolved analysis region
 */
struct RegionSelection {
  cv::Rect2d clip;
  RegionSource source = RegionSource::BottomHalf;
};

/**
 * @brief Bottom half of the page, split at the vertical midpoint
 */
cv::Rect2d bottomHalf(const cv::Rect2d &pageBounds);

/**
 * @brief Resolve the analysis region for a page
 *
 * Uses the requested rectangle clamped to the page bounds when the request is
 * complete and well formed, otherwise falls back to the bottom half of the
 * page. Never throws.
 */
RegionSelection selectRegion(const cv::Rect2d &pageBounds,
                             const RegionRequest &request);

std::string toString(RegionSource source);

} // namespace artfmt

#endif // ART_FORMAT_REGION_GEOMETRY_HPP
