#ifndef ART_FORMAT_NATIVE_RESOLUTION_HPP
#define ART_FORMAT_NATIVE_RESOLUTION_HPP

#include "PageContent.hpp"

#include <optional>
#include <string>

namespace artfmt {

/**
 * @brief Effective resolution of the dominant raster in a region
 */
struct NativeRasterInfo {
  std::string imageId;        ///< Identifier of the chosen image
  int nativePxW = 0;          ///< Native width in pixels
  int nativePxH = 0;          ///< Native height in pixels
  double placedWidthIn = 0;   ///< Width of the visible part in inches
  double placedHeightIn = 0;  ///< Height of the visible part in inches
  double dpiX = 0;            ///< Horizontal placed DPI
  double dpiY = 0;            ///< Vertical placed DPI
  double dpiMin = 0;          ///< min(dpiX, dpiY), 0 unless both are positive
};

/**
 * @brief Estimate the placed DPI of the largest raster inside the clip
 *
 * Picks the image with the largest intersection with the clip (first one on
 * ties) and divides its native pixel size by the physical size of that
 * intersection. Images whose native size could not be decoded report 0 DPI.
 *
 * @param page Page content
 * @param clip Analysis region in points
 * @return The estimate, or std::nullopt if no image overlaps the clip
 */
std::optional<NativeRasterInfo>
estimateNativeResolution(const PageContent &page, const cv::Rect2d &clip);

} // namespace artfmt

#endif // ART_FORMAT_NATIVE_RESOLUTION_HPP
