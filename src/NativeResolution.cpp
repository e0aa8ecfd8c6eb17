#include "NativeResolution.hpp"
#include "RegionGeometry.hpp"

#include <algorithm>

namespace artfmt {

std::optional<NativeRasterInfo>
estimateNativeResolution(const PageContent &page, const cv::Rect2d &clip) {
  const PlacedImage *best = nullptr;
  cv::Rect2d bestIntersection;
  double bestArea = 0.0;

  for (const auto &image : page.images) {
    cv::Rect2d inter = intersectRects(image.placement, clip);
    double area = rectArea(inter);
    if (area > bestArea) {
      best = &image;
      bestIntersection = inter;
      bestArea = area;
    }
  }

  if (!best) {
    return std::nullopt;
  }

  NativeRasterInfo info;
  info.imageId = best->id;
  info.nativePxW = std::max(0, best->nativeWidth);
  info.nativePxH = std::max(0, best->nativeHeight);
  info.placedWidthIn = bestIntersection.width / kPointsPerInch;
  info.placedHeightIn = bestIntersection.height / kPointsPerInch;
  info.dpiX =
      info.placedWidthIn > 0 ? info.nativePxW / info.placedWidthIn : 0.0;
  info.dpiY =
      info.placedHeightIn > 0 ? info.nativePxH / info.placedHeightIn : 0.0;
  info.dpiMin =
      (info.dpiX > 0 && info.dpiY > 0) ? std::min(info.dpiX, info.dpiY) : 0.0;

  return info;
}

} // namespace artfmt
