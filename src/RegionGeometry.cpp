#include "RegionGeometry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace artfmt {

namespace {

// Enough digits for the value to parse back unchanged
std::string formatNumber(double value) {
  std::ostringstream out;
  out << std::setprecision(17) << value;
  return out.str();
}

// Parse a complete, finite decimal number. Returns false for empty input,
// trailing garbage, NaN or infinity.
bool parseNumber(const std::string &text, double &value) {
  if (text.empty()) {
    return false;
  }

  size_t consumed = 0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }

  // Allow trailing whitespace only
  while (consumed < text.size() &&
         std::isspace(static_cast<unsigned char>(text[consumed]))) {
    consumed++;
  }

  return consumed == text.size() && std::isfinite(value);
}

} // anonymous namespace

cv::Rect2d rectFromCorners(double x0, double y0, double x1, double y1) {
  double left = std::min(x0, x1);
  double top = std::min(y0, y1);
  return cv::Rect2d(left, top, std::max(x0, x1) - left,
                    std::max(y0, y1) - top);
}

double rectArea(const cv::Rect2d &rect) {
  if (rect.width <= 0 || rect.height <= 0) {
    return 0.0;
  }
  return rect.area();
}

cv::Rect2d intersectRects(const cv::Rect2d &a, const cv::Rect2d &b) {
  return a & b;
}

double intersectionArea(const cv::Rect2d &a, const cv::Rect2d &b) {
  return rectArea(intersectRects(a, b));
}

bool rectsTouch(const cv::Rect2d &a, const cv::Rect2d &b) {
  return a.x <= b.x + b.width && b.x <= a.x + a.width &&
         a.y <= b.y + b.height && b.y <= a.y + a.height;
}

double coverageDenominator(const cv::Rect2d &clip) {
  return std::max(1.0, rectArea(clip));
}

double clamp01(double value) { return std::min(1.0, std::max(0.0, value)); }

RegionRequest RegionRequest::fromPageRect(double x, double y, double width,
                                          double height) {
  RegionRequest request;
  request.coordsOrigin = kPageSpaceOrigin;
  request.x = formatNumber(x);
  request.y = formatNumber(y);
  request.width = formatNumber(width);
  request.height = formatNumber(height);
  return request;
}

cv::Rect2d bottomHalf(const cv::Rect2d &pageBounds) {
  double midY = pageBounds.y + pageBounds.height / 2.0;
  return rectFromCorners(pageBounds.x, midY, pageBounds.x + pageBounds.width,
                         pageBounds.y + pageBounds.height);
}

RegionSelection selectRegion(const cv::Rect2d &pageBounds,
                             const RegionRequest &request) {
  RegionSelection fallback;
  fallback.clip = bottomHalf(pageBounds);
  fallback.source = RegionSource::BottomHalf;

  if (request.coordsOrigin != RegionRequest::kPageSpaceOrigin) {
    return fallback;
  }

  double x = 0, y = 0, width = 0, height = 0;
  if (!parseNumber(request.x, x) || !parseNumber(request.y, y) ||
      !parseNumber(request.width, width) ||
      !parseNumber(request.height, height)) {
    return fallback;
  }

  if (width < 0 || height < 0) {
    return fallback;
  }

  double pageX0 = pageBounds.x;
  double pageY0 = pageBounds.y;
  double pageX1 = pageBounds.x + pageBounds.width;
  double pageY1 = pageBounds.y + pageBounds.height;

  // Clamp both edges into the page so a request outside the page collapses to
  // a degenerate box on the nearest page edge
  double x0 = std::min(pageX1, std::max(pageX0, x));
  double y0 = std::min(pageY1, std::max(pageY0, y));
  double x1 = std::min(pageX1, std::max(pageX0, x + width));
  double y1 = std::min(pageY1, std::max(pageY0, y + height));

  RegionSelection selection;
  selection.clip = cv::Rect2d(x0, y0, x1 - x0, y1 - y0);
  selection.source = RegionSource::Explicit;
  return selection;
}

std::string toString(RegionSource source) {
  switch (source) {
  case RegionSource::Explicit:
    return "clip";
  case RegionSource::BottomHalf:
    return "bottom-half";
  }
  return "bottom-half";
}

} // namespace artfmt
