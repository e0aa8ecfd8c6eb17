#ifndef ART_FORMAT_PAGE_CONTENT_HPP
#define ART_FORMAT_PAGE_CONTENT_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace artfmt {

/**
 * @brief Path construction operator of a vector drawing
 */
enum class PathOp {
  Move,  ///< Start of a new subpath
  Line,  ///< Straight segment
  Curve, ///< Cubic Bezier segment
  Rect,  ///< Axis-aligned rectangle drawn as a single operator
  Close  ///< Subpath closed back to its start point
};

/**
 * @brief Kind tag of a text-layer block
 */
enum class BlockKind {
  Text, ///< Block holding text lines
  Image ///< Non-text block (image placement)
};

/**
 * @brief A raster image placed on the page
 */
struct PlacedImage {
  std::string id;       ///< Opaque identifier ("xref:12", "inline:0")
  cv::Rect2d placement; ///< Axis-aligned placement box in points
  int nativeWidth = 0;  ///< Native width in pixels (0 if undecodable)
  int nativeHeight = 0; ///< Native height in pixels (0 if undecodable)
};

/**
 * @brief A filled and/or stroked vector path
 */
struct DrawingObject {
  cv::Rect2d bounds;        ///< Bounding box in points
  double strokeWidth = 0.0; ///< Stroke width in points, 0 if not stroked
  bool filled = false;      ///< Whether the path is filled
  std::vector<PathOp> ops;  ///< Path operators in drawing order
};

/**
 * @brief A block of the page's text layer
 */
struct TextBlock {
  cv::Rect2d bounds; ///< Bounding box in points
  BlockKind kind = BlockKind::Text;
};

/**
 * @brief Read-only geometric content of a single page
 *
 * Coordinates are PDF points with the origin at the top-left corner of the
 * page's crop box.
 */
struct PageContent {
  cv::Rect2d bounds;                  ///< Page bounds (0, 0, width, height)
  std::vector<PlacedImage> images;    ///< Every placed raster on the page
  std::vector<DrawingObject> drawings; ///< Filled/stroked vector paths
  std::vector<TextBlock> textBlocks;  ///< Text-layer blocks
};

} // namespace artfmt

#endif // ART_FORMAT_PAGE_CONTENT_HPP
