#include "PDFPageLoader.hpp"
#include "RegionGeometry.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

// Poppler low-level API for images and paths
#include <Error.h>
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Page.h>
#include <Stream.h>
#include <goo/GooString.h>

namespace artfmt {

// Custom OutputDev to capture placed images and vector paths
namespace {

class PageContentOutputDev : public OutputDev {
public:
  PageContentOutputDev() : inlineImageCount(0) {}

  PageContent &getContent() { return content; }

  // Required OutputDev overrides. Device space is top-left origin at 72 DPI,
  // so device units are points.
  bool upsideDown() override { return true; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void startPage(int /*pageNum*/, GfxState *state, XRef * /*xref*/) override {
    content.bounds =
        cv::Rect2d(0, 0, state->getPageWidth(), state->getPageHeight());
  }

  void fill(GfxState *state) override { addPath(state, true); }
  void eoFill(GfxState *state) override { addPath(state, true); }
  void stroke(GfxState *state) override { addPath(state, false); }

  // Called for each image; masked and soft-masked images arrive here through
  // the OutputDev defaults
  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool /*interpolate*/,
                 const int * /*maskColors*/, bool inlineImg) override {
    // The CTM maps the unit square to the image; take the axis-aligned
    // bounding box of its four corners
    const auto &ctm = state->getCTM();
    double x0 = ctm[4];
    double y0 = ctm[5];
    double x1 = ctm[4] + ctm[0];
    double y1 = ctm[5] + ctm[1];
    double x2 = ctm[4] + ctm[2];
    double y2 = ctm[5] + ctm[3];
    double x3 = ctm[4] + ctm[0] + ctm[2];
    double y3 = ctm[5] + ctm[1] + ctm[3];

    PlacedImage image;
    if (ref && ref->isRef()) {
      image.id = "xref:" + std::to_string(ref->getRef().num);
    } else {
      image.id = "inline:" + std::to_string(inlineImageCount++);
    }
    image.placement = rectFromCorners(std::min({x0, x1, x2, x3}),
                                      std::min({y0, y1, y2, y3}),
                                      std::max({x0, x1, x2, x3}),
                                      std::max({y0, y1, y2, y3}));

    if (decodeImageRows(str, width, height, colorMap, inlineImg)) {
      image.nativeWidth = width;
      image.nativeHeight = height;
    } else {
      std::cerr << "DEBUG: Could not decode image " << image.id
                << ", native size unknown" << std::endl;
    }

    std::cerr << "DEBUG: Image " << image.id << " at ("
              << image.placement.x << ", " << image.placement.y
              << ") size " << image.placement.width << " x "
              << image.placement.height << ", native " << image.nativeWidth
              << " x " << image.nativeHeight << std::endl;

    content.images.push_back(image);
  }

private:
  // Check that pixel rows can be read. Inline image data lives in the content
  // stream, so it is always read to the end.
  bool decodeImageRows(Stream *str, int width, int height,
                       GfxImageColorMap *colorMap, bool inlineImg) {
    if (width <= 0 || height <= 0 || !colorMap) {
      return false;
    }

    ImageStream imgStr(str, width, colorMap->getNumPixelComps(),
                       colorMap->getBits());
    imgStr.reset();

    int rowsRead = 0;
    int rowsWanted = inlineImg ? height : 1;
    for (int row = 0; row < rowsWanted; row++) {
      if (!imgStr.getLine())
        break;
      rowsRead++;
    }

    imgStr.close();
    return rowsRead > 0;
  }

  void addPath(GfxState *state, bool isFilled) {
    DrawingObject drawing;
    if (!convertPath(state, drawing))
      return;

    drawing.filled = isFilled;
    drawing.strokeWidth = isFilled ? 0.0 : state->getTransformedLineWidth();

    // Fill-and-stroke operators paint the same path twice; keep one drawing
    if (!isFilled && !content.drawings.empty()) {
      DrawingObject &last = content.drawings.back();
      if (last.filled && last.strokeWidth <= 0.0 &&
          last.bounds == drawing.bounds && last.ops == drawing.ops) {
        last.strokeWidth = drawing.strokeWidth;
        return;
      }
    }

    content.drawings.push_back(std::move(drawing));
  }

  bool convertPath(GfxState *state, DrawingObject &drawing) {
    const GfxPath *path = state->getPath();
    if (!path)
      return false;

    const auto &ctm = state->getCTM();
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();

    for (int i = 0; i < path->getNumSubpaths(); i++) {
      const GfxSubpath *subpath = path->getSubpath(i);
      int numPoints = subpath->getNumPoints();

      // A lone moveto draws nothing
      if (numPoints < 2)
        continue;

      // Transform points through CTM to get page coordinates
      std::vector<cv::Point2d> points(numPoints);
      for (int j = 0; j < numPoints; j++) {
        double x = subpath->getX(j);
        double y = subpath->getY(j);
        points[j].x = ctm[0] * x + ctm[2] * y + ctm[4];
        points[j].y = ctm[1] * x + ctm[3] * y + ctm[5];

        minX = std::min(minX, points[j].x);
        minY = std::min(minY, points[j].y);
        maxX = std::max(maxX, points[j].x);
        maxY = std::max(maxY, points[j].y);
      }

      if (isRectangleSubpath(subpath, points)) {
        drawing.ops.push_back(PathOp::Rect);
        continue;
      }

      drawing.ops.push_back(PathOp::Move);
      for (int j = 1; j < numPoints;) {
        // Curves store two control points followed by the end point
        if (subpath->getCurve(j)) {
          drawing.ops.push_back(PathOp::Curve);
          j += 3;
        } else {
          drawing.ops.push_back(PathOp::Line);
          j++;
        }
      }
      if (subpath->isClosed())
        drawing.ops.push_back(PathOp::Close);
    }

    if (drawing.ops.empty())
      return false;

    drawing.bounds = rectFromCorners(minX, minY, maxX, maxY);
    return true;
  }

  bool isRectangleSubpath(const GfxSubpath *subpath,
                          const std::vector<cv::Point2d> &points) {
    int numPoints = subpath->getNumPoints();
    for (int j = 0; j < numPoints; j++) {
      if (subpath->getCurve(j))
        return false;
    }

    return isAxisAlignedRectangle(points, subpath->isClosed());
  }

  PageContent content;
  int inlineImageCount;
};

} // anonymous namespace

bool isAxisAlignedRectangle(const std::vector<cv::Point2d> &points,
                            bool closed) {
  const double tolerance = 0.5; // Half a point tolerance

  auto samePoint = [tolerance](const cv::Point2d &a, const cv::Point2d &b) {
    return std::abs(a.x - b.x) < tolerance && std::abs(a.y - b.y) < tolerance;
  };

  // The point that returns to the start is not a corner. An outline that
  // neither returns nor is closed is open.
  std::vector<cv::Point2d> corners(points);
  if (corners.size() > 1 && samePoint(corners.front(), corners.back())) {
    corners.pop_back();
  } else if (!closed) {
    return false;
  }

  if (corners.size() != 4)
    return false;

  for (size_t i = 0; i < corners.size(); i++) {
    for (size_t j = i + 1; j < corners.size(); j++) {
      if (samePoint(corners[i], corners[j]))
        return false;
    }
  }

  // Every edge horizontal or vertical, alternating around the outline
  bool firstHorizontal = false;
  for (size_t i = 0; i < 4; i++) {
    const cv::Point2d &a = corners[i];
    const cv::Point2d &b = corners[(i + 1) % 4];
    bool horizontal = std::abs(a.y - b.y) < tolerance;
    bool vertical = std::abs(a.x - b.x) < tolerance;
    if (horizontal == vertical)
      return false;

    if (i == 0) {
      firstHorizontal = horizontal;
    } else if (horizontal != (firstHorizontal == (i % 2 == 0))) {
      return false;
    }
  }

  return true;
}

std::vector<cv::Rect2d>
groupWordsIntoLines(const std::vector<cv::Rect2d> &words) {
  std::vector<cv::Rect2d> lines;
  std::vector<bool> used(words.size(), false);

  for (size_t i = 0; i < words.size(); i++) {
    if (used[i])
      continue;

    cv::Rect2d line = words[i];
    used[i] = true;

    // Words on the same line share a vertical centre within half a height
    double tolerance = std::max(2.0, line.height / 2.0);

    for (size_t j = i + 1; j < words.size(); j++) {
      if (used[j])
        continue;

      const cv::Rect2d &candidate = words[j];

      double yCenter1 = line.y + line.height / 2.0;
      double yCenter2 = candidate.y + candidate.height / 2.0;
      double yDiff = std::abs(yCenter1 - yCenter2);

      double horizontalGap =
          std::min(std::abs(candidate.x - (line.x + line.width)),
                   std::abs(line.x - (candidate.x + candidate.width)));

      if (yDiff <= tolerance && horizontalGap < line.width * 3) {
        used[j] = true;
        line = rectFromCorners(
            std::min(line.x, candidate.x), std::min(line.y, candidate.y),
            std::max(line.x + line.width, candidate.x + candidate.width),
            std::max(line.y + line.height, candidate.y + candidate.height));
      }
    }

    lines.push_back(line);
  }

  return lines;
}

PageContentResult PDFPageLoader::loadPage(const std::string &pdfPath,
                                          int pageIndex) const {
  PageContentResult result;
  result.success = false;
  result.pageIndex = pageIndex;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    // Initialize Poppler's global parameters (required for low-level API)
    // GlobalParamsIniter is a RAII class that manages the lifecycle
    GlobalParamsIniter globalParamsInit(nullptr);

    auto fileName = std::make_unique<GooString>(pdfPath);
    std::unique_ptr<PDFDoc> doc(new PDFDoc(std::move(fileName)));

    if (!doc->isOk()) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    result.pageCount = doc->getNumPages();
    if (pageIndex < 0 || pageIndex >= result.pageCount) {
      result.errorMessage = "Page index " + std::to_string(pageIndex) +
                            " out of range (document has " +
                            std::to_string(result.pageCount) + " pages)";
      return result;
    }

    PageContentOutputDev outputDev;

    // Poppler pages are 1-indexed. Crop box coordinates, no extra rotation.
    std::cerr << "DEBUG: Calling displayPage for page " << (pageIndex + 1)
              << std::endl;
    doc->displayPage(&outputDev, pageIndex + 1, 72.0, 72.0, // DPI
                     0,                                     // rotation
                     false,                                 // useMediaBox
                     false,                                 // crop
                     false);                                // printing

    result.page = std::move(outputDev.getContent());
    std::cerr << "DEBUG: Found " << result.page.images.size() << " images, "
              << result.page.drawings.size() << " drawings" << std::endl;

    // Text layer through the C++ wrapper
    std::unique_ptr<poppler::document> textDoc(
        poppler::document::load_from_file(pdfPath));

    if (!textDoc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (textDoc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    std::unique_ptr<poppler::page> page(textDoc->create_page(pageIndex));
    if (!page) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageIndex + 1);
      return result;
    }

    // Word boxes use the same top-left crop box space as the OutputDev
    std::vector<cv::Rect2d> words;
    for (auto &textBox : page->text_list()) {
      poppler::byte_array textBytes = textBox.text().to_utf8();
      if (textBytes.empty())
        continue;

      poppler::rectf bbox = textBox.bbox();
      words.emplace_back(bbox.x(), bbox.y(), bbox.width(), bbox.height());
    }

    std::vector<cv::Rect2d> lines = groupWordsIntoLines(words);
    std::cerr << "DEBUG: Grouped " << words.size() << " words into "
              << lines.size() << " text lines" << std::endl;

    for (const auto &line : lines) {
      TextBlock block;
      block.bounds = line;
      block.kind = BlockKind::Text;
      result.page.textBlocks.push_back(block);
    }

    for (const auto &image : result.page.images) {
      TextBlock block;
      block.bounds = image.placement;
      block.kind = BlockKind::Image;
      result.page.textBlocks.push_back(block);
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page loading failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace artfmt
