#ifndef ART_FORMAT_PDF_PAGE_LOADER_HPP
#define ART_FORMAT_PDF_PAGE_LOADER_HPP

#include "PageContent.hpp"

#include <string>
#include <vector>

namespace artfmt {

/**
 * @brief Result of loading a page's geometric content from a PDF
 */
struct PageContentResult {
  bool success = false;        ///< Whether the page was loaded
  std::string errorMessage;    ///< Error message if failed
  PageContent page;            ///< Extracted page content
  int pageIndex = 0;           ///< 0-indexed page that was loaded
  int pageCount = 0;           ///< Number of pages in the document
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Extracts images, vector drawings and text blocks from a PDF page
 *
 * Uses Poppler's low-level OutputDev interface for images and paths and the
 * Poppler C++ wrapper for text. All coordinates are returned in points with
 * the origin at the top-left of the page's crop box.
 *
 * Example usage:
 * @code
 * artfmt::PDFPageLoader loader;
 * auto result = loader.loadPage("proof.pdf", 0);
 * if (result.success) {
 *     std::cout << result.page.images.size() << " images" << std::endl;
 * }
 * @endcode
 */
class PDFPageLoader {
public:
  /**
   * @brief Load the content of one page
   *
   * The document is opened, read and closed within this call; nothing is kept
   * between calls.
   *
   * @param pdfPath Path to the PDF file
   * @param pageIndex 0-indexed page number
   * @return PageContentResult with the page content or an error message
   */
  PageContentResult loadPage(const std::string &pdfPath,
                             int pageIndex = 0) const;
};

/**
 * @brief Check whether a straight-edged outline is an axis-aligned rectangle
 *
 * The outline needs four distinct corners joined by alternating horizontal
 * and vertical edges. A trailing point equal to the first one is the return
 * to the start; without it the outline must be closed.
 *
 * @param points Outline points in page space
 * @param closed Whether the outline was closed with a closepath
 */
bool isAxisAlignedRectangle(const std::vector<cv::Point2d> &points,
                            bool closed);

/**
 * @brief Group word boxes into line boxes
 *
 * Words whose vertical centres lie within half a word height of each other and
 * whose horizontal gap is below three line widths are merged, in input order.
 *
 * @param words Word bounding boxes, top-left origin
 * @return Bounding boxes of the grouped lines
 */
std::vector<cv::Rect2d> groupWordsIntoLines(const std::vector<cv::Rect2d> &words);

} // namespace artfmt

#endif // ART_FORMAT_PDF_PAGE_LOADER_HPP
