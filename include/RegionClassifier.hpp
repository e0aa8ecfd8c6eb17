#ifndef ART_FORMAT_REGION_CLASSIFIER_HPP
#define ART_FORMAT_REGION_CLASSIFIER_HPP

#include "ClassifierConfig.hpp"
#include "Coverage.hpp"
#include "DecisionEngine.hpp"
#include "NativeResolution.hpp"
#include "PDFPageLoader.hpp"
#include "PageContent.hpp"
#include "RegionGeometry.hpp"

#include <optional>
#include <string>

namespace artfmt {

/**
 * @brief Result of classifying a page region
 *
 * label, rule and metrics are only meaningful when success is true.
 */
struct ClassificationResult {
  bool success = false;     ///< Whether the region was fully analysed
  std::string errorMessage; ///< Error message if failed
  Label label = Label::HasRaster;                  ///< Region format
  DecisionRule rule = DecisionRule::DefaultRaster; ///< Rule that fired
  CoverageMetrics metrics;     ///< Signals the label was derived from
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Classifies a region of a PDF page as raster or vector dominated
 *
 * Measures raster, text and drawing coverage of the region, counts vector
 * segments, estimates the placed DPI of the dominant raster and feeds the
 * results through the decision cascade.
 *
 * Example usage:
 * @code
 * artfmt::RegionClassifier classifier;
 * auto request = artfmt::RegionRequest::fromPageRect(36, 400, 540, 360);
 * auto result = classifier.classifyPDF("proof.pdf", 0, request);
 * if (result.success) {
 *     std::cout << artfmt::toString(result.label) << std::endl;
 * }
 * @endcode
 */
class RegionClassifier {
public:
  /**
   * @brief Default constructor
   */
  RegionClassifier();

  /**
   * @brief Constructor with custom configuration
   * @param config Classifier configuration
   */
  explicit RegionClassifier(const ClassifierConfig &config);

  /**
   * @brief Classify a region of an already loaded page
   * @param page Page content, left untouched
   * @param request Region request; malformed requests use the bottom half
   * @return ClassificationResult, always successful
   */
  ClassificationResult classify(const PageContent &page,
                                const RegionRequest &request) const;

  /**
   * @brief Load a PDF page and classify a region of it
   *
   * The document is released before returning, on success and failure alike.
   *
   * @param pdfPath Path to the PDF file
   * @param pageIndex 0-indexed page number
   * @param request Region request; malformed requests use the bottom half
   * @return ClassificationResult; on load failure success is false and no
   * label is set
   */
  ClassificationResult classifyPDF(const std::string &pdfPath, int pageIndex,
                                   const RegionRequest &request) const;

  /**
   * @brief Compute all metrics for an explicit clip without deciding
   */
  CoverageMetrics measure(const PageContent &page,
                          const cv::Rect2d &clip) const;

  /**
   * @brief Get the current configuration
   */
  const ClassifierConfig &getConfig() const;

  /**
   * @brief Set a new configuration
   */
  void setConfig(const ClassifierConfig &config);

private:
  ClassifierConfig m_config; ///< Current configuration
  PDFPageLoader m_loader;    ///< Page content source for classifyPDF
};

} // namespace artfmt

#endif // ART_FORMAT_REGION_CLASSIFIER_HPP
