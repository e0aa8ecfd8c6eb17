#include "RegionClassifier.hpp"

#include <chrono>
#include <iostream>
#include <set>

namespace artfmt {

RegionClassifier::RegionClassifier() : m_config(), m_loader() {}

RegionClassifier::RegionClassifier(const ClassifierConfig &config)
    : m_config(config), m_loader() {}

CoverageMetrics RegionClassifier::measure(const PageContent &page,
                                          const cv::Rect2d &clip) const {
  CoverageMetrics metrics;
  metrics.clip = clip;
  metrics.rasterCoverage = rasterCoverage(page, clip);
  metrics.textCoverage = textCoverage(page, clip);
  metrics.drawingCoverage = drawingCoverage(page, clip, m_config.coverage);
  metrics.effectiveVectorCoverage = effectiveVectorCoverage(
      metrics.textCoverage, metrics.drawingCoverage, m_config.coverage);
  metrics.vectorSegments = countVectorSegments(page, clip, m_config.segments);

  // Page-wide count of distinct images; repeated placements of one XObject
  // count once
  std::set<std::string> imageIds;
  for (const auto &image : page.images) {
    imageIds.insert(image.id);
  }
  metrics.rasterCount = static_cast<int>(imageIds.size());
  metrics.nativeRaster = estimateNativeResolution(page, clip);
  return metrics;
}

ClassificationResult
RegionClassifier::classify(const PageContent &page,
                           const RegionRequest &request) const {
  ClassificationResult result;

  auto startTime = std::chrono::high_resolution_clock::now();

  RegionSelection region = selectRegion(page.bounds, request);
  result.metrics = measure(page, region.clip);
  result.metrics.regionSource = region.source;

  Decision decision = decide(result.metrics, m_config.decision);
  result.label = decision.label;
  result.rule = decision.rule;
  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

ClassificationResult
RegionClassifier::classifyPDF(const std::string &pdfPath, int pageIndex,
                              const RegionRequest &request) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  PageContentResult loaded = m_loader.loadPage(pdfPath, pageIndex);

  ClassificationResult result;
  if (!loaded.success) {
    result.errorMessage = loaded.errorMessage;
  } else {
    result = classify(loaded.page, request);
    std::cerr << "DEBUG: Region " << toString(result.metrics.regionSource)
              << " classified as " << toString(result.label) << " by "
              << toString(result.rule) << std::endl;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const ClassifierConfig &RegionClassifier::getConfig() const {
  return m_config;
}

void RegionClassifier::setConfig(const ClassifierConfig &config) {
  m_config = config;
}

} // namespace artfmt
