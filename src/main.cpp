#include "RegionClassifier.hpp"

#include <iomanip>
#include <iostream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -p, --page <index>        Page index, 0-based (default: 0)\n"
      << "      --coords-origin <o>   'pdf' to use --x/--y/--width/--height\n"
      << "      --x <pt>              Region left edge in points\n"
      << "      --y <pt>              Region top edge in points\n"
      << "      --width <pt>          Region width in points\n"
      << "      --height <pt>         Region height in points\n"
      << "  -s, --set <name=value>    Override a classifier parameter\n"
      << "      --list-config         Print all parameters and exit\n"
      << "  -h, --help                Show this help message\n"
      << "\nWithout a complete pdf region the bottom half of the page is "
         "analysed.\n"
      << "\nExamples:\n"
      << "  " << programName << " proof.pdf\n"
      << "  " << programName
      << " proof.pdf --coords-origin pdf --x 36 --y 400 --width 540 "
         "--height 360\n"
      << "  " << programName << " proof.pdf -s coverage.drawingWeight=0.3\n";
}

void printConfig(const artfmt::ClassifierConfig &config) {
  for (const auto &entry : artfmt::listConfigValues(config)) {
    std::cout << std::left << std::setw(36) << entry.first << entry.second
              << "\n";
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  int pageIndex = 0;
  artfmt::RegionRequest request;
  artfmt::ClassifierConfig config;
  bool listConfig = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](std::string &target) -> bool {
      if (i + 1 < argc) {
        target = argv[++i];
        return true;
      }
      std::cerr << "Error: " << arg << " requires an argument\n";
      return false;
    };

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-p" || arg == "--page") {
      std::string value;
      if (!requireValue(value))
        return 1;
      try {
        pageIndex = std::stoi(value);
      } catch (const std::exception &) {
        std::cerr << "Error: invalid page index: " << value << "\n";
        return 1;
      }
    } else if (arg == "--coords-origin") {
      if (!requireValue(request.coordsOrigin))
        return 1;
    } else if (arg == "--x") {
      if (!requireValue(request.x))
        return 1;
    } else if (arg == "--y") {
      if (!requireValue(request.y))
        return 1;
    } else if (arg == "--width") {
      if (!requireValue(request.width))
        return 1;
    } else if (arg == "--height") {
      if (!requireValue(request.height))
        return 1;
    } else if (arg == "-s" || arg == "--set") {
      std::string assignment;
      if (!requireValue(assignment))
        return 1;
      size_t eq = assignment.find('=');
      if (eq == std::string::npos) {
        std::cerr << "Error: --set expects name=value, got: " << assignment
                  << "\n";
        return 1;
      }
      std::string error;
      if (!artfmt::setConfigValue(config, assignment.substr(0, eq),
                                  assignment.substr(eq + 1), error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
      }
    } else if (arg == "--list-config") {
      listConfig = true;
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (listConfig) {
    printConfig(config);
    return 0;
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  artfmt::RegionClassifier classifier(config);
  auto result = classifier.classifyPDF(pdfPath, pageIndex, request);

  if (!result.success) {
    std::cerr << "Classification failed: " << result.errorMessage << "\n";
    return 1;
  }

  const auto &m = result.metrics;

  std::cout << "=== Art Format Detection ===\n"
            << "File: " << pdfPath << "\n"
            << "Page: " << pageIndex << "\n"
            << "Region: " << artfmt::toString(m.regionSource) << " ("
            << std::fixed << std::setprecision(1) << m.clip.x << ", "
            << m.clip.y << ", " << m.clip.width << " x " << m.clip.height
            << " pt)\n"
            << "----------------------------------------\n";

  std::cout << "Format: " << artfmt::toString(result.label) << "\n"
            << "Rule:   " << artfmt::toString(result.rule) << "\n"
            << "----------------------------------------\n";

  std::cout << std::setprecision(4);
  std::cout << std::left << std::setw(28) << "Raster coverage"
            << m.rasterCoverage << "\n"
            << std::setw(28) << "Text coverage" << m.textCoverage << "\n"
            << std::setw(28) << "Drawing coverage" << m.drawingCoverage << "\n"
            << std::setw(28) << "Effective vector coverage"
            << m.effectiveVectorCoverage << "\n"
            << std::setw(28) << "Vector segments" << m.vectorSegments << "\n"
            << std::setw(28) << "Raster count" << m.rasterCount << "\n";

  if (m.nativeRaster) {
    const auto &native = *m.nativeRaster;
    std::cout << "\n[Native Raster]\n"
              << std::setw(28) << "Image" << native.imageId << "\n"
              << std::setw(28) << "Native size (px)" << native.nativePxW
              << " x " << native.nativePxH << "\n"
              << std::setprecision(3) << std::setw(28) << "Placed size (in)"
              << native.placedWidthIn << " x " << native.placedHeightIn
              << "\n"
              << std::setprecision(1) << std::setw(28) << "Native DPI (x, y)"
              << native.dpiX << ", " << native.dpiY << "\n"
              << std::setw(28) << "Native DPI (min)" << native.dpiMin << "\n";
  }

  std::cout << "\nProcessing time: " << std::setprecision(2)
            << result.processingTimeMs << " ms\n";

  return 0;
}
