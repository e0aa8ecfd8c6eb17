#include "ClassifierConfig.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace artfmt {

namespace {

// A named field of ClassifierConfig. Exactly one pointer is set.
struct Parameter {
  const char *name;
  double *real;
  int *integer;
  bool *flag;
};

Parameter real(const char *name, double &field) {
  return {name, &field, nullptr, nullptr};
}

Parameter integer(const char *name, int &field) {
  return {name, nullptr, &field, nullptr};
}

Parameter flag(const char *name, bool &field) {
  return {name, nullptr, nullptr, &field};
}

std::vector<Parameter> parameterTable(ClassifierConfig &config) {
  CoverageConfig &c = config.coverage;
  SegmentConfig &s = config.segments;
  DecisionThresholds &d = config.decision;

  return {
      real("coverage.hairlineWidth", c.hairlineWidth),
      real("coverage.panelAreaFraction", c.panelAreaFraction),
      integer("coverage.panelMaxItems", c.panelMaxItems),
      real("coverage.panelWeight", c.panelWeight),
      real("coverage.rectangleWeight", c.rectangleWeight),
      real("coverage.straightShapeWeight", c.straightShapeWeight),
      real("coverage.curvedShapeWeight", c.curvedShapeWeight),
      real("coverage.drawingWeight", c.drawingWeight),

      real("segments.hairlineWidth", s.hairlineWidth),
      real("segments.minAreaFraction", s.minAreaFraction),
      flag("segments.skipPanels", s.skipPanels),
      real("segments.panelAreaFraction", s.panelAreaFraction),
      integer("segments.panelMaxItems", s.panelMaxItems),

      real("decision.noRasterMax", d.noRasterMax),
      real("decision.noRasterVectorMin", d.noRasterVectorMin),
      real("decision.noRasterTextMin", d.noRasterTextMin),
      integer("decision.noRasterSegmentsMin", d.noRasterSegmentsMin),
      real("decision.rasterMargin", d.rasterMargin),
      real("decision.vectorMargin", d.vectorMargin),
      real("decision.closeRasterMin", d.closeRasterMin),
      real("decision.closeVectorMax", d.closeVectorMax),
      real("decision.pureVectorRasterMax", d.pureVectorRasterMax),
      integer("decision.pureVectorSegmentsMin", d.pureVectorSegmentsMin),
      integer("decision.lowDetailSegmentsMin", d.lowDetailSegmentsMin),
      real("decision.lowDetailDpiMax", d.lowDetailDpiMax),
      real("decision.lowDetailRasterMin", d.lowDetailRasterMin),
  };
}

} // anonymous namespace

bool setConfigValue(ClassifierConfig &config, const std::string &name,
                    const std::string &value, std::string &errorMessage) {
  for (const Parameter &param : parameterTable(config)) {
    if (name != param.name) {
      continue;
    }

    try {
      size_t consumed = 0;
      if (param.real) {
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
          errorMessage = "Invalid number for " + name + ": " + value;
          return false;
        }
        *param.real = parsed;
      } else if (param.integer) {
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
          errorMessage = "Invalid integer for " + name + ": " + value;
          return false;
        }
        *param.integer = parsed;
      } else {
        std::string lower = value;
        for (auto &ch : lower) {
          ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (lower == "true" || lower == "1") {
          *param.flag = true;
        } else if (lower == "false" || lower == "0") {
          *param.flag = false;
        } else {
          errorMessage = "Invalid boolean for " + name + ": " + value;
          return false;
        }
      }
    } catch (const std::invalid_argument &) {
      errorMessage = "Invalid value for " + name + ": " + value;
      return false;
    } catch (const std::out_of_range &) {
      errorMessage = "Value out of range for " + name + ": " + value;
      return false;
    }

    return true;
  }

  errorMessage = "Unknown parameter: " + name;
  return false;
}

std::vector<std::pair<std::string, std::string>>
listConfigValues(const ClassifierConfig &config) {
  // The table needs mutable fields, so list from a copy
  ClassifierConfig copy = config;
  std::vector<std::pair<std::string, std::string>> values;

  for (const Parameter &param : parameterTable(copy)) {
    std::ostringstream text;
    if (param.real) {
      text << *param.real;
    } else if (param.integer) {
      text << *param.integer;
    } else {
      text << (*param.flag ? "true" : "false");
    }
    values.emplace_back(param.name, text.str());
  }

  return values;
}

} // namespace artfmt
