#include "dococr/OcrEngine.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace dococr {

namespace {

constexpr size_t kTsvColumns = 12;
constexpr size_t kLeftColumn = 6;
constexpr size_t kConfidenceColumn = 10;
constexpr size_t kTextColumn = 11;

std::vector<std::string> splitTabs(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream stream(line);
  while (std::getline(stream, field, '\t')) {
    fields.push_back(field);
  }
  // getline drops a trailing empty field
  if (!line.empty() && line.back() == '\t') {
    fields.emplace_back();
  }
  return fields;
}

int toInt(const std::string &value) {
  return static_cast<int>(std::strtol(value.c_str(), nullptr, 10));
}

} // namespace

std::string EngineConfig::toString() const {
  std::ostringstream config;
  config << "--oem " << engineMode << " --psm " << pageSegMode << " -l "
         << language;
  if (tessdataDir) {
    config << " --tessdata-dir " << *tessdataDir;
  }
  return config.str();
}

bool EngineConfig::operator==(const EngineConfig &other) const {
  return engineMode == other.engineMode && pageSegMode == other.pageSegMode &&
         language == other.language && tessdataDir == other.tessdataDir;
}

EngineConfig buildEngineConfig(const RecognitionOptions &options) {
  EngineConfig config;
  config.engineMode = options.engineMode;
  config.pageSegMode = options.pageSegMode;
  config.language = options.language;

  if (options.tessdataDir && !options.tessdataDir->empty()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*options.tessdataDir, ec)) {
      std::string dir = *options.tessdataDir;
      std::replace(dir.begin(), dir.end(), '\\', '/');
      config.tessdataDir = dir;
    } else {
      std::cerr << "Ignoring tessdata directory '" << *options.tessdataDir
                << "': not a directory" << std::endl;
    }
  }

  return config;
}

WordTable parseTsv(const std::string &tsv) {
  WordTable table;
  std::istringstream stream(tsv);
  std::string line;

  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.compare(0, 5, "level") == 0) {
      continue;
    }

    std::vector<std::string> fields = splitTabs(line);
    fields.resize(std::max(fields.size(), kTsvColumns));

    table.boxes.emplace_back(toInt(fields[kLeftColumn]),
                             toInt(fields[kLeftColumn + 1]),
                             toInt(fields[kLeftColumn + 2]),
                             toInt(fields[kLeftColumn + 3]));
    table.confidence.push_back(fields[kConfidenceColumn]);
    table.text.push_back(fields[kTextColumn]);
  }

  return table;
}

} // namespace dococr
