#include "dococr/Errors.hpp"
#include "dococr/OcrPipeline.hpp"
#include "dococr/TesseractEngine.hpp"

#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

const char *kDefaultDictionary = "/usr/share/dict/words";

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <image_path> [options]\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>     OCR language (default: eng)\n"
      << "      --psm <0-13>          Page segmentation mode (default: 3)\n"
      << "      --oem <0-3>           OCR engine mode (default: 3)\n"
      << "      --tessdata-dir <dir>  Tesseract language data directory\n"
      << "      --blur <type>         None, Gaussian or Median "
         "(default: Gaussian)\n"
      << "      --no-deskew           Skip skew correction\n"
      << "      --no-clahe            Skip contrast equalization\n"
      << "      --no-spellcheck       Skip spell correction\n"
      << "  -c, --min-confidence <n>  Minimum word confidence (default: 35)\n"
      << "      --dictionary <file>   Word list for spell correction\n"
      << "      --save-processed <f>  Write the conditioned image to <f>\n"
      << "      --list-languages      Show installed OCR languages\n"
      << "      --list-modes          Show page segmentation and engine modes\n"
      << "  -h, --help                Show this help message\n"
      << "\nEnvironment:\n"
      << "  TESSDATA_PREFIX           Default tessdata directory\n"
      << "  DOCOCR_DICTIONARY         Default dictionary file\n"
      << "\nExamples:\n"
      << "  " << programName << " scan.png\n"
      << "  " << programName << " scan.png -l ind+eng --psm 6\n"
      << "  " << programName << " photo.jpg --blur Median --no-clahe\n";
}

void printModes() {
  std::cout << "Page segmentation modes (--psm):\n";
  for (int mode = 0; mode <= 13; ++mode) {
    std::cout << std::setw(4) << mode << ": "
              << dococr::pageSegModeDescription(mode) << "\n";
  }
  std::cout << "\nEngine modes (--oem):\n";
  for (int mode = 0; mode <= 3; ++mode) {
    std::cout << std::setw(4) << mode << ": "
              << dococr::engineModeDescription(mode) << "\n";
  }
}

std::shared_ptr<const dococr::Dictionary>
loadDictionary(const std::string &requested) {
  std::string path = requested;
  if (path.empty()) {
    const char *envPath = std::getenv("DOCOCR_DICTIONARY");
    path = envPath != nullptr ? envPath : kDefaultDictionary;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    std::cerr << "Warning: dictionary not found: " << path << "\n";
    return nullptr;
  }

  try {
    auto dictionary = std::make_shared<dococr::FrequencyDictionary>(
        dococr::FrequencyDictionary::load(path));
    std::cerr << "Loaded " << dictionary->size() << " words from " << path
              << "\n";
    return dictionary;
  } catch (const std::exception &e) {
    std::cerr << "Warning: " << e.what() << "\n";
    return nullptr;
  }
}

int parseInt(const std::string &option, const std::string &value) {
  const std::string message =
      option + " expects an integer, got '" + value + "'";
  size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(message);
  }
  if (consumed != value.size()) {
    throw std::invalid_argument(message);
  }
  return parsed;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string imagePath;
  std::string dictionaryPath;
  std::string processedPath;
  dococr::RecognitionOptions options;
  bool listLanguages = false;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(arg + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "--list-modes") {
        printModes();
        return 0;
      } else if (arg == "--list-languages") {
        listLanguages = true;
      } else if (arg == "-l" || arg == "--language") {
        options.language = value();
      } else if (arg == "--psm") {
        options.pageSegMode = parseInt(arg, value());
      } else if (arg == "--oem") {
        options.engineMode = parseInt(arg, value());
      } else if (arg == "--tessdata-dir") {
        options.tessdataDir = value();
      } else if (arg == "--blur") {
        options.blurType = dococr::parseBlurType(value());
      } else if (arg == "--no-deskew") {
        options.applyDeskew = false;
      } else if (arg == "--no-clahe") {
        options.applyClahe = false;
      } else if (arg == "--no-spellcheck") {
        options.applySpellcheck = false;
      } else if (arg == "-c" || arg == "--min-confidence") {
        options.minConfidence = parseInt(arg, value());
      } else if (arg == "--dictionary") {
        dictionaryPath = value();
      } else if (arg == "--save-processed") {
        processedPath = value();
      } else if (arg[0] != '-') {
        imagePath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
    options.validate();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  auto engine = std::make_shared<dococr::TesseractEngine>();

  if (listLanguages) {
    try {
      std::cout << "Available languages: ";
      auto languages =
          engine->availableLanguages(dococr::buildEngineConfig(options));
      for (size_t i = 0; i < languages.size(); ++i) {
        std::cout << languages[i];
        if (i < languages.size() - 1)
          std::cout << ", ";
      }
      std::cout << "\n";
      return 0;
    } catch (const std::runtime_error &e) {
      std::cerr << "\n" << e.what() << "\n";
      return 1;
    }
  }

  if (imagePath.empty()) {
    std::cerr << "Error: No image path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Display version info
  std::cout << "=== dococr ===\n"
            << "Tesseract version: " << dococr::TesseractEngine::version()
            << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << options.language << "\n"
            << "==============\n\n";

  std::shared_ptr<const dococr::Dictionary> dictionary;
  if (options.applySpellcheck && options.language == dococr::kEnglishLanguage) {
    dictionary = loadDictionary(dictionaryPath);
  }

  dococr::OcrPipeline pipeline(engine, dictionary);

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    auto output = pipeline.recognize(imagePath, options);
    auto endTime = std::chrono::high_resolution_clock::now();

    std::cout << "\n[Extracted Text]\n";
    std::cout << "-------------------------------------------\n";
    std::cout << output.result.text() << "\n";
    std::cout << "-------------------------------------------\n";
    std::cout << "Conditioned image: " << output.result.width() << "x"
              << output.result.height() << " pixels\n";
    std::cout << "Processing time: " << std::fixed << std::setprecision(2)
              << std::chrono::duration<double, std::milli>(endTime - startTime)
                     .count()
              << " ms\n";

    if (!processedPath.empty()) {
      if (cv::imwrite(processedPath, output.conditioned)) {
        std::cout << "Saved conditioned image: " << processedPath << "\n";
      } else {
        std::cerr << "Warning: could not write " << processedPath << "\n";
      }
    }
  } catch (const dococr::EngineNotFoundError &e) {
    std::cerr << "\n"
              << e.what() << "\n"
              << "Install Tesseract (e.g. tesseract-ocr and "
                 "tesseract-ocr-eng) or point --tessdata-dir / "
                 "TESSDATA_PREFIX at its language data.\n";
    return 1;
  } catch (const dococr::ImageLoadError &e) {
    std::cerr << "\n" << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "\nOCR failed: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
