#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/errors/error_classifier.hpp"

namespace speechmaker::files {

/*
  Source text and output folder handling.

  Read failures are classified in the file domain and thrown as
  errors::ClassifiedError.
*/
class FileManager {
 public:
  static constexpr std::uintmax_t kMaxTextFileBytes = 10 * 1024 * 1024;

  explicit FileManager(std::shared_ptr<errors::ErrorClassifier> classifier);

  // .txt only, at most 10MB, readable, not blank.
  std::string ReadTextFile(const std::string& path);

  // Creates the directory when missing; true if it is a writable directory.
  bool ValidateOutputDirectory(const std::string& directory) const;

  // <directory>/<base><extension>, then <base>_1, <base>_2, ... until unused.
  // <>:"/\|?* in `base` are replaced by '_'. `extension` includes the dot.
  std::string GenerateUniqueFileName(const std::string& directory, const std::string& base,
                                     const std::string& extension) const;

  // First writable of ~/Documents/SpeechMaker, ~/SpeechMaker, <tmp>/SpeechMaker.
  // Empty when none is usable.
  std::string DefaultOutputFolder() const;

  std::vector<std::string> DefaultOutputCandidates() const;

 private:
  std::shared_ptr<errors::ErrorClassifier> classifier_;
};

} // namespace speechmaker::files
