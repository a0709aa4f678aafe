#include "file_manager.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

#include "internal/errors/classified_error.hpp"
#include "internal/util/errno_codes.hpp"
#include "internal/util/errors.hpp"

namespace speechmaker::files {

namespace fs = std::filesystem;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Megabytes(std::uintmax_t bytes) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(bytes) / 1024.0 / 1024.0);
  return buffer;
}

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

FileManager::FileManager(std::shared_ptr<errors::ErrorClassifier> classifier) : classifier_(std::move(classifier)) {
  if (!classifier_) {
    throw util::InvalidArgument("file manager requires a classifier");
  }
}

std::string FileManager::ReadTextFile(const std::string& path) {
  auto fail = [&](const std::string& code, const std::string& message) {
    throw errors::ClassifiedError(
        classifier_->Classify(errors::RawError{code, message, errors::ErrorDomain::kFile, "read_text_file", path}));
  };

  if (path.empty()) {
    fail("EINVAL", "Invalid file path provided");
  }

  std::error_code ec;
  const auto      status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    fail(ec && ec != std::errc::no_such_file_or_directory ? util::ErrnoName(ec.value()) : "ENOENT",
         "File not found: " + path);
  }
  if (fs::is_directory(status)) {
    fail("EISDIR", "Is a directory: " + path);
  }

  const auto extension = Lower(fs::path(path).extension().string());
  if (extension != ".txt") {
    fail("EUNSUPPORTED", "Unsupported file type: " + (extension.empty() ? std::string("(none)") : extension) +
                             ". Only .txt files are supported.");
  }

  const auto size = fs::file_size(path, ec);
  if (ec) {
    fail(util::ErrnoName(ec.value()), "Cannot stat file: " + ec.message());
  }
  if (size > kMaxTextFileBytes) {
    fail("EFBIG", "File too large: " + Megabytes(size) + "MB. Maximum size is 10MB.");
  }

  if (::access(path.c_str(), R_OK) != 0) {
    fail(util::ErrnoName(errno), "Cannot read file: Permission denied for " + path);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    fail(util::ErrnoName(errno), "Cannot open file: " + path);
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    fail("EIO", "Failed to read file: " + path);
  }

  auto text = content.str();
  if (IsBlank(text)) {
    fail("EEMPTY", "File is empty or contains no readable text");
  }
  return text;
}

bool FileManager::ValidateOutputDirectory(const std::string& directory) const {
  if (directory.empty()) {
    return false;
  }
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec || !fs::is_directory(directory, ec)) {
    return false;
  }
  return ::access(directory.c_str(), W_OK) == 0;
}

std::string FileManager::GenerateUniqueFileName(const std::string& directory, const std::string& base,
                                                const std::string& extension) const {
  if (directory.empty() || base.empty() || extension.empty()) {
    throw util::InvalidArgument("Missing required parameters for filename generation");
  }

  std::string sanitized = base;
  std::replace_if(
      sanitized.begin(), sanitized.end(),
      [](char c) { return std::string_view("<>:\"/\\|?*").find(c) != std::string_view::npos; }, '_');

  fs::path candidate = fs::path(directory) / (sanitized + extension);
  for (int counter = 1; fs::exists(candidate); ++counter) {
    candidate = fs::path(directory) / (sanitized + "_" + std::to_string(counter) + extension);
  }
  return candidate.string();
}

std::vector<std::string> FileManager::DefaultOutputCandidates() const {
  std::vector<std::string> candidates;
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    candidates.push_back((fs::path(home) / "Documents" / "SpeechMaker").string());
    candidates.push_back((fs::path(home) / "SpeechMaker").string());
  }
  std::error_code ec;
  const auto      tmp = fs::temp_directory_path(ec);
  candidates.push_back(((ec ? fs::path("/tmp") : tmp) / "SpeechMaker").string());
  return candidates;
}

std::string FileManager::DefaultOutputFolder() const {
  for (const auto& candidate : DefaultOutputCandidates()) {
    if (ValidateOutputDirectory(candidate)) {
      return candidate;
    }
  }
  return {};
}

} // namespace speechmaker::files
