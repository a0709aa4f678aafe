#include "voice_list_parser.hpp"

#include <cmath>
#include <regex>
#include <sstream>

namespace speechmaker::engine {

namespace {

std::string Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(begin, end - begin + 1));
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

struct PendingVoice {
  std::string name;
  std::string short_name;
  std::string gender;
  std::string locale;

  bool Empty() const {
    return name.empty() && short_name.empty();
  }
};

void Push(std::vector<model::Voice>& out, PendingVoice& pending) {
  if (pending.Empty()) {
    return;
  }
  model::Voice voice;
  voice.id           = pending.short_name.empty() ? pending.name : pending.short_name;
  voice.display_name = pending.name.empty() ? voice.id : pending.name;
  voice.gender       = pending.gender.empty() ? "Unknown" : pending.gender;
  voice.locale       = pending.locale.empty() ? LocaleFromVoiceId(voice.id) : pending.locale;
  out.push_back(std::move(voice));
  pending = PendingVoice{};
}

std::string Match(const std::string& line, const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(line, match, pattern)) {
    return Trim(match[1].str());
  }
  return {};
}

} // namespace

std::string LocaleFromVoiceId(std::string_view id) {
  const auto first = id.find('-');
  if (first == std::string_view::npos) {
    return "Unknown";
  }
  const auto second = id.find('-', first + 1);
  if (second == std::string_view::npos) {
    return "Unknown";
  }
  return std::string(id.substr(0, second));
}

std::string FormatRate(double speed) {
  const long percent = std::lround((speed - 1.0) * 100.0);
  return (percent >= 0 ? "+" : "") + std::to_string(percent) + "%";
}

std::vector<model::Voice> ParseVoiceList(std::string_view output) {
  static const std::regex name_field(R"(Name:\s*([^,]+))");
  static const std::regex gender_field(R"(Gender:\s*([^,]+))");
  static const std::regex locale_field(R"((?:Language|Locale):\s*([^,\s]+))");
  static const std::regex table_header(R"(^Name\s+Gender\b)");

  std::vector<model::Voice> voices;
  PendingVoice              pending;
  bool                      table = false;

  std::istringstream stream{std::string(output)};
  std::string        raw;
  while (std::getline(stream, raw)) {
    const auto line = Trim(raw);
    if (line.empty()) {
      Push(voices, pending);
      continue;
    }

    if (std::regex_search(line, table_header)) {
      Push(voices, pending);
      table = true;
      continue;
    }

    if (table) {
      if (StartsWith(line, "---")) {
        continue;
      }
      std::istringstream row(line);
      std::string        id;
      std::string        gender;
      row >> id >> gender;
      pending.short_name = id;
      pending.gender     = gender;
      Push(voices, pending);
      continue;
    }

    if (StartsWith(line, "Name:") && line.find(", Gender:") != std::string::npos) {
      Push(voices, pending);
      pending.name   = Match(line, name_field);
      pending.gender = Match(line, gender_field);
      pending.locale = Match(line, locale_field);
      Push(voices, pending);
      continue;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const auto key   = std::string_view(line).substr(0, colon);
    const auto value = Trim(std::string_view(line).substr(colon + 1));

    if (key == "Name") {
      if (!pending.name.empty()) {
        Push(voices, pending);
      }
      pending.name = value;
    } else if (key == "ShortName") {
      pending.short_name = value;
    } else if (key == "Gender") {
      pending.gender = value;
    } else if (key == "Locale" || key == "Language") {
      pending.locale = value;
    }
  }
  Push(voices, pending);

  for (auto& voice : voices) {
    if (StartsWith(voice.locale, "en")) {
      voice.is_default = true;
      break;
    }
  }
  return voices;
}

} // namespace speechmaker::engine
