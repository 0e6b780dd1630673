#include "core/text.hpp"

#include <cctype>
#include <cstdint>

namespace warden::text {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

std::string trim(std::string_view input) {
  size_t begin = 0;
  size_t end = input.size();
  while (begin < end && is_space(input[begin])) ++begin;
  while (end > begin && is_space(input[end - 1])) --end;
  return std::string(input.substr(begin, end - begin));
}

std::vector<std::string> split_whitespace(std::string_view input) {
  std::vector<std::string> words;
  std::string current;
  for (char c : input) {
    if (is_space(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

std::string collapse_whitespace(std::string_view input) {
  std::string result;
  for (const auto& word : split_whitespace(input)) {
    if (!result.empty()) result.push_back(' ');
    result += word;
  }
  return result;
}

std::string to_lower(std::string_view input) {
  std::string result(input);
  for (auto& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

bool is_blank(std::string_view input) {
  for (char c : input) {
    if (!is_space(c)) return false;
  }
  return true;
}

std::string percent_decode(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size()) {
      int hi = hex_value(input[i + 1]);
      int lo = hex_value(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    result.push_back(input[i]);
  }
  return result;
}

std::string decode_html_entities(std::string_view input) {
  if (input.find('&') == std::string_view::npos) {
    return std::string(input);
  }

  std::string result;
  result.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    if (input[i] != '&') {
      result.push_back(input[i++]);
      continue;
    }

    auto semi = input.find(';', i);
    if (semi == std::string_view::npos || semi - i > 10) {
      result.push_back(input[i++]);
      continue;
    }

    auto entity = input.substr(i + 1, semi - i - 1);
    bool decoded = true;
    if (entity == "amp") {
      result.push_back('&');
    } else if (entity == "lt") {
      result.push_back('<');
    } else if (entity == "gt") {
      result.push_back('>');
    } else if (entity == "quot") {
      result.push_back('"');
    } else if (entity == "apos") {
      result.push_back('\'');
    } else if (entity.size() > 1 && entity[0] == '#') {
      bool hex = entity[1] == 'x' || entity[1] == 'X';
      auto digits = entity.substr(hex ? 2 : 1);
      uint32_t cp = 0;
      decoded = !digits.empty();
      for (char c : digits) {
        int v = hex ? hex_value(c) : (std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : -1);
        if (v < 0 || cp > 0x10FFFF) {
          decoded = false;
          break;
        }
        cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(v);
      }
      if (decoded && cp > 0 && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF)) {
        append_utf8(result, cp);
      } else {
        decoded = false;
      }
    } else {
      decoded = false;
    }

    if (decoded) {
      i = semi + 1;
    } else {
      result.push_back(input[i++]);
    }
  }
  return result;
}

std::string sanitize_utf8(std::string_view input) {
  static const char* kReplacement = "\xEF\xBF\xBD";

  std::string output;
  output.reserve(input.size());

  auto byte_at = [&input](size_t pos) { return static_cast<unsigned char>(input[pos]); };
  auto is_continuation = [&](size_t pos) { return pos < input.size() && (byte_at(pos) & 0xC0) == 0x80; };

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = byte_at(i);
    size_t length = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;

    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      length = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      output.append(kReplacement);
      ++i;
      continue;
    }

    bool complete = true;
    for (size_t k = 1; k < length; ++k) {
      if (!is_continuation(i + k)) {
        complete = false;
        break;
      }
      cp = (cp << 6) | (byte_at(i + k) & 0x3F);
    }

    if (!complete) {
      output.append(kReplacement);
      ++i;
      continue;
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      output.append(kReplacement);
    } else {
      output.append(input.substr(i, length));
    }
    i += length;
  }

  return output;
}

}  // namespace warden::text
