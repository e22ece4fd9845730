#include "solo/codec.hpp"

namespace solo {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

// Length of the sequence introduced by `lead`, 0 if it cannot start one.
std::size_t sequenceLength(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if (lead >= 0xC2 && lead <= 0xDF)
    return 2;
  if (lead >= 0xE0 && lead <= 0xEF)
    return 3;
  if (lead >= 0xF0 && lead <= 0xF4)
    return 4;
  return 0;
}

// The second byte is restricted for some leads (overlongs, surrogates,
// code points above U+10FFFF); later continuation bytes are plain 80..BF.
bool validSecond(unsigned char lead, unsigned char byte) {
  switch (lead) {
  case 0xE0:
    return byte >= 0xA0 && byte <= 0xBF;
  case 0xED:
    return byte >= 0x80 && byte <= 0x9F;
  case 0xF0:
    return byte >= 0x90 && byte <= 0xBF;
  case 0xF4:
    return byte >= 0x80 && byte <= 0x8F;
  default:
    return byte >= 0x80 && byte <= 0xBF;
  }
}

} // namespace

std::string sanitizeUtf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  std::size_t i = 0;
  while (i < bytes.size()) {
    auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t len = sequenceLength(lead);
    if (len == 0) {
      out += kReplacement;
      ++i;
      continue;
    }

    std::size_t valid = 1;
    while (valid < len && i + valid < bytes.size()) {
      auto byte = static_cast<unsigned char>(bytes[i + valid]);
      bool ok = valid == 1 ? validSecond(lead, byte)
                           : (byte >= 0x80 && byte <= 0xBF);
      if (!ok)
        break;
      ++valid;
    }

    if (valid == len) {
      out.append(bytes.substr(i, len));
    } else {
      out += kReplacement;
    }
    i += valid;
  }
  return out;
}

std::string encode(const ArgumentSet &args,
                   const std::optional<std::string> &secret) {
  std::string message;
  if (secret) {
    message += *secret;
    message += kDelimiter;
  }
  for (const auto &arg : args) {
    message += arg;
    message += kDelimiter;
  }
  if (message.empty()) {
    message += kDelimiter;
  }
  return message;
}

std::optional<ArgumentSet> decode(std::string_view message,
                                  const std::optional<std::string> &secret) {
  std::string text = sanitizeUtf8(message);
  if (!text.empty() && text.back() == kDelimiter) {
    text.pop_back();
  }

  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find(kDelimiter, start);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > start) {
      segments.emplace_back(text.substr(start, end - start));
    }
    start = end + 1;
  }

  auto first = segments.begin();
  if (secret) {
    if (segments.empty() || segments.front() != *secret) {
      return std::nullopt;
    }
    ++first;
  }

  if (first == segments.end()) {
    return std::nullopt;
  }
  return ArgumentSet(first, segments.end());
}

} // namespace solo
