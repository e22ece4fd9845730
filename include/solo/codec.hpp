#ifndef SOLO_CODEC_HPP
#define SOLO_CODEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solo {

// One client invocation's arguments, program name excluded.
using ArgumentSet = std::vector<std::string>;

// NUL cannot appear inside a command line argument, newline can.
inline constexpr char kDelimiter = '\0';

// Largest message the host reads from a single connection.
inline constexpr std::size_t kMaxMessageSize = 4096;

// Wire format: [secret \0] arg1 \0 arg2 \0 ... \0
std::string encode(const ArgumentSet &args,
                   const std::optional<std::string> &secret = std::nullopt);

// Returns std::nullopt when the secret does not match or no argument is left.
// Empty segments are dropped; invalid UTF-8 is replaced, never rejected.
std::optional<ArgumentSet>
decode(std::string_view message,
       const std::optional<std::string> &secret = std::nullopt);

// Replaces every maximal invalid UTF-8 subsequence with U+FFFD.
std::string sanitizeUtf8(std::string_view bytes);

} // namespace solo

#endif // SOLO_CODEC_HPP
