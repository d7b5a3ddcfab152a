#include "uidgen/core/unique_id.h"

#include <charconv>
#include <limits>
#include <optional>
#include <ostream>
#include <system_error>

namespace uidgen::core {

namespace {

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

// Reads one field starting at pos; on success advances pos past it.
Result<std::int64_t, ParseError> read_field(std::string_view text, std::size_t& pos) {
  if (pos >= text.size()) {
    return Result<std::int64_t, ParseError>::err(ParseError::kMissingField);
  }

  std::size_t end = pos;
  if (text[end] == '-') {
    ++end;
  }
  const std::size_t digits_begin = end;
  while (end < text.size() && is_digit(text[end])) {
    ++end;
  }
  if (end == digits_begin) {
    return Result<std::int64_t, ParseError>::err(end == text.size() ? ParseError::kMissingField
                                                                     : ParseError::kInvalidFormat);
  }

  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + end, value);
  if (ec == std::errc::result_out_of_range) {
    return Result<std::int64_t, ParseError>::err(ParseError::kOutOfRange);
  }
  if (ec != std::errc{} || ptr != text.data() + end) {
    return Result<std::int64_t, ParseError>::err(ParseError::kInvalidFormat);
  }

  pos = end;
  return Result<std::int64_t, ParseError>::ok(value);
}

// Consumes the '-' separating two fields.
std::optional<ParseError> read_separator(std::string_view text, std::size_t& pos) {
  if (pos >= text.size()) {
    return ParseError::kMissingField;
  }
  if (text[pos] != '-') {
    return ParseError::kInvalidFormat;
  }
  ++pos;
  return std::nullopt;
}

}  // namespace

std::string UniqueId::to_string() const {
  return std::to_string(timestamp_) + "-" + std::to_string(node_address_) + "-" +
         std::to_string(sequence_);
}

int compare(const UniqueId& a, const UniqueId& b) {
  const auto order = a <=> b;
  if (order < 0) {
    return -1;
  }
  if (order > 0) {
    return 1;
  }
  return 0;
}

std::ostream& operator<<(std::ostream& os, const UniqueId& id) {
  return os << id.to_string();
}

Result<UniqueId, ParseError> parse_unique_id(std::string_view text) {
  using ParseResult = Result<UniqueId, ParseError>;

  std::size_t pos = 0;

  const auto timestamp = read_field(text, pos);
  if (!timestamp.has_value()) {
    return ParseResult::err(timestamp.error());
  }
  if (const auto sep = read_separator(text, pos)) {
    return ParseResult::err(*sep);
  }

  const auto node_address = read_field(text, pos);
  if (!node_address.has_value()) {
    return ParseResult::err(node_address.error());
  }
  if (const auto sep = read_separator(text, pos)) {
    return ParseResult::err(*sep);
  }

  const auto sequence = read_field(text, pos);
  if (!sequence.has_value()) {
    return ParseResult::err(sequence.error());
  }
  if (pos != text.size()) {
    return ParseResult::err(ParseError::kInvalidFormat);
  }
  if (sequence.value() < 0 || sequence.value() > std::numeric_limits<std::int32_t>::max()) {
    return ParseResult::err(ParseError::kOutOfRange);
  }

  return ParseResult::ok(UniqueId{timestamp.value(), node_address.value(),
                                  static_cast<std::int32_t>(sequence.value())});
}

}  // namespace uidgen::core
