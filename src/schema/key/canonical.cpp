#include <hexref/schema/key/canonical.hpp>

#include <algorithm>
#include <cctype>
#include <string>

using namespace hexref::schema;

namespace hexref::schema::key {

namespace {

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_valid_code(std::string_view value) {
  return std::ranges::none_of(value, [](const char c) {
    return c == kCanonicalDelimiter || static_cast<unsigned char>(c) > 0x7F;
  });
}

std::string normalize_code(const std::optional<std::string>& value) {
  if (!value) {
    return {};
  }
  return to_upper(trim(*value));
}

}  // namespace

// Anchored match: `2024-01-15T10:00` is not a date here and falls back to
// today, so only the ten date characters can reach the base key.
bool is_iso_date(std::string_view value) {
  if (value.size() != 10) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i == 4 || i == 7) {
      if (value[i] != '-') {
        return false;
      }
    } else if (!is_digit(value[i])) {
      return false;
    }
  }
  return true;
}

std::optional<normalized_attributes_t> normalize(const raw_attributes_t& raw,
                                                 std::string_view today,
                                                 canonical_error& error) {
  auto type = try_parse_procedure_type(to_upper(trim(raw.type)));
  if (!type) {
    error.code = allocation_error_code::invalid_type;
    error.message = "type must be one of C, M, S, I, A";
    return std::nullopt;
  }

  if (trim(raw.secret).empty()) {
    error.code = allocation_error_code::missing_secret;
    error.message = "secret is required";
    return std::nullopt;
  }

  auto out = normalized_attributes_t{};
  out.type = *type;

  auto date = raw.date ? trim(*raw.date) : std::string_view{};
  out.date = is_iso_date(date) ? std::string{date} : std::string{today};

  out.jurisdiction = normalize_code(raw.jurisdiction);
  out.channel = normalize_code(raw.channel);
  if (out.channel.empty()) {
    out.channel = std::string{kDefaultChannel};
  }
  if (!is_valid_code(out.jurisdiction) || !is_valid_code(out.channel)) {
    error.code = allocation_error_code::invalid_field;
    error.message =
        "jurisdiction and channel must be ASCII and must not contain '|'";
    return std::nullopt;
  }

  out.secret = raw.secret;
  return out;
}

std::string make_base_key(const normalized_attributes_t& attrs) {
  auto key = std::string{kCanonicalVersion};
  key.push_back(kCanonicalDelimiter);
  key.push_back(to_symbol(attrs.type));
  key.push_back(kCanonicalDelimiter);
  key.append(attrs.date);
  key.push_back(kCanonicalDelimiter);
  key.append(attrs.jurisdiction);
  key.push_back(kCanonicalDelimiter);
  key.append(attrs.channel);
  return key;
}

std::string make_full_key(std::string_view base_key,
                          const disambiguator_t disambiguator,
                          std::string_view secret) {
  auto key = std::string{base_key};
  key.push_back(kCanonicalDelimiter);
  key.append(std::to_string(disambiguator));
  key.push_back(kCanonicalDelimiter);
  key.append(secret);
  return key;
}

}  // namespace hexref::schema::key
