#include <strata/common/critical.hpp>
#include <strata/schema/primitives.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace strata::schema {

namespace {

std::string_view strip_braces(std::string_view text) {
  if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
    text.remove_prefix(1);
    text.remove_suffix(1);
  }
  return text;
}

bool is_canonical_uid(const std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') {
        return false;
      }
      continue;
    }
    if (std::isxdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

uid_t make_uid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return generator();
}

uid_t make_uid(const uid_bytes_t& bytes) {
  auto uid = uid_t{};
  std::copy(std::begin(bytes), std::end(bytes), uid.begin());
  return uid;
}

uid_t make_uid(const std::string_view& text) {
  auto uid = try_make_uid(text);
  if (!uid) {
    strata::common::critical("make_uid expected a canonical uid string");
  }
  return *uid;
}

std::optional<uid_t> try_make_uid(const std::string_view& text) {
  auto stripped = strip_braces(text);
  if (!is_canonical_uid(stripped)) {
    return std::nullopt;
  }
  auto generator = boost::uuids::string_generator{};
  return generator(std::begin(stripped), std::end(stripped));
}

uid_t make_nil_uid() {
  return uid_t{};
}

bool is_nil(const uid_t& uid) {
  return uid.is_nil();
}

uid_bytes_t to_uid_bytes(const uid_t& uid) {
  auto bytes = uid_bytes_t{};
  std::copy(uid.begin(), uid.end(), std::begin(bytes));
  return bytes;
}

std::string to_string(const uid_t& uid) {
  return boost::uuids::to_string(uid);
}

}  // namespace strata::schema
