#pragma once
#include <array>
#include <boost/functional/hash.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using uid_t = boost::uuids::uuid;
using uid_bytes_t = std::array<uint8_t, 16>;
using uid_hash_t = boost::hash<uid_t>;

struct vector3_t final {
  double x{};
  double y{};
  double z{};

  bool operator==(const vector3_t&) const = default;
};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Fresh random (version 4) uid.
uid_t make_uid();
uid_t make_uid(const uid_bytes_t& bytes);
/// Parse a uid string; the critical path is taken on malformed input.
uid_t make_uid(const std::string_view& text);
std::optional<uid_t> try_make_uid(const std::string_view& text);
uid_t make_nil_uid();
bool is_nil(const uid_t& uid);

uid_bytes_t to_uid_bytes(const uid_t& uid);
std::string to_string(const uid_t& uid);

}  // namespace strata::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
