#include <strata/model/property_group.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace strata::model {

property_group::property_group(const strata::schema::uid_t& uid,
                               std::string name,
                               association_t association)
    : uid_{uid}, name_{std::move(name)}, association_{association} {}

bool property_group::contains(const strata::schema::uid_t& data_uid) const {
  return std::find(std::begin(properties_), std::end(properties_), data_uid) !=
         std::end(properties_);
}

bool property_group::add(const strata::schema::uid_t& data_uid) {
  if (contains(data_uid)) {
    return false;
  }
  properties_.push_back(data_uid);
  return true;
}

bool property_group::remove(const strata::schema::uid_t& data_uid) {
  auto it = std::find(std::begin(properties_), std::end(properties_), data_uid);
  if (it == std::end(properties_)) {
    return false;
  }
  properties_.erase(it);
  return true;
}

}  // namespace strata::model
