#include <strata/model/entity.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace strata::model {

entity::entity(strata::workspace::workspace& workspace,
               const strata::schema::uid_t& uid,
               const strata::schema::uid_t& type_uid,
               std::string name)
    : workspace_{workspace},
      uid_{uid},
      type_uid_{type_uid},
      name_{std::move(name)} {}

void entity::set_name(std::string name) {
  name_ = std::move(name);
  modified_ = true;
}

bool entity::has_child(const strata::schema::uid_t& uid) const {
  return std::find(std::begin(children_), std::end(children_), uid) !=
         std::end(children_);
}

void entity::add_child(const strata::schema::uid_t& uid) {
  if (!has_child(uid)) {
    children_.push_back(uid);
    modified_ = true;
  }
}

bool entity::remove_child(const strata::schema::uid_t& uid) {
  auto it = std::find(std::begin(children_), std::end(children_), uid);
  if (it == std::end(children_)) {
    return false;
  }
  children_.erase(it);
  modified_ = true;
  return true;
}

}  // namespace strata::model
