#pragma once
#include <strata/model/entity_kind.hpp>
#include <strata/schema/primitives.hpp>
#include <string>
#include <vector>

namespace strata::model {

/// Named, ordered set of data uids clustering related channels of one
/// object (for instance "Observed" and "Uncertainties").
class property_group final {
 public:
  property_group(const strata::schema::uid_t& uid,
                 std::string name,
                 association_t association = association_t::unknown);

  const strata::schema::uid_t& uid() const { return uid_; }
  const std::string& name() const { return name_; }
  association_t association() const { return association_; }
  const std::vector<strata::schema::uid_t>& properties() const {
    return properties_;
  }

  bool contains(const strata::schema::uid_t& data_uid) const;
  /// Append `data_uid` unless already listed; returns whether it was added.
  bool add(const strata::schema::uid_t& data_uid);
  bool remove(const strata::schema::uid_t& data_uid);

 private:
  strata::schema::uid_t uid_;
  std::string name_;
  association_t association_;
  std::vector<strata::schema::uid_t> properties_;
};

}  // namespace strata::model
