#pragma once
#include <strata/model/entity.hpp>
#include <strata/model/entity_type.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace strata::model {

using data_values_t = std::variant<std::monostate,
                                   std::vector<int32_t>,
                                   std::vector<double>,
                                   std::vector<std::string>>;

primitive_type_t primitive_type_of(const data_values_t& values);

/// Value channel attached to an object.
class data final : public entity {
 public:
  data(strata::workspace::workspace& workspace,
       const strata::schema::uid_t& uid,
       const strata::schema::uid_t& type_uid,
       std::string name,
       association_t association = association_t::object);

  entity_kind_t kind() const override { return entity_kind_t::data; }
  data* as_data() override { return this; }

  association_t association() const { return association_; }
  const data_values_t& values() const { return values_; }
  void set_values(data_values_t values);
  std::size_t size() const;

 private:
  association_t association_;
  data_values_t values_;
};

}  // namespace strata::model
