#include <strata/model/data.hpp>

#include <utility>

namespace strata::model {

primitive_type_t primitive_type_of(const data_values_t& values) {
  return std::visit(
      overloaded{
          [](const std::monostate&) { return primitive_type_t::invalid; },
          [](const std::vector<int32_t>&) { return primitive_type_t::integer; },
          [](const std::vector<double>&) { return primitive_type_t::floating; },
          [](const std::vector<std::string>&) {
            return primitive_type_t::text;
          }},
      values);
}

data::data(strata::workspace::workspace& workspace,
           const strata::schema::uid_t& uid,
           const strata::schema::uid_t& type_uid,
           std::string name,
           association_t association)
    : entity{workspace, uid, type_uid, std::move(name)},
      association_{association} {}

void data::set_values(data_values_t values) {
  values_ = std::move(values);
  set_modified(true);
}

std::size_t data::size() const {
  return std::visit(
      overloaded{[](const std::monostate&) { return std::size_t{0}; },
                 [](const auto& values) { return values.size(); }},
      values_);
}

}  // namespace strata::model
