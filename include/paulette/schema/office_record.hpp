#pragma once
#include <paulette/schema/bought_record.hpp>
#include <paulette/schema/for_sale_record.hpp>
#include <variant>

namespace paulette::schema {

using office_record_t = std::variant<for_sale_record_t, bought_record_t>;

}  // namespace paulette::schema
