#pragma once
#include <herald/schema/primitives.hpp>
#include <string_view>

namespace herald::blake3 {

herald::schema::hash32_t hash(const std::string_view& str);
herald::schema::hash32_t hash(const herald::schema::bytes_view_t& bytes);

}  // namespace herald::blake3
