#include <blake3.h>
#include <herald/blake3/hash.hpp>

namespace herald::blake3 {

namespace {

herald::schema::hash32_t finalize(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = herald::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<herald::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

herald::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

herald::schema::hash32_t hash(const herald::schema::bytes_view_t& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace herald::blake3
