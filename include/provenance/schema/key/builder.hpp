#pragma once
#include <boost/endian/conversion.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <span>
#include <string_view>
#include <type_traits>

namespace provenance::schema::key {

/// Byte-wise storage key assembly. `write_ordered` writes integers
/// big-endian so that RocksDB iteration order follows numeric order.
struct builder final {
  provenance::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace provenance::schema::key
