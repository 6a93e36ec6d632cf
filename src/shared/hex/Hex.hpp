#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <span>
#include <sstream>
#include <string>
#include <type_traits>

namespace uoe::arp::shared::hex
{

// -----------------------------------------------------------------------------
// hex_dump(data, max_len)
//  - "AA BB CC ..." with a total-size suffix when truncated; max_len 0 = all.
// -----------------------------------------------------------------------------
inline std::string hex_dump(std::span<const uint8_t> data, size_t max_len = 64)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');

  const size_t take = (max_len > 0) ? (std::min)(max_len, data.size()) : data.size();

  for (size_t i = 0; i < take; ++i)
  {
    if (i) oss << ' ';
    oss << std::setw(2) << static_cast<unsigned int>(data[i]);
  }

  if (take < data.size())
  {
    oss << " ...(" << data.size() << " bytes total)";
  }

  return oss.str();
}

// -----------------------------------------------------------------------------
// to_hex(value, width)
// -----------------------------------------------------------------------------
template <class UInt>
inline std::string to_hex(UInt value, int width = -1)
{
  static_assert(std::is_unsigned<UInt>::value, "to_hex requires an unsigned integer type");

  if (width < 0) width = static_cast<int>(sizeof(UInt) * 2);

  std::ostringstream oss;
  oss << "0x" << std::uppercase << std::hex << std::setw(width) << std::setfill('0')
      << static_cast<unsigned long long>(value);
  return oss.str();
}

// -----------------------------------------------------------------------------
// make_line(tag, bytes, max)
//  - "<tag> n=<size>: <dump>", one line per frame in the wire log.
// -----------------------------------------------------------------------------
inline std::string make_line(const char* tag, std::span<const uint8_t> sp, size_t max = 0)
{
  std::string line;
  line.reserve(64 + sp.size() * 3);
  line.append(tag).append(" n=").append(std::to_string(sp.size())).append(": ");
  line += hex_dump(sp, max);
  return line;
}

}  // namespace uoe::arp::shared::hex
