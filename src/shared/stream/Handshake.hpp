#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace uoe::arp::shared::stream
{

// -----------------------------------------------------------------------------
// Channel<T>
//  - Producer side of a valid/ready link as seen during one tick.
//  - The consumer's ready travels separately; an item moves only on a tick
//    where both valid and ready are asserted.
// -----------------------------------------------------------------------------
template <typename T>
struct Channel
{
  bool valid{false};
  T data{};
};

constexpr bool fires(bool valid, bool ready) noexcept
{
  return valid && ready;
}

template <typename T>
constexpr bool fires(const Channel<T>& ch, bool ready) noexcept
{
  return ch.valid && ready;
}

// -----------------------------------------------------------------------------
// Beat
//  - One transfer of a byte stream. Lane i of data is valid when bit i of
//    keep is set; widths are therefore limited to 64 lanes.
// -----------------------------------------------------------------------------
inline constexpr std::size_t kMaxBeatBytes = 64;

struct Beat
{
  std::vector<uint8_t> data;
  uint64_t keep{0};
  bool last{false};

  std::size_t valid_bytes() const noexcept
  {
    std::size_t n = 0;
    for (std::size_t i = 0; i < data.size(); ++i)
    {
      if ((keep >> i) & 1u) ++n;
    }
    return n;
  }
};

// -----------------------------------------------------------------------------
// BeatCollector
//  - Reassembles the kept lanes of successive beats into a frame.
//  - push() returns true on the beat carrying 'last'; take() hands the frame
//    over and starts a new one.
// -----------------------------------------------------------------------------
class BeatCollector
{
 public:
  bool push(const Beat& beat)
  {
    for (std::size_t i = 0; i < beat.data.size(); ++i)
    {
      if ((beat.keep >> i) & 1u) bytes_.push_back(beat.data[i]);
    }
    ++beats_;
    return beat.last;
  }

  std::vector<uint8_t> take()
  {
    std::vector<uint8_t> out;
    out.swap(bytes_);
    beats_ = 0;
    return out;
  }

  std::size_t beats() const noexcept { return beats_; }
  std::size_t size() const noexcept { return bytes_.size(); }

 private:
  std::vector<uint8_t> bytes_;
  std::size_t beats_{0};
};

}  // namespace uoe::arp::shared::stream
