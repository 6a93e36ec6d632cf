#include "application/services/resolution/FrameEncoder.hpp"

#include <stdexcept>
#include <string>

namespace uoe::arp::application::services
{

namespace net = uoe::arp::domain::net;
using shared::stream::Beat;
using shared::stream::Channel;

namespace
{
constexpr uint8_t be16_byte(uint16_t v, std::size_t i) noexcept
{
  return static_cast<uint8_t>(i == 0 ? (v >> 8) : v);
}

uint8_t field_byte(const FrameJob& job, net::Field field, std::size_t i) noexcept
{
  switch (field)
  {
    case net::Field::EthDestination: return job.target_link.octets[i];
    case net::Field::EthSource:      return job.local_link.octets[i];
    case net::Field::EtherType:      return be16_byte(net::kEtherTypeArp, i);
    case net::Field::HardwareType:   return be16_byte(net::kArpHardwareEthernet, i);
    case net::Field::ProtocolType:   return be16_byte(net::kEtherTypeIpv4, i);
    case net::Field::HardwareLength: return net::kArpHardwareLength;
    case net::Field::ProtocolLength: return net::kArpProtocolLength;
    case net::Field::Operation:      return be16_byte(static_cast<uint16_t>(job.opcode), i);
    case net::Field::SenderHardware: return job.local_link.octets[i];
    case net::Field::SenderProtocol: return job.local_address.octets[i];
    case net::Field::TargetHardware:
      // a broadcast query carries the all-zero target, a reply the requester
      return net::is_broadcast(job.target_link) ? net::kBroadcastTargetMac.octets[i]
                                                : job.target_link.octets[i];
    case net::Field::TargetProtocol: return job.target_address.octets[i];
  }
  return 0;
}
}  // namespace

FrameEncoder::FrameEncoder(std::size_t beat_bytes, LocalIdentity identity)
    : beat_bytes_(beat_bytes), identity_(identity)
{
  if (beat_bytes_ == 0 || beat_bytes_ > shared::stream::kMaxBeatBytes)
  {
    throw std::invalid_argument("FrameEncoder: beat width must be 1.." +
                                std::to_string(shared::stream::kMaxBeatBytes) + " bytes, got " +
                                std::to_string(beat_bytes));
  }
}

void FrameEncoder::reset() noexcept
{
  state_ = State::Idle;
  job_ = {};
  beat_index_ = 0;
}

uint8_t FrameEncoder::frame_byte(const FrameJob& job, std::size_t offset) noexcept
{
  if (offset >= net::kHeaderBytes) return 0;
  const net::LayoutEntry& e = net::kLayout[offset];
  return field_byte(job, e.field, e.field_byte);
}

std::array<uint8_t, net::kFrameBytes> FrameEncoder::render(const FrameJob& job) noexcept
{
  std::array<uint8_t, net::kFrameBytes> out{};
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = frame_byte(job, i);
  return out;
}

// -------------------------------------------------------------------------------------------------
// make_beat(index)
//  - Lane i of beat n carries frame byte n * width + i.
//  - Lanes past the last frame byte are zero and have their keep bit clear.
// -------------------------------------------------------------------------------------------------
Beat FrameEncoder::make_beat(std::size_t index) const
{
  Beat b;
  b.data.assign(beat_bytes_, 0);
  const std::size_t base = index * beat_bytes_;
  for (std::size_t lane = 0; lane < beat_bytes_; ++lane)
  {
    const std::size_t offset = base + lane;
    if (offset >= net::kFrameBytes) break;
    b.data[lane] = frame_byte(job_, offset);
    b.keep |= (uint64_t{1} << lane);
  }
  b.last = (base + beat_bytes_ >= net::kFrameBytes);
  return b;
}

Channel<Beat> FrameEncoder::out() const
{
  if (state_ != State::Framing) return {};
  return {true, make_beat(beat_index_)};
}

void FrameEncoder::step(const Inputs& in) noexcept
{
  switch (state_)
  {
    case State::Idle:
      if (in.control.valid)
      {
        const FrameRequest& r = in.control.data;
        job_ = FrameJob{r.opcode, r.target_link, r.target_address, identity_.mac, identity_.ip};
        beat_index_ = 0;
        state_ = State::Framing;
      }
      break;

    case State::Framing:
      if (in.out_ready)
      {
        if (beat_index_ + 1 >= beats_per_frame())
        {
          state_ = State::Idle;
          beat_index_ = 0;
        }
        else
        {
          ++beat_index_;
        }
      }
      break;
  }
}

}  // namespace uoe::arp::application::services
