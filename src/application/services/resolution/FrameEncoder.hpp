#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "application/services/resolution/ResolutionCache.hpp"
#include "domain/net/Addresses.hpp"
#include "domain/net/ArpFrame.hpp"
#include "shared/stream/Handshake.hpp"

namespace uoe::arp::application::services
{

// Control input: what to send, to whom
struct FrameRequest
{
  domain::net::Opcode opcode{domain::net::Opcode::Request};
  domain::net::MacAddress target_link{};
  domain::net::Ipv4Address target_address{};

  // Who-has target_ip, broadcast on the wire
  static FrameRequest request(const domain::net::Ipv4Address& target_ip) noexcept
  {
    return {domain::net::Opcode::Request, domain::net::kBroadcastMac, target_ip};
  }
  // Is-at, sent back to the requester
  static FrameRequest reply(const domain::net::MacAddress& requester_mac,
                            const domain::net::Ipv4Address& requester_ip) noexcept
  {
    return {domain::net::Opcode::Reply, requester_mac, requester_ip};
  }
  // Announcement of our own binding
  static FrameRequest gratuitous(const LocalIdentity& self) noexcept
  {
    return {domain::net::Opcode::Request, domain::net::kBroadcastMac, self.ip};
  }
};

// One frame being streamed out
struct FrameJob
{
  domain::net::Opcode opcode{domain::net::Opcode::Request};
  domain::net::MacAddress target_link{};
  domain::net::Ipv4Address target_address{};
  domain::net::MacAddress local_link{};
  domain::net::Ipv4Address local_address{};
};

class FrameEncoder
{
 public:
  enum class State : uint8_t
  {
    Idle,
    Framing
  };

  struct Inputs
  {
    shared::stream::Channel<FrameRequest> control;
    bool out_ready{false};
  };

  // beat_bytes must be within 1..64, throws std::invalid_argument otherwise
  explicit FrameEncoder(std::size_t beat_bytes, LocalIdentity identity = {});

  void set_identity(const LocalIdentity& identity) noexcept { identity_ = identity; }

  // Abandons the frame in flight; nothing more is emitted for it
  void reset() noexcept;

  void step(const Inputs& in) noexcept;

  // ---- outputs, stable between steps ----
  bool control_ready() const noexcept { return state_ == State::Idle; }
  shared::stream::Channel<shared::stream::Beat> out() const;

  State state() const noexcept { return state_; }
  std::size_t beat_bytes() const noexcept { return beat_bytes_; }
  std::size_t beats_per_frame() const noexcept
  {
    return (domain::net::kFrameBytes + beat_bytes_ - 1) / beat_bytes_;
  }

  // Byte at a frame offset; padding and offsets past the frame read zero
  static uint8_t frame_byte(const FrameJob& job, std::size_t offset) noexcept;
  static std::array<uint8_t, domain::net::kFrameBytes> render(const FrameJob& job) noexcept;

 private:
  shared::stream::Beat make_beat(std::size_t index) const;

  std::size_t beat_bytes_;
  LocalIdentity identity_;
  State state_{State::Idle};
  FrameJob job_{};
  std::size_t beat_index_{0};
};

}  // namespace uoe::arp::application::services
