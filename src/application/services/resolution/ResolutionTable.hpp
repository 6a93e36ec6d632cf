#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "domain/net/Addresses.hpp"
#include "shared/stream/Handshake.hpp"

namespace uoe::arp::application::services
{

// Answer to a table query. link is zero when found is false.
struct TableAnswer
{
  domain::net::Ipv4Address address{};
  domain::net::MacAddress link{};
  bool found{false};
};

// Word offsets inside a slot on the diagnostic port
enum class DiagField : uint8_t
{
  Address = 0,
  LinkLow = 1,
  LinkHigh = 2,
  Reserved = 3
};

class ResolutionTable
{
 public:
  static constexpr std::size_t kSlots = 256;
  static constexpr std::size_t kSlotStride = 16;  // bytes per slot on the diagnostic port
  static constexpr std::size_t kReadLatency = 2;  // ticks from read issue to response

  using TableSlot = domain::net::Mapping;

  struct Inputs
  {
    shared::stream::Channel<domain::net::Mapping> insert;
    shared::stream::Channel<domain::net::Ipv4Address> query;
    bool response_ready{false};
    bool clear{false};  // ClearAll trigger, sampled as a pulse
  };

  ResolutionTable() = default;

  // Drops pending read, read pipeline, response and sweep. Slots keep their
  // contents; only ClearAll erases them.
  void reset() noexcept;

  void step(const Inputs& in) noexcept;

  // ---- outputs, stable between steps ----
  bool insert_ready() const noexcept { return !clearing_ && !pending_; }
  bool query_ready() const noexcept
  {
    return !clearing_ && !pending_ && !stage_.valid && !response_.valid;
  }
  const shared::stream::Channel<TableAnswer>& response() const noexcept { return response_; }
  bool clearing() const noexcept { return clearing_; }
  bool clear_done() const noexcept { return clear_done_; }
  bool has_pending_read() const noexcept { return pending_.has_value(); }

  // ---- diagnostic port ----
  // Byte address: slot * 16 + field * 4. The two low bits are ignored.
  uint32_t diag_read(uint32_t byte_address) const noexcept;
  // strobe selects the byte lanes of value to write (bit i = bits 8i..8i+7)
  void diag_write(uint32_t byte_address, uint32_t value, uint8_t strobe = 0xF) noexcept;

  static constexpr uint32_t diag_address(std::size_t slot, DiagField field) noexcept
  {
    return static_cast<uint32_t>(slot * kSlotStride + static_cast<std::size_t>(field) * 4);
  }

  // Direct inspection, for tooling and tests
  const TableSlot& slot(std::size_t index) const noexcept { return slots_[index]; }

 private:
  void write_slot(const domain::net::Mapping& m) noexcept;
  TableAnswer read_slot(const domain::net::Ipv4Address& address) const noexcept;

  std::array<TableSlot, kSlots> slots_{};

  std::optional<domain::net::Ipv4Address> pending_;
  shared::stream::Channel<TableAnswer> stage_;     // read issued last tick
  shared::stream::Channel<TableAnswer> response_;  // held until accepted

  bool clearing_{false};
  std::size_t clear_index_{0};
  bool clear_done_{false};
};

}  // namespace uoe::arp::application::services
