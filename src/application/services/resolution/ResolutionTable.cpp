#include "application/services/resolution/ResolutionTable.hpp"

namespace uoe::arp::application::services
{

using domain::net::Ipv4Address;
using domain::net::MacAddress;
using domain::net::Mapping;
using shared::stream::fires;

namespace
{
constexpr uint64_t kLinkLowMask = 0xFFFFFFFFull;
constexpr uint64_t kLinkHighMask = 0xFFFFull;

uint32_t merge_lanes(uint32_t current, uint32_t value, uint8_t strobe) noexcept
{
  uint32_t out = current;
  for (unsigned lane = 0; lane < 4; ++lane)
  {
    if ((strobe >> lane) & 1u)
    {
      const uint32_t mask = 0xFFu << (8 * lane);
      out = (out & ~mask) | (value & mask);
    }
  }
  return out;
}
}  // namespace

void ResolutionTable::reset() noexcept
{
  pending_.reset();
  stage_ = {};
  response_ = {};
  clearing_ = false;
  clear_index_ = 0;
  clear_done_ = false;
}

void ResolutionTable::write_slot(const Mapping& m) noexcept
{
  slots_[domain::net::hash_index(m.address)] = m;
}

TableAnswer ResolutionTable::read_slot(const Ipv4Address& address) const noexcept
{
  const TableSlot& s = slots_[domain::net::hash_index(address)];
  TableAnswer a;
  a.address = address;
  a.found = (s.address == address);
  if (a.found) a.link = s.link;
  return a;
}

// -------------------------------------------------------------------------------------------------
// step(inputs)
//  - Handshakes are sampled against the outputs presented during this tick.
//  - The read pipeline advances before the storage port is used, so a read
//    issued now lands in stage_ and is presented two ticks after issue.
//  - Storage port priority: deferred read, clear sweep, insert, query. An
//    insert and a query in the same tick defer the query to the next tick.
// -------------------------------------------------------------------------------------------------
void ResolutionTable::step(const Inputs& in) noexcept
{
  const bool do_insert = fires(in.insert, insert_ready());
  const bool do_query = fires(in.query, query_ready());
  const bool delivered = fires(response_, in.response_ready);
  const bool start_clear = in.clear && !clearing_;

  clear_done_ = false;

  // ---- read pipeline ----
  if (delivered) response_.valid = false;
  if (stage_.valid)
  {
    response_ = stage_;
    stage_.valid = false;
  }

  // ---- storage port ----
  if (pending_)
  {
    stage_ = {true, read_slot(*pending_)};
    pending_.reset();
  }
  else if (clearing_)
  {
    slots_[clear_index_] = TableSlot{};
    if (clear_index_ == kSlots - 1)
    {
      clearing_ = false;
      clear_index_ = 0;
      clear_done_ = true;
    }
    else
    {
      ++clear_index_;
    }
  }
  else if (do_insert)
  {
    write_slot(in.insert.data);
    if (do_query) pending_ = in.query.data;
  }
  else if (do_query)
  {
    stage_ = {true, read_slot(in.query.data)};
  }

  if (start_clear)
  {
    clearing_ = true;
    clear_index_ = 0;
  }
}

uint32_t ResolutionTable::diag_read(uint32_t byte_address) const noexcept
{
  const std::size_t index = (byte_address >> 4) & (kSlots - 1);
  const auto field = static_cast<DiagField>((byte_address >> 2) & 0x3u);
  const TableSlot& s = slots_[index];

  switch (field)
  {
    case DiagField::Address:  return s.address.to_u32();
    case DiagField::LinkLow:  return static_cast<uint32_t>(s.link.to_u64() & kLinkLowMask);
    case DiagField::LinkHigh: return static_cast<uint32_t>((s.link.to_u64() >> 32) & kLinkHighMask);
    case DiagField::Reserved: return 0;
  }
  return 0;
}

void ResolutionTable::diag_write(uint32_t byte_address, uint32_t value, uint8_t strobe) noexcept
{
  const std::size_t index = (byte_address >> 4) & (kSlots - 1);
  const auto field = static_cast<DiagField>((byte_address >> 2) & 0x3u);
  TableSlot& s = slots_[index];

  const uint32_t merged = merge_lanes(diag_read(byte_address), value, strobe);
  const uint64_t link = s.link.to_u64();

  switch (field)
  {
    case DiagField::Address:
      s.address = Ipv4Address::from_u32(merged);
      break;
    case DiagField::LinkLow:
      s.link = MacAddress::from_u64((link & (kLinkHighMask << 32)) | merged);
      break;
    case DiagField::LinkHigh:
      s.link = MacAddress::from_u64((static_cast<uint64_t>(merged & kLinkHighMask) << 32) |
                                    (link & kLinkLowMask));
      break;
    case DiagField::Reserved:
      break;
  }
}

}  // namespace uoe::arp::application::services
