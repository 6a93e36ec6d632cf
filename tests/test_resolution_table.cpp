#include <gtest/gtest.h>

#include "application/services/resolution/ResolutionTable.hpp"

using uoe::arp::application::services::DiagField;
using uoe::arp::application::services::ResolutionTable;
using uoe::arp::application::services::TableAnswer;
namespace net = uoe::arp::domain::net;

static net::Ipv4Address ip(uint32_t v) { return net::Ipv4Address::from_u32(v); }
static net::MacAddress mac(uint64_t v) { return net::MacAddress::from_u64(v); }

// Minimal tick driver around one table
struct TableBench
{
  ResolutionTable t;

  void idle(bool response_ready = false)
  {
    ResolutionTable::Inputs in;
    in.response_ready = response_ready;
    t.step(in);
  }

  void insert(net::Ipv4Address a, net::MacAddress m)
  {
    ASSERT_TRUE(t.insert_ready());
    ResolutionTable::Inputs in;
    in.insert = {true, {a, m}};
    t.step(in);
  }

  // Issues a query, waits for and consumes the answer
  TableAnswer query(net::Ipv4Address a)
  {
    EXPECT_TRUE(t.query_ready());
    ResolutionTable::Inputs in;
    in.query = {true, a};
    t.step(in);
    for (int i = 0; i < 8 && !t.response().valid; ++i) idle();
    EXPECT_TRUE(t.response().valid);
    TableAnswer out = t.response().data;
    idle(true);
    return out;
  }
};

TEST(ResolutionTable, InsertThenQueryHits)
{
  TableBench b;
  b.insert(ip(0xC0A8010A), mac(0x111213141516ull));

  auto a = b.query(ip(0xC0A8010A));
  EXPECT_TRUE(a.found);
  EXPECT_EQ(a.address, ip(0xC0A8010A));
  EXPECT_EQ(a.link, mac(0x111213141516ull));
}

TEST(ResolutionTable, UnknownAddressMissesWithZeroLink)
{
  TableBench b;
  b.insert(ip(0xC0A8010A), mac(0x111213141516ull));

  auto a = b.query(ip(0xC0A80114));
  EXPECT_FALSE(a.found);
  EXPECT_EQ(a.link, net::MacAddress{});
}

TEST(ResolutionTable, CollidingInsertEvictsPreviousOccupant)
{
  const auto A = ip(0x0A000005);
  const auto B = ip(0x0A000500);
  ASSERT_EQ(net::hash_index(A), net::hash_index(B));

  TableBench b;
  b.insert(A, mac(0xAAAAAAAAAAAAull));
  b.insert(B, mac(0xBBBBBBBBBBBBull));

  EXPECT_FALSE(b.query(A).found);
  auto hit = b.query(B);
  EXPECT_TRUE(hit.found);
  EXPECT_EQ(hit.link, mac(0xBBBBBBBBBBBBull));
}

TEST(ResolutionTable, ResponseArrivesTwoTicksAfterIssue)
{
  TableBench b;
  b.insert(ip(0x0A000001), mac(0x1ull));

  ResolutionTable::Inputs in;
  in.query = {true, ip(0x0A000001)};
  b.t.step(in);  // issue
  EXPECT_FALSE(b.t.response().valid);
  b.idle();      // lookup
  EXPECT_TRUE(b.t.response().valid);
  EXPECT_TRUE(b.t.response().data.found);
}

TEST(ResolutionTable, SameTickInsertWinsAndQueryIsDeferred)
{
  const auto A = ip(0xC0A80105);
  TableBench b;

  ResolutionTable::Inputs in;
  in.insert = {true, {A, mac(0x0A35033EF1ull)}};
  in.query = {true, A};
  b.t.step(in);

  // write already visible, read parked
  EXPECT_EQ(b.t.slot(net::hash_index(A)).address, A);
  EXPECT_TRUE(b.t.has_pending_read());
  EXPECT_FALSE(b.t.insert_ready());
  EXPECT_FALSE(b.t.query_ready());

  b.idle();  // deferred read issued
  EXPECT_FALSE(b.t.has_pending_read());
  EXPECT_FALSE(b.t.response().valid);

  b.idle();
  ASSERT_TRUE(b.t.response().valid);
  EXPECT_TRUE(b.t.response().data.found);
  EXPECT_EQ(b.t.response().data.link, mac(0x0A35033EF1ull));
}

TEST(ResolutionTable, HoldsResponseUntilConsumed)
{
  TableBench b;
  ResolutionTable::Inputs in;
  in.query = {true, ip(0x01020304)};
  b.t.step(in);
  b.idle();

  for (int i = 0; i < 5; ++i)
  {
    EXPECT_TRUE(b.t.response().valid);
    EXPECT_FALSE(b.t.query_ready());
    b.idle(false);
  }
  b.idle(true);
  EXPECT_FALSE(b.t.response().valid);
  EXPECT_TRUE(b.t.query_ready());
}

TEST(ResolutionTable, ClearAllZeroesEverySlotWithOnePulse)
{
  TableBench b;
  const auto A = ip(0xC0A8010A);
  b.insert(A, mac(0x111213141516ull));
  b.insert(ip(0xC0A8010F), mac(0x212223242526ull));
  b.t.diag_write(ResolutionTable::diag_address(255, DiagField::Address), 0xDEADBEEF);

  ResolutionTable::Inputs trigger;
  trigger.clear = true;
  b.t.step(trigger);
  EXPECT_TRUE(b.t.clearing());

  // a query offered during the sweep is not taken
  ResolutionTable::Inputs in;
  in.query = {true, A};

  int pulses = 0;
  int ticks = 0;
  while (b.t.clearing() && ticks < 1000)
  {
    EXPECT_FALSE(b.t.query_ready());
    EXPECT_FALSE(b.t.insert_ready());
    b.t.step(in);
    EXPECT_FALSE(b.t.response().valid);
    if (b.t.clear_done()) ++pulses;
    ++ticks;
  }
  EXPECT_EQ(ticks, 256);
  EXPECT_EQ(pulses, 1);
  EXPECT_TRUE(b.t.clear_done());

  for (std::size_t i = 0; i < ResolutionTable::kSlots; ++i)
  {
    EXPECT_EQ(b.t.slot(i), net::Mapping{}) << "slot " << i;
  }

  // accepted now, answered from the cleared table
  EXPECT_TRUE(b.t.query_ready());
  b.t.step(in);
  EXPECT_FALSE(b.t.clear_done());
  b.idle();
  ASSERT_TRUE(b.t.response().valid);
  EXPECT_FALSE(b.t.response().data.found);
}

TEST(ResolutionTable, ClearTriggerDuringSweepIsIgnored)
{
  TableBench b;
  ResolutionTable::Inputs trigger;
  trigger.clear = true;

  int pulses = 0;
  for (int i = 0; i < 600; ++i)
  {
    b.t.step(trigger);
    if (b.t.clear_done()) ++pulses;
    trigger.clear = (i < 100);  // held high well into the sweep
  }
  EXPECT_EQ(pulses, 1);
}

TEST(ResolutionTable, DiagnosticPortReadsAndWritesFields)
{
  TableBench b;
  const auto A = ip(0xC0A8010A);
  const auto slot = net::hash_index(A);
  b.insert(A, mac(0x111213141516ull));

  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::Address)), 0xC0A8010Au);
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::LinkLow)), 0x13141516u);
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::LinkHigh)), 0x1112u);
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::Reserved)), 0u);

  // low address bits are ignored
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::Address) + 3), 0xC0A8010Au);

  b.t.diag_write(ResolutionTable::diag_address(slot, DiagField::LinkHigh), 0xFFFF2122u);
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(slot, DiagField::LinkHigh)), 0x2122u);
  EXPECT_EQ(b.t.slot(slot).link, mac(0x212213141516ull));

  auto a = b.query(A);
  EXPECT_TRUE(a.found);
  EXPECT_EQ(a.link, mac(0x212213141516ull));
}

TEST(ResolutionTable, DiagnosticWriteHonorsByteStrobe)
{
  TableBench b;
  const auto addr = ResolutionTable::diag_address(7, DiagField::LinkLow);
  b.t.diag_write(addr, 0x11223344u);
  b.t.diag_write(addr, 0xAABBCCDDu, 0b0101);
  EXPECT_EQ(b.t.diag_read(addr), 0x11BB33DDu);

  b.t.diag_write(ResolutionTable::diag_address(7, DiagField::Reserved), 0xFFFFFFFFu);
  EXPECT_EQ(b.t.diag_read(ResolutionTable::diag_address(7, DiagField::Reserved)), 0u);
  EXPECT_EQ(b.t.slot(7).address, net::Ipv4Address{});
}

TEST(ResolutionTable, DiagnosticEntryIsFoundByQuery)
{
  TableBench b;
  const auto A = ip(0xC0A80114);
  const auto slot = net::hash_index(A);
  b.t.diag_write(ResolutionTable::diag_address(slot, DiagField::Address), A.to_u32());
  b.t.diag_write(ResolutionTable::diag_address(slot, DiagField::LinkLow), 0x33343536u);
  b.t.diag_write(ResolutionTable::diag_address(slot, DiagField::LinkHigh), 0x3132u);

  auto a = b.query(A);
  EXPECT_TRUE(a.found);
  EXPECT_EQ(a.link, mac(0x313233343536ull));
}

TEST(ResolutionTable, ResetDropsInFlightReadButKeepsSlots)
{
  TableBench b;
  const auto A = ip(0x0A000001);
  ResolutionTable::Inputs in;
  in.insert = {true, {A, mac(0x42ull)}};
  in.query = {true, A};
  b.t.step(in);
  ASSERT_TRUE(b.t.has_pending_read());

  b.t.reset();
  EXPECT_FALSE(b.t.has_pending_read());
  for (int i = 0; i < 4; ++i)
  {
    b.idle();
    EXPECT_FALSE(b.t.response().valid);
  }
  EXPECT_EQ(b.t.slot(net::hash_index(A)).address, A);
  EXPECT_TRUE(b.query(A).found);
}

TEST(ResolutionTable, ClearTriggerWaitsForDeferredRead)
{
  TableBench b;
  const auto A = ip(0x0A000001);
  ResolutionTable::Inputs in;
  in.insert = {true, {A, mac(0x42ull)}};
  in.query = {true, A};
  b.t.step(in);
  ASSERT_TRUE(b.t.has_pending_read());

  ResolutionTable::Inputs trigger;
  trigger.clear = true;
  b.t.step(trigger);  // deferred read owns the port this tick
  EXPECT_FALSE(b.t.has_pending_read());
  EXPECT_TRUE(b.t.clearing());

  int ticks = 0;
  int pulses = 0;
  bool answered = false;
  while (b.t.clearing() && ticks < 600)
  {
    const auto rsp = b.t.response();
    if (rsp.valid)
    {
      answered = true;
      EXPECT_TRUE(rsp.data.found);
      EXPECT_EQ(rsp.data.link, mac(0x42ull));
    }
    b.idle(true);
    ++ticks;
    if (b.t.clear_done()) ++pulses;
  }
  for (int i = 0; i < 4; ++i)
  {
    b.idle(true);
    if (b.t.clear_done()) ++pulses;
  }

  EXPECT_TRUE(answered);
  EXPECT_EQ(ticks, 256);
  EXPECT_EQ(pulses, 1);
  EXPECT_EQ(b.t.slot(net::hash_index(A)).address, net::Ipv4Address{});
  EXPECT_EQ(b.t.slot(net::hash_index(A)).link, net::MacAddress{});
}
