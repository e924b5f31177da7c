#include <gtest/gtest.h>
#include "grabber/slots.h"

using Table = grabber::SlotTable<int>;

namespace {
	Table::Slot slot(const char * id, int attempt, bool periodic, int timer, uint32_t due = 0) {
		Table::Slot s;
		s.instance_id = id;
		s.attempt = attempt;
		s.periodic = periodic;
		s.timer = timer;
		s.due = due;
		return s;
	}
}

TEST(SlotTable, SlotsAreNeverReused) {
	Table t;
	auto a = t.reserve();
	auto b = t.reserve();
	EXPECT_NE(a, b);

	t.insert(a, slot("x", 2, false, 10));
	Table::Slot out;
	ASSERT_TRUE(t.take(a, out));
	EXPECT_NE(t.reserve(), a);
}

TEST(SlotTable, OneShotIsTakenOnce) {
	Table t;
	auto s = t.reserve();
	t.insert(s, slot("x", 3, false, 10));

	Table::Slot out;
	ASSERT_TRUE(t.take(s, out));
	EXPECT_EQ(out.instance_id, "x");
	EXPECT_EQ(out.attempt, 3);
	EXPECT_EQ(out.timer, 10);
	EXPECT_FALSE(t.take(s, out));
	EXPECT_EQ(t.size(), 0u);
}

TEST(SlotTable, PeriodicStays) {
	Table t;
	auto s = t.reserve();
	t.insert(s, slot("x", 0, true, 10));

	Table::Slot out;
	EXPECT_TRUE(t.take(s, out));
	EXPECT_TRUE(t.take(s, out));
	EXPECT_TRUE(out.periodic);
}

TEST(SlotTable, CancelDropsEverySlotOfTheInstance) {
	Table t;
	auto refresh = t.reserve();
	auto retry = t.reserve();
	auto other = t.reserve();
	t.insert(refresh, slot("x", 0, true, 1));
	t.insert(retry, slot("x", 2, false, 2));
	t.insert(other, slot("y", 0, true, 3));

	auto timers = t.cancel("x");
	ASSERT_EQ(timers.size(), 2u);
	EXPECT_EQ(timers[0], 1);
	EXPECT_EQ(timers[1], 2);

	Table::Slot out;
	EXPECT_FALSE(t.take(retry, out));
	EXPECT_TRUE(t.take(other, out));
	EXPECT_TRUE(t.cancel("nope").empty());
}

TEST(SlotTable, LostRetryBecomesOverdue) {
	Table t;
	auto refresh = t.reserve();
	auto retry = t.reserve();
	t.insert(refresh, slot("x", 0, true, 1, 1000));
	t.insert(retry, slot("x", 2, false, 2, 1000));

	EXPECT_TRUE(t.overdue(1000, 2000).empty());
	EXPECT_TRUE(t.overdue(2999, 2000).empty());

	// only the one-shot slot, periodic ones just wait for their next tick
	auto late = t.overdue(3000, 2000);
	ASSERT_EQ(late.size(), 1u);
	EXPECT_EQ(late[0], retry);

	// once handled it's gone
	Table::Slot out;
	ASSERT_TRUE(t.take(retry, out));
	EXPECT_TRUE(t.overdue(5000, 2000).empty());
}

TEST(SlotTable, OverdueSurvivesTickWrap) {
	Table t;
	auto s = t.reserve();
	t.insert(s, slot("x", 2, false, 1, 0xFFFFFF00u));

	EXPECT_TRUE(t.overdue(0xFFFFFF80u, 0x200).empty());
	EXPECT_EQ(t.overdue(0x100u, 0x200).size(), 1u);
}
