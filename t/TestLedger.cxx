#include "batch/Ledger.hxx"

#include <gtest/gtest.h>

TEST(Ledger, UnknownNode)
{
	ResourceLedger ledger;
	EXPECT_FALSE(ledger.HasNode("foo"));
	EXPECT_EQ(ledger.Capacity("foo"), 0u);
	EXPECT_EQ(ledger.Committed("foo"), 0u);
	EXPECT_EQ(ledger.Free("foo"), 0u);
	EXPECT_FALSE(ledger.TryReserve("foo", 1));

	ledger.Release("foo", 1);
	EXPECT_EQ(ledger.Committed("foo"), 0u);
}

TEST(Ledger, Reserve)
{
	ResourceLedger ledger;
	ledger.SetCapacity("node1", 4);
	EXPECT_TRUE(ledger.HasNode("node1"));
	EXPECT_EQ(ledger.Capacity("node1"), 4u);
	EXPECT_EQ(ledger.Free("node1"), 4u);

	EXPECT_TRUE(ledger.TryReserve("node1", 4));
	EXPECT_EQ(ledger.Committed("node1"), 4u);
	EXPECT_EQ(ledger.Free("node1"), 0u);

	/* does not fit: nothing changes */
	EXPECT_FALSE(ledger.TryReserve("node1", 2));
	EXPECT_EQ(ledger.Committed("node1"), 4u);

	ledger.Release("node1", 4);
	EXPECT_EQ(ledger.Committed("node1"), 0u);

	EXPECT_TRUE(ledger.TryReserve("node1", 2));
	EXPECT_TRUE(ledger.TryReserve("node1", 1));
	EXPECT_FALSE(ledger.TryReserve("node1", 2));
	EXPECT_TRUE(ledger.TryReserve("node1", 1));
	EXPECT_EQ(ledger.Free("node1"), 0u);

	/* other nodes are independent */
	ledger.SetCapacity("node2", 1);
	EXPECT_TRUE(ledger.TryReserve("node2", 1));
	EXPECT_EQ(ledger.Committed("node1"), 4u);
}

TEST(Ledger, ReleaseFloor)
{
	ResourceLedger ledger;
	ledger.SetCapacity("node1", 4);
	EXPECT_TRUE(ledger.TryReserve("node1", 1));

	ledger.Release("node1", 3);
	EXPECT_EQ(ledger.Committed("node1"), 0u);
	EXPECT_EQ(ledger.Free("node1"), 4u);
}

TEST(Ledger, ShrinkCapacity)
{
	ResourceLedger ledger;
	EXPECT_TRUE(ledger.SetCapacity("node1", 8));
	EXPECT_TRUE(ledger.TryReserve("node1", 6));

	/* below the committed units: refused, nothing changes */
	EXPECT_FALSE(ledger.SetCapacity("node1", 4));
	EXPECT_EQ(ledger.Capacity("node1"), 8u);
	EXPECT_EQ(ledger.Committed("node1"), 6u);
	EXPECT_EQ(ledger.Free("node1"), 2u);

	/* down to exactly the committed units */
	EXPECT_TRUE(ledger.SetCapacity("node1", 6));
	EXPECT_EQ(ledger.Free("node1"), 0u);
	EXPECT_FALSE(ledger.TryReserve("node1", 1));

	ledger.Release("node1", 3);
	EXPECT_TRUE(ledger.SetCapacity("node1", 4));
	EXPECT_EQ(ledger.Free("node1"), 1u);
	EXPECT_TRUE(ledger.TryReserve("node1", 1));
}
