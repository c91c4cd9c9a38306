/*

         sitescout - find the nearest radio sites from a GPS fix
            Copyright (C) 2026 Thomas A. Early N7TAE

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program; if not, write to the Free Software Foundation, Inc.,
51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*/

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "../SafeQueue.h"

using IntQueue = CSafeQueue<std::unique_ptr<int>>;

TEST(TestSafeQueue, fifo)
{
	IntQueue q;
	EXPECT_TRUE(q.IsEmpty());
	EXPECT_EQ(q.Pop(), nullptr);
	for (int i=0; i<5; i++)
		q.Push(std::make_unique<int>(i));
	EXPECT_FALSE(q.IsEmpty());
	for (int i=0; i<5; i++)
	{
		auto p = q.Pop();
		ASSERT_NE(p, nullptr);
		EXPECT_EQ(*p, i);
	}
	EXPECT_TRUE(q.IsEmpty());
}

TEST(TestSafeQueue, clear)
{
	IntQueue q;
	q.Push(std::make_unique<int>(1));
	q.Push(std::make_unique<int>(2));
	q.Clear();
	EXPECT_TRUE(q.IsEmpty());
	EXPECT_EQ(q.PopWaitFor(10), nullptr);
}

TEST(TestSafeQueue, boundedPushDropsOldest)
{
	IntQueue q;
	for (int i=0; i<10; i++)
		q.Push(std::make_unique<int>(i), 4);
	EXPECT_EQ(q.Size(), 4u);
	for (int i=6; i<10; i++)
	{
		auto p = q.Pop();
		ASSERT_NE(p, nullptr);
		EXPECT_EQ(*p, i);
	}
	EXPECT_TRUE(q.IsEmpty());
}

TEST(TestSafeQueue, waitForProducer)
{
	IntQueue q;
	auto producer = std::async(std::launch::async, [&q]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		q.Push(std::make_unique<int>(42));
	});
	auto p = q.PopWaitFor(2000);
	producer.get();
	ASSERT_NE(p, nullptr);
	EXPECT_EQ(*p, 42);
}

TEST(TestSafeQueue, waitTimesOut)
{
	IntQueue q;
	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(q.PopWaitFor(100), nullptr);
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
	EXPECT_GE(ms, 90);
}
