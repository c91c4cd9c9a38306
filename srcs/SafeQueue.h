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

#pragma once

#include <cstddef>
#include <queue>
#include <mutex>
#include <chrono>
#include <condition_variable>

// A locked FIFO of unique_ptrs, one thread pushes and another pops.
// The pops return nullptr when nothing is there.
template <class T>
class CSafeQueue
{
public:
	CSafeQueue() : q(), m(), c() {}

	~CSafeQueue() {}

	void Push(T t)
	{
		std::lock_guard<std::mutex> lock(m);
		q.push(std::move(t));
		c.notify_one();
	}

	// never holds more than limit, the oldest are dropped to make room
	void Push(T t, std::size_t limit)
	{
		std::lock_guard<std::mutex> lock(m);
		while (limit and q.size() >= limit)
			q.pop();
		q.push(std::move(t));
		c.notify_one();
	}

	std::size_t Size() const
	{
		std::lock_guard<std::mutex> lock(m);
		return q.size();
	}

	T Pop()
	{
		std::lock_guard<std::mutex> lock(m);
		if (q.empty())
			return nullptr;
		T val = std::move(q.front());
		q.pop();
		return val;
	}

	// wait for some time, or until an element is available.
	T PopWaitFor(int ms)
	{
		std::unique_lock<std::mutex> lock(m);
		T val;
		if (c.wait_for(lock, std::chrono::milliseconds(ms), [this] { return not q.empty(); }))
		{
			val = std::move(q.front());
			q.pop();
		}
		return val;
	}

	bool IsEmpty() const
	{
		std::lock_guard<std::mutex> lock(m);
		return q.empty();
	}

	void Clear()
	{
		std::lock_guard<std::mutex> lock(m);
		while (not q.empty())
			q.pop();
	}

private:
	std::queue<T> q;
	mutable std::mutex m;
	std::condition_variable c;
};
