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
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <dirent.h>
#include <poll.h>
#include <unistd.h>

#include "../DaemonSource.h"
#include "../SockAddress.h"

static const std::string VERSION_REPORT { R"({"class":"VERSION","release":"3.22","rev":"3.22","proto_major":3,"proto_minor":14})" };
static const std::string DEVICES_REPORT { R"({"class":"DEVICES","devices":[{"class":"DEVICE","path":"/dev/ttyACM0","driver":"u-blox"}]})" };
static const std::string TPV_NOFIX      { R"({"class":"TPV","device":"/dev/ttyACM0","mode":1})" };
static const std::string TPV_3D         { R"({"class":"TPV","device":"/dev/ttyACM0","mode":3,"lat":44.9778,"lon":-93.2650,"altMSL":264.0,"speed":2.5,"track":84.4})" };

/// @test gpsd report decoding
TEST(TestDaemonSource, parseReport)
{
	SFixData fix;
	EXPECT_EQ(CDaemonSource::ParseReport(VERSION_REPORT, fix), EParseResult::unrecognized);
	EXPECT_EQ(CDaemonSource::ParseReport(DEVICES_REPORT, fix), EParseResult::unrecognized);
	EXPECT_EQ(CDaemonSource::ParseReport(R"({"class":"SKY","satellites":[]})", fix), EParseResult::unrecognized);
	EXPECT_EQ(CDaemonSource::ParseReport("not json at all", fix), EParseResult::unrecognized);
	EXPECT_EQ(CDaemonSource::ParseReport("[1,2,3]", fix), EParseResult::unrecognized);
	EXPECT_EQ(CDaemonSource::ParseReport(R"({"mode":3})", fix), EParseResult::unrecognized);

	EXPECT_EQ(CDaemonSource::ParseReport(TPV_NOFIX, fix), EParseResult::noFix);
	EXPECT_EQ(CDaemonSource::ParseReport(R"({"class":"TPV","mode":0,"lat":1.0,"lon":2.0})", fix), EParseResult::noFix);
	// mode is fine but there's no position
	EXPECT_EQ(CDaemonSource::ParseReport(R"({"class":"TPV","mode":2,"lat":1.0})", fix), EParseResult::noFix);

	SFixData f3;
	ASSERT_EQ(CDaemonSource::ParseReport(TPV_3D, f3), EParseResult::fix);
	EXPECT_DOUBLE_EQ(f3.latitude, 44.9778);
	EXPECT_DOUBLE_EQ(f3.longitude, -93.265);
	EXPECT_EQ(f3.mode, EFixMode::fix3D);
	EXPECT_TRUE(f3.hasAltitude);
	EXPECT_DOUBLE_EQ(f3.altitude, 264.0);
	EXPECT_TRUE(f3.hasSpeed);
	EXPECT_DOUBLE_EQ(f3.speed, 2.5);
	EXPECT_TRUE(f3.hasTrack);
	EXPECT_DOUBLE_EQ(f3.track, 84.4);

	SFixData f2;
	ASSERT_EQ(CDaemonSource::ParseReport(R"({"class":"TPV","mode":2,"lat":-33.8688,"lon":151.2093})", f2), EParseResult::fix);
	EXPECT_EQ(f2.mode, EFixMode::fix2D);
	EXPECT_FALSE(f2.hasAltitude);
	EXPECT_FALSE(f2.hasSpeed);
	EXPECT_FALSE(f2.hasTrack);
}

static unsigned openDescriptors()
{
	unsigned count = 0u;
	DIR *dir = opendir("/proc/self/fd");
	if (nullptr == dir)
		return 0u;
	while (nullptr != readdir(dir))
		count++;
	closedir(dir);
	return count;
}

// a one connection gpsd on the loopback interface
class TestDaemonServer : public testing::Test
{
protected:
	void SetUp() override
	{
		ASSERT_FALSE(addr.Initialize(AF_INET, 0, "loc"));
		listenFD = socket(AF_INET, SOCK_STREAM, 0);
		ASSERT_GE(listenFD, 0);
		int yes = 1;
		setsockopt(listenFD, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
		ASSERT_EQ(0, bind(listenFD, addr.GetCPointer(), addr.GetSize()));
		ASSERT_EQ(0, listen(listenFD, 1));
		socklen_t len = addr.GetSize();
		ASSERT_EQ(0, getsockname(listenFD, addr.GetPointer(), &len));
		port = addr.GetPort();
	}

	void TearDown() override
	{
		stop = true;
		if (server.valid())
			server.get();
		if (listenFD >= 0)
			close(listenFD);
	}

	// accepts, reads the WATCH request, sends the reports, then holds the
	// connection open unless told to hang up
	void Serve(const std::vector<std::string> &reports, bool hangup)
	{
		server = std::async(std::launch::async, [this, reports, hangup]() {
			struct pollfd pfd { listenFD, POLLIN, 0 };
			while (not stop and 0 == poll(&pfd, 1, 50))
				;
			if (stop)
				return;
			int fd = accept(listenFD, nullptr, nullptr);
			if (fd < 0)
				return;

			char buf[256];
			auto n = read(fd, buf, sizeof(buf) - 1);
			if (n > 0)
				request.assign(buf, n);

			for (const auto &r : reports)
			{
				const std::string line(r + "\n");
				if (write(fd, line.data(), line.size()) < 0)
					break;
			}
			while (not hangup and not stop)
				std::this_thread::sleep_for(std::chrono::milliseconds(20));
			close(fd);
		});
	}

	CSockAddress addr;
	int listenFD = -1;
	uint16_t port = 0;
	std::atomic<bool> stop { false };
	std::future<void> server;
	std::string request;
};

TEST_F(TestDaemonServer, resolvesTPV)
{
	Serve({ VERSION_REPORT, DEVICES_REPORT, TPV_NOFIX, TPV_3D }, false);
	CDaemonSource source("127.0.0.1", port);
	std::unique_ptr<CPosition> pos;
	ASSERT_EQ(source.Acquire(3.0, pos), EAcquireError::none);
	ASSERT_NE(pos, nullptr);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), 44.9778);
	EXPECT_EQ(pos->GetFixMode(), EFixMode::fix3D);
	EXPECT_TRUE(pos->HasAltitude());
	stop = true;
	server.get();
	EXPECT_EQ(request, "?WATCH={\"enable\":true,\"json\":true}\n");
}

TEST_F(TestDaemonServer, timesOutWithoutFix)
{
	Serve({ VERSION_REPORT, TPV_NOFIX, TPV_NOFIX }, false);
	CDaemonSource source(CDaemonSource::DefaultHost, port);
	std::unique_ptr<CPosition> pos;
	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(source.Acquire(1.0, pos), EAcquireError::timeout);
	const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
	EXPECT_GE(t, 0.9);
	EXPECT_LT(t, 1.5);
	EXPECT_EQ(pos, nullptr);
}

TEST_F(TestDaemonServer, hangupIsUnavailable)
{
	Serve({ VERSION_REPORT, TPV_NOFIX }, true);
	CDaemonSource source("127.0.0.1", port);
	std::unique_ptr<CPosition> pos;
	EXPECT_EQ(source.Acquire(3.0, pos), EAcquireError::sourceUnavailable);
}

TEST_F(TestDaemonServer, connectionRefused)
{
	// nobody is listening once the socket is closed
	close(listenFD);
	listenFD = -1;
	CDaemonSource source("127.0.0.1", port);
	std::unique_ptr<CPosition> pos;
	const auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(source.Acquire(2.0, pos), EAcquireError::sourceUnavailable);
	EXPECT_LT(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count(), 1.5);
}

TEST_F(TestDaemonServer, noDescriptorsLeft)
{
	const unsigned before = openDescriptors();
	ASSERT_GT(before, 0u);

	Serve({ VERSION_REPORT, TPV_3D }, false);
	{
		CDaemonSource source("127.0.0.1", port);
		std::unique_ptr<CPosition> pos;
		ASSERT_EQ(source.Acquire(3.0, pos), EAcquireError::none);
	}
	stop = true;
	server.get();
	EXPECT_EQ(openDescriptors(), before);

	close(listenFD);
	listenFD = -1;
	CDaemonSource source("127.0.0.1", port);
	std::unique_ptr<CPosition> pos;
	for (int i=0; i<100; i++)
		ASSERT_EQ(source.Acquire(1.0, pos), EAcquireError::sourceUnavailable);
	EXPECT_EQ(openDescriptors(), before - 1u);
}
