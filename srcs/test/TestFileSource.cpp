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
#include <fstream>
#include <string>
#include <unistd.h>
#include <sys/stat.h>

#include "../FileSource.h"
#include "../ManualSource.h"

class TestFileSource : public testing::Test
{
protected:
	void SetUp() override
	{
		char tmpl[] = "/tmp/sitescout_posXXXXXX";
		int fd = mkstemp(tmpl);
		ASSERT_GE(fd, 0);
		close(fd);
		path.assign(tmpl);
	}

	void TearDown() override
	{
		unlink(path.c_str());
	}

	void write(const std::string &content)
	{
		std::ofstream ofs(path, std::ofstream::trunc);
		ofs << content;
	}

	EAcquireError acquire()
	{
		CFileSource source(path);
		return source.Acquire(1.0, pos);
	}

	std::string path;
	std::unique_ptr<CPosition> pos;
};

TEST_F(TestFileSource, jsonFullKeys)
{
	write("{\"latitude\": 44.9778, \"longitude\": -93.2650, \"altitude\": 264.0}\n");
	ASSERT_EQ(acquire(), EAcquireError::none);
	ASSERT_NE(pos, nullptr);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), 44.9778);
	EXPECT_DOUBLE_EQ(pos->GetLongitude(), -93.265);
	EXPECT_TRUE(pos->HasAltitude());
	EXPECT_DOUBLE_EQ(pos->GetAltitude(), 264.0);
	EXPECT_EQ(pos->GetFixMode(), EFixMode::fix3D);
}

TEST_F(TestFileSource, jsonShortKeys)
{
	write("{\"lat\": \"-33.8688\", \"lon\": 151.2093}");
	ASSERT_EQ(acquire(), EAcquireError::none);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), -33.8688);
	EXPECT_DOUBLE_EQ(pos->GetLongitude(), 151.2093);
	EXPECT_FALSE(pos->HasAltitude());
	EXPECT_EQ(pos->GetFixMode(), EFixMode::fix2D);
}

TEST_F(TestFileSource, plainText)
{
	write("  44.9778, -93.2650\n");
	ASSERT_EQ(acquire(), EAcquireError::none);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), 44.9778);
	EXPECT_DOUBLE_EQ(pos->GetLongitude(), -93.265);
	EXPECT_EQ(pos->GetFixMode(), EFixMode::fix2D);
}

TEST_F(TestFileSource, missing)
{
	unlink(path.c_str());
	EXPECT_EQ(acquire(), EAcquireError::notFound);
	EXPECT_EQ(pos, nullptr);
}

TEST_F(TestFileSource, unreadable)
{
	// no read permission
	if (0 == geteuid())
		GTEST_SKIP() << "root reads everything";
	chmod(path.c_str(), 0);
	EXPECT_EQ(acquire(), EAcquireError::sourceUnavailable);
}

TEST_F(TestFileSource, malformed)
{
	const char *bad[] {
		"",
		"   \n",
		"44.9778",
		"north, west",
		"{\"latitude\": 44.9}",
		"{\"latitude\": \"abc\", \"longitude\": 1.0}",
		"{\"position\": [1, 2]}",
		"91.0, 10.0",
		"{\"lat\": 10.0, \"lon\": 200.0}"
	};
	for (const auto b : bad)
	{
		write(b);
		EXPECT_EQ(acquire(), EAcquireError::malformed) << "content: " << b;
		EXPECT_EQ(pos, nullptr);
	}
}

TEST_F(TestFileSource, saveAndReload)
{
	auto saved = CPosition::Make(SFixData { 51.5007, -0.1246, true, 11.0, false, 0.0, false, 0.0, EFixMode::fix3D });
	ASSERT_NE(saved, nullptr);
	ASSERT_FALSE(CFileSource::Save(path, *saved));
	ASSERT_EQ(acquire(), EAcquireError::none);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), 51.5007);
	EXPECT_DOUBLE_EQ(pos->GetLongitude(), -0.1246);
	EXPECT_DOUBLE_EQ(pos->GetAltitude(), 11.0);

	EXPECT_TRUE(CFileSource::Save("/nonexistent/dir/position.json", *saved));
}

TEST_F(TestFileSource, cancelled)
{
	write("1.0,2.0");
	CFileSource source(path);
	source.Cancel();
	EXPECT_EQ(source.Acquire(1.0, pos), EAcquireError::sourceUnavailable);
}

TEST(TestManualSource, coordinates)
{
	std::unique_ptr<CPosition> pos;
	CManualSource good(44.9778, -93.2650);
	ASSERT_EQ(good.Acquire(0.0, pos), EAcquireError::none);
	EXPECT_DOUBLE_EQ(pos->GetLatitude(), 44.9778);
	EXPECT_EQ(pos->GetFixMode(), EFixMode::fix3D);

	CManualSource bad(44.9778, -193.2650);
	EXPECT_EQ(bad.Acquire(0.0, pos), EAcquireError::invalidCoordinate);
	EXPECT_EQ(pos, nullptr);
}
