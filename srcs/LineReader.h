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

#include <atomic>
#include <string>

enum class EReadResult { line, timeout, closed, cancelled };

// Owns a file descriptor and splits what comes in into lines. The
// descriptor is closed when the reader goes out of scope.
class CLineReader
{
public:
	static constexpr int PollSliceMs = 100;
	static constexpr std::size_t MaxLineLength = 4096;

	CLineReader() {}
	~CLineReader() { Close(); }
	CLineReader(const CLineReader &) = delete;
	CLineReader &operator=(const CLineReader &) = delete;

	// takes ownership of fd
	void Attach(int fd);
	void Close();
	bool IsOpen() const { return m_fd >= 0; }

	// Waits up to ms milliseconds for a complete line, in PollSliceMs
	// pieces, checking cancel between them. The line has no end-of-line
	// characters. An unterminated last line is returned before closed.
	EReadResult ReadLine(std::string &line, int ms, const std::atomic<bool> &cancel);

private:
	bool takeLine(std::string &line);

	int m_fd = -1;
	bool m_eof = false;
	std::string m_buffer;
};
