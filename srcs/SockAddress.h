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

#include <cstring>
#include <cstdint>
#include <string>

#include <strings.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include "Log.h"

// an IPv4 or IPv6 address and port for a stream socket
class CSockAddress
{
public:
	CSockAddress()
	{
		Clear();
	}

	~CSockAddress() {}

	// resolves a host name or numeric address, returns true on failure
	bool Initialize(const std::string &address, uint16_t port)
	{
		Clear();
		struct addrinfo hints, *result;
		memset(&hints, 0, sizeof(struct addrinfo));
		hints.ai_family = AF_UNSPEC;
		hints.ai_socktype = SOCK_STREAM;
		const std::string service(std::to_string(port));
		auto rval = getaddrinfo(address.c_str(), service.c_str(), &hints, &result);
		if (0 != rval)
		{
			LogError("Could not find address for %s: %s", address.c_str(), gai_strerror(rval));
			return true;
		}
		memcpy(&addr, result->ai_addr, result->ai_addrlen);
		addr.ss_family = result->ai_family;
		freeaddrinfo(result);
		SetPort(port);
		return false;
	}

	// "loc" is the loopback address, "any" is the wildcard
	bool Initialize(const int family, const uint16_t port, const char *address)
	{
		Clear();
		addr.ss_family = family;
		if (AF_INET == family)
		{
			auto addr4 = (struct sockaddr_in *)&addr;
			addr4->sin_port = htons(port);
			if (0 == strncasecmp(address, "loc", 3))
				inet_pton(AF_INET, "127.0.0.1", &(addr4->sin_addr));
			else if (0 == strncasecmp(address, "any", 3))
				inet_pton(AF_INET, "0.0.0.0", &(addr4->sin_addr));
			else if (1 > inet_pton(AF_INET, address, &(addr4->sin_addr)))
			{
				LogError("IPv4 address initialization failed for '%s'", address);
				return true;
			}
		}
		else if (AF_INET6 == family)
		{
			auto addr6 = (struct sockaddr_in6 *)&addr;
			addr6->sin6_port = htons(port);
			if (0 == strncasecmp(address, "loc", 3))
				inet_pton(AF_INET6, "::1", &(addr6->sin6_addr));
			else if (0 == strncasecmp(address, "any", 3))
				inet_pton(AF_INET6, "::", &(addr6->sin6_addr));
			else if (1 > inet_pton(AF_INET6, address, &(addr6->sin6_addr)))
			{
				LogError("IPv6 address initialization failed for '%s'", address);
				return true;
			}
		}
		else
		{
			addr.ss_family = AF_INET;
			LogError("Address family must be IPv4 or IPv6");
			return true;
		}
		return false;
	}

	const char *GetAddress() const
	{
		if (straddr[0])
			return straddr;
		if (AF_INET == addr.ss_family)
		{
			auto addr4 = (const struct sockaddr_in *)&addr;
			inet_ntop(AF_INET, &(addr4->sin_addr), straddr, INET6_ADDRSTRLEN);
		}
		else if (AF_INET6 == addr.ss_family)
		{
			auto addr6 = (const struct sockaddr_in6 *)&addr;
			inet_ntop(AF_INET6, &(addr6->sin6_addr), straddr, INET6_ADDRSTRLEN);
		}
		else
			return "UNKNOWN";
		return straddr;
	}

	int GetFamily() const
	{
		return addr.ss_family;
	}

	unsigned short GetPort() const
	{
		if (AF_INET == addr.ss_family)
			return ntohs(((const struct sockaddr_in *)&addr)->sin_port);
		else if (AF_INET6 == addr.ss_family)
			return ntohs(((const struct sockaddr_in6 *)&addr)->sin6_port);
		return 0;
	}

	void SetPort(const uint16_t newport)
	{
		if (AF_INET == addr.ss_family)
			((struct sockaddr_in *)&addr)->sin_port = htons(newport);
		else if (AF_INET6 == addr.ss_family)
			((struct sockaddr_in6 *)&addr)->sin6_port = htons(newport);
	}

	struct sockaddr *GetPointer()
	{
		memset(straddr, 0, INET6_ADDRSTRLEN);	// things might change
		return (struct sockaddr *)&addr;
	}

	const struct sockaddr *GetCPointer() const
	{
		return (const struct sockaddr *)&addr;
	}

	socklen_t GetSize() const
	{
		if (AF_INET == addr.ss_family)
			return sizeof(struct sockaddr_in);
		else
			return sizeof(struct sockaddr_in6);
	}

	void Clear()
	{
		memset(&addr, 0, sizeof(struct sockaddr_storage));
		memset(straddr, 0, INET6_ADDRSTRLEN);
	}

private:
	struct sockaddr_storage addr;
	mutable char straddr[INET6_ADDRSTRLEN];
};
