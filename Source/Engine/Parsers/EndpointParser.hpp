/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string_view>

#include "IPAddress.hpp"

// An endpoint as printed by ss, netstat or written in the csv tables
struct NTextEndpoint
{
	NEndpoint Endpoint{};
	bool      bStarAddress{}; // "*", ss uses it for the dual stack wildcard
	bool      bAnyPort{};     // "*" as port

	// "*:*", "0.0.0.0:*", "[::]:0"... the peer column of a socket that isn't connected
	[[nodiscard]] bool IsUnconnectedPeer() const
	{
		return bAnyPort || (Endpoint.Address.IsUnspecified() && Endpoint.Port == 0);
	}

	// ss marks dual stack sockets with "*" or a v4-mapped address, everything else v6 is v6 only
	[[nodiscard]] bool IsV6Only() const
	{
		if (Endpoint.Address.Family != EIPFamily::IPv6)
		{
			return true;
		}
		return !bStarAddress && !Endpoint.Address.IsV4Mapped();
	}
};

class NEndpointParser
{
public:
	// Accepts "a.b.c.d:port", "[v6%zone]:port", unbracketed "v6:port" (split at the last colon),
	// "*:port" and "*" as port. StarFamily is the family assumed for a "*" address.
	static std::optional<NTextEndpoint> Parse(std::string_view Str, EIPFamily::Type StarFamily);
};
