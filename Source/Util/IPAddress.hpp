/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};

	inline char const* ToString(Type Family)
	{
		switch (Family)
		{
			case IPv4:
				return "v4";
			case IPv6:
				return "v6";
			default:
				return "unknown";
		}
	}
} // namespace EIPFamily

namespace EProtocol
{
	enum Type : uint8_t
	{
		Unknown = 0,
		TCP = 6,
		UDP = 17
	};

	inline char const* ToString(Type Protocol)
	{
		switch (Protocol)
		{
			case TCP:
				return "tcp";
			case UDP:
				return "udp";
			default:
				return "unknown";
		}
	}

	// Accepts "tcp", "TCP", "tcp6", "udp4"... anything else is Unknown
	Type FromString(std::string_view Str);
} // namespace EProtocol

struct NIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};
	// Scope of a link-local v6 address ("eth0", "12"), not part of the address identity
	std::string Zone{};

	[[nodiscard]] static std::optional<NIPAddress> FromString(std::string_view Str);
	[[nodiscard]] static NIPAddress                AnyV4();
	[[nodiscard]] static NIPAddress                AnyV6();

	[[nodiscard]] std::string ToString() const;

	// Same as ToString() but with the %zone suffix if there is one
	[[nodiscard]] std::string ToDisplayString() const;

	[[nodiscard]] bool IsValid() const { return Family != EIPFamily::Unknown; }

	[[nodiscard]] bool IsLoopback() const;

	// 0.0.0.0 or ::
	[[nodiscard]] bool IsUnspecified() const;

	// ::ffff:a.b.c.d
	[[nodiscard]] bool IsV4Mapped() const;

	[[nodiscard]] NIPAddress ToV4Mapped() const;

	// Only valid if IsV4Mapped()
	[[nodiscard]] NIPAddress FromV4Mapped() const;

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Bytes, Family, Zone);
	}
};

inline bool operator==(NIPAddress const& Lhs, NIPAddress const& Rhs)
{
	return Lhs.Bytes == Rhs.Bytes && Lhs.Family == Rhs.Family;
}

inline bool operator!=(NIPAddress const& Lhs, NIPAddress const& Rhs)
{
	return !(Lhs == Rhs);
}

inline bool operator<(NIPAddress const& Lhs, NIPAddress const& Rhs)
{
	if (Lhs.Family != Rhs.Family)
	{
		return Lhs.Family < Rhs.Family;
	}
	return Lhs.Bytes < Rhs.Bytes;
}

struct NEndpoint
{
	NIPAddress Address{};
	NPort      Port{}; // host byte order

	// Parses "a.b.c.d:port" and "[v6]:port" (RFC 2732), with an optional %zone
	[[nodiscard]] static std::optional<NEndpoint> FromString(std::string_view Str);

	[[nodiscard]] std::string ToString() const
	{
		if (Address.Family == EIPFamily::IPv6)
		{
			return "[" + Address.ToDisplayString() + "]:" + std::to_string(Port);
		}
		return Address.ToString() + ":" + std::to_string(Port);
	}

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Address, Port);
	}
};

inline bool operator==(NEndpoint const& Lhs, NEndpoint const& Rhs)
{
	return Lhs.Address == Rhs.Address && Lhs.Port == Rhs.Port;
}

inline bool operator!=(NEndpoint const& Lhs, NEndpoint const& Rhs)
{
	return !(Lhs == Rhs);
}

inline bool operator<(NEndpoint const& Lhs, NEndpoint const& Rhs)
{
	if (Lhs.Address != Rhs.Address)
	{
		return Lhs.Address < Rhs.Address;
	}
	return Lhs.Port < Rhs.Port;
}
