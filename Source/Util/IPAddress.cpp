/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "IPAddress.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>

#include "StringUtil.hpp"

EProtocol::Type EProtocol::FromString(std::string_view Str)
{
	std::string const Lower = NStringUtil::ToLower(NStringUtil::Trim(Str));
	if (Lower == "tcp" || Lower == "tcp4" || Lower == "tcp6")
	{
		return TCP;
	}
	if (Lower == "udp" || Lower == "udp4" || Lower == "udp6")
	{
		return UDP;
	}
	return Unknown;
}

std::optional<NIPAddress> NIPAddress::FromString(std::string_view Str)
{
	Str = NStringUtil::Trim(Str);
	if (Str.empty())
	{
		return std::nullopt;
	}

	NIPAddress Result{};
	if (auto const ZonePos = Str.find('%'); ZonePos != std::string_view::npos)
	{
		Result.Zone = std::string(Str.substr(ZonePos + 1));
		Str = Str.substr(0, ZonePos);
	}

	std::string const Literal(Str);
	if (Literal.find(':') == std::string::npos)
	{
		in_addr Addr4{};
		if (inet_pton(AF_INET, Literal.c_str(), &Addr4) != 1)
		{
			return std::nullopt;
		}
		std::memcpy(Result.Bytes.data(), &Addr4.s_addr, 4);
		Result.Family = EIPFamily::IPv4;
		// v4 literals never carry a zone
		Result.Zone.clear();
		return Result;
	}

	in6_addr Addr6{};
	if (inet_pton(AF_INET6, Literal.c_str(), &Addr6) != 1)
	{
		return std::nullopt;
	}
	std::memcpy(Result.Bytes.data(), Addr6.s6_addr, 16);
	Result.Family = EIPFamily::IPv6;
	return Result;
}

NIPAddress NIPAddress::AnyV4()
{
	NIPAddress Address{};
	Address.Family = EIPFamily::IPv4;
	return Address;
}

NIPAddress NIPAddress::AnyV6()
{
	NIPAddress Address{};
	Address.Family = EIPFamily::IPv6;
	return Address;
}

std::string NIPAddress::ToString() const
{
	if (Family == EIPFamily::IPv4)
	{
		in_addr Addr4{};
		std::memcpy(&Addr4.s_addr, Bytes.data(), 4);
		char Buffer[INET_ADDRSTRLEN];
		if (inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN))
		{
			return { Buffer };
		}
		return {};
	}

	if (Family == EIPFamily::IPv6)
	{
		in6_addr Addr6{};
		std::memcpy(Addr6.s6_addr, Bytes.data(), 16);
		char Buffer[INET6_ADDRSTRLEN];
		if (inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN))
		{
			return { Buffer };
		}
	}
	return {};
}

std::string NIPAddress::ToDisplayString() const
{
	if (Zone.empty())
	{
		return ToString();
	}
	return ToString() + "%" + Zone;
}

bool NIPAddress::IsLoopback() const
{
	if (Family == EIPFamily::IPv4)
	{
		return Bytes[0] == 127;
	}

	if (Family == EIPFamily::IPv6)
	{
		if (IsV4Mapped())
		{
			return FromV4Mapped().IsLoopback();
		}
		// ::1
		for (size_t i = 0; i < 15; ++i)
		{
			if (Bytes[i] != 0)
			{
				return false;
			}
		}
		return Bytes[15] == 1;
	}

	return false;
}

bool NIPAddress::IsUnspecified() const
{
	size_t const Len = Family == EIPFamily::IPv4 ? 4 : 16;
	for (size_t i = 0; i < Len; ++i)
	{
		if (Bytes[i] != 0)
		{
			return false;
		}
	}
	return Family != EIPFamily::Unknown;
}

bool NIPAddress::IsV4Mapped() const
{
	if (Family != EIPFamily::IPv6)
	{
		return false;
	}
	for (size_t i = 0; i < 10; ++i)
	{
		if (Bytes[i] != 0)
		{
			return false;
		}
	}
	return Bytes[10] == 0xFF && Bytes[11] == 0xFF;
}

NIPAddress NIPAddress::ToV4Mapped() const
{
	if (Family != EIPFamily::IPv4)
	{
		return *this;
	}
	NIPAddress Mapped{};
	Mapped.Family = EIPFamily::IPv6;
	Mapped.Bytes[10] = 0xFF;
	Mapped.Bytes[11] = 0xFF;
	std::memcpy(Mapped.Bytes.data() + 12, Bytes.data(), 4);
	return Mapped;
}

NIPAddress NIPAddress::FromV4Mapped() const
{
	NIPAddress V4{};
	V4.Family = EIPFamily::IPv4;
	std::memcpy(V4.Bytes.data(), Bytes.data() + 12, 4);
	return V4;
}

std::optional<NEndpoint> NEndpoint::FromString(std::string_view Str)
{
	Str = NStringUtil::Trim(Str);
	std::string_view AddressPart{};
	std::string_view PortPart{};

	if (Str.starts_with('['))
	{
		auto const Close = Str.find(']');
		if (Close == std::string_view::npos || Close + 1 >= Str.size() || Str[Close + 1] != ':')
		{
			return std::nullopt;
		}
		AddressPart = Str.substr(1, Close - 1);
		PortPart = Str.substr(Close + 2);
	}
	else
	{
		auto const Colon = Str.rfind(':');
		if (Colon == std::string_view::npos)
		{
			return std::nullopt;
		}
		AddressPart = Str.substr(0, Colon);
		PortPart = Str.substr(Colon + 1);
		// Unbracketed v6 literals are ambiguous, only accept them in brackets
		if (AddressPart.find(':') != std::string_view::npos)
		{
			return std::nullopt;
		}
	}

	auto Address = NIPAddress::FromString(AddressPart);
	auto Port = NStringUtil::ParseNumber<NPort>(PortPart);
	if (!Address || !Port)
	{
		return std::nullopt;
	}
	return NEndpoint{ .Address = *Address, .Port = *Port };
}
