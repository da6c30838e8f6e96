/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "EndpointParser.hpp"

#include "StringUtil.hpp"

std::optional<NTextEndpoint> NEndpointParser::Parse(std::string_view Str, EIPFamily::Type StarFamily)
{
	Str = NStringUtil::Trim(Str);
	if (Str.empty())
	{
		return std::nullopt;
	}

	std::string_view HostPart{};
	std::string_view PortPart{};
	if (Str.front() == '[')
	{
		auto const Close = Str.find(']');
		if (Close == std::string_view::npos || Close + 1 >= Str.size() || Str[Close + 1] != ':')
		{
			return std::nullopt;
		}
		HostPart = Str.substr(1, Close - 1);
		PortPart = Str.substr(Close + 2);
	}
	else
	{
		auto const Colon = Str.rfind(':');
		if (Colon == std::string_view::npos || Colon == 0)
		{
			return std::nullopt;
		}
		HostPart = Str.substr(0, Colon);
		PortPart = Str.substr(Colon + 1);
	}

	NTextEndpoint Result{};
	if (HostPart == "*")
	{
		Result.bStarAddress = true;
		Result.Endpoint.Address = StarFamily == EIPFamily::IPv4 ? NIPAddress::AnyV4() : NIPAddress::AnyV6();
	}
	else if (auto Address = NIPAddress::FromString(HostPart))
	{
		Result.Endpoint.Address = *Address;
	}
	else
	{
		return std::nullopt;
	}

	if (PortPart == "*")
	{
		Result.bAnyPort = true;
	}
	else if (auto Port = NStringUtil::ParseNumber<NPort>(PortPart))
	{
		Result.Endpoint.Port = *Port;
	}
	else
	{
		return std::nullopt;
	}
	return Result;
}
