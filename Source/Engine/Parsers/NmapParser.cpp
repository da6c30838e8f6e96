/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "NmapParser.hpp"

#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

NParseResult NNmapParser::Parse(
	std::string_view Text, NHostName const& Host, std::string_view ScannedAddress, std::string const& File)
{
	NParseResult Result(Host, File);

	auto const Address = NIPAddress::FromString(ScannedAddress);
	if (!Address)
	{
		Result.Fail(fmt::format("invalid scanned address '{}'", ScannedAddress));
		return Result;
	}
	Result.Inventory.AddInterface(*Address);

	auto const Lines = NStringUtil::SplitLines(Text);
	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		// Port lines are the only ones starting with a digit
		if (Line.empty() || Line.front() < '0' || Line.front() > '9')
		{
			continue;
		}

		auto const Fields = NStringUtil::SplitWhitespace(Line);
		if (Fields.size() < 2)
		{
			Result.LineError(LineNo, "expected PORT STATE [SERVICE]");
			continue;
		}
		if (Fields[1] != "open")
		{
			continue;
		}

		auto const Slash = Fields[0].find('/');
		if (Slash == std::string_view::npos)
		{
			Result.LineError(LineNo, fmt::format("invalid port '{}'", Fields[0]));
			continue;
		}
		auto const            Port = NStringUtil::ParseNumber<NPort>(Fields[0].substr(0, Slash));
		EProtocol::Type const Protocol = EProtocol::FromString(Fields[0].substr(Slash + 1));
		if (!Port)
		{
			Result.LineError(LineNo, fmt::format("invalid port '{}'", Fields[0]));
			continue;
		}
		if (Protocol == EProtocol::Unknown)
		{
			// sctp
			continue;
		}

		NSocketRecord Record{};
		Record.Protocol = Protocol;
		Record.State = EConnectionState::Listening;
		Record.LocalEndpoint = NEndpoint{ .Address = *Address, .Port = *Port };
		Record.bV6Only = true;
		Record.ProcessName = std::string(Fields.size() > 2 ? Fields[2] : "unknown") + "?";
		Result.AddSocket(LineNo, std::move(Record));
	}
	return Result;
}
