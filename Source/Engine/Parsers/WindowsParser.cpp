/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "WindowsParser.hpp"

#include <spdlog/spdlog.h>

#include "Csv.hpp"
#include "StringUtil.hpp"
#include "Parsers/EndpointParser.hpp"

namespace
{
	// "IPAddress : x", "IPv4 Address. . . . . : x", "Link-local IPv6 Address . . : x"
	bool IsAddressKey(std::string_view Key)
	{
		return Key.starts_with("IPAddress") || Key.find("IPv4 Address") != std::string_view::npos
			|| Key.find("IPv6 Address") != std::string_view::npos;
	}
} // namespace

NParseResult NWindowsParser::ParseIpConfig(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);

		// The key never contains a colon, v6 values do
		auto const Colon = Line.find(':');
		if (Colon == std::string_view::npos || !IsAddressKey(Line.substr(0, Colon)))
		{
			continue;
		}

		std::string_view Value = NStringUtil::Trim(Line.substr(Colon + 1));
		if (auto const Paren = Value.find('('); Paren != std::string_view::npos)
		{
			// "(Preferred)", "(Deprecated)"
			Value = NStringUtil::Trim(Value.substr(0, Paren));
		}
		if (Value.empty())
		{
			continue;
		}

		auto Address = NIPAddress::FromString(Value);
		if (!Address)
		{
			Result.LineError(LineNo, fmt::format("invalid address '{}'", Value));
			continue;
		}
		Result.Inventory.AddInterface(*Address);
	}
	return Result;
}

NParseResult NWindowsParser::ParseNetstat(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}

		auto const            Fields = NStringUtil::SplitWhitespace(Line);
		EProtocol::Type const Protocol = EProtocol::FromString(Fields[0]);
		if (Protocol == EProtocol::Unknown)
		{
			// "Active Connections", the column header and localized variants of both
			continue;
		}

		size_t const Expected = Protocol == EProtocol::TCP ? 5 : 4;
		if (Fields.size() != Expected)
		{
			Result.LineError(LineNo, fmt::format("expected {} columns, got {}", Expected, Fields.size()));
			continue;
		}

		auto Local = NEndpointParser::Parse(Fields[1], EIPFamily::IPv4);
		if (!Local || Local->bAnyPort)
		{
			Result.LineError(LineNo, fmt::format("invalid local address '{}'", Fields[1]));
			continue;
		}
		auto Foreign = NEndpointParser::Parse(Fields[2], Local->Endpoint.Address.Family);
		if (!Foreign)
		{
			Result.LineError(LineNo, fmt::format("invalid foreign address '{}'", Fields[2]));
			continue;
		}
		auto Pid = NStringUtil::ParseNumber<NProcessId>(Fields.back());
		if (!Pid)
		{
			Result.LineError(LineNo, fmt::format("invalid pid '{}'", Fields.back()));
			continue;
		}

		NSocketRecord Record{};
		Record.Protocol = Protocol;
		Record.LocalEndpoint = Local->Endpoint;
		Record.Pid = *Pid;
		// Windows sockets are v6 only unless the application asks otherwise, which netstat doesn't show
		Record.bV6Only = true;

		if (Protocol == EProtocol::TCP)
		{
			if (Fields[3] == "LISTENING")
			{
				Record.State = EConnectionState::Listening;
			}
			else if (Fields[3] == "ESTABLISHED")
			{
				Record.State = EConnectionState::Established;
			}
			else
			{
				continue;
			}
		}
		else
		{
			Record.State = Foreign->IsUnconnectedPeer() ? EConnectionState::Listening : EConnectionState::Established;
		}

		if (Record.State == EConnectionState::Established)
		{
			if (Foreign->IsUnconnectedPeer())
			{
				Result.LineError(LineNo, fmt::format("established socket without peer '{}'", Fields[2]));
				continue;
			}
			Record.ForeignEndpoint = Foreign->Endpoint;
		}
		Result.AddSocket(LineNo, std::move(Record));
	}
	return Result;
}

NParseResult NWindowsParser::ParseTasklist(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);
	bool         bSawRow{};

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}
		if (Line.front() != '"')
		{
			Result.Fail("not tasklist CSV output, capture it with `tasklist /FO CSV`", LineNo);
			return Result;
		}

		auto Row = NCsv::ParseLine(Line);
		if (!Row || Row->size() < 2)
		{
			Result.LineError(LineNo, "expected at least image name and pid");
			continue;
		}

		auto Pid = NStringUtil::ParseNumber<NProcessId>((*Row)[1]);
		if (!Pid)
		{
			// Header row, its wording depends on the system language
			if (bSawRow)
			{
				Result.LineError(LineNo, fmt::format("invalid pid '{}'", (*Row)[1]));
			}
			continue;
		}
		bSawRow = true;
		if (*Pid == 0)
		{
			continue;
		}
		Result.Inventory.ProcessNames[*Pid] = (*Row)[0];
	}
	return Result;
}
