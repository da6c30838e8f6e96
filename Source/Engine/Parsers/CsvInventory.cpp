/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "CsvInventory.hpp"

#include <array>
#include <spdlog/spdlog.h>

#include "Csv.hpp"
#include "Filesystem.hpp"
#include "StringUtil.hpp"
#include "Parsers/EndpointParser.hpp"

namespace
{
	constexpr std::array<char const*, 6> NetworkColumns{ "protocol", "local_socket", "foreign_socket", "state", "pid",
		"process_name" };

	std::string FormatLocalEndpoint(NSocketRecord const& Record)
	{
		auto const& Address = Record.LocalEndpoint.Address;
		if (Address.Family == EIPFamily::IPv6 && Address.IsUnspecified() && !Record.bV6Only)
		{
			return "*:" + std::to_string(Record.LocalEndpoint.Port);
		}
		return Record.LocalEndpoint.ToString();
	}
} // namespace

NParseResult NCsvInventory::ParseIpFile(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);
	bool         bSawHeader{};

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}

		auto Row = NCsv::ParseLine(Line);
		if (!bSawHeader)
		{
			if (!Row || Row->size() != 1 || NStringUtil::ToLower(NStringUtil::Trim((*Row)[0])) != "ip")
			{
				Result.Fail("expected the header 'IP'", LineNo);
				return Result;
			}
			bSawHeader = true;
			continue;
		}

		if (!Row || Row->size() != 1)
		{
			Result.LineError(LineNo, "expected a single column");
			continue;
		}
		auto Address = NIPAddress::FromString((*Row)[0]);
		if (!Address)
		{
			Result.LineError(LineNo, fmt::format("invalid address '{}'", (*Row)[0]));
			continue;
		}
		Result.Inventory.AddInterface(*Address);
	}

	if (!bSawHeader)
	{
		Result.Fail("empty ip table");
	}
	return Result;
}

NParseResult NCsvInventory::ParseNetworkFile(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);
	bool         bSawHeader{};

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}

		auto Row = NCsv::ParseLine(Line);
		if (!bSawHeader)
		{
			bool bValid = Row && Row->size() == NetworkColumns.size();
			for (size_t Column = 0; bValid && Column < NetworkColumns.size(); ++Column)
			{
				bValid = NStringUtil::ToLower(NStringUtil::Trim((*Row)[Column])) == NetworkColumns[Column];
			}
			if (!bValid)
			{
				Result.Fail("expected the header 'protocol,local_socket,foreign_socket,state,pid,process_name'", LineNo);
				return Result;
			}
			bSawHeader = true;
			continue;
		}

		if (!Row || Row->size() != NetworkColumns.size())
		{
			Result.LineError(LineNo, fmt::format("expected {} columns", NetworkColumns.size()));
			continue;
		}
		auto const& Fields = *Row;

		NSocketRecord Record{};
		Record.Protocol = EProtocol::FromString(Fields[0]);
		if (Record.Protocol == EProtocol::Unknown)
		{
			Result.LineError(LineNo, fmt::format("unknown protocol '{}'", Fields[0]));
			continue;
		}

		auto Local = NEndpointParser::Parse(Fields[1], EIPFamily::IPv6);
		if (!Local || Local->bAnyPort)
		{
			Result.LineError(LineNo, fmt::format("invalid local socket '{}'", Fields[1]));
			continue;
		}
		Record.LocalEndpoint = Local->Endpoint;
		Record.bV6Only = Local->IsV6Only();

		std::string_view const ForeignText = NStringUtil::Trim(Fields[2]);
		if (!ForeignText.empty())
		{
			auto Foreign = NEndpointParser::Parse(ForeignText, Local->Endpoint.Address.Family);
			if (!Foreign || Foreign->bAnyPort)
			{
				Result.LineError(LineNo, fmt::format("invalid foreign socket '{}'", ForeignText));
				continue;
			}
			Record.ForeignEndpoint = Foreign->Endpoint;
		}

		std::string const State = NStringUtil::ToLower(NStringUtil::Trim(Fields[3]));
		if (State == "established")
		{
			Record.State = EConnectionState::Established;
		}
		else if (State == "listening" || State == "listen" || (State.empty() && !Record.ForeignEndpoint))
		{
			Record.State = EConnectionState::Listening;
		}
		else
		{
			Result.LineError(LineNo, fmt::format("unknown state '{}'", Fields[3]));
			continue;
		}

		if (!NStringUtil::Trim(Fields[4]).empty())
		{
			auto Pid = NStringUtil::ParseNumber<NProcessId>(Fields[4]);
			if (!Pid)
			{
				Result.LineError(LineNo, fmt::format("invalid pid '{}'", Fields[4]));
				continue;
			}
			Record.Pid = *Pid;
		}
		Record.ProcessName = std::string(NStringUtil::Trim(Fields[5]));
		Result.AddSocket(LineNo, std::move(Record));
	}

	if (!bSawHeader)
	{
		Result.Fail("empty network table");
	}
	return Result;
}

NParseResult NCsvInventory::Parse(std::string_view IpText, std::string_view NetworkText, NHostName const& Host)
{
	NParseResult Result = ParseIpFile(IpText, Host, Host + "_ip.csv");
	NParseResult Network = ParseNetworkFile(NetworkText, Host, Host + "_network.csv");

	Result.bOk = Result.bOk && Network.bOk;
	Result.Diagnostics.insert(Result.Diagnostics.end(), Network.Diagnostics.begin(), Network.Diagnostics.end());
	if (!Result.bOk)
	{
		Result.Inventory = NHostInventory{ .Name = Host };
		return Result;
	}
	Result.Inventory.MergeFrom(Network.Inventory, &Result.Diagnostics);
	return Result;
}

std::string NCsvInventory::FormatIpFile(NHostInventory const& Inventory)
{
	std::string Out = "IP\n";
	for (auto const& Address : Inventory.Interfaces)
	{
		Out += NCsv::FormatRow({ Address.ToDisplayString() });
	}
	return Out;
}

std::string NCsvInventory::FormatNetworkFile(NHostInventory const& Inventory)
{
	std::string Out = NCsv::FormatRow(NCsv::NRow(NetworkColumns.begin(), NetworkColumns.end()));
	for (auto const& Record : Inventory.Sockets)
	{
		Out += NCsv::FormatRow({
			EProtocol::ToString(Record.Protocol),
			FormatLocalEndpoint(Record),
			Record.ForeignEndpoint ? Record.ForeignEndpoint->ToString() : std::string{},
			EConnectionState::ToString(Record.State),
			std::to_string(Record.Pid),
			Record.ProcessName,
		});
	}
	return Out;
}

bool NCsvInventory::Write(NHostInventory const& Inventory, std::filesystem::path const& Dir)
{
	if (!NFilesystem::CreateDirectories(Dir))
	{
		return false;
	}
	return NFilesystem::WriteTextFile(Dir / (Inventory.Name + "_ip.csv"), FormatIpFile(Inventory))
		&& NFilesystem::WriteTextFile(Dir / (Inventory.Name + "_network.csv"), FormatNetworkFile(Inventory));
}
