/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "LinuxParser.hpp"

#include <spdlog/spdlog.h>

#include "StringUtil.hpp"
#include "Parsers/EndpointParser.hpp"

namespace
{
	bool IsStateWord(std::string_view Field)
	{
		if (Field.empty() || Field == "-")
		{
			return false;
		}
		for (char const C : Field)
		{
			if (!(C >= 'A' && C <= 'Z') && C != '_' && !(C >= '0' && C <= '9'))
			{
				return false;
			}
		}
		return true;
	}

	// Everything after the Nth whitespace separated field, the process columns may contain spaces
	std::string_view RestOfLine(std::string_view Line, std::string_view Field)
	{
		auto const Offset = static_cast<size_t>(Field.data() - Line.data());
		return NStringUtil::Trim(Line.substr(Offset));
	}
} // namespace

bool NLinuxParser::ParseSsProcess(std::string_view Field, NProcessId& OutPid, std::string& OutName)
{
	auto const UsersPos = Field.find("users:((");
	if (UsersPos == std::string_view::npos)
	{
		return false;
	}
	Field = Field.substr(UsersPos);

	auto const NameStart = Field.find('"');
	if (NameStart == std::string_view::npos)
	{
		return false;
	}
	auto const NameEnd = Field.find('"', NameStart + 1);
	if (NameEnd == std::string_view::npos)
	{
		return false;
	}

	auto const PidPos = Field.find("pid=", NameEnd);
	if (PidPos == std::string_view::npos)
	{
		return false;
	}
	size_t PidEnd = PidPos + 4;
	while (PidEnd < Field.size() && Field[PidEnd] >= '0' && Field[PidEnd] <= '9')
	{
		++PidEnd;
	}

	auto Pid = NStringUtil::ParseNumber<NProcessId>(Field.substr(PidPos + 4, PidEnd - PidPos - 4));
	if (!Pid)
	{
		return false;
	}
	OutPid = *Pid;
	OutName = std::string(Field.substr(NameStart + 1, NameEnd - NameStart - 1));
	return true;
}

bool NLinuxParser::ParseNetstatProcess(std::string_view Field, NProcessId& OutPid, std::string& OutName)
{
	Field = NStringUtil::Trim(Field);
	auto const Slash = Field.find('/');
	if (Field.empty() || Field == "-" || Slash == std::string_view::npos)
	{
		return false;
	}

	auto Pid = NStringUtil::ParseNumber<NProcessId>(Field.substr(0, Slash));
	if (!Pid)
	{
		return false;
	}

	// "812/sshd: /usr/sbin/sshd", only the command name is of interest
	std::string_view Name = Field.substr(Slash + 1);
	if (auto const Space = Name.find_first_of(" \t"); Space != std::string_view::npos)
	{
		Name = Name.substr(0, Space);
	}
	if (!Name.empty() && Name.back() == ':')
	{
		Name.remove_suffix(1);
	}
	OutPid = *Pid;
	OutName = std::string(Name);
	return true;
}

NParseResult NLinuxParser::ParseSs(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);
	bool         bReportedMissingProcess{};

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}

		auto const        Fields = NStringUtil::SplitWhitespace(Line);
		std::string const First = NStringUtil::ToLower(Fields[0]);
		if (First == "netid")
		{
			continue;
		}
		if (First == "state")
		{
			Result.Fail("ss output without a Netid column, capture it with `ss -tuanp`", LineNo);
			return Result;
		}
		if (First != "tcp" && First != "udp")
		{
			// unix, raw, icmp6 and friends
			continue;
		}

		if (Fields.size() < 6)
		{
			Result.LineError(LineNo, fmt::format("expected at least 6 columns, got {}", Fields.size()));
			continue;
		}

		EProtocol::Type const  Protocol = EProtocol::FromString(First);
		std::string_view const State = Fields[1];
		EConnectionState::Type RecordState{};
		if (State == "ESTAB")
		{
			RecordState = EConnectionState::Established;
		}
		else if ((Protocol == EProtocol::TCP && State == "LISTEN") || (Protocol == EProtocol::UDP && State == "UNCONN"))
		{
			RecordState = EConnectionState::Listening;
		}
		else
		{
			// TIME-WAIT, SYN-SENT, ... are transient
			continue;
		}

		auto Local = NEndpointParser::Parse(Fields[4], EIPFamily::IPv6);
		if (!Local || Local->bAnyPort)
		{
			Result.LineError(LineNo, fmt::format("invalid local address '{}'", Fields[4]));
			continue;
		}
		auto Peer = NEndpointParser::Parse(Fields[5], EIPFamily::IPv6);
		if (!Peer)
		{
			Result.LineError(LineNo, fmt::format("invalid peer address '{}'", Fields[5]));
			continue;
		}

		NSocketRecord Record{};
		Record.Protocol = Protocol;
		Record.State = RecordState;
		Record.LocalEndpoint = Local->Endpoint;
		Record.bV6Only = Local->IsV6Only();
		if (RecordState == EConnectionState::Established)
		{
			if (Peer->IsUnconnectedPeer())
			{
				Result.LineError(LineNo, fmt::format("established socket without peer '{}'", Fields[5]));
				continue;
			}
			Record.ForeignEndpoint = Peer->Endpoint;
		}

		if (Fields.size() < 7 || !ParseSsProcess(RestOfLine(Line, Fields[6]), Record.Pid, Record.ProcessName))
		{
			if (!bReportedMissingProcess)
			{
				bReportedMissingProcess = true;
				spdlog::debug("{}: some ss lines have no process, was ss run as root?", Host);
			}
		}
		Result.AddSocket(LineNo, std::move(Record));
	}
	return Result;
}

NParseResult NLinuxParser::ParseNetstat(std::string_view Text, NHostName const& Host, std::string const& File)
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

		auto const        Fields = NStringUtil::SplitWhitespace(Line);
		std::string const First = NStringUtil::ToLower(Fields[0]);
		if (First == "active")
		{
			// The unix domain socket table follows, nothing of interest there
			if (NStringUtil::ToLower(Line).find("unix") != std::string::npos)
			{
				break;
			}
			continue;
		}
		if (First == "proto")
		{
			if (Fields.size() < 6)
			{
				Result.Fail("unexpected netstat header, capture it with `netstat -tunap`", LineNo);
				return Result;
			}
			continue;
		}

		EProtocol::Type const Protocol = EProtocol::FromString(First);
		if (Protocol == EProtocol::Unknown)
		{
			continue;
		}
		bool const bV6 = First.ends_with('6');

		if (Fields.size() < 6)
		{
			Result.LineError(LineNo, fmt::format("expected at least 6 columns, got {}", Fields.size()));
			continue;
		}

		auto const Family = bV6 ? EIPFamily::IPv6 : EIPFamily::IPv4;
		auto       Local = NEndpointParser::Parse(Fields[3], Family);
		if (!Local || Local->bAnyPort)
		{
			Result.LineError(LineNo, fmt::format("invalid local address '{}'", Fields[3]));
			continue;
		}
		auto Foreign = NEndpointParser::Parse(Fields[4], Family);
		if (!Foreign)
		{
			Result.LineError(LineNo, fmt::format("invalid foreign address '{}'", Fields[4]));
			continue;
		}

		// UDP lines usually have an empty state column
		std::string_view State{};
		size_t           ProcessColumn = 5;
		if (IsStateWord(Fields[5]))
		{
			State = Fields[5];
			ProcessColumn = 6;
		}

		NSocketRecord Record{};
		Record.Protocol = Protocol;
		Record.LocalEndpoint = Local->Endpoint;
		// netstat doesn't tell, assume v6 only so nothing is matched that shouldn't be
		Record.bV6Only = true;

		if (Protocol == EProtocol::TCP)
		{
			if (State == "LISTEN")
			{
				Record.State = EConnectionState::Listening;
			}
			else if (State == "ESTABLISHED")
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
			if (State.empty())
			{
				Record.State = Foreign->IsUnconnectedPeer() ? EConnectionState::Listening : EConnectionState::Established;
			}
			else if (State == "ESTABLISHED")
			{
				Record.State = EConnectionState::Established;
			}
			else
			{
				continue;
			}
		}

		if (Record.State == EConnectionState::Established)
		{
			if (Foreign->IsUnconnectedPeer())
			{
				Result.LineError(LineNo, fmt::format("established socket without peer '{}'", Fields[4]));
				continue;
			}
			Record.ForeignEndpoint = Foreign->Endpoint;
		}

		if (ProcessColumn < Fields.size())
		{
			ParseNetstatProcess(RestOfLine(Line, Fields[ProcessColumn]), Record.Pid, Record.ProcessName);
		}
		Result.AddSocket(LineNo, std::move(Record));
	}
	return Result;
}

NParseResult NLinuxParser::ParseIpAddr(std::string_view Text, NHostName const& Host, std::string const& File)
{
	NParseResult Result(Host, File);
	auto const   Lines = NStringUtil::SplitLines(Text);
	std::string  InterfaceName{};

	for (size_t i = 0; i < Lines.size(); ++i)
	{
		size_t const           LineNo = i + 1;
		std::string_view const Line = NStringUtil::Trim(Lines[i]);
		if (Line.empty())
		{
			continue;
		}

		auto const Fields = NStringUtil::SplitWhitespace(Line);

		// "2: eth0: <BROADCAST,...>", "3: veth1@if2: <...>"
		if (Fields.size() >= 2 && Fields[0].ends_with(':') && NStringUtil::ParseNumber<uint32_t>(Fields[0].substr(0, Fields[0].size() - 1)))
		{
			std::string_view Name = Fields[1];
			if (Name.ends_with(':'))
			{
				Name.remove_suffix(1);
			}
			if (auto const At = Name.find('@'); At != std::string_view::npos)
			{
				Name = Name.substr(0, At);
			}
			InterfaceName = std::string(Name);
			continue;
		}

		if (Fields[0] != "inet" && Fields[0] != "inet6")
		{
			continue;
		}
		if (Fields.size() < 2)
		{
			Result.LineError(LineNo, "address line without an address");
			continue;
		}

		std::string_view Literal = Fields[1];
		if (auto const Slash = Literal.find('/'); Slash != std::string_view::npos)
		{
			Literal = Literal.substr(0, Slash);
		}
		auto Address = NIPAddress::FromString(Literal);
		if (!Address)
		{
			Result.LineError(LineNo, fmt::format("invalid address '{}'", Fields[1]));
			continue;
		}

		// Link-local addresses are only meaningful together with their interface
		if (Address->Family == EIPFamily::IPv6 && Address->Zone.empty() && Address->Bytes[0] == 0xFE
			&& (Address->Bytes[1] & 0xC0) == 0x80)
		{
			Address->Zone = InterfaceName;
		}
		Result.Inventory.AddInterface(*Address);
	}
	return Result;
}
