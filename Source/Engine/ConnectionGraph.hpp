/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "Types.hpp"
#include "Data/Diagnostic.hpp"
#include "Data/SocketRecord.hpp"

namespace EMatchRule
{
	// Tried in this order, the first rule with a candidate wins
	enum Type : uint8_t
	{
		Direct = 0,
		V4Mapped,
		UdpMutual,
		UdpMutualV4Mapped
	};

	inline char const* ToString(Type Rule)
	{
		switch (Rule)
		{
			case Direct:
				return "direct";
			case V4Mapped:
				return "v4-mapped";
			case UdpMutual:
				return "udp-mutual";
			case UdpMutualV4Mapped:
				return "udp-mutual-v4-mapped";
			default:
				return "unknown";
		}
	}
} // namespace EMatchRule

struct NProcessRef
{
	NHostName   Host{};
	NProcessId  Pid{};
	std::string Name{};

	[[nodiscard]] std::string GetLabel() const { return Name.empty() ? "unknown" : Name; }
};

// One client socket paired with the server socket it talks to
struct NConnectionEdge
{
	NHostName        ClientHost{};
	NSocketRecord    ClientSocket{};
	NHostName        ServerHost{};
	NSocketRecord    ServerSocket{};
	EMatchRule::Type Rule{};

	// Process owning the accepted socket when it isn't the listener (socket handover)
	std::optional<NProcessRef> Handover{};

	[[nodiscard]] NProcessRef GetClientProcess() const
	{
		return { .Host = ClientHost, .Pid = ClientSocket.Pid, .Name = ClientSocket.ProcessName };
	}

	[[nodiscard]] NProcessRef GetServerProcess() const
	{
		return { .Host = ServerHost, .Pid = ServerSocket.Pid, .Name = ServerSocket.ProcessName };
	}

	[[nodiscard]] bool IsSameHost() const { return ClientHost == ServerHost; }
};

inline bool operator<(NConnectionEdge const& Lhs, NConnectionEdge const& Rhs)
{
	return std::tie(Lhs.ClientHost, Lhs.ClientSocket, Lhs.ServerHost, Lhs.ServerSocket, Lhs.Rule)
		< std::tie(Rhs.ClientHost, Rhs.ClientSocket, Rhs.ServerHost, Rhs.ServerSocket, Rhs.Rule);
}

inline bool operator==(NConnectionEdge const& Lhs, NConnectionEdge const& Rhs)
{
	auto HandoverKey = [](NConnectionEdge const& Edge) {
		return Edge.Handover ? std::make_tuple(true, Edge.Handover->Pid, Edge.Handover->Name)
							 : std::make_tuple(false, NProcessId{}, std::string{});
	};
	return std::tie(Lhs.ClientHost, Lhs.ClientSocket, Lhs.ServerHost, Lhs.ServerSocket, Lhs.Rule)
		== std::tie(Rhs.ClientHost, Rhs.ClientSocket, Rhs.ServerHost, Rhs.ServerSocket, Rhs.Rule)
		&& HandoverKey(Lhs) == HandoverKey(Rhs);
}

// Result of one correlation run, never modified afterwards
struct NConnectionGraph
{
	std::vector<NConnectionEdge>     Edges{};
	std::map<NHostName, std::string> Hosts{}; // name -> display name
	NDiagnostics                     Diagnostics{};

	[[nodiscard]] size_t CountDiagnostics(EDiagnosticKind::Type Kind) const
	{
		size_t Count = 0;
		for (auto const& Diagnostic : Diagnostics)
		{
			Count += Diagnostic.Kind == Kind ? 1 : 0;
		}
		return Count;
	}
};
