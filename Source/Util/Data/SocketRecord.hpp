/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <tuple>

#include "IPAddress.hpp"
#include "Types.hpp"

namespace EConnectionState
{
	enum Type : uint8_t
	{
		Listening = 0, // TCP listen or unconnected UDP
		Established    // TCP connected or UDP exclusively bound to one peer
	};

	inline char const* ToString(Type State)
	{
		switch (State)
		{
			case Listening:
				return "LISTENING";
			case Established:
				return "ESTABLISHED";
			default:
				return "UNKNOWN";
		}
	}
} // namespace EConnectionState

struct NSocketRecord
{
	EProtocol::Type          Protocol{ EProtocol::TCP };
	NEndpoint                LocalEndpoint{};
	std::optional<NEndpoint> ForeignEndpoint{};
	EConnectionState::Type   State{ EConnectionState::Listening };
	bool                     bV6Only{ true };
	NProcessId               Pid{};
	std::string              ProcessName{};

	[[nodiscard]] EIPFamily::Type GetFamily() const { return LocalEndpoint.Address.Family; }

	[[nodiscard]] bool IsListening() const { return State == EConnectionState::Listening; }

	[[nodiscard]] bool IsEstablished() const { return State == EConnectionState::Established; }

	// LISTENING never has a foreign endpoint, ESTABLISHED always has one
	[[nodiscard]] bool IsConsistent() const
	{
		if (Protocol == EProtocol::Unknown || !LocalEndpoint.Address.IsValid())
		{
			return false;
		}
		return IsListening() ? !ForeignEndpoint.has_value() : ForeignEndpoint.has_value();
	}

	[[nodiscard]] std::string GetProcessLabel() const { return ProcessName.empty() ? "unknown" : ProcessName; }

	[[nodiscard]] std::string ToString() const
	{
		std::string Str = std::string(EProtocol::ToString(Protocol)) + " " + LocalEndpoint.ToString();
		if (ForeignEndpoint)
		{
			Str += " -> " + ForeignEndpoint->ToString();
		}
		Str += " " + std::string(EConnectionState::ToString(State));
		Str += " (" + GetProcessLabel() + "/" + std::to_string(Pid) + ")";
		return Str;
	}

	// Identity without the process name, used to pair up a record with its enriched version
	[[nodiscard]] auto GetEndpointKey() const
	{
		return std::tie(Protocol, LocalEndpoint, ForeignEndpoint, State, bV6Only, Pid);
	}

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Protocol, LocalEndpoint, ForeignEndpoint, State, bV6Only, Pid, ProcessName);
	}
};

inline bool operator==(NSocketRecord const& Lhs, NSocketRecord const& Rhs)
{
	return Lhs.GetEndpointKey() == Rhs.GetEndpointKey() && Lhs.ProcessName == Rhs.ProcessName;
}

inline bool operator!=(NSocketRecord const& Lhs, NSocketRecord const& Rhs)
{
	return !(Lhs == Rhs);
}

inline bool operator<(NSocketRecord const& Lhs, NSocketRecord const& Rhs)
{
	if (Lhs.GetEndpointKey() != Rhs.GetEndpointKey())
	{
		return Lhs.GetEndpointKey() < Rhs.GetEndpointKey();
	}
	return Lhs.ProcessName < Rhs.ProcessName;
}
