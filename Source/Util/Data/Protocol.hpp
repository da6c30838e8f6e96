/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#define NETZKARTE_PROTOCOL_VERSION 1
#define NETZKARTE_DEFAULT_PORT 6840

#include <cstdint>
#include <string>
#include <vector>

#include "IPAddress.hpp"
#include "Types.hpp"
#include "Data/HostInventory.hpp"

// First message on every agent connection
struct NRegisterMessage
{
	uint8_t                 ProtocolVersion{ NETZKARTE_PROTOCOL_VERSION };
	NHostName               HostName{};
	std::string             PrettyName{};
	std::vector<NIPAddress> Addresses{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(ProtocolVersion, HostName, PrettyName, Addresses);
	}
};

namespace ECaptureMode
{
	enum Type : uint8_t
	{
		Single = 0,
		StartRecord,
		StopRecord
	};

	inline char const* ToString(Type Mode)
	{
		switch (Mode)
		{
			case Single:
				return "single";
			case StartRecord:
				return "start-record";
			case StopRecord:
				return "stop-record";
			default:
				return "unknown";
		}
	}
} // namespace ECaptureMode

struct NCaptureRequest
{
	ECaptureMode::Type Mode{ ECaptureMode::Single };
	uint32_t           IntervalSeconds{ 5 }; // only used for StartRecord

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Mode, IntervalSeconds);
	}
};

struct NCaptureSnapshot
{
	NHostInventory Inventory{};
	NMsec          Timestamp{};
	// Set on the single-shot reply and on the last snapshot of a recording
	bool bFinal{ true };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Inventory, Timestamp, bFinal);
	}
};

struct NExitMessage
{
	std::string Reason{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Reason);
	}
};
