/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "Types.hpp"

namespace EDiagnosticKind
{
	enum Type : uint8_t
	{
		ParseError = 0,
		AmbiguousOwnership,
		MergeConflict,
		AgentTimeout,
		AgentDisconnected,
		ProtocolDecodeError,
		DanglingClient,
		MissingInput
	};

	inline char const* ToString(Type Kind)
	{
		switch (Kind)
		{
			case ParseError:
				return "parse-error";
			case AmbiguousOwnership:
				return "ambiguous-ownership";
			case MergeConflict:
				return "merge-conflict";
			case AgentTimeout:
				return "agent-timeout";
			case AgentDisconnected:
				return "agent-disconnected";
			case ProtocolDecodeError:
				return "protocol-decode-error";
			case DanglingClient:
				return "dangling-client";
			case MissingInput:
				return "missing-input";
			default:
				return "unknown";
		}
	}

	inline spdlog::level::level_enum GetLevel(Type Kind)
	{
		switch (Kind)
		{
			case ProtocolDecodeError:
				return spdlog::level::err;
			case ParseError:
			case AmbiguousOwnership:
			case MergeConflict:
			case AgentTimeout:
			case MissingInput:
				return spdlog::level::warn;
			case AgentDisconnected:
				return spdlog::level::info;
			case DanglingClient:
			default:
				return spdlog::level::debug;
		}
	}
} // namespace EDiagnosticKind

// Non fatal problem found while parsing, merging, correlating or talking to an agent
struct NDiagnostic
{
	EDiagnosticKind::Type Kind{};
	NHostName             Host{};
	std::string           File{};
	size_t                Line{}; // 1-based, 0 if not tied to a line
	std::string           Message{};

	[[nodiscard]] std::string ToString() const
	{
		std::string Location = Host;
		if (!File.empty())
		{
			Location += (Location.empty() ? "" : " ") + File;
			if (Line > 0)
			{
				Location += ":" + std::to_string(Line);
			}
		}
		return fmt::format("[{}] {}{}{}", EDiagnosticKind::ToString(Kind), Location, Location.empty() ? "" : ": ", Message);
	}

	void Log() const { spdlog::log(EDiagnosticKind::GetLevel(Kind), "{}", ToString()); }
};

using NDiagnostics = std::vector<NDiagnostic>;

inline void LogDiagnostics(NDiagnostics const& Diagnostics)
{
	for (auto const& Diagnostic : Diagnostics)
	{
		Diagnostic.Log();
	}
}
