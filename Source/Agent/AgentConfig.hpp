/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "Types.hpp"
#include "Data/Protocol.hpp"

struct NAgentConfig final : TSingleton<NAgentConfig>
{
	std::string ServerAddress{ "127.0.0.1" };
	NPort       ServerPort{ NETZKARTE_DEFAULT_PORT };
	std::string PrettyName{};
	bool        bPreferNetstat{};

	NAgentConfig();

	// Values from Path override what is already set, false if the file can't be parsed
	bool Load(std::string const& Path);

	void LogConfig() const;
};
