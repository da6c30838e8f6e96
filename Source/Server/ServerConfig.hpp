/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "CollectionServer.hpp"
#include "CorrelationEngine.hpp"

struct NServerConfig final : TSingleton<NServerConfig>
{
	NServerSettings     Server{};
	NCorrelationOptions Graph{};
	std::string         LogLevel{ "info" };

	NServerConfig();

	// Values from Path override what is already set, false if the file can't be parsed
	bool Load(std::string const& Path);

	void LogConfig() const;
};
