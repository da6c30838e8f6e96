/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>

#include "Data/HostInventory.hpp"

// Source of local snapshots for the agent
class ICollector
{
public:
	ICollector() = default;
	virtual ~ICollector() = default;

	[[nodiscard]] virtual NHostName GetHostName() const = 0;

	// Interfaces and sockets as they are right now, nullopt if nothing could be read
	virtual std::optional<NHostInventory> Collect() = 0;
};
