/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "ConnectionGraph.hpp"
#include "InventoryStore.hpp"

struct NCorrelationOptions
{
	// Keep edges whose client and server live on the same host
	bool bIncludeLoopback{ true };

	// Edges with a client or server process starting with one of these are dropped
	std::vector<std::string> ExcludedProcessPrefixes{};

	[[nodiscard]] bool IsExcluded(std::string const& ProcessName) const;
};

// Pairs established sockets with the server sockets they talk to, across all hosts of a view.
// The result only depends on the content of the view, not on its iteration order.
class NCorrelationEngine
{
	std::mutex Mutex{};

public:
	NConnectionGraph Correlate(NInventoryView const& View, NCorrelationOptions const& Options = {});
};
