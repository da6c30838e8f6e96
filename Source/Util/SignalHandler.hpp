/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <atomic>

#include "Singleton.hpp"

// SIGINT/SIGTERM only set the flag, the main loops poll it
class NSignalHandler : public TSingleton<NSignalHandler>
{
public:
	NSignalHandler();

	std::atomic<bool> bStop{ false };
};
