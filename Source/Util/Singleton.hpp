/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

// Only used for process wide state (config, signal flag), everything else is passed by reference
template <typename T>
class TSingleton
{
public:
	static T& GetInstance()
	{
		static T Instance{};
		return Instance;
	}

	TSingleton(TSingleton const&) = delete;
	TSingleton& operator=(TSingleton const&) = delete;

protected:
	TSingleton() = default;
	virtual ~TSingleton() = default;
};
