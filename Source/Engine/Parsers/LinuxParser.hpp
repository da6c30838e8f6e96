/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

#include "Parsers/ParseResult.hpp"

// Parsers for the output of `ss -tuanp`, `netstat -tunap` and `ip addr`.
// The captures are expected in the C locale, column headers are matched case-insensitively.
class NLinuxParser
{
public:
	static NParseResult ParseSs(std::string_view Text, NHostName const& Host, std::string const& File = {});

	static NParseResult ParseNetstat(std::string_view Text, NHostName const& Host, std::string const& File = {});

	static NParseResult ParseIpAddr(std::string_view Text, NHostName const& Host, std::string const& File = {});

	// `users:(("name",pid=N,fd=M),...)`, only the first user is taken
	static bool ParseSsProcess(std::string_view Field, NProcessId& OutPid, std::string& OutName);

	// `pid/program`, "-" if unknown
	static bool ParseNetstatProcess(std::string_view Field, NProcessId& OutPid, std::string& OutName);
};
