/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <string>

#include "InventoryStore.hpp"

namespace EInputFileType
{
	enum Type : uint8_t
	{
		Unknown = 0,
		LinuxIp,
		LinuxSs,
		LinuxNetstat,
		WindowsIp,
		WindowsNetstat,
		WindowsTasklist,
		Nmap,
		CsvIp,
		CsvNetwork
	};

	inline char const* ToString(Type FileType)
	{
		switch (FileType)
		{
			case LinuxIp:
				return "linux_ip";
			case LinuxSs:
				return "linux_ss";
			case LinuxNetstat:
				return "linux_netstat";
			case WindowsIp:
				return "windows_ip";
			case WindowsNetstat:
				return "windows_netstat";
			case WindowsTasklist:
				return "windows_tasklist";
			case Nmap:
				return "nmap";
			case CsvIp:
				return "csv_ip";
			case CsvNetwork:
				return "csv_network";
			default:
				return "unknown";
		}
	}
} // namespace EInputFileType

struct NInputFile
{
	std::filesystem::path Path{};
	EInputFileType::Type  Type{};
	NHostName             Host{};
	std::string           ScannedAddress{}; // nmap only
};

// Turns a directory of <host>.<type> files into host inventories
class NDirectoryLoader
{
public:
	// Type and host from the file name, Unknown if the name doesn't follow the convention
	[[nodiscard]] static NInputFile Classify(std::filesystem::path const& Path);

	// Parses every known file and merges it into the store. Only returns false if the
	// directory itself can't be read, anything else ends up in Diagnostics.
	static bool Load(std::filesystem::path const& Dir, NInventoryStore& Store, NDiagnostics& Diagnostics);
};
