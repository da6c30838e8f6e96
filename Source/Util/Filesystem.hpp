/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include "ErrnoUtil.hpp"
#include "Types.hpp"

#include <filesystem>
#include <fstream>
#include <algorithm>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

class NFilesystem
{
	static void AppendUtf8(std::string& Out, uint32_t CodePoint)
	{
		if (CodePoint < 0x80)
		{
			Out.push_back(static_cast<char>(CodePoint));
		}
		else if (CodePoint < 0x800)
		{
			Out.push_back(static_cast<char>(0xC0 | (CodePoint >> 6)));
			Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
		}
		else if (CodePoint < 0x10000)
		{
			Out.push_back(static_cast<char>(0xE0 | (CodePoint >> 12)));
			Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 6) & 0x3F)));
			Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
		}
		else
		{
			Out.push_back(static_cast<char>(0xF0 | (CodePoint >> 18)));
			Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 12) & 0x3F)));
			Out.push_back(static_cast<char>(0x80 | ((CodePoint >> 6) & 0x3F)));
			Out.push_back(static_cast<char>(0x80 | (CodePoint & 0x3F)));
		}
	}

public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	static bool IsDirectory(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::is_directory(p, Ec);
	}

	// Windows tools redirected from PowerShell write UTF-16LE with a BOM
	static std::string Utf16LeToUtf8(std::string_view Bytes)
	{
		std::string Out{};
		Out.reserve(Bytes.size() / 2);
		for (size_t i = 0; i + 1 < Bytes.size(); i += 2)
		{
			uint32_t Unit = static_cast<uint8_t>(Bytes[i]) | (static_cast<uint8_t>(Bytes[i + 1]) << 8);
			if (Unit >= 0xD800 && Unit <= 0xDBFF && i + 3 < Bytes.size())
			{
				uint32_t const Low = static_cast<uint8_t>(Bytes[i + 2]) | (static_cast<uint8_t>(Bytes[i + 3]) << 8);
				if (Low >= 0xDC00 && Low <= 0xDFFF)
				{
					Unit = 0x10000 + ((Unit - 0xD800) << 10) + (Low - 0xDC00);
					i += 2;
				}
			}
			else if (Unit >= 0xD800 && Unit <= 0xDFFF)
			{
				// lone surrogate
				Unit = 0xFFFD;
			}
			AppendUtf8(Out, Unit);
		}
		return Out;
	}

	// Decodes raw file contents to UTF-8 based on the BOM, without a BOM the bytes are taken as UTF-8
	static std::string DecodeText(std::string Raw)
	{
		if (Raw.size() >= 2 && static_cast<uint8_t>(Raw[0]) == 0xFF && static_cast<uint8_t>(Raw[1]) == 0xFE)
		{
			return Utf16LeToUtf8(std::string_view(Raw).substr(2));
		}
		if (Raw.size() >= 3 && static_cast<uint8_t>(Raw[0]) == 0xEF && static_cast<uint8_t>(Raw[1]) == 0xBB
			&& static_cast<uint8_t>(Raw[2]) == 0xBF)
		{
			return Raw.substr(3);
		}
		return Raw;
	}

	static std::optional<std::string> ReadTextFile(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
		{
			spdlog::debug("Failed to open {}: {}", Path.string(), NErrnoUtil::StrError());
			return std::nullopt;
		}

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		if (FileStream.bad())
		{
			return std::nullopt;
		}
		return DecodeText(ss.str());
	}

	static bool WriteTextFile(stdfs::path const& Path, std::string const& Content)
	{
		std::ofstream FileStream(Path, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!FileStream)
		{
			spdlog::error("Failed to open {} for writing: {}", Path.string(), NErrnoUtil::StrError());
			return false;
		}
		FileStream.write(Content.data(), static_cast<std::streamsize>(Content.size()));
		if (!FileStream)
		{
			spdlog::error("Failed to write {}: {}", Path.string(), NErrnoUtil::StrError());
			return false;
		}
		return true;
	}

	// Regular files directly inside Dir, sorted by name so loading is deterministic
	static std::optional<std::vector<stdfs::path>> ListFiles(stdfs::path const& Dir)
	{
		std::vector<stdfs::path> Files{};
		try
		{
			for (auto const& Entry : stdfs::directory_iterator(Dir))
			{
				if (Entry.is_regular_file())
				{
					Files.push_back(Entry.path());
				}
			}
		}
		catch (stdfs::filesystem_error const& e)
		{
			spdlog::error("Can't list {}: {}", Dir.string(), e.what());
			return std::nullopt;
		}
		std::ranges::sort(Files);
		return Files;
	}

	static bool CreateDirectories(stdfs::path const& Dir)
	{
		std::error_code Ec;
		stdfs::create_directories(Dir, Ec);
		if (Ec)
		{
			spdlog::error("Can't create {}: {}", Dir.string(), Ec.message());
			return false;
		}
		return true;
	}
};
