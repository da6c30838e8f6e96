/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DirectoryLoader.hpp"

#include <map>
#include <vector>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Parsers/CsvInventory.hpp"
#include "Parsers/LinuxParser.hpp"
#include "Parsers/NmapParser.hpp"
#include "Parsers/WindowsParser.hpp"

namespace
{
	constexpr std::string_view CsvIpSuffix = "_ip.csv";
	constexpr std::string_view CsvNetworkSuffix = "_network.csv";
	constexpr std::string_view NmapMarker = ".nmap_";

	EInputFileType::Type TypeFromExtension(std::string_view Extension)
	{
		if (Extension == "ss" || Extension == "linux_ss")
		{
			return EInputFileType::LinuxSs;
		}
		if (Extension == "netstat" || Extension == "linux_netstat")
		{
			return EInputFileType::LinuxNetstat;
		}
		if (Extension == "linux_ip")
		{
			return EInputFileType::LinuxIp;
		}
		if (Extension == "windows_ip")
		{
			return EInputFileType::WindowsIp;
		}
		if (Extension == "windows_netstat")
		{
			return EInputFileType::WindowsNetstat;
		}
		if (Extension == "windows_tasklist")
		{
			return EInputFileType::WindowsTasklist;
		}
		return EInputFileType::Unknown;
	}

	NDiagnostic MissingInput(NHostName const& Host, std::string Message)
	{
		return { .Kind = EDiagnosticKind::MissingInput, .Host = Host, .Message = std::move(Message) };
	}

	std::optional<NParseResult> ParseFile(NInputFile const& File, std::string const& Text)
	{
		std::string const FileName = File.Path.filename().string();
		switch (File.Type)
		{
			case EInputFileType::LinuxIp:
				return NLinuxParser::ParseIpAddr(Text, File.Host, FileName);
			case EInputFileType::LinuxSs:
				return NLinuxParser::ParseSs(Text, File.Host, FileName);
			case EInputFileType::LinuxNetstat:
				return NLinuxParser::ParseNetstat(Text, File.Host, FileName);
			case EInputFileType::WindowsIp:
				return NWindowsParser::ParseIpConfig(Text, File.Host, FileName);
			case EInputFileType::WindowsNetstat:
				return NWindowsParser::ParseNetstat(Text, File.Host, FileName);
			case EInputFileType::WindowsTasklist:
				return NWindowsParser::ParseTasklist(Text, File.Host, FileName);
			case EInputFileType::Nmap:
				return NNmapParser::Parse(Text, File.Host, File.ScannedAddress, FileName);
			default:
				return std::nullopt;
		}
	}
} // namespace

NInputFile NDirectoryLoader::Classify(std::filesystem::path const& Path)
{
	NInputFile        File{ .Path = Path };
	std::string const Name = Path.filename().string();

	if (Name.size() > CsvIpSuffix.size() && Name.ends_with(CsvIpSuffix))
	{
		File.Type = EInputFileType::CsvIp;
		File.Host = Name.substr(0, Name.size() - CsvIpSuffix.size());
		return File;
	}
	if (Name.size() > CsvNetworkSuffix.size() && Name.ends_with(CsvNetworkSuffix))
	{
		File.Type = EInputFileType::CsvNetwork;
		File.Host = Name.substr(0, Name.size() - CsvNetworkSuffix.size());
		return File;
	}

	if (auto const Marker = Name.find(NmapMarker); Marker != std::string::npos && Marker > 0)
	{
		std::string Address = Name.substr(Marker + NmapMarker.size());
		if (Address.empty())
		{
			return File;
		}
		File.Type = EInputFileType::Nmap;
		File.Host = Name.substr(0, Marker);
		File.ScannedAddress = std::move(Address);
		return File;
	}

	auto const Dot = Name.rfind('.');
	if (Dot == std::string::npos || Dot == 0)
	{
		return File;
	}
	File.Type = TypeFromExtension(std::string_view(Name).substr(Dot + 1));
	if (File.Type != EInputFileType::Unknown)
	{
		File.Host = Name.substr(0, Dot);
	}
	return File;
}

bool NDirectoryLoader::Load(std::filesystem::path const& Dir, NInventoryStore& Store, NDiagnostics& Diagnostics)
{
	auto Paths = NFilesystem::ListFiles(Dir);
	if (!Paths)
	{
		spdlog::error("Can't read input directory {}", Dir.string());
		return false;
	}

	std::map<NHostName, std::vector<NInputFile>> Hosts{};
	for (auto const& Path : *Paths)
	{
		NInputFile File = Classify(Path);
		if (File.Type == EInputFileType::Unknown)
		{
			spdlog::debug("Skipping {}", Path.filename().string());
			continue;
		}
		spdlog::debug("{}: {} ({})", File.Host, Path.filename().string(), EInputFileType::ToString(File.Type));
		Hosts[File.Host].push_back(std::move(File));
	}

	auto Report = [&](NDiagnostics const& New) {
		LogDiagnostics(New);
		Diagnostics.insert(Diagnostics.end(), New.begin(), New.end());
	};

	for (auto const& [Host, Files] : Hosts)
	{
		NInputFile const* CsvIp{};
		NInputFile const* CsvNetwork{};
		bool              bHasInterfaces{};
		bool              bHasSockets{};
		bool              bHasWindowsNetstat{};
		bool              bHasTasklist{};

		for (auto const& File : Files)
		{
			switch (File.Type)
			{
				case EInputFileType::CsvIp:
					CsvIp = &File;
					continue;
				case EInputFileType::CsvNetwork:
					CsvNetwork = &File;
					continue;
				case EInputFileType::LinuxIp:
				case EInputFileType::WindowsIp:
				case EInputFileType::Nmap:
					bHasInterfaces = true;
					break;
				case EInputFileType::WindowsNetstat:
					bHasWindowsNetstat = true;
					bHasSockets = true;
					break;
				case EInputFileType::WindowsTasklist:
					bHasTasklist = true;
					break;
				default:
					bHasSockets = true;
					break;
			}

			auto Text = NFilesystem::ReadTextFile(File.Path);
			if (!Text)
			{
				Report({ { .Kind = EDiagnosticKind::ParseError,
					.Host = Host,
					.File = File.Path.filename().string(),
					.Message = "unreadable file" } });
				continue;
			}

			auto Result = ParseFile(File, *Text);
			if (!Result)
			{
				continue;
			}
			Report(Result->Diagnostics);
			if (Result->bOk)
			{
				NDiagnostics MergeDiagnostics{};
				Store.PutPartial(Host, Result->Inventory, &MergeDiagnostics);
				Report(MergeDiagnostics);
			}
		}

		if (CsvIp && CsvNetwork)
		{
			auto IpText = NFilesystem::ReadTextFile(CsvIp->Path);
			auto NetworkText = NFilesystem::ReadTextFile(CsvNetwork->Path);
			if (!IpText || !NetworkText)
			{
				Report({ MissingInput(Host, "unreadable CSV tables") });
			}
			else
			{
				auto Result = NCsvInventory::Parse(*IpText, *NetworkText, Host);
				Report(Result.Diagnostics);
				if (Result.bOk)
				{
					NDiagnostics MergeDiagnostics{};
					Store.PutPartial(Host, Result.Inventory, &MergeDiagnostics);
					Report(MergeDiagnostics);
				}
			}
			bHasInterfaces = true;
			bHasSockets = true;
		}
		else if (CsvIp || CsvNetwork)
		{
			Report({ MissingInput(Host,
				fmt::format("{} has no {} counterpart, ignored", (CsvIp ? CsvIp : CsvNetwork)->Path.filename().string(),
					CsvIp ? CsvNetworkSuffix : CsvIpSuffix)) });
		}

		if (bHasSockets && !bHasInterfaces)
		{
			Report({ MissingInput(Host, "no interface list, other hosts can't be matched to it") });
		}
		if (bHasWindowsNetstat && !bHasTasklist)
		{
			Report({ MissingInput(Host, "no windows_tasklist, process names stay unknown") });
		}
	}

	spdlog::info("Loaded {} hosts from {}", Store.GetHostCount(), Dir.string());
	return true;
}
