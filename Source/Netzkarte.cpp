/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>
#include <sigslot/signal.hpp>
#include <spdlog/spdlog.h>

#include "CollectionServer.hpp"
#include "CorrelationEngine.hpp"
#include "DirectoryLoader.hpp"
#include "GraphExport.hpp"
#include "InventoryStore.hpp"
#include "ServerConfig.hpp"
#include "SignalHandler.hpp"
#include "StringUtil.hpp"
#include "Parsers/CsvInventory.hpp"

namespace
{
	struct NArguments
	{
		int                      Verbosity{};
		bool                     bNoLoopback{};
		std::string              ConfigPath{};
		std::string              Command{};
		std::vector<std::string> Positional{};
	};

	void PrintUsage()
	{
		fmt::print("usage: netzkarte [-v|-vv] csv <output.csv> <input-dir> [--no-loopback]\n"
				   "       netzkarte [-v|-vv] json <output.json> <input-dir> [--no-loopback]\n"
				   "       netzkarte [-v|-vv] inventory <output-dir> <input-dir>\n"
				   "       netzkarte [-v|-vv] serve [--config FILE] [input-dir]\n");
	}

	std::optional<NArguments> ParseArguments(int argc, char** argv)
	{
		NArguments Args{};
		for (int i = 1; i < argc; ++i)
		{
			std::string_view const Arg = argv[i];
			if (Arg == "-v")
			{
				Args.Verbosity = std::max(Args.Verbosity, 1);
			}
			else if (Arg == "-vv")
			{
				Args.Verbosity = 2;
			}
			else if (Arg == "--no-loopback")
			{
				Args.bNoLoopback = true;
			}
			else if (Arg == "--config")
			{
				if (i + 1 >= argc)
				{
					spdlog::critical("--config needs a file");
					return std::nullopt;
				}
				Args.ConfigPath = argv[++i];
			}
			else if (NStringUtil::StartsWith(Arg, "-"))
			{
				spdlog::critical("Unknown option '{}'", Arg);
				return std::nullopt;
			}
			else if (Args.Command.empty())
			{
				Args.Command = Arg;
			}
			else
			{
				Args.Positional.emplace_back(Arg);
			}
		}
		return Args;
	}

	void ApplyVerbosity(int Verbosity)
	{
		if (Verbosity >= 2)
		{
			spdlog::set_level(spdlog::level::trace);
		}
		else if (Verbosity == 1)
		{
			spdlog::set_level(spdlog::level::debug);
		}
	}

	// Loads a whole input directory, false if it isn't readable
	bool LoadInput(std::string const& Dir, NInventoryStore& Store, NDiagnostics& Diagnostics)
	{
		if (!NDirectoryLoader::Load(Dir, Store, Diagnostics))
		{
			spdlog::critical("Can't read input directory '{}'", Dir);
			return false;
		}
		return true;
	}

	int RunExport(NArguments const& Args, bool bJson)
	{
		if (Args.Positional.size() != 2)
		{
			PrintUsage();
			return 1;
		}

		NInventoryStore Store;
		NDiagnostics    LoadDiagnostics;
		if (!LoadInput(Args.Positional[1], Store, LoadDiagnostics))
		{
			return 1;
		}

		NCorrelationOptions Options = NServerConfig::GetInstance().Graph;
		if (Args.bNoLoopback)
		{
			Options.bIncludeLoopback = false;
		}

		NCorrelationEngine Engine;
		auto const         View = Store.Snapshot();
		auto               Graph = Engine.Correlate(*View, Options);
		Graph.Diagnostics.insert(Graph.Diagnostics.begin(), LoadDiagnostics.begin(), LoadDiagnostics.end());

		bool const bWritten = bJson ? NGraphExport::WriteJson(Graph, Args.Positional[0], View.get())
									: NGraphExport::WriteConnectionsCsv(Graph, Args.Positional[0]);
		return bWritten ? 0 : 1;
	}

	int RunInventory(NArguments const& Args)
	{
		if (Args.Positional.size() != 2)
		{
			PrintUsage();
			return 1;
		}

		NInventoryStore Store;
		NDiagnostics    Diagnostics;
		if (!LoadInput(Args.Positional[1], Store, Diagnostics))
		{
			return 1;
		}

		int  Failed = 0;
		auto View = Store.Snapshot();
		for (auto const& [Name, Inventory] : *View)
		{
			if (!NCsvInventory::Write(Inventory, Args.Positional[0]))
			{
				++Failed;
			}
		}
		spdlog::info("Wrote {} of {} inventories to {}", View->size() - Failed, View->size(), Args.Positional[0]);
		return Failed == 0 ? 0 : 1;
	}

	class NServeSession
	{
		NInventoryStore&    Store;
		NCollectionServer&  Server;
		NCorrelationOptions Options;
		NCorrelationEngine  Engine{};
		NDiagnostics        Diagnostics{};
		bool                bQuit{};

		// Notices from the socket threads, printed as they happen
		sigslot::scoped_connection AgentAdded{};
		sigslot::scoped_connection AgentRemoved{};
		sigslot::scoped_connection HostChanged{};

		void Export(std::string const& Path)
		{
			auto const View = Store.Snapshot();
			auto       Graph = Engine.Correlate(*View, Options);

			auto Collected = Server.TakeDiagnostics();
			Diagnostics.insert(Diagnostics.end(), Collected.begin(), Collected.end());
			Graph.Diagnostics.insert(Graph.Diagnostics.begin(), Diagnostics.begin(), Diagnostics.end());

			bool const bWritten = NStringUtil::ToLower(Path).ends_with(".csv")
				? NGraphExport::WriteConnectionsCsv(Graph, Path)
				: NGraphExport::WriteJson(Graph, Path, View.get());
			if (bWritten)
			{
				fmt::print("exported {} connections of {} hosts to {}\n", Graph.Edges.size(), View->size(), Path);
			}
		}

		void ListAgents() const
		{
			auto Agents = Server.ListActiveAgents();
			if (Agents.empty())
			{
				fmt::print("no agents connected\n");
				return;
			}
			for (auto const& Agent : Agents)
			{
				fmt::print("{:<24} {:<24} {:<18} {}\n", Agent.HostName, Agent.PrettyName, Agent.PeerAddress,
					EAgentState::ToString(Agent.State));
			}
		}

	public:
		NServeSession(NInventoryStore& Store_, NCollectionServer& Server_, NCorrelationOptions Options_)
			: Store(Store_), Server(Server_), Options(std::move(Options_))
		{
			auto& Registry = Server.GetRegistry();
			AgentAdded = Registry.OnAgentAdded.connect(
				[](NHostName const& Host) { fmt::print("agent {} connected\n", Host); });
			AgentRemoved = Registry.OnAgentRemoved.connect(
				[](NHostName const& Host) { fmt::print("agent {} left\n", Host); });
			HostChanged = Store.OnHostChanged.connect(
				[](NHostName const& Host) { fmt::print("inventory of {} updated\n", Host); });
		}

		void HandleLine(std::string_view Line)
		{
			auto Words = NStringUtil::SplitWhitespace(Line);
			if (Words.empty())
			{
				return;
			}

			auto const& Command = Words[0];
			std::string Argument = Words.size() > 1 ? std::string(Words[1]) : std::string{};
			if (Command == "quit" || Command == "exit")
			{
				bQuit = true;
			}
			else if (Command == "agents")
			{
				ListAgents();
			}
			else if (Argument.empty())
			{
				fmt::print("commands: agents, capture <host>, record <host>, stop <host>, export <file>, quit\n");
			}
			else if (Command == "capture")
			{
				fmt::print("{}\n", Server.TriggerCapture(Argument) ? "captured" : "capture failed");
			}
			else if (Command == "record")
			{
				fmt::print("{}\n", Server.StartRecording(Argument) ? "recording" : "can't start recording");
			}
			else if (Command == "stop")
			{
				if (auto Recorded = Server.StopRecording(Argument))
				{
					fmt::print("recorded {} sockets on {}\n", Recorded->Sockets.size(), Argument);
				}
				else
				{
					fmt::print("no recording for {}\n", Argument);
				}
			}
			else if (Command == "export")
			{
				Export(Argument);
			}
			else
			{
				fmt::print("unknown command '{}'\n", Command);
			}
		}

		[[nodiscard]] bool ShouldQuit() const { return bQuit; }
	};

	int RunServe(NArguments const& Args)
	{
		auto& Config = NServerConfig::GetInstance();
		if (!Args.ConfigPath.empty() && !Config.Load(Args.ConfigPath))
		{
			spdlog::critical("Can't load config '{}'", Args.ConfigPath);
			return 1;
		}
		if (Args.Verbosity == 0)
		{
			spdlog::set_level(spdlog::level::from_str(Config.LogLevel));
		}
		if (Args.bNoLoopback)
		{
			Config.Graph.bIncludeLoopback = false;
		}
		Config.LogConfig();

		NInventoryStore Store;
		if (!Args.Positional.empty())
		{
			NDiagnostics Ignored;
			if (!LoadInput(Args.Positional[0], Store, Ignored))
			{
				return 1;
			}
		}

		auto& Signals = NSignalHandler::GetInstance();

		NCollectionServer Server(Config.Server, Store);
		if (!Server.Start())
		{
			spdlog::critical("Failed to start the collection server");
			return 1;
		}

		NServeSession Session(Store, Server, Config.Graph);
		std::string   Pending;
		bool          bStdinOpen = true;
		while (!Signals.bStop && !Session.ShouldQuit())
		{
			Server.Tick();

			pollfd Fd{ .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
			if (!bStdinOpen || poll(&Fd, 1, 200) <= 0)
			{
				if (!bStdinOpen)
				{
					usleep(200 * 1000);
				}
				continue;
			}

			char Chunk[512];
			auto Read = read(STDIN_FILENO, Chunk, sizeof(Chunk));
			if (Read <= 0)
			{
				// stdin went away, keep serving until signalled
				bStdinOpen = false;
				continue;
			}
			Pending.append(Chunk, static_cast<size_t>(Read));

			size_t NewLine;
			while ((NewLine = Pending.find('\n')) != std::string::npos)
			{
				Session.HandleLine(NStringUtil::Trim(std::string_view(Pending).substr(0, NewLine)));
				Pending.erase(0, NewLine + 1);
			}
		}

		Server.Stop();
		return 0;
	}
} // namespace

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto Args = ParseArguments(argc, argv);
	if (!Args || Args->Command.empty() || Args->Command == "help")
	{
		PrintUsage();
		return Args && Args->Command == "help" ? 0 : 1;
	}
	ApplyVerbosity(Args->Verbosity);

	if (Args->Command == "csv")
	{
		return RunExport(*Args, false);
	}
	if (Args->Command == "json")
	{
		return RunExport(*Args, true);
	}
	if (Args->Command == "inventory")
	{
		return RunInventory(*Args);
	}
	if (Args->Command == "serve")
	{
		spdlog::info("Netzkarte server starting");
		auto const Result = RunServe(*Args);
		spdlog::info("Netzkarte server stopped");
		return Result;
	}

	spdlog::critical("Unknown command '{}'", Args->Command);
	PrintUsage();
	return 1;
}
