/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "CorrelationEngine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <spdlog/spdlog.h>

#include "StringUtil.hpp"

namespace
{
	constexpr NPort WellKnownPortLimit = 1024;

	NIPAddress Unmap(NIPAddress const& Address)
	{
		return Address.IsV4Mapped() ? Address.FromV4Mapped() : Address;
	}

	NEndpoint Unmap(NEndpoint const& Endpoint)
	{
		return { .Address = Unmap(Endpoint.Address), .Port = Endpoint.Port };
	}

	// Endpoints of a connected socket as seen on the wire. A dual stack socket whose peer is
	// an IPv4 address (plain or mapped) carries an IPv4 connection, that includes a socket
	// connected from the v6 wildcard (`*:53` talking to 10.0.0.5:5353).
	struct NWireView
	{
		EIPFamily::Type Family{};
		NEndpoint       Local{};
		NEndpoint       Foreign{};
	};

	NWireView MakeWireView(NSocketRecord const& Record)
	{
		NWireView View{ .Family = Record.GetFamily(), .Local = Record.LocalEndpoint, .Foreign = *Record.ForeignEndpoint };
		if (View.Family != EIPFamily::IPv6)
		{
			return View;
		}

		NEndpoint const Foreign = Unmap(View.Foreign);
		if (Foreign.Address.Family != EIPFamily::IPv4)
		{
			return View;
		}
		if (View.Local.Address.IsUnspecified())
		{
			View = { .Family = EIPFamily::IPv4,
				.Local = { .Address = NIPAddress::AnyV4(), .Port = View.Local.Port },
				.Foreign = Foreign };
		}
		else if (View.Local.Address.IsV4Mapped())
		{
			View = { .Family = EIPFamily::IPv4, .Local = Unmap(View.Local), .Foreign = Foreign };
		}
		return View;
	}

	// Address specific before wildcard, then lowest pid, then name
	bool IsBetterCandidate(NSocketRecord const* Lhs, NSocketRecord const* Rhs)
	{
		bool const bLhsWildcard = Lhs->LocalEndpoint.Address.IsUnspecified();
		bool const bRhsWildcard = Rhs->LocalEndpoint.Address.IsUnspecified();
		auto const LhsKey = std::tie(bLhsWildcard, Lhs->Pid, Lhs->ProcessName);
		auto const RhsKey = std::tie(bRhsWildcard, Rhs->Pid, Rhs->ProcessName);
		if (LhsKey != RhsKey)
		{
			return LhsKey < RhsKey;
		}
		return *Lhs < *Rhs;
	}

	struct NBoundUdp
	{
		NSocketRecord const* Record{};
		NWireView            View{};
	};

	using NIndexKey = std::tuple<NHostName, EIPFamily::Type, NPort>;
	using NConnectionKey = std::tuple<NHostName, NEndpoint, NEndpoint>;

	struct NMatch
	{
		NSocketRecord const* Server{};
		EMatchRule::Type     Rule{};
	};

	enum class EUdpResult
	{
		NoPeer,
		Matched,
		PeerIsClient // the pair exists but is emitted from the other side
	};

	class NCorrelationRun
	{
		NInventoryView const&      View;
		NCorrelationOptions const& Options;
		NConnectionGraph           Graph{};

		std::map<NIPAddress, std::set<NHostName>>               Owners{};
		std::map<NIndexKey, std::vector<NSocketRecord const*>> TcpListeners{};
		std::map<NIndexKey, std::vector<NBoundUdp>>            UdpBound{};
		std::set<std::pair<NHostName, NPort>>                  UdpListenPorts{};

		// Established TCP records keyed by their unmapped (local, foreign) endpoints
		std::map<NConnectionKey, std::vector<NSocketRecord const*>> TcpConnections{};

		void BuildOwnership()
		{
			for (auto const& [Host, Inventory] : View)
			{
				for (auto const& Address : Inventory.Interfaces)
				{
					if (!Address.IsValid() || Address.IsLoopback() || Address.IsUnspecified())
					{
						continue;
					}
					Owners[Address].insert(Host);
					if (Address.Family == EIPFamily::IPv4)
					{
						Owners[Address.ToV4Mapped()].insert(Host);
					}
					else if (Address.IsV4Mapped())
					{
						Owners[Address.FromV4Mapped()].insert(Host);
					}
				}
			}

			for (auto const& [Address, Claimants] : Owners)
			{
				// The mapped twin is reported through its IPv4 form
				if (Claimants.size() < 2 || Address.IsV4Mapped())
				{
					continue;
				}
				std::string HostList{};
				for (auto const& Host : Claimants)
				{
					HostList += (HostList.empty() ? "" : ", ") + Host;
				}
				Graph.Diagnostics.push_back({ .Kind = EDiagnosticKind::AmbiguousOwnership,
					.Message = fmt::format("{} is claimed by {}, not used across hosts", Address.ToString(), HostList) });
			}
		}

		void BuildIndex()
		{
			for (auto const& [Host, Inventory] : View)
			{
				for (auto const& Record : Inventory.Sockets)
				{
					if (Record.Protocol == EProtocol::TCP)
					{
						if (Record.IsListening())
						{
							TcpListeners[{ Host, Record.GetFamily(), Record.LocalEndpoint.Port }].push_back(&Record);
						}
						else if (Record.ForeignEndpoint)
						{
							TcpConnections[{ Host, Unmap(Record.LocalEndpoint), Unmap(*Record.ForeignEndpoint) }].push_back(
								&Record);
						}
					}
					else if (Record.Protocol == EProtocol::UDP)
					{
						if (Record.IsListening())
						{
							UdpListenPorts.emplace(Host, Record.LocalEndpoint.Port);
						}
						else if (Record.ForeignEndpoint)
						{
							NWireView const Wire = MakeWireView(Record);
							UdpBound[{ Host, Wire.Family, Wire.Local.Port }].push_back({ .Record = &Record, .View = Wire });
						}
					}
				}
			}
		}

		// Host that owns the foreign address of a socket on Host
		std::optional<NHostName> ResolveTarget(NHostName const& Host, NIPAddress const& Foreign, std::string& Reason) const
		{
			if (Foreign.IsUnspecified())
			{
				Reason = "wildcard foreign address";
				return std::nullopt;
			}
			if (Foreign.IsLoopback())
			{
				return Host;
			}

			auto It = Owners.find(Foreign);
			if (It == Owners.end())
			{
				Reason = fmt::format("no known host owns {}", Foreign.ToString());
				return std::nullopt;
			}
			auto const& Claimants = It->second;
			if (Claimants.contains(Host))
			{
				return Host;
			}
			if (Claimants.size() > 1)
			{
				Reason = fmt::format("{} has ambiguous ownership", Foreign.ToString());
				return std::nullopt;
			}
			return *Claimants.begin();
		}

		template <class TPredicate>
		static NSocketRecord const* PickBest(std::vector<NSocketRecord const*> const* Candidates, TPredicate&& Predicate)
		{
			NSocketRecord const* Best{};
			if (!Candidates)
			{
				return Best;
			}
			for (auto const* Candidate : *Candidates)
			{
				if (Predicate(*Candidate) && (!Best || IsBetterCandidate(Candidate, Best)))
				{
					Best = Candidate;
				}
			}
			return Best;
		}

		template <class TValue>
		static std::vector<TValue> const* Find(std::map<NIndexKey, std::vector<TValue>> const& Index, NIndexKey const& Key)
		{
			auto It = Index.find(Key);
			return It == Index.end() ? nullptr : &It->second;
		}

		// Server half of an accepted TCP connection, it shows up on the server host as well
		bool IsAcceptedSocket(NHostName const& Host, NSocketRecord const& Record) const
		{
			NIPAddress const Local = Unmap(Record.LocalEndpoint.Address);
			for (auto Family : { EIPFamily::IPv4, EIPFamily::IPv6 })
			{
				auto const* Listeners = Find(TcpListeners, { Host, Family, Record.LocalEndpoint.Port });
				if (!Listeners)
				{
					continue;
				}
				for (auto const* Listener : *Listeners)
				{
					auto const& Address = Listener->LocalEndpoint.Address;
					if (Address.IsUnspecified() || Unmap(Address) == Local)
					{
						return true;
					}
				}
			}
			return false;
		}

		std::optional<NMatch> MatchTcp(NHostName const& Target, NWireView const& Client) const
		{
			NIPAddress const& Foreign = Client.Foreign.Address;

			auto const* Direct = Find(TcpListeners, { Target, Client.Family, Client.Foreign.Port });
			auto const* Best = PickBest(Direct, [&](NSocketRecord const& Candidate) {
				auto const& Address = Candidate.LocalEndpoint.Address;
				if (Address.IsUnspecified())
				{
					// A v6-only wildcard never sees a v4-mapped peer
					return !(Foreign.IsV4Mapped() && Candidate.bV6Only);
				}
				return Address == Foreign;
			});
			if (Best)
			{
				return NMatch{ .Server = Best, .Rule = EMatchRule::Direct };
			}

			if (Client.Family != EIPFamily::IPv4)
			{
				return std::nullopt;
			}
			NIPAddress const Mapped = Foreign.ToV4Mapped();
			auto const*      DualStack = Find(TcpListeners, { Target, EIPFamily::IPv6, Client.Foreign.Port });
			Best = PickBest(DualStack, [&](NSocketRecord const& Candidate) {
				auto const& Address = Candidate.LocalEndpoint.Address;
				return !Candidate.bV6Only && (Address.IsUnspecified() || Address == Mapped);
			});
			if (Best)
			{
				return NMatch{ .Server = Best, .Rule = EMatchRule::V4Mapped };
			}
			return std::nullopt;
		}

		[[nodiscard]] bool IsUdpServerPort(NHostName const& Host, NPort Port) const
		{
			return Port < WellKnownPortLimit || UdpListenPorts.contains({ Host, Port });
		}

		// True if Peer is the server side of the pair (Client on Host, Peer on Target)
		[[nodiscard]] bool IsPeerServer(NHostName const& Host, NSocketRecord const& Client, NHostName const& Target,
			NSocketRecord const& Peer) const
		{
			bool const bClientServerPort = IsUdpServerPort(Host, Client.LocalEndpoint.Port);
			bool const bPeerServerPort = IsUdpServerPort(Target, Peer.LocalEndpoint.Port);
			if (bClientServerPort != bPeerServerPort)
			{
				return bPeerServerPort;
			}
			if (Client.LocalEndpoint.Port != Peer.LocalEndpoint.Port)
			{
				return Peer.LocalEndpoint.Port < Client.LocalEndpoint.Port;
			}
			if (Host != Target)
			{
				return Target < Host;
			}
			return Peer.LocalEndpoint < Client.LocalEndpoint;
		}

		EUdpResult MatchUdp(NHostName const& Host, NSocketRecord const& Record, NWireView const& Client,
			NHostName const& Target, NMatch& OutMatch) const
		{
			// Both sides are compared in their wire view, so a dual stack socket with an IPv4 peer
			// is indexed with the IPv4 sockets
			NSocketRecord const* Best{};
			if (auto const* Peers = Find(UdpBound, { Target, Client.Family, Client.Foreign.Port }))
			{
				for (auto const& Peer : *Peers)
				{
					if (Peer.Record == &Record)
					{
						continue;
					}
					auto const& PeerAddress = Peer.View.Local.Address;
					if (!PeerAddress.IsUnspecified() && PeerAddress != Client.Foreign.Address)
					{
						continue;
					}
					// A socket connected from a wildcard address is only known by its port
					if (Peer.View.Foreign.Port != Client.Local.Port
						|| (!Client.Local.Address.IsUnspecified() && Peer.View.Foreign.Address != Client.Local.Address))
					{
						continue;
					}
					if (!Best || IsBetterCandidate(Peer.Record, Best))
					{
						Best = Peer.Record;
					}
				}
			}
			if (!Best)
			{
				return EUdpResult::NoPeer;
			}

			NMatch const Match{ .Server = Best,
				.Rule = Best->GetFamily() == Record.GetFamily() ? EMatchRule::UdpMutual : EMatchRule::UdpMutualV4Mapped };
			if (!IsPeerServer(Host, Record, Target, *Match.Server))
			{
				return EUdpResult::PeerIsClient;
			}
			OutMatch = Match;
			return EUdpResult::Matched;
		}

		std::optional<NProcessRef> FindHandover(NHostName const& Target, NWireView const& Client,
			NSocketRecord const& Listener) const
		{
			auto It = TcpConnections.find({ Target, Unmap(Client.Foreign), Unmap(Client.Local) });
			if (It == TcpConnections.end())
			{
				return std::nullopt;
			}
			auto const* Accepted = *std::min_element(It->second.begin(), It->second.end(),
				[](NSocketRecord const* Lhs, NSocketRecord const* Rhs) { return IsBetterCandidate(Lhs, Rhs); });

			if (Accepted->Pid == 0 && Accepted->ProcessName.empty())
			{
				return std::nullopt;
			}
			if (Accepted->Pid == Listener.Pid && Accepted->ProcessName == Listener.ProcessName)
			{
				return std::nullopt;
			}
			return NProcessRef{ .Host = Target, .Pid = Accepted->Pid, .Name = Accepted->ProcessName };
		}

		void AddDangling(NHostName const& Host, NSocketRecord const& Record, std::string const& Reason)
		{
			Graph.Diagnostics.push_back({ .Kind = EDiagnosticKind::DanglingClient,
				.Host = Host,
				.Message = fmt::format("{}: {}", Record.ToString(), Reason) });
		}

		void MatchRecord(NHostName const& Host, NSocketRecord const& Record)
		{
			if (Record.Protocol == EProtocol::TCP && IsAcceptedSocket(Host, Record))
			{
				return;
			}
			if (Options.IsExcluded(Record.ProcessName))
			{
				return;
			}

			NWireView const Client = MakeWireView(Record);
			std::string     Reason{};
			auto const      Target = ResolveTarget(Host, Client.Foreign.Address, Reason);
			if (!Target)
			{
				AddDangling(Host, Record, Reason);
				return;
			}
			if (!Options.bIncludeLoopback && *Target == Host)
			{
				return;
			}

			NMatch Match{};
			if (Record.Protocol == EProtocol::TCP)
			{
				auto Found = MatchTcp(*Target, Client);
				if (!Found)
				{
					AddDangling(Host, Record, fmt::format("nothing on {} listens on port {}", *Target, Client.Foreign.Port));
					return;
				}
				Match = *Found;
			}
			else
			{
				switch (MatchUdp(Host, Record, Client, *Target, Match))
				{
					case EUdpResult::NoPeer:
						AddDangling(Host, Record, fmt::format("no socket on {} is bound to this peer", *Target));
						return;
					case EUdpResult::PeerIsClient:
						return;
					case EUdpResult::Matched:
						break;
				}
			}

			if (Options.IsExcluded(Match.Server->ProcessName))
			{
				return;
			}

			NConnectionEdge Edge{ .ClientHost = Host,
				.ClientSocket = Record,
				.ServerHost = *Target,
				.ServerSocket = *Match.Server,
				.Rule = Match.Rule };
			if (Record.Protocol == EProtocol::TCP)
			{
				Edge.Handover = FindHandover(*Target, Client, *Match.Server);
			}
			Graph.Edges.push_back(std::move(Edge));
		}

	public:
		NCorrelationRun(NInventoryView const& InView, NCorrelationOptions const& InOptions)
			: View(InView), Options(InOptions)
		{
		}

		NConnectionGraph Run()
		{
			for (auto const& [Host, Inventory] : View)
			{
				Graph.Hosts[Host] = Inventory.GetDisplayName();
			}
			BuildOwnership();
			BuildIndex();

			for (auto const& [Host, Inventory] : View)
			{
				std::vector<NSocketRecord const*> Sockets{};
				for (auto const& Record : Inventory.Sockets)
				{
					if (Record.IsEstablished() && Record.ForeignEndpoint)
					{
						Sockets.push_back(&Record);
					}
				}
				std::sort(Sockets.begin(), Sockets.end(),
					[](NSocketRecord const* Lhs, NSocketRecord const* Rhs) { return *Lhs < *Rhs; });
				// A record listed twice must only produce one edge
				Sockets.erase(std::unique(Sockets.begin(), Sockets.end(),
								  [](NSocketRecord const* Lhs, NSocketRecord const* Rhs) { return *Lhs == *Rhs; }),
					Sockets.end());

				for (auto const* Record : Sockets)
				{
					MatchRecord(Host, *Record);
				}
			}

			std::sort(Graph.Edges.begin(), Graph.Edges.end());
			return std::move(Graph);
		}
	};
} // namespace

bool NCorrelationOptions::IsExcluded(std::string const& ProcessName) const
{
	if (ProcessName.empty())
	{
		return false;
	}
	return std::ranges::any_of(ExcludedProcessPrefixes, [&](std::string const& Prefix) {
		return !Prefix.empty() && NStringUtil::StartsWith(ProcessName, Prefix);
	});
}

NConnectionGraph NCorrelationEngine::Correlate(NInventoryView const& View, NCorrelationOptions const& Options)
{
	std::lock_guard Lock(Mutex);

	NConnectionGraph Graph = NCorrelationRun(View, Options).Run();

	size_t const Dangling = Graph.CountDiagnostics(EDiagnosticKind::DanglingClient);
	spdlog::info("Correlated {} hosts: {} connections, {} unmatched sockets", Graph.Hosts.size(), Graph.Edges.size(),
		Dangling);
	LogDiagnostics(Graph.Diagnostics);
	return Graph;
}
