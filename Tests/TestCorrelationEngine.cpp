/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <gtest/gtest.h>
#include <random>

#include "TestHelpers.hpp"
#include "CorrelationEngine.hpp"
#include "Parsers/CsvInventory.hpp"

using namespace NTestHelpers;

class CorrelationEngineTest : public ::testing::Test
{
protected:
	NCorrelationEngine Engine;
	NInventoryView     View;

	NHostInventory& Add(NHostInventory Inventory)
	{
		auto Name = Inventory.Name;
		return View[Name] = std::move(Inventory);
	}

	NConnectionGraph Correlate(NCorrelationOptions const& Options = {}) { return Engine.Correlate(View, Options); }

	// debian runs an ssh client against centos
	void AddSshPair()
	{
		auto& Debian = Add(Host("debian", { "10.0.0.1", "127.0.0.1" }));
		Debian.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:51000", "10.0.0.2:22", 300, "ssh"));

		auto& Centos = Add(Host("centos", { "10.0.0.2" }));
		Centos.PrettyName = "CentOS build box";
		Centos.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:22", 700, "sshd"));
		Centos.Sockets.push_back(Listen(EProtocol::TCP, "[::]:22", 700, "sshd"));
		// Accepted half, forked off to a per-session sshd
		Centos.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.2:22", "10.0.0.1:51000", 1500, "sshd"));
	}
};

TEST_F(CorrelationEngineTest, DirectTcpEdgeWithHandover)
{
	AddSshPair();
	auto Graph = Correlate();

	ASSERT_EQ(Graph.Edges.size(), 1u);
	auto const& Edge = Graph.Edges[0];
	EXPECT_EQ(Edge.ClientHost, "debian");
	EXPECT_EQ(Edge.ServerHost, "centos");
	EXPECT_EQ(Edge.Rule, EMatchRule::Direct);
	EXPECT_EQ(Edge.ClientSocket.ProcessName, "ssh");
	EXPECT_EQ(Edge.ServerSocket.Pid, 700u);
	EXPECT_EQ(Edge.ServerSocket.LocalEndpoint.ToString(), "0.0.0.0:22");
	ASSERT_TRUE(Edge.Handover);
	EXPECT_EQ(Edge.Handover->Pid, 1500u);
	EXPECT_EQ(Edge.Handover->Host, "centos");

	// The accepted half is neither an edge nor dangling
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 0u);
	EXPECT_EQ(Graph.Hosts.at("centos"), "CentOS build box");
	EXPECT_EQ(Graph.Hosts.at("debian"), "debian");
}

TEST_F(CorrelationEngineTest, NoHandoverWhenListenerKeepsTheSocket)
{
	AddSshPair();
	View["centos"].Sockets.back().Pid = 700;

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_FALSE(Graph.Edges[0].Handover);
}

TEST_F(CorrelationEngineTest, V4ClientMatchesDualStackListener)
{
	auto& Client = Add(Host("alpha", { "10.0.0.1" }));
	Client.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40000", "10.0.0.2:443", 10, "curl"));
	auto& Server = Add(Host("bravo", { "10.0.0.2", "fd00::2" }));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "[::]:443", 820, "nginx", false));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].Rule, EMatchRule::V4Mapped);
	EXPECT_EQ(Graph.Edges[0].ServerSocket.ProcessName, "nginx");
}

TEST_F(CorrelationEngineTest, V6OnlyListenerRefusesV4Client)
{
	auto& Client = Add(Host("alpha", { "10.0.0.1" }));
	Client.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40000", "10.0.0.2:443", 10, "curl"));
	auto& Server = Add(Host("bravo", { "10.0.0.2" }));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "[::]:443", 820, "nginx", true));

	auto Graph = Correlate();
	EXPECT_TRUE(Graph.Edges.empty());
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 1u);
}

TEST_F(CorrelationEngineTest, DirectRuleWinsOverV4Mapped)
{
	auto& Client = Add(Host("alpha", { "10.0.0.1" }));
	Client.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40000", "10.0.0.2:443", 10, "curl"));
	auto& Server = Add(Host("bravo", { "10.0.0.2" }));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "[::]:443", 2, "haproxy", false));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:443", 1, "nginx"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].Rule, EMatchRule::Direct);
	EXPECT_EQ(Graph.Edges[0].ServerSocket.ProcessName, "nginx");
}

TEST_F(CorrelationEngineTest, SpecificAddressWinsOverWildcard)
{
	auto& Client = Add(Host("alpha", { "10.0.0.1" }));
	Client.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40000", "10.0.0.2:8080", 10, "curl"));
	auto& Server = Add(Host("bravo", { "10.0.0.2", "10.0.0.3" }));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:8080", 40, "catchall"));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "10.0.0.2:8080", 50, "tomcat"));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "10.0.0.3:8080", 30, "other"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].ServerSocket.ProcessName, "tomcat");
}

TEST_F(CorrelationEngineTest, MappedClientIsMatchedAsIPv4)
{
	auto& Client = Add(Host("alpha", { "10.0.0.1" }));
	auto  Record = Connected(EProtocol::TCP, "[::ffff:10.0.0.1]:40000", "[::ffff:10.0.0.2]:22", 10, "java");
	Record.bV6Only = false;
	Client.Sockets.push_back(Record);
	auto& Server = Add(Host("bravo", { "10.0.0.2" }));
	Server.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:22", 700, "sshd"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].Rule, EMatchRule::Direct);
	EXPECT_EQ(Graph.Edges[0].ServerHost, "bravo");
}

TEST_F(CorrelationEngineTest, UdpMutualPair)
{
	auto& Client = Add(Host("alpha", { "10.0.0.5" }));
	Client.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.5:5353", "10.0.0.1:53", 500, "resolved"));
	auto& Server = Add(Host("dns", { "10.0.0.1" }));
	Server.Sockets.push_back(Listen(EProtocol::UDP, "0.0.0.0:53", 80, "dnsmasq"));
	Server.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.1:53", "10.0.0.5:5353", 80, "dnsmasq"));
	// No reciprocal record on dns for this one
	auto& Lonely = Add(Host("charlie", { "10.0.0.7" }));
	Lonely.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.7:5353", "10.0.0.1:53", 501, "resolved"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	auto const& Edge = Graph.Edges[0];
	EXPECT_EQ(Edge.ClientHost, "alpha");
	EXPECT_EQ(Edge.ServerHost, "dns");
	EXPECT_EQ(Edge.Rule, EMatchRule::UdpMutual);
	EXPECT_TRUE(Edge.ServerSocket.IsEstablished());
	EXPECT_FALSE(Edge.Handover);

	// Only charlie dangles, the server half of the pair doesn't
	ASSERT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 1u);
	auto Dangling = std::ranges::find_if(Graph.Diagnostics,
		[](NDiagnostic const& D) { return D.Kind == EDiagnosticKind::DanglingClient; });
	EXPECT_EQ(Dangling->Host, "charlie");
}

TEST_F(CorrelationEngineTest, UdpMutualWithDualStackPeer)
{
	auto& Client = Add(Host("alpha", { "10.0.0.5" }));
	Client.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.5:40000", "10.0.0.1:123", 500, "chronyd"));
	auto& Server = Add(Host("ntp", { "10.0.0.1" }));
	auto  Peer = Connected(EProtocol::UDP, "[::]:123", "[::ffff:10.0.0.5]:40000", 90, "ntpd");
	Peer.bV6Only = false;
	Server.Sockets.push_back(Peer);

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].Rule, EMatchRule::UdpMutualV4Mapped);
	EXPECT_EQ(Graph.Edges[0].ClientHost, "alpha");
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 0u);
}

TEST_F(CorrelationEngineTest, UdpPeerBoundToStarWildcard)
{
	auto Alpha = NCsvInventory::Parse("IP\n10.0.0.5\n",
		"protocol,local_socket,foreign_socket,state,pid,process_name\n"
		"udp,10.0.0.5:5353,10.0.0.1:53,ESTABLISHED,500,resolved\n",
		"alpha");
	auto Dns = NCsvInventory::Parse("IP\n10.0.0.1\n",
		"protocol,local_socket,foreign_socket,state,pid,process_name\n"
		"udp,*:53,10.0.0.5:5353,ESTABLISHED,80,dnsmasq\n",
		"dns");
	ASSERT_TRUE(Alpha.bOk);
	ASSERT_TRUE(Dns.bOk);
	Add(Alpha.Inventory);
	Add(Dns.Inventory);

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	auto const& Edge = Graph.Edges[0];
	EXPECT_EQ(Edge.ClientHost, "alpha");
	EXPECT_EQ(Edge.ClientSocket.ProcessName, "resolved");
	EXPECT_EQ(Edge.ServerHost, "dns");
	EXPECT_EQ(Edge.ServerSocket.ProcessName, "dnsmasq");
	EXPECT_EQ(Edge.Rule, EMatchRule::UdpMutualV4Mapped);
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 0u);

	// Without the reciprocal record nothing matches
	View["dns"].Sockets.clear();
	Graph = Correlate();
	EXPECT_TRUE(Graph.Edges.empty());
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 1u);
}

TEST_F(CorrelationEngineTest, RemoteDesktopClientReachesSshd)
{
	auto& Debian = Add(Host("debian", { "10.0.0.11" }));
	Debian.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.11:53293", "10.0.0.13:22", 4100, "Remmina-rdp"));
	auto& Centos = Add(Host("centos", { "10.0.0.13" }));
	Centos.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:22", 700, "sshd"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	auto const& Edge = Graph.Edges[0];
	EXPECT_EQ(Edge.ClientHost, "debian");
	EXPECT_EQ(Edge.ClientSocket.ProcessName, "Remmina-rdp");
	EXPECT_EQ(Edge.ServerHost, "centos");
	EXPECT_EQ(Edge.ServerSocket.ProcessName, "sshd");
	EXPECT_EQ(Edge.Rule, EMatchRule::Direct);
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 0u);
}

TEST_F(CorrelationEngineTest, UdpOrientationFallsBackToPortOrder)
{
	auto& Left = Add(Host("left", { "10.0.0.1" }));
	Left.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.1:40000", "10.0.0.2:30000", 1, "peer"));
	auto& Right = Add(Host("right", { "10.0.0.2" }));
	Right.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.2:30000", "10.0.0.1:40000", 2, "peer"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	// Lower port is the server
	EXPECT_EQ(Graph.Edges[0].ServerHost, "right");
	EXPECT_EQ(Graph.Edges[0].ClientHost, "left");

	// A listening port beats the port order
	Left.Sockets.push_back(Listen(EProtocol::UDP, "0.0.0.0:40000", 1, "peer"));
	Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].ServerHost, "left");
}

TEST_F(CorrelationEngineTest, AmbiguousOwnership)
{
	auto& X = Add(Host("x", { "192.168.1.10" }));
	X.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:80", 1, "httpd"));
	// Talking to itself through the shared address is fine
	X.Sockets.push_back(Connected(EProtocol::TCP, "192.168.1.10:41000", "192.168.1.10:80", 2, "curl"));
	auto& Y = Add(Host("y", { "192.168.1.10" }));
	Y.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:80", 1, "nginx"));
	auto& Z = Add(Host("z", { "192.168.1.20" }));
	Z.Sockets.push_back(Connected(EProtocol::TCP, "192.168.1.20:42000", "192.168.1.10:80", 3, "wget"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_EQ(Graph.Edges[0].ClientHost, "x");
	EXPECT_TRUE(Graph.Edges[0].IsSameHost());
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::AmbiguousOwnership), 1u);
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 1u);
}

TEST_F(CorrelationEngineTest, DanglingClients)
{
	auto& Alpha = Add(Host("alpha", { "10.0.0.1" }));
	Alpha.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40000", "8.8.8.8:53", 1, "dig"));
	Alpha.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40001", "10.0.0.2:5432", 2, "psql"));
	Alpha.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.1:40002", "0.0.0.0:80", 3, "odd"));
	Add(Host("bravo", { "10.0.0.2" }));

	auto Graph = Correlate();
	EXPECT_TRUE(Graph.Edges.empty());
	EXPECT_EQ(Graph.CountDiagnostics(EDiagnosticKind::DanglingClient), 3u);
	for (auto const& Diagnostic : Graph.Diagnostics)
	{
		EXPECT_EQ(Diagnostic.Host, "alpha");
	}
}

TEST_F(CorrelationEngineTest, LoopbackAndOptions)
{
	auto& Db = Add(Host("db", { "10.0.0.9" }));
	Db.Sockets.push_back(Listen(EProtocol::TCP, "127.0.0.1:5432", 100, "postgres"));
	Db.Sockets.push_back(Connected(EProtocol::TCP, "127.0.0.1:45000", "127.0.0.1:5432", 200, "app"));

	auto Graph = Correlate();
	ASSERT_EQ(Graph.Edges.size(), 1u);
	EXPECT_TRUE(Graph.Edges[0].IsSameHost());

	EXPECT_TRUE(Correlate({ .bIncludeLoopback = false }).Edges.empty());
	EXPECT_TRUE(Correlate({ .ExcludedProcessPrefixes = { "post" } }).Edges.empty());
	EXPECT_TRUE(Correlate({ .ExcludedProcessPrefixes = { "app" } }).Edges.empty());
	EXPECT_EQ(Correlate({ .ExcludedProcessPrefixes = { "", "mysql" } }).Edges.size(), 1u);
}

TEST_F(CorrelationEngineTest, DuplicateRecordsGiveOneEdge)
{
	AddSshPair();
	auto&         Debian = View["debian"];
	NSocketRecord Copy = Debian.Sockets.front();
	Debian.Sockets.push_back(Copy);

	EXPECT_EQ(Correlate().Edges.size(), 1u);
}

TEST_F(CorrelationEngineTest, ResultDoesNotDependOnRecordOrder)
{
	AddSshPair();
	auto& Alpha = Add(Host("alpha", { "10.0.0.5" }));
	Alpha.Sockets.push_back(Connected(EProtocol::UDP, "10.0.0.5:5353", "10.0.0.1:53", 500, "resolved"));
	Alpha.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.5:41000", "10.0.0.2:22", 501, "ssh"));
	Alpha.Sockets.push_back(Connected(EProtocol::TCP, "10.0.0.5:41001", "10.0.0.2:23", 502, "telnet"));
	View["centos"].Sockets.push_back(Listen(EProtocol::TCP, "10.0.0.2:22", 701, "sshd-alt"));

	auto const First = Correlate();
	auto const Second = Correlate();
	EXPECT_EQ(First.Edges, Second.Edges);

	std::mt19937 Rng(1234);
	for (auto& [Name, Inventory] : View)
	{
		std::shuffle(Inventory.Sockets.begin(), Inventory.Sockets.end(), Rng);
		std::shuffle(Inventory.Interfaces.begin(), Inventory.Interfaces.end(), Rng);
	}
	auto const Shuffled = Correlate();
	EXPECT_EQ(First.Edges, Shuffled.Edges);
	EXPECT_EQ(First.Diagnostics.size(), Shuffled.Diagnostics.size());
	EXPECT_TRUE(std::is_sorted(First.Edges.begin(), First.Edges.end()));
}
