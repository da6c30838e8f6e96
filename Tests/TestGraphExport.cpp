/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "GraphExport.hpp"

using namespace NTestHelpers;

namespace
{
	NConnectionGraph MakeGraph()
	{
		NConnectionGraph Graph;
		Graph.Hosts = { { "centos", "CentOS build box" }, { "debian", "debian" } };

		NConnectionEdge Ssh{ .ClientHost = "debian",
			.ClientSocket = Connected(EProtocol::TCP, "10.0.0.1:51000", "10.0.0.2:22", 300, "ssh"),
			.ServerHost = "centos",
			.ServerSocket = Listen(EProtocol::TCP, "0.0.0.0:22", 700, "sshd"),
			.Rule = EMatchRule::Direct };
		Ssh.Handover = NProcessRef{ .Host = "centos", .Pid = 1500, .Name = "sshd" };
		Graph.Edges.push_back(Ssh);

		Graph.Edges.push_back({ .ClientHost = "debian",
			.ClientSocket = Connected(EProtocol::UDP, "10.0.0.1:5353", "10.0.0.2:53", 0, ""),
			.ServerHost = "centos",
			.ServerSocket = Connected(EProtocol::UDP, "10.0.0.2:53", "10.0.0.1:5353", 80, "dnsmasq"),
			.Rule = EMatchRule::UdpMutual });

		Graph.Diagnostics.push_back({ .Kind = EDiagnosticKind::DanglingClient,
			.Host = "debian",
			.Message = "tcp 10.0.0.1:40000 -> 8.8.8.8:53: no known host owns 8.8.8.8" });
		return Graph;
	}
} // namespace

TEST(GraphExportTest, ConnectionsCsv)
{
	std::string const Csv = NGraphExport::ToConnectionsCsv(MakeGraph());
	EXPECT_EQ(Csv,
		"Source host,Dest host,Source process,Dest process,Source PID,Dest PID,"
		"Source process socket,Dest process socket,Protocol,Rule\n"
		"debian,centos,ssh,sshd,300,700,10.0.0.1:51000,0.0.0.0:22,TCP,direct\n"
		"debian,centos,unknown,dnsmasq,0,80,10.0.0.1:5353,10.0.0.2:53,UDP,udp-mutual\n");
}

TEST(GraphExportTest, EmptyGraphOnlyHasHeader)
{
	std::string const Csv = NGraphExport::ToConnectionsCsv({});
	EXPECT_EQ(std::count(Csv.begin(), Csv.end(), '\n'), 1);
}

TEST(GraphExportTest, Json)
{
	NInventoryView View;
	View["centos"] = Host("centos", { "10.0.0.2", "fe80::2%ens3" });

	NJson const Json = NGraphExport::ToJson(MakeGraph(), &View);

	auto const& Hosts = Json[JSON_KEY_HOSTS].array_items();
	ASSERT_EQ(Hosts.size(), 2u);
	EXPECT_EQ(Hosts[0][JSON_KEY_NAME].string_value(), "centos");
	EXPECT_EQ(Hosts[0][JSON_KEY_DISPLAY_NAME].string_value(), "CentOS build box");
	ASSERT_EQ(Hosts[0][JSON_KEY_INTERFACES].array_items().size(), 2u);
	EXPECT_EQ(Hosts[0][JSON_KEY_INTERFACES][1].string_value(), "fe80::2%ens3");
	EXPECT_TRUE(Hosts[1][JSON_KEY_INTERFACES].array_items().empty());

	auto const& Edges = Json[JSON_KEY_EDGES].array_items();
	ASSERT_EQ(Edges.size(), 2u);
	auto const& Ssh = Edges[0];
	EXPECT_EQ(Ssh[JSON_KEY_RULE].string_value(), "direct");
	EXPECT_EQ(Ssh[JSON_KEY_CLIENT][JSON_KEY_HOST].string_value(), "debian");
	EXPECT_EQ(Ssh[JSON_KEY_CLIENT][JSON_KEY_PID].int_value(), 300);
	EXPECT_EQ(Ssh[JSON_KEY_CLIENT][JSON_KEY_SOCKET][JSON_KEY_FOREIGN].string_value(), "10.0.0.2:22");
	EXPECT_EQ(Ssh[JSON_KEY_SERVER][JSON_KEY_PROCESS].string_value(), "sshd");
	EXPECT_TRUE(Ssh[JSON_KEY_SERVER][JSON_KEY_SOCKET][JSON_KEY_FOREIGN].is_null());
	EXPECT_EQ(Ssh[JSON_KEY_SERVER][JSON_KEY_SOCKET][JSON_KEY_STATE].string_value(), "LISTENING");
	EXPECT_EQ(Ssh[JSON_KEY_HANDOVER][JSON_KEY_PID].int_value(), 1500);

	auto const& Dns = Edges[1];
	EXPECT_TRUE(Dns[JSON_KEY_HANDOVER].is_null());
	EXPECT_EQ(Dns[JSON_KEY_CLIENT][JSON_KEY_PROCESS].string_value(), "unknown");
	EXPECT_EQ(Dns[JSON_KEY_CLIENT][JSON_KEY_SOCKET][JSON_KEY_PROTOCOL].string_value(), "udp");

	auto const& Diagnostics = Json[JSON_KEY_DIAGNOSTICS].array_items();
	ASSERT_EQ(Diagnostics.size(), 1u);
	EXPECT_EQ(Diagnostics[0][JSON_KEY_KIND].string_value(), "dangling-client");
	EXPECT_EQ(Diagnostics[0][JSON_KEY_HOST].string_value(), "debian");
}

TEST(GraphExportTest, WithoutViewThereAreNoInterfaces)
{
	NJson const Json = NGraphExport::ToJson(MakeGraph());
	EXPECT_TRUE(Json[JSON_KEY_HOSTS][0][JSON_KEY_INTERFACES].is_null());
}

TEST(GraphExportTest, WrittenJsonParsesBack)
{
	NTempDir   Dir;
	auto const Path = Dir.Get() / "graph.json";
	ASSERT_TRUE(NGraphExport::WriteJson(MakeGraph(), Path));

	auto Text = NFilesystem::ReadTextFile(Path);
	ASSERT_TRUE(Text);
	std::string Error;
	NJson const Parsed = NJson::parse(*Text, Error);
	EXPECT_TRUE(Error.empty()) << Error;
	EXPECT_EQ(Parsed[JSON_KEY_EDGES].array_items().size(), 2u);

	EXPECT_FALSE(NGraphExport::WriteConnectionsCsv(MakeGraph(), Dir.Get() / "missing" / "graph.csv"));
}
