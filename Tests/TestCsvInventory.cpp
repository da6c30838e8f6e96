/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "Parsers/CsvInventory.hpp"

using namespace NTestHelpers;

namespace
{
	NHostInventory MakeInventory()
	{
		NHostInventory Inventory = Host("centos", { "10.0.0.2", "fe80::2%ens3", "::1" });
		Inventory.Sockets = {
			Listen(EProtocol::TCP, "0.0.0.0:22", 700, "sshd"),
			Listen(EProtocol::TCP, "[::]:443", 820, "nginx", false),
			Listen(EProtocol::TCP, "[::]:22", 700, "sshd", true),
			Listen(EProtocol::UDP, "10.0.0.2:123", 0, ""),
			Connected(EProtocol::TCP, "10.0.0.2:22", "10.0.0.1:51000", 1500, "sshd"),
			Connected(EProtocol::TCP, "10.0.0.2:40122", "10.0.0.9:5432", 910, "java, worker \"7\""),
			Connected(EProtocol::UDP, "[fe80::2%ens3]:546", "[fe80::1%ens3]:547", 650, "dhclient"),
		};
		// ss reports v4-mapped ends of dual stack sockets
		auto Mapped = Connected(EProtocol::TCP, "[::ffff:10.0.0.2]:443", "[::ffff:10.0.0.1]:40000", 820, "nginx");
		Mapped.bV6Only = false;
		Inventory.Sockets.push_back(Mapped);
		Inventory.Normalize();
		return Inventory;
	}
} // namespace

TEST(CsvInventoryTest, WriteThenParseIsLossless)
{
	NHostInventory const Original = MakeInventory();

	std::string const IpText = NCsvInventory::FormatIpFile(Original);
	std::string const NetworkText = NCsvInventory::FormatNetworkFile(Original);
	auto              Result = NCsvInventory::Parse(IpText, NetworkText, "centos");

	ASSERT_TRUE(Result.bOk);
	EXPECT_TRUE(Result.Diagnostics.empty());
	EXPECT_EQ(Result.Inventory.Name, "centos");
	EXPECT_EQ(Result.Inventory.Interfaces, Original.Interfaces);
	EXPECT_EQ(Result.Inventory.Sockets, Original.Sockets);

	// Zones survive even though they aren't part of the identity
	EXPECT_NE(IpText.find("fe80::2%ens3"), std::string::npos);
}

TEST(CsvInventoryTest, DualStackWildcardIsWrittenAsStar)
{
	std::string const NetworkText = NCsvInventory::FormatNetworkFile(MakeInventory());
	EXPECT_NE(NetworkText.find("tcp,*:443,,LISTENING,820,nginx"), std::string::npos);
	EXPECT_NE(NetworkText.find("tcp,[::]:22,,LISTENING,700,sshd"), std::string::npos);
	EXPECT_NE(NetworkText.find("\"java, worker \"\"7\"\"\""), std::string::npos);
}

TEST(CsvInventoryTest, HandWrittenTables)
{
	auto Result = NCsvInventory::Parse("IP\n10.0.0.3\n",
		"protocol, local_socket, foreign_socket, state, pid, process_name\n"
		"TCP, 10.0.0.3:8080, , listen, , tomcat\n"
		"udp,10.0.0.3:514,,,,\n"
		"tcp,10.0.0.3:41000,10.0.0.2:22,ESTABLISHED,4242,ssh\n",
		"legacy");
	ASSERT_TRUE(Result.bOk);
	EXPECT_TRUE(Result.Diagnostics.empty());
	ASSERT_EQ(Result.Inventory.Sockets.size(), 3u);

	auto const& Sockets = Result.Inventory.Sockets;
	auto        Tomcat = std::ranges::find_if(Sockets, [](NSocketRecord const& R) { return R.ProcessName == "tomcat"; });
	ASSERT_NE(Tomcat, Sockets.end());
	EXPECT_TRUE(Tomcat->IsListening());
	EXPECT_EQ(Tomcat->Pid, 0u);
	EXPECT_EQ(Tomcat->LocalEndpoint.Port, 8080);
}

TEST(CsvInventoryTest, BadHeaderRejectsFile)
{
	auto Ip = NCsvInventory::ParseIpFile("Address\n10.0.0.3\n", "legacy", "legacy_ip.csv");
	EXPECT_FALSE(Ip.bOk);
	EXPECT_TRUE(Ip.Inventory.Interfaces.empty());

	auto Network = NCsvInventory::ParseNetworkFile("proto,local,foreign\n", "legacy", "legacy_network.csv");
	EXPECT_FALSE(Network.bOk);

	// One broken half and the host gets nothing
	auto Both = NCsvInventory::Parse("IP\n10.0.0.3\n", "proto,local,foreign\n", "legacy");
	EXPECT_FALSE(Both.bOk);
	EXPECT_TRUE(Both.Inventory.IsEmpty());
}

TEST(CsvInventoryTest, BadRowsAreSkipped)
{
	auto Result = NCsvInventory::ParseNetworkFile("protocol,local_socket,foreign_socket,state,pid,process_name\n"
												  "icmp,10.0.0.3:1,,LISTENING,1,ping\n"
												  "tcp,10.0.0.3:22,,LISTENING,abc,sshd\n"
												  "tcp,10.0.0.3:22,,CLOSE_WAIT,1,sshd\n"
												  "tcp,10.0.0.3:22,10.0.0.4:50000,LISTENING,1,sshd\n"
												  "tcp,10.0.0.3:22,,LISTENING,1,sshd\n",
		"legacy", "legacy_network.csv");
	EXPECT_TRUE(Result.bOk);
	ASSERT_EQ(Result.Inventory.Sockets.size(), 1u);
	ASSERT_EQ(Result.Diagnostics.size(), 4u);
	EXPECT_EQ(Result.Diagnostics[0].Line, 2u);
	EXPECT_EQ(Result.Diagnostics[3].Line, 5u);
	for (auto const& Diagnostic : Result.Diagnostics)
	{
		EXPECT_EQ(Diagnostic.Kind, EDiagnosticKind::ParseError);
		EXPECT_EQ(Diagnostic.File, "legacy_network.csv");
	}
}

TEST(CsvInventoryTest, WriteCreatesBothFiles)
{
	NTempDir Dir;
	auto     Out = Dir.Get() / "out";
	ASSERT_TRUE(NCsvInventory::Write(MakeInventory(), Out));
	EXPECT_TRUE(NFilesystem::Exists(Out / "centos_ip.csv"));
	EXPECT_TRUE(NFilesystem::Exists(Out / "centos_network.csv"));
}
