/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "TestHelpers.hpp"
#include "AgentClient.hpp"
#include "CollectionServer.hpp"
#include "ICollector.hpp"

using namespace NTestHelpers;

namespace
{
	class NFakeCollector : public ICollector
	{
		NHostName          Name;
		mutable std::mutex Mutex{};
		NHostInventory     Inventory{};
		bool               bFail{};
		std::atomic<int>   CollectCount{ 0 };

	public:
		explicit NFakeCollector(NHostName Name_) : Name(std::move(Name_))
		{
			Inventory = Host(Name, { "10.0.0.5" });
			Inventory.Sockets.push_back(Listen(EProtocol::TCP, "0.0.0.0:22", 812, "sshd"));
		}

		[[nodiscard]] NHostName GetHostName() const override { return Name; }

		std::optional<NHostInventory> Collect() override
		{
			++CollectCount;
			std::lock_guard Lock(Mutex);
			if (bFail)
			{
				return std::nullopt;
			}
			return Inventory;
		}

		void SetSockets(std::vector<NSocketRecord> Sockets)
		{
			std::lock_guard Lock(Mutex);
			Inventory.Sockets = std::move(Sockets);
		}

		void SetFail(bool bFail_)
		{
			std::lock_guard Lock(Mutex);
			bFail = bFail_;
		}

		[[nodiscard]] int GetCollectCount() const { return CollectCount; }
	};

	template <class TPredicate>
	bool WaitUntil(TPredicate&& Predicate, std::chrono::milliseconds Timeout = std::chrono::seconds(5))
	{
		auto const Deadline = std::chrono::steady_clock::now() + Timeout;
		while (std::chrono::steady_clock::now() < Deadline)
		{
			if (Predicate())
			{
				return true;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
		return Predicate();
	}

	NSocketRecord const Ssh = Connected(EProtocol::TCP, "10.0.0.5:41000", "10.0.0.2:22", 3001, "ssh");
	NSocketRecord const Curl = Connected(EProtocol::TCP, "10.0.0.5:41001", "10.0.0.2:443", 3002, "curl");
} // namespace

class CollectionServerTest : public ::testing::Test
{
protected:
	NInventoryStore                    Store;
	NFakeCollector                     Collector{ "debian" };
	std::unique_ptr<NCollectionServer> Server{};
	std::unique_ptr<NAgentClient>      Agent{};

	void SetUp() override
	{
		Server = std::make_unique<NCollectionServer>(
			NServerSettings{ .Address = "127.0.0.1", .Port = 0, .CaptureTimeoutMs = 3000, .RecordingIntervalSeconds = 1 },
			Store);
		ASSERT_TRUE(Server->Start());
		ASSERT_NE(Server->GetPort(), 0);

		Agent = std::make_unique<NAgentClient>("127.0.0.1", Server->GetPort(), Collector, "Debian test box");
		Agent->Start();
		ASSERT_TRUE(WaitUntil([this] { return IsIdle("debian"); }));
	}

	void TearDown() override
	{
		// Agent first, its Exit is handled while the server is still up
		Agent.reset();
		Server.reset();
	}

	bool IsIdle(NHostName const& Name) const
	{
		auto Agents = Server->ListActiveAgents();
		return std::ranges::any_of(
			Agents, [&](NAgentInfo const& Info) { return Info.HostName == Name && Info.State == EAgentState::Idle; });
	}

	size_t CountDiagnostics(EDiagnosticKind::Type Kind)
	{
		auto Diagnostics = Server->TakeDiagnostics();
		return std::ranges::count_if(Diagnostics, [&](NDiagnostic const& D) { return D.Kind == Kind; });
	}

	// Diagnostics from the socket thread may show up a little after the state change
	bool WaitForDiagnostic(EDiagnosticKind::Type Kind)
	{
		size_t Count = 0;
		return WaitUntil([&] {
			Count += CountDiagnostics(Kind);
			return Count > 0;
		});
	}
};

TEST_F(CollectionServerTest, RegistrationFillsTheStore)
{
	auto Agents = Server->ListActiveAgents();
	ASSERT_EQ(Agents.size(), 1u);
	EXPECT_EQ(Agents[0].PrettyName, "Debian test box");
	EXPECT_EQ(Agents[0].PeerAddress, "127.0.0.1");

	auto Inventory = Store.Get("debian");
	ASSERT_TRUE(Inventory);
	EXPECT_EQ(Inventory->GetDisplayName(), "Debian test box");
	EXPECT_TRUE(Inventory->HasInterface(Ip("10.0.0.5")));
	// Registration only carries addresses
	EXPECT_TRUE(Inventory->Sockets.empty());
}

TEST_F(CollectionServerTest, SingleCapture)
{
	Collector.SetSockets({ Ssh });
	ASSERT_TRUE(Server->TriggerCapture("debian"));

	auto Inventory = Store.Get("debian");
	ASSERT_TRUE(Inventory);
	ASSERT_EQ(Inventory->Sockets.size(), 1u);
	EXPECT_EQ(Inventory->Sockets[0], Ssh);
	EXPECT_TRUE(IsIdle("debian"));

	// A new capture replaces the previous one
	Collector.SetSockets({ Curl });
	ASSERT_TRUE(Server->TriggerCapture("debian"));
	Inventory = Store.Get("debian");
	ASSERT_EQ(Inventory->Sockets.size(), 1u);
	EXPECT_EQ(Inventory->Sockets[0], Curl);
}

TEST_F(CollectionServerTest, RecordingUnionsSnapshots)
{
	Collector.SetSockets({ Ssh });
	int const CollectsBefore = Collector.GetCollectCount();
	ASSERT_TRUE(Server->StartRecording("debian"));
	EXPECT_TRUE(Store.IsRecording("debian"));
	EXPECT_FALSE(Server->StartRecording("debian"));
	EXPECT_FALSE(Server->TriggerCapture("debian"));

	// First periodic snapshot is taken right away
	ASSERT_TRUE(WaitUntil([&] { return Collector.GetCollectCount() > CollectsBefore; }));
	Collector.SetSockets({ Curl });

	auto Recorded = Server->StopRecording("debian");
	ASSERT_TRUE(Recorded);
	EXPECT_FALSE(Store.IsRecording("debian"));
	EXPECT_NE(std::ranges::find(Recorded->Sockets, Ssh), Recorded->Sockets.end());
	EXPECT_NE(std::ranges::find(Recorded->Sockets, Curl), Recorded->Sockets.end());
	EXPECT_TRUE(IsIdle("debian"));

	EXPECT_FALSE(Server->StopRecording("debian"));
}

TEST_F(CollectionServerTest, UnknownHost)
{
	EXPECT_FALSE(Server->TriggerCapture("nobody"));
	EXPECT_FALSE(Server->StartRecording("nobody"));
	EXPECT_FALSE(Server->StopRecording("nobody"));
	EXPECT_FALSE(Store.IsRecording("nobody"));
}

TEST_F(CollectionServerTest, SecondAgentWithSameNameIsRefused)
{
	NFakeCollector Twin("debian");
	NAgentClient   Second("127.0.0.1", Server->GetPort(), Twin, "impostor");
	Second.Start();

	// The server sends it away
	EXPECT_TRUE(WaitUntil([&] { return !Second.IsRunning(); }));
	Second.Stop();

	auto Agents = Server->ListActiveAgents();
	ASSERT_EQ(Agents.size(), 1u);
	EXPECT_EQ(Agents[0].PrettyName, "Debian test box");
	EXPECT_TRUE(Server->TriggerCapture("debian"));
}

TEST_F(CollectionServerTest, FailedCollectionTimesOut)
{
	Server.reset();
	Agent.reset();
	Server = std::make_unique<NCollectionServer>(
		NServerSettings{ .Address = "127.0.0.1", .Port = 0, .CaptureTimeoutMs = 300, .RecordingIntervalSeconds = 1 }, Store);
	ASSERT_TRUE(Server->Start());
	Agent = std::make_unique<NAgentClient>("127.0.0.1", Server->GetPort(), Collector, "Debian test box");
	Agent->Start();
	ASSERT_TRUE(WaitUntil([this] { return IsIdle("debian"); }));

	Collector.SetFail(true);
	EXPECT_FALSE(Server->TriggerCapture("debian"));
	EXPECT_EQ(CountDiagnostics(EDiagnosticKind::AgentTimeout), 1u);
	// Usable again afterwards
	EXPECT_TRUE(IsIdle("debian"));

	Collector.SetFail(false);
	EXPECT_TRUE(Server->TriggerCapture("debian"));
}

TEST_F(CollectionServerTest, SilentRecordingTimesOut)
{
	Server.reset();
	Agent.reset();
	Server = std::make_unique<NCollectionServer>(
		NServerSettings{ .Address = "127.0.0.1", .Port = 0, .CaptureTimeoutMs = 300, .RecordingIntervalSeconds = 1 }, Store);
	ASSERT_TRUE(Server->Start());
	Agent = std::make_unique<NAgentClient>("127.0.0.1", Server->GetPort(), Collector, "Debian test box");
	Agent->Start();
	ASSERT_TRUE(WaitUntil([this] { return IsIdle("debian"); }));

	// The agent accepts the recording but never manages to send a snapshot
	Collector.SetFail(true);
	ASSERT_TRUE(Server->StartRecording("debian"));
	Server->Tick();
	EXPECT_TRUE(Store.IsRecording("debian"));

	ASSERT_TRUE(WaitUntil([this] {
		Server->Tick();
		return !Store.IsRecording("debian");
	}));
	EXPECT_TRUE(IsIdle("debian"));
	EXPECT_TRUE(WaitForDiagnostic(EDiagnosticKind::AgentTimeout));
	EXPECT_FALSE(Server->StopRecording("debian"));

	// The host can be recorded again
	Collector.SetFail(false);
	Collector.SetSockets({ Ssh });
	ASSERT_TRUE(Server->StartRecording("debian"));
	ASSERT_TRUE(WaitUntil([this] {
		auto Inventory = Store.Get("debian");
		return Inventory && std::ranges::find(Inventory->Sockets, Ssh) != Inventory->Sockets.end();
	}));
	auto Recorded = Server->StopRecording("debian");
	ASSERT_TRUE(Recorded);
	EXPECT_NE(std::ranges::find(Recorded->Sockets, Ssh), Recorded->Sockets.end());
}

TEST_F(CollectionServerTest, AgentLeaving)
{
	Agent->Stop();
	ASSERT_TRUE(WaitUntil([this] { return Server->ListActiveAgents().empty(); }));
	Server->Tick();

	EXPECT_FALSE(Server->TriggerCapture("debian"));
	// Data from before stays available
	EXPECT_TRUE(Store.Get("debian"));
	EXPECT_EQ(CountDiagnostics(EDiagnosticKind::AgentDisconnected), 0u);
}

TEST_F(CollectionServerTest, RegistryAnnouncesAgents)
{
	std::mutex             Mutex;
	std::vector<NHostName> Added;
	std::vector<NHostName> Removed;

	auto&                      Registry = Server->GetRegistry();
	sigslot::scoped_connection AddedConnection = Registry.OnAgentAdded.connect([&](NHostName const& Host) {
		std::lock_guard Lock(Mutex);
		Added.push_back(Host);
	});
	sigslot::scoped_connection RemovedConnection = Registry.OnAgentRemoved.connect([&](NHostName const& Host) {
		std::lock_guard Lock(Mutex);
		Removed.push_back(Host);
	});

	Agent->Stop();
	ASSERT_TRUE(WaitUntil([&] {
		std::lock_guard Lock(Mutex);
		return !Removed.empty();
	}));

	NFakeCollector Other("centos");
	NAgentClient   Second("127.0.0.1", Server->GetPort(), Other, "CentOS test box");
	Second.Start();
	ASSERT_TRUE(WaitUntil([&] { return IsIdle("centos"); }));
	Second.Stop();
	ASSERT_TRUE(WaitUntil([&] {
		std::lock_guard Lock(Mutex);
		return Removed.size() == 2;
	}));

	std::lock_guard Lock(Mutex);
	EXPECT_EQ(Removed, (std::vector<NHostName>{ "debian", "centos" }));
	ASSERT_FALSE(Added.empty());
	EXPECT_EQ(Added.front(), "centos");
}

TEST_F(CollectionServerTest, DisconnectWhileRecordingKeepsSnapshots)
{
	Collector.SetSockets({ Ssh });
	int const CollectsBefore = Collector.GetCollectCount();
	ASSERT_TRUE(Server->StartRecording("debian"));
	ASSERT_TRUE(WaitUntil([&] { return Collector.GetCollectCount() > CollectsBefore; }));

	Agent->Stop();
	EXPECT_TRUE(WaitForDiagnostic(EDiagnosticKind::AgentDisconnected));
	EXPECT_FALSE(Store.IsRecording("debian"));
	EXPECT_TRUE(Server->ListActiveAgents().empty());

	auto Inventory = Store.Get("debian");
	ASSERT_TRUE(Inventory);
	EXPECT_NE(std::ranges::find(Inventory->Sockets, Ssh), Inventory->Sockets.end());
}
