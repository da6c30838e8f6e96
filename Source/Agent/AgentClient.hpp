/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "ICollector.hpp"
#include "Messages.hpp"
#include "Socket.hpp"

// Keeps a connection to the server alive and answers its capture requests
class NAgentClient
{
	std::shared_ptr<NClientSocket> Socket;
	ICollector&                    Collector;
	std::string                    PrettyName{};

	std::thread       ConnectionThread{};
	std::atomic<bool> bRunning{ false };

	std::mutex              RecordControlMutex{}; // serializes starting and stopping the record thread
	std::mutex              RecordMutex{};
	std::condition_variable RecordCondition{};
	bool                    bRecording{};
	std::thread             RecordThread{};

	void ConnectionThreadFunction();

	bool EnsureConnected();

	bool Register();

	void HandleData(NBuffer& Buf);

	void HandleCaptureRequest(NBuffer const& Buf);

	void SendSnapshot(bool bFinal);

	void StartRecording(uint32_t IntervalSeconds);

	void StopRecording();

	void StopRecordThread();

	void RecordThreadFunction(uint32_t IntervalSeconds);

	template <class T>
	void SendMessage(EMessageType Type, T const& Data) const
	{
		if (auto Sent = Socket->SendFramed(EncodeMessage(Type, Data)); Sent < 0)
		{
			spdlog::error(
				"Failed to send message of type {} to server: {}", static_cast<int>(Type), NErrnoUtil::StrError());
		}
	}

public:
	NAgentClient(std::string const& ServerAddress, NPort ServerPort, ICollector& Collector_, std::string PrettyName_);

	~NAgentClient() { Stop(); }

	void Start();

	void Stop();

	// False once stopped locally or sent away by the server
	[[nodiscard]] bool IsRunning() const { return bRunning; }

	[[nodiscard]] bool IsConnected() const { return Socket->IsConnected(); }
};
