/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Socket.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <sys/ioctl.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

void NClientSocket::ReleaseFdLocked()
{
	if (SocketFd >= 0)
	{
		close(SocketFd);
		SocketFd = -1;
	}
	State = ES_Initial;
}

void NClientSocket::Close()
{
	std::lock_guard Lock(FdMutex);
	if (SocketFd < 0)
	{
		return;
	}

	// Wakes up the listen thread, it still reads from the fd and closes it on its way out
	shutdown(SocketFd, SHUT_RDWR);
	if (bReaderAlive)
	{
		State = ES_Initial;
		return;
	}
	ReleaseFdLocked();
}

bool NClientSocket::Open()
{
	if (State == ES_Opened)
	{
		return true;
	}

	// The address family is only known after name resolution, Connect() creates the socket
	State = ES_Opened;
	return true;
}

bool NClientSocket::Connect()
{
	if (State == ES_Connected)
	{
		return true;
	}

	addrinfo Hints{};
	Hints.ai_family = AF_UNSPEC;
	Hints.ai_socktype = SOCK_STREAM;

	addrinfo*         Result = nullptr;
	std::string const Service = std::to_string(Port);
	if (int const Err = getaddrinfo(Address.c_str(), Service.c_str(), &Hints, &Result); Err != 0)
	{
		spdlog::debug("Failed to resolve {}: {}", Address, gai_strerror(Err));
		return false;
	}

	int Fd = -1;
	for (addrinfo* Info = Result; Info != nullptr; Info = Info->ai_next)
	{
		Fd = socket(Info->ai_family, Info->ai_socktype, Info->ai_protocol);
		if (Fd < 0)
		{
			continue;
		}

		if (connect(Fd, Info->ai_addr, Info->ai_addrlen) == 0)
		{
			int const NoDelay = 1;
			setsockopt(Fd, IPPROTO_TCP, TCP_NODELAY, &NoDelay, sizeof(NoDelay));
			break;
		}
		spdlog::debug("Failed to connect to {}:{}: {} ({})", Address, Port, NErrnoUtil::StrError(), errno);
		close(Fd);
		Fd = -1;
	}
	freeaddrinfo(Result);

	std::lock_guard Lock(FdMutex);
	if (Fd < 0)
	{
		State = ES_Initial;
		return false;
	}
	// A previous connection must be gone before a new one is made
	ReleaseFdLocked();
	SocketFd = Fd;
	State = ES_Connected;
	return true;
}

ssize_t NClientSocket::Send(NBuffer const& Buf)
{
	std::lock_guard Lock(FdMutex);
	return SendLocked(Buf);
}

ssize_t NClientSocket::SendLocked(NBuffer const& Buf)
{
	if (SocketFd < 0)
	{
		return -1;
	}

	char const* Data = Buf.GetData();
	size_t      Total = 0;
	size_t      Len = Buf.GetWritePos();
	while (Total < Len)
	{
		ssize_t Sent = send(SocketFd, Data + Total, Len - Total, MSG_NOSIGNAL);
		if (Sent < 0)
		{
			if (errno == EINTR)
				continue; // retry
			int const e = errno;
			if (e == EPIPE || e == EBADF || e == ECONNRESET)
			{
				State = ES_Initial;
			}
			else
			{
				spdlog::error("Socket send error: {} ({})", NErrnoUtil::StrError(e), e);
			}
			return (Total > 0) ? static_cast<ssize_t>(Total) : -1;
		}
		if (Sent == 0)
			break; // shouldn't happen unless disconnected
		Total += static_cast<size_t>(Sent);
	}
	return static_cast<ssize_t>(Total);
}

ssize_t NClientSocket::SendFramed(std::string const& Data)
{
	if (Data.size() > NETZKARTE_MAX_FRAME_LENGTH)
	{
		spdlog::error("Refusing to send frame of {} bytes", Data.size());
		return -1;
	}

	std::lock_guard Lock(FdMutex);
	FrameBuffer.Reset();
	if (!FrameBuffer.Write(static_cast<uint32_t>(Data.size())) || !FrameBuffer.Write(Data))
	{
		return -1;
	}
	return SendLocked(FrameBuffer);
}

bool NClientSocket::Receive(NBuffer& Buf, bool* bDataToRead)
{
	if (bDataToRead)
	{
		*bDataToRead = false;
	}
	if (SocketFd < 0)
	{
		return false; // socket not open -> treat as ended
	}

	auto IsConnEndedErr = [](int e) -> bool {
		return e == EBADF || e == ECONNRESET || e == ENOTCONN || e == EPIPE || e == ESHUTDOWN;
	};

	Buf.Reset();

	int Available = 0;
	if (ioctl(SocketFd, FIONREAD, &Available) < 0)
	{
		if (IsConnEndedErr(errno))
		{
			State = ES_Initial;
			return false;
		}
		// transient error, connection still alive
		return true;
	}

	ssize_t AvailableSize = Available;

	if (AvailableSize == 0)
	{
		// Nothing buffered, a non-consuming recv tells EOF apart from "no data yet"
		char    PeekBuf;
		ssize_t Result = recv(SocketFd, &PeekBuf, 1, MSG_PEEK | MSG_DONTWAIT);
		if (Result == 0)
		{
			State = ES_Initial;
			return false;
		}
		if (Result < 0)
		{
			if (IsConnEndedErr(errno))
			{
				State = ES_Initial;
				return false;
			}
			return true;
		}
		AvailableSize = Result;
	}

	if (AvailableSize <= 0)
	{
		return true;
	}

	Buf.Resize(static_cast<size_t>(AvailableSize));
	ssize_t Got = recv(SocketFd, Buf.GetData(), static_cast<size_t>(AvailableSize), 0);
	if (Got < 0)
	{
		if (IsConnEndedErr(errno))
		{
			State = ES_Initial;
			return false;
		}
		return true;
	}
	if (Got == 0)
	{
		// Peer performed orderly shutdown
		State = ES_Initial;
		return false;
	}

	Buf.SetWritingPos(static_cast<size_t>(Got));
	if (bDataToRead)
	{
		*bDataToRead = true;
	}
	return true;
}

void NClientSocket::ListenThreadFunction()
{
	NBuffer RecvBuf{};
	Accum.Reset();
	while (bListening)
	{
		bool bDataToRead{};
		if (!Receive(RecvBuf, &bDataToRead))
		{
			break;
		}

		if (!bDataToRead)
		{
			pollfd Pfd{};
			Pfd.fd = SocketFd;
			Pfd.events = POLLIN;
			// Short timeout so Stop() and connection loss are noticed quickly
			poll(&Pfd, 1, 50);
			continue;
		}

		if (!Accum.Write(RecvBuf.GetData(), RecvBuf.GetWritePos()))
		{
			spdlog::error("Failed to buffer {} received bytes from {}", RecvBuf.GetWritePos(), Address);
			break;
		}

		bool bCorrupt{};
		while (Accum.GetReadableSize() >= sizeof(uint32_t))
		{
			uint32_t FrameLength = 0;
			std::memcpy(&FrameLength, Accum.PeekReadPtr(), sizeof(uint32_t));

			if (FrameLength > NETZKARTE_MAX_FRAME_LENGTH)
			{
				spdlog::error("Received frame of {} bytes from {}, closing connection", FrameLength, Address);
				bCorrupt = true;
				break;
			}

			if (Accum.GetReadableSize() < sizeof(uint32_t) + FrameLength)
			{
				break;
			}

			NBuffer Msg(FrameLength);
			Accum.Consume(sizeof(uint32_t));
			Msg.Write(Accum.PeekReadPtr(), FrameLength);
			Accum.Consume(FrameLength);
			OnData(Msg);
			if (!IsConnected())
			{
				// Closed by a slot, the rest of the stream is not wanted
				break;
			}
		}

		if (bCorrupt)
		{
			break;
		}
		Accum.Compact();
	}

	bool const bWasListening = bListening.exchange(false);
	{
		std::lock_guard Lock(FdMutex);
		bReaderAlive = false;
		// On connection loss nobody else is going to close the fd. A local StopListenThread()
		// leaves it to the owner, who may still want to send a goodbye.
		if (bWasListening)
		{
			ReleaseFdLocked();
		}
	}
	// Only report connection loss, not a local StopListenThread()
	if (bWasListening)
	{
		OnClosed();
	}
}

void NClientSocket::StartListenThread()
{
	if (bListening)
	{
		return;
	}
	{
		std::lock_guard Lock(FdMutex);
		bReaderAlive = true;
	}
	bListening = true;
	ListenThread = std::thread(&NClientSocket::ListenThreadFunction, this);
}

void NClientSocket::StopListenThread()
{
	bListening = false;
	if (ListenThread.joinable())
	{
		if (ListenThread.get_id() == std::this_thread::get_id())
		{
			// Called from a slot running on the listen thread itself
			ListenThread.detach();
			return;
		}
		ListenThread.join();
	}
}

bool NServerSocket::BindAndListen()
{
	addrinfo Hints{};
	Hints.ai_family = AF_UNSPEC;
	Hints.ai_socktype = SOCK_STREAM;
	Hints.ai_flags = AI_PASSIVE;

	addrinfo*         Result = nullptr;
	std::string const Service = std::to_string(Port);
	char const*       Node = Address.empty() ? nullptr : Address.c_str();
	if (int const Err = getaddrinfo(Node, Service.c_str(), &Hints, &Result); Err != 0)
	{
		spdlog::error("Failed to resolve listen address {}: {}", Address, gai_strerror(Err));
		return false;
	}

	for (addrinfo* Info = Result; Info != nullptr; Info = Info->ai_next)
	{
		SocketFd = socket(Info->ai_family, Info->ai_socktype, Info->ai_protocol);
		if (SocketFd < 0)
		{
			continue;
		}

		int const Yes = 1;
		setsockopt(SocketFd, SOL_SOCKET, SO_REUSEADDR, &Yes, sizeof(Yes));
		if (Info->ai_family == AF_INET6)
		{
			// Agents may connect over either family
			int const No = 0;
			setsockopt(SocketFd, IPPROTO_IPV6, IPV6_V6ONLY, &No, sizeof(No));
		}

		if (bind(SocketFd, Info->ai_addr, Info->ai_addrlen) == 0 && listen(SocketFd, SOMAXCONN) == 0)
		{
			break;
		}
		spdlog::debug("Failed to bind {}:{}: {} ({})", Address, Port, NErrnoUtil::StrError(), errno);
		close(SocketFd);
		SocketFd = -1;
	}
	freeaddrinfo(Result);

	if (SocketFd < 0)
	{
		return false;
	}

	sockaddr_storage Bound{};
	socklen_t        BoundLen = sizeof(Bound);
	if (getsockname(SocketFd, reinterpret_cast<sockaddr*>(&Bound), &BoundLen) == 0)
	{
		if (Bound.ss_family == AF_INET)
		{
			Port = ntohs(reinterpret_cast<sockaddr_in*>(&Bound)->sin_port);
		}
		else if (Bound.ss_family == AF_INET6)
		{
			Port = ntohs(reinterpret_cast<sockaddr_in6*>(&Bound)->sin6_port);
		}
	}
	return true;
}

std::shared_ptr<NClientSocket> NServerSocket::Accept(int TimeoutMs, bool* bTimedOut) const
{
	pollfd pfd{};
	pfd.fd = SocketFd;
	pfd.events = POLLIN;

	if (int const Ret = poll(&pfd, 1, TimeoutMs); Ret > 0)
	{
		if (pfd.revents & POLLIN)
		{
			sockaddr_storage Peer{};
			socklen_t        PeerLen = sizeof(Peer);
			int              ClientFd = accept(SocketFd, reinterpret_cast<sockaddr*>(&Peer), &PeerLen);
			if (ClientFd < 0)
			{
				return nullptr;
			}

			char PeerName[NI_MAXHOST]{};
			if (getnameinfo(reinterpret_cast<sockaddr*>(&Peer), PeerLen, PeerName, sizeof(PeerName), nullptr, 0,
					NI_NUMERICHOST)
				!= 0)
			{
				PeerName[0] = '\0';
			}
			return std::make_shared<NClientSocket>(ClientFd, std::string(PeerName));
		}
	}
	else if (Ret == 0 && bTimedOut)
	{
		*bTimedOut = true;
	}
	return nullptr;
}
