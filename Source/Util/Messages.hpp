/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/types/array.hpp>
#include <cereal/types/vector.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/archives/binary.hpp>
// ReSharper restore CppUnusedIncludeDirective

#include "Buffer.hpp"

// Frame payload: [int8 EMessageType][cereal binary archive]
enum EMessageType : int8_t
{
	MT_Invalid = -1,
	MT_Register,
	MT_CaptureRequest,
	MT_CaptureSnapshot,
	MT_Exit
};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

static EMessageType ReadMessageTypeFromBuffer(NBuffer& Buf)
{
	int8_t Type{};
	if (!Buf.Read(Type) || Type < MT_Register || Type > MT_Exit)
	{
		return MT_Invalid;
	}

	return static_cast<EMessageType>(Type);
}

#pragma GCC diagnostic pop

template <class T>
std::string EncodeMessage(EMessageType Type, T const& Data)
{
	std::stringstream Os{};
	Os.put(static_cast<char>(Type));
	{
		cereal::BinaryOutputArchive Archive(Os);
		Archive(Data);
	}
	return Os.str();
}

// Decodes the rest of the buffer (after the message type) into Out.
// Returns false on truncated or otherwise undecodable payloads.
template <class T>
bool DecodeMessage(NBuffer const& Buf, T& Out)
{
	std::stringstream Is(Buf.ReadableAsString());
	try
	{
		cereal::BinaryInputArchive Archive(Is);
		Archive(Out);
	}
	catch (std::exception const& e)
	{
		spdlog::debug("Failed to decode message payload: {}", e.what());
		return false;
	}
	return true;
}
