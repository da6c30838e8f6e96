/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

// Growable byte buffer with separate read and write cursors, used to accumulate
// partial reads from a stream socket until a full frame is available
class NBuffer
{
	std::vector<char> Data{};
	std::size_t       ReadPos{};
	std::size_t       WritePos{};

	bool EnsureCapacity(std::size_t Needed)
	{
		if (Needed <= Data.size())
		{
			return true;
		}
		if (Needed > Data.max_size())
		{
			return false;
		}

		std::size_t NewCap = !Data.empty() ? Data.size() : static_cast<std::size_t>(1024);
		while (NewCap < Needed)
		{
			if (NewCap > (std::numeric_limits<std::size_t>::max)() / 2)
			{
				NewCap = Needed;
				break;
			}
			NewCap *= 2;
		}
		Data.resize(NewCap);
		return true;
	}

public:
	explicit NBuffer(std::size_t Size = 1024) : Data(Size) {}

	[[nodiscard]] std::size_t GetSize() const { return Data.size(); }
	[[nodiscard]] std::size_t GetReadPos() const { return ReadPos; }
	[[nodiscard]] std::size_t GetWritePos() const { return WritePos; }
	[[nodiscard]] bool        HasDataToRead() const { return ReadPos < WritePos; }

	[[nodiscard]] std::size_t GetReadableSize() const { return WritePos - ReadPos; }
	[[nodiscard]] char const* PeekReadPtr() const { return Data.data() + ReadPos; }

	void Consume(std::size_t N)
	{
		ReadPos += std::min(N, GetReadableSize());
		if (ReadPos == WritePos)
		{
			Reset();
		}
	}

	// Moves unread data to the front so the accumulator doesn't grow forever
	void Compact()
	{
		if (ReadPos == 0 || ReadPos >= WritePos)
		{
			return;
		}
		std::size_t const Remaining = WritePos - ReadPos;
		std::memmove(Data.data(), Data.data() + ReadPos, Remaining);
		ReadPos = 0;
		WritePos = Remaining;
	}

	void SetWritingPos(std::size_t Pos)
	{
		if (Pos > Data.size() && !EnsureCapacity(Pos))
		{
			return;
		}
		WritePos = Pos;
		if (ReadPos > WritePos)
		{
			ReadPos = WritePos;
		}
	}

	std::size_t Read(char* Buf, std::size_t Len)
	{
		if (Buf == nullptr || Len == 0)
		{
			return 0;
		}

		std::size_t const N = std::min(Len, GetReadableSize());
		if (N > 0)
		{
			std::memcpy(Buf, Data.data() + ReadPos, N);
			ReadPos += N;
		}
		return N;
	}

	bool Write(char const* Buf, std::size_t BytesToWrite)
	{
		if (Buf == nullptr || BytesToWrite == 0)
		{
			return true;
		}

		if (BytesToWrite > (std::numeric_limits<std::size_t>::max)() - WritePos)
		{
			return false;
		}

		if (!EnsureCapacity(WritePos + BytesToWrite))
		{
			return false;
		}

		std::memcpy(Data.data() + WritePos, Buf, BytesToWrite);
		WritePos += BytesToWrite;
		return true;
	}

	bool Write(std::string const& Str) { return Write(Str.data(), Str.size()); }

	void Reset()
	{
		ReadPos = 0;
		WritePos = 0;
	}

	void Resize(std::size_t NewSize)
	{
		Data.resize(NewSize);
		if (WritePos > NewSize)
		{
			WritePos = NewSize;
		}
		if (ReadPos > WritePos)
		{
			ReadPos = WritePos;
		}
	}

	char*                     GetData() { return Data.data(); }
	[[nodiscard]] char const* GetData() const { return Data.data(); }

	// Unread bytes as a string, used to hand a frame payload to a cereal input archive
	[[nodiscard]] std::string ReadableAsString() const { return { PeekReadPtr(), GetReadableSize() }; }

	template <typename T>
	bool Write(T const& Value)
	{
		static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
		return Write(reinterpret_cast<char const*>(&Value), sizeof(T));
	}

	template <typename T>
	bool Read(T& Value)
	{
		static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
		return Read(reinterpret_cast<char*>(&Value), sizeof(T)) == sizeof(T);
	}
};
