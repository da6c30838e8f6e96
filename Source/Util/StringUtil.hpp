/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Helpers for picking apart command output. Everything here is locale independent,
// the captures are expected to be made with LC_ALL=C anyway
class NStringUtil
{
public:
	static bool IsSpace(char C) { return C == ' ' || C == '\t' || C == '\r' || C == '\n' || C == '\v' || C == '\f'; }

	static std::string_view Trim(std::string_view Str)
	{
		while (!Str.empty() && IsSpace(Str.front()))
		{
			Str.remove_prefix(1);
		}
		while (!Str.empty() && IsSpace(Str.back()))
		{
			Str.remove_suffix(1);
		}
		return Str;
	}

	static std::string ToLower(std::string_view Str)
	{
		std::string Result(Str);
		std::ranges::transform(Result, Result.begin(), [](unsigned char C) { return static_cast<char>(std::tolower(C)); });
		return Result;
	}

	static bool StartsWith(std::string_view Str, std::string_view Prefix) { return Str.starts_with(Prefix); }

	static bool EqualsIgnoreCase(std::string_view A, std::string_view B)
	{
		return A.size() == B.size() && ToLower(A) == ToLower(B);
	}

	// Splits on runs of whitespace, empty fields are dropped
	static std::vector<std::string_view> SplitWhitespace(std::string_view Str)
	{
		std::vector<std::string_view> Fields{};
		size_t                        Pos = 0;
		while (Pos < Str.size())
		{
			while (Pos < Str.size() && IsSpace(Str[Pos]))
			{
				++Pos;
			}
			size_t const Start = Pos;
			while (Pos < Str.size() && !IsSpace(Str[Pos]))
			{
				++Pos;
			}
			if (Pos > Start)
			{
				Fields.emplace_back(Str.substr(Start, Pos - Start));
			}
		}
		return Fields;
	}

	static std::vector<std::string_view> Split(std::string_view Str, char Delimiter)
	{
		std::vector<std::string_view> Parts{};
		size_t                        Start = 0;
		while (true)
		{
			size_t const Pos = Str.find(Delimiter, Start);
			if (Pos == std::string_view::npos)
			{
				Parts.emplace_back(Str.substr(Start));
				break;
			}
			Parts.emplace_back(Str.substr(Start, Pos - Start));
			Start = Pos + 1;
		}
		return Parts;
	}

	// Splits text into lines, accepting both \n and \r\n
	static std::vector<std::string_view> SplitLines(std::string_view Text)
	{
		std::vector<std::string_view> Lines = Split(Text, '\n');
		for (auto& Line : Lines)
		{
			if (!Line.empty() && Line.back() == '\r')
			{
				Line.remove_suffix(1);
			}
		}
		if (!Lines.empty() && Lines.back().empty())
		{
			Lines.pop_back();
		}
		return Lines;
	}

	template <typename T>
	static std::optional<T> ParseNumber(std::string_view Str, int Base = 10)
	{
		Str = Trim(Str);
		if (Str.empty())
		{
			return std::nullopt;
		}
		T Value{};
		auto [Ptr, Ec] = std::from_chars(Str.data(), Str.data() + Str.size(), Value, Base);
		if (Ec != std::errc{} || Ptr != Str.data() + Str.size())
		{
			return std::nullopt;
		}
		return Value;
	}
};
