/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Minimal RFC 4180 reader/writer, one record per line (no embedded newlines)
class NCsv
{
public:
	using NRow = std::vector<std::string>;

	// Returns nullopt for an unterminated quoted field
	static std::optional<NRow> ParseLine(std::string_view Line)
	{
		NRow        Fields{};
		std::string Current{};
		bool        bInQuotes{};
		bool        bWasQuoted{};

		for (size_t i = 0; i < Line.size(); ++i)
		{
			char const C = Line[i];
			if (bInQuotes)
			{
				if (C == '"')
				{
					if (i + 1 < Line.size() && Line[i + 1] == '"')
					{
						Current.push_back('"');
						++i;
					}
					else
					{
						bInQuotes = false;
					}
				}
				else
				{
					Current.push_back(C);
				}
				continue;
			}

			if (C == '"' && !bWasQuoted && Current.find_first_not_of(" \t") == std::string::npos)
			{
				Current.clear();
				bInQuotes = true;
				bWasQuoted = true;
			}
			else if (C == ',')
			{
				Fields.push_back(std::move(Current));
				Current.clear();
				bWasQuoted = false;
			}
			else if (!bWasQuoted)
			{
				Current.push_back(C);
			}
		}

		if (bInQuotes)
		{
			return std::nullopt;
		}
		Fields.push_back(std::move(Current));
		return Fields;
	}

	static std::string EscapeField(std::string_view Field)
	{
		if (Field.find_first_of(",\"\r\n") == std::string_view::npos)
		{
			return std::string(Field);
		}

		std::string Escaped = "\"";
		for (char const C : Field)
		{
			if (C == '"')
			{
				Escaped.push_back('"');
			}
			Escaped.push_back(C);
		}
		Escaped.push_back('"');
		return Escaped;
	}

	static std::string FormatRow(NRow const& Row)
	{
		std::string Line{};
		for (size_t i = 0; i < Row.size(); ++i)
		{
			if (i > 0)
			{
				Line.push_back(',');
			}
			Line += EscapeField(Row[i]);
		}
		Line.push_back('\n');
		return Line;
	}
};
