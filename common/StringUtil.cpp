// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "StringUtil.h"

#include <cctype>

namespace StringUtil
{
	bool IsAllDigits(const std::string_view str)
	{
		if (str.empty())
			return false;

		for (const char ch : str)
		{
			if (ch < '0' || ch > '9')
				return false;
		}

		return true;
	}

	std::string_view StripWhitespace(const std::string_view str)
	{
		std::string_view::size_type start = 0;
		while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start])))
			start++;
		if (start == str.size())
			return {};

		std::string_view::size_type end = str.size() - 1;
		while (end > start && std::isspace(static_cast<unsigned char>(str[end])))
			end--;

		return str.substr(start, end - start + 1);
	}

	std::string ReplaceAll(const std::string_view subject, const std::string_view search, const std::string_view replacement)
	{
		std::string ret(subject);
		ReplaceAll(&ret, search, replacement);
		return ret;
	}

	void ReplaceAll(std::string* subject, const std::string_view search, const std::string_view replacement)
	{
		if (!subject->empty())
		{
			std::string::size_type start_pos = 0;
			while ((start_pos = subject->find(search, start_pos)) != std::string::npos)
			{
				subject->replace(start_pos, search.length(), replacement);
				start_pos += replacement.length();
			}
		}
	}

	void EncodeAndAppendUTF8(std::string& s, char32_t ch)
	{
		if (ch <= 0x7F)
		{
			s.push_back(static_cast<char>(static_cast<u8>(ch)));
		}
		else if (ch <= 0x07FF)
		{
			s.push_back(static_cast<char>(static_cast<u8>(0xc0 | static_cast<u8>((ch >> 6) & 0x1f))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>((ch & 0x3f)))));
		}
		else if (ch <= 0xFFFF)
		{
			s.push_back(static_cast<char>(static_cast<u8>(0xe0 | static_cast<u8>(((ch >> 12) & 0x0f)))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>(((ch >> 6) & 0x3f)))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>((ch & 0x3f)))));
		}
		else if (ch <= 0x10FFFF)
		{
			s.push_back(static_cast<char>(static_cast<u8>(0xf0 | static_cast<u8>(((ch >> 18) & 0x07)))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>(((ch >> 12) & 0x3f)))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>(((ch >> 6) & 0x3f)))));
			s.push_back(static_cast<char>(static_cast<u8>(0x80 | static_cast<u8>((ch & 0x3f)))));
		}
		else
		{
			s.push_back(static_cast<char>(0xefu));
			s.push_back(static_cast<char>(0xbfu));
			s.push_back(static_cast<char>(0xbdu));
		}
	}
} // namespace StringUtil
