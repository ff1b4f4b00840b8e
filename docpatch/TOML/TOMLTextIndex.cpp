// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/TOML/TOMLTextIndex.h"
#include "docpatch/TOML/TOMLCodec.h"

#include "common/Console.h"
#include "common/StringUtil.h"

#include "fmt/format.h"

#include <algorithm>

static bool StartsWithPath(const std::vector<std::string>& path, const std::vector<std::string>& prefix)
{
	return (path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin()));
}

class TOMLScanner
{
public:
	TOMLScanner(std::string_view data, TOMLTextIndex& index);

	bool Scan(Error* error);

private:
	bool ScanHeader(Error* error);
	bool ScanKeyValue(Error* error);
	bool ParseKey(std::vector<std::string>* segments);
	bool ParseBasicString(std::string* out);

	size_t ScanValueEnd(size_t pos) const;
	size_t ScanStringEnd(size_t pos) const;
	size_t LineStart(size_t pos) const;

	void SkipSpaces();
	void SkipRestOfLine();
	bool Fail(Error* error, std::string_view what) const;

	std::string_view m_data;
	TOMLTextIndex& m_index;
	size_t m_pos = 0;

	std::vector<std::string> m_current_table;
	s32 m_current_section = -1;
};

TOMLScanner::TOMLScanner(std::string_view data, TOMLTextIndex& index)
	: m_data(data)
	, m_index(index)
{
}

bool TOMLScanner::Fail(Error* error, std::string_view what) const
{
	size_t line = 1;
	for (size_t i = 0; i < m_pos && i < m_data.size(); i++)
		line += (m_data[i] == '\n') ? 1 : 0;

	Error::SetParse(error, "TOML", fmt::format("{} (line {}, column {})", what, line, m_pos - LineStart(m_pos) + 1));
	return false;
}

size_t TOMLScanner::LineStart(size_t pos) const
{
	pos = std::min(pos, m_data.size());
	while (pos > 0 && m_data[pos - 1] != '\n')
		pos--;

	return pos;
}

void TOMLScanner::SkipSpaces()
{
	while (m_pos < m_data.size() && (m_data[m_pos] == ' ' || m_data[m_pos] == '\t'))
		m_pos++;
}

void TOMLScanner::SkipRestOfLine()
{
	// Whitespace and comments up to and including the newline.
	while (m_pos < m_data.size() && m_data[m_pos] != '\n')
		m_pos++;
	if (m_pos < m_data.size())
		m_pos++;
}

size_t TOMLScanner::ScanStringEnd(size_t pos) const
{
	const char quote = m_data[pos];
	const bool basic = (quote == '"');
	const std::string_view triple = basic ? std::string_view("\"\"\"") : std::string_view("'''");

	if (m_data.compare(pos, 3, triple) == 0)
	{
		size_t i = pos + 3;
		while (i < m_data.size())
		{
			if (basic && m_data[i] == '\\')
			{
				i += 2;
				continue;
			}

			if (m_data.compare(i, 3, triple) == 0)
			{
				// Up to two more quotes are part of the content.
				i += 3;
				for (u32 extra = 0; extra < 2 && i < m_data.size() && m_data[i] == quote; extra++)
					i++;

				return i;
			}

			i++;
		}

		return m_data.size();
	}

	size_t i = pos + 1;
	while (i < m_data.size() && m_data[i] != '\n')
	{
		if (basic && m_data[i] == '\\')
		{
			i += 2;
			continue;
		}

		if (m_data[i] == quote)
			return i + 1;

		i++;
	}

	return std::min(i, m_data.size());
}

size_t TOMLScanner::ScanValueEnd(size_t pos) const
{
	if (pos >= m_data.size())
		return pos;

	const char ch = m_data[pos];
	if (ch == '"' || ch == '\'')
		return ScanStringEnd(pos);

	if (ch == '[' || ch == '{')
	{
		const char close = (ch == '[') ? ']' : '}';
		size_t i = pos + 1;
		while (i < m_data.size())
		{
			const char c = m_data[i];
			if (c == close)
				return i + 1;

			if (c == '"' || c == '\'' || c == '[' || c == '{')
			{
				i = ScanValueEnd(i);
				continue;
			}

			if (c == '#')
			{
				while (i < m_data.size() && m_data[i] != '\n')
					i++;
				continue;
			}

			i++;
		}

		return m_data.size();
	}

	// Numbers, booleans and dates run to the comment or end of line. Dates may contain a space.
	size_t end = pos;
	while (end < m_data.size() && m_data[end] != '\n' && m_data[end] != '#')
		end++;
	while (end > pos && (m_data[end - 1] == ' ' || m_data[end - 1] == '\t' || m_data[end - 1] == '\r'))
		end--;

	return end;
}

bool TOMLScanner::ParseBasicString(std::string* out)
{
	// Opening quote already consumed.
	while (m_pos < m_data.size() && m_data[m_pos] != '"')
	{
		if (m_data[m_pos] == '\n')
			return false;

		if (m_data[m_pos] != '\\')
		{
			out->push_back(m_data[m_pos++]);
			continue;
		}

		if (++m_pos >= m_data.size())
			return false;

		const char escape = m_data[m_pos++];
		switch (escape)
		{
			case 'b': out->push_back('\b'); break;
			case 't': out->push_back('\t'); break;
			case 'n': out->push_back('\n'); break;
			case 'f': out->push_back('\f'); break;
			case 'r': out->push_back('\r'); break;
			case '"': out->push_back('"'); break;
			case '\\': out->push_back('\\'); break;

			case 'u':
			case 'U':
			{
				const size_t digits = (escape == 'u') ? 4 : 8;
				if (m_pos + digits > m_data.size())
					return false;

				const std::optional<u32> codepoint = StringUtil::FromChars<u32>(m_data.substr(m_pos, digits), 16);
				if (!codepoint.has_value())
					return false;

				StringUtil::EncodeAndAppendUTF8(*out, static_cast<char32_t>(codepoint.value()));
				m_pos += digits;
			}
			break;

			default:
				return false;
		}
	}

	if (m_pos >= m_data.size())
		return false;

	m_pos++;
	return true;
}

bool TOMLScanner::ParseKey(std::vector<std::string>* segments)
{
	for (;;)
	{
		SkipSpaces();
		if (m_pos >= m_data.size())
			return false;

		std::string segment;
		const char ch = m_data[m_pos];
		if (ch == '"')
		{
			m_pos++;
			if (!ParseBasicString(&segment))
				return false;
		}
		else if (ch == '\'')
		{
			const size_t end = m_data.find('\'', m_pos + 1);
			if (end == std::string_view::npos)
				return false;

			segment = std::string(m_data.substr(m_pos + 1, end - m_pos - 1));
			m_pos = end + 1;
		}
		else
		{
			const size_t start = m_pos;
			while (m_pos < m_data.size())
			{
				const char c = m_data[m_pos];
				if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_'))
					break;
				m_pos++;
			}

			if (m_pos == start)
				return false;

			segment = std::string(m_data.substr(start, m_pos - start));
		}

		segments->push_back(std::move(segment));

		SkipSpaces();
		if (m_pos < m_data.size() && m_data[m_pos] == '.')
		{
			m_pos++;
			continue;
		}

		return true;
	}
}

bool TOMLScanner::ScanHeader(Error* error)
{
	TOMLSection section;
	section.header_start = LineStart(m_pos);
	section.array_of_tables = (m_data.compare(m_pos, 2, "[[") == 0);
	m_pos += section.array_of_tables ? 2 : 1;

	if (!ParseKey(&section.path))
		return Fail(error, "invalid table header");

	SkipSpaces();
	const std::string_view close = section.array_of_tables ? std::string_view("]]") : std::string_view("]");
	if (m_data.compare(m_pos, close.size(), close) != 0)
		return Fail(error, "unterminated table header");

	m_pos += close.size();
	SkipRestOfLine();
	section.header_end = m_pos;
	section.content_end = m_pos;

	m_current_table = section.path;
	m_current_section = static_cast<s32>(m_index.m_sections.size());
	m_index.m_sections.push_back(std::move(section));
	return true;
}

bool TOMLScanner::ScanKeyValue(Error* error)
{
	TOMLKeyValue kv;
	kv.line_start = LineStart(m_pos);
	kv.section = m_current_section;

	std::vector<std::string> segments;
	if (!ParseKey(&segments))
		return Fail(error, "invalid key");

	SkipSpaces();
	if (m_pos >= m_data.size() || m_data[m_pos] != '=')
		return Fail(error, "expected '=' after key");

	m_pos++;
	SkipSpaces();

	kv.value_start = m_pos;
	kv.value_end = ScanValueEnd(m_pos);
	m_pos = kv.value_end;
	SkipRestOfLine();
	kv.line_end = m_pos;

	kv.key_segments = segments.size();
	kv.path = m_current_table;
	kv.path.insert(kv.path.end(), segments.begin(), segments.end());

	if (m_current_section >= 0)
		m_index.m_sections[m_current_section].content_end = kv.line_end;
	else
		m_index.m_root_content_end = kv.line_end;

	m_index.m_key_value_lookup[TOMLTextIndex::MakeLookupKey(kv.path)] = m_index.m_key_values.size();
	m_index.m_key_values.push_back(std::move(kv));
	return true;
}

bool TOMLScanner::Scan(Error* error)
{
	for (;;)
	{
		while (m_pos < m_data.size() &&
			   (m_data[m_pos] == ' ' || m_data[m_pos] == '\t' || m_data[m_pos] == '\r' || m_data[m_pos] == '\n'))
		{
			m_pos++;
		}

		if (m_pos >= m_data.size())
			break;

		const char ch = m_data[m_pos];
		if (ch == '#')
		{
			SkipRestOfLine();
			continue;
		}

		if (!((ch == '[') ? ScanHeader(error) : ScanKeyValue(error)))
			return false;
	}

	std::vector<TOMLSection>& sections = m_index.m_sections;
	for (size_t i = 0; i < sections.size(); i++)
		sections[i].end = (i + 1 < sections.size()) ? sections[i + 1].header_start : m_data.size();

	m_index.m_data_size = m_data.size();
	return true;
}

TOMLTextIndex::TOMLTextIndex() = default;

TOMLTextIndex::~TOMLTextIndex() = default;

std::string TOMLTextIndex::MakeLookupKey(const std::vector<std::string>& path)
{
	return StringUtil::JoinString(path.begin(), path.end(), '\0');
}

std::optional<TOMLTextIndex> TOMLTextIndex::Build(std::string_view data, Error* error)
{
	TOMLTextIndex index;
	TOMLScanner scanner(data, index);
	if (!scanner.Scan(error))
		return std::nullopt;

	TRACE_LOG("Indexed TOML buffer: {} sections, {} keys", index.m_sections.size(), index.m_key_values.size());
	return index;
}

const TOMLSection* TOMLTextIndex::FindSection(const std::vector<std::string>& path) const
{
	for (const TOMLSection& section : m_sections)
	{
		if (!section.array_of_tables && section.path == path)
			return &section;
	}

	return nullptr;
}

const TOMLSection* TOMLTextIndex::FindArrayOfTables(const std::vector<std::string>& path) const
{
	for (const TOMLSection& section : m_sections)
	{
		if (section.array_of_tables && StartsWithPath(path, section.path))
			return &section;
	}

	return nullptr;
}

const TOMLKeyValue* TOMLTextIndex::FindKeyValue(const std::vector<std::string>& path) const
{
	const auto it = m_key_value_lookup.find(MakeLookupKey(path));
	return (it != m_key_value_lookup.end()) ? &m_key_values[it->second] : nullptr;
}

const TOMLKeyValue* TOMLTextIndex::FindKeyValuePrefix(const std::vector<std::string>& path) const
{
	for (size_t length = 1; length < path.size(); length++)
	{
		const std::vector<std::string> prefix(path.begin(), path.begin() + length);
		if (const TOMLKeyValue* kv = FindKeyValue(prefix))
			return kv;
	}

	return nullptr;
}

bool TOMLTextIndex::HasTable(const std::vector<std::string>& path) const
{
	for (const TOMLSection& section : m_sections)
	{
		if (StartsWithPath(section.path, path))
			return true;
	}

	for (const TOMLKeyValue& kv : m_key_values)
	{
		if (kv.path.size() > path.size() && StartsWithPath(kv.path, path))
			return true;
	}

	return false;
}

TOMLTextIndex::InsertionPoint TOMLTextIndex::FindInsertionPoint(const std::vector<std::string>& table) const
{
	InsertionPoint ret;

	if (table.empty())
	{
		// After the last root key, otherwise before the first header.
		if (m_root_content_end != std::string_view::npos)
			ret.offset = m_root_content_end;
		else
			ret.offset = m_sections.empty() ? m_data_size : m_sections.front().header_start;

		return ret;
	}

	if (const TOMLSection* section = FindSection(table))
	{
		ret.offset = section->content_end;
		return ret;
	}

	// Table spelled as dotted keys, e.g. "tls.enabled = true" inside [server].
	const TOMLKeyValue* last = nullptr;
	for (const TOMLKeyValue& kv : m_key_values)
	{
		const size_t section_length = kv.path.size() - kv.key_segments;
		if (kv.path.size() > table.size() && section_length < table.size() && StartsWithPath(kv.path, table) &&
			(!last || kv.line_end > last->line_end))
		{
			last = &kv;
		}
	}

	if (last)
	{
		const size_t section_length = last->path.size() - last->key_segments;
		ret.offset = last->line_end;
		ret.key_prefix = TOMLCodec::FormatDottedKey(std::vector<std::string>(table.begin() + section_length, table.end()));
		ret.key_prefix.push_back('.');
		return ret;
	}

	ret.offset = m_data_size;
	ret.needs_header = true;
	return ret;
}
