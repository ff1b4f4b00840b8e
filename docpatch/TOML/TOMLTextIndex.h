// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct TOMLSection
{
	std::vector<std::string> path;

	/// Start of the header line, and the offset just past its newline.
	size_t header_start = 0;
	size_t header_end = 0;

	/// Start of the next header, or the end of the buffer.
	size_t end = 0;

	/// End of the last key-value line in the section, header_end if there is none.
	size_t content_end = 0;

	bool array_of_tables = false;
};

struct TOMLKeyValue
{
	/// Fully-qualified path, the section path followed by the dotted key.
	std::vector<std::string> path;

	/// Number of segments spelled out on the line itself.
	size_t key_segments = 0;

	/// Owning section, or -1 for keys before the first header.
	s32 section = -1;

	/// Whole line(s) including the newline, and the value without trailing comment or whitespace.
	size_t line_start = 0;
	size_t line_end = 0;
	size_t value_start = 0;
	size_t value_end = 0;
};

/// Byte offsets of the tables and key-value pairs in a TOML buffer. Built from scratch for every
/// edit, the buffer is expected to have been validated by the parser first.
class TOMLTextIndex
{
public:
	struct InsertionPoint
	{
		size_t offset = 0;

		/// Dotted prefix to write before the new key when the table only exists as dotted keys.
		std::string key_prefix;

		/// The table doesn't exist and needs a header at the end of the buffer.
		bool needs_header = false;
	};

	TOMLTextIndex();
	~TOMLTextIndex();

	static std::optional<TOMLTextIndex> Build(std::string_view data, Error* error);

	__fi const std::vector<TOMLSection>& GetSections() const { return m_sections; }
	__fi const std::vector<TOMLKeyValue>& GetKeyValues() const { return m_key_values; }

	/// Standard table with exactly this path.
	const TOMLSection* FindSection(const std::vector<std::string>& path) const;

	/// Array-of-tables section whose path is a prefix of (or equal to) the given path.
	const TOMLSection* FindArrayOfTables(const std::vector<std::string>& path) const;

	/// Key-value pair with exactly this path.
	const TOMLKeyValue* FindKeyValue(const std::vector<std::string>& path) const;

	/// Key-value pair whose path is a proper prefix of the given path, i.e. the path continues
	/// inside an inline table or array.
	const TOMLKeyValue* FindKeyValuePrefix(const std::vector<std::string>& path) const;

	/// True if any header or dotted key lives below the path.
	bool HasTable(const std::vector<std::string>& path) const;

	/// Where a new key belongs for the given table path.
	InsertionPoint FindInsertionPoint(const std::vector<std::string>& table) const;

private:
	friend class TOMLScanner;

	static std::string MakeLookupKey(const std::vector<std::string>& path);

	std::vector<TOMLSection> m_sections;
	std::vector<TOMLKeyValue> m_key_values;
	std::map<std::string, size_t> m_key_value_lookup;

	size_t m_root_content_end = std::string_view::npos;
	size_t m_data_size = 0;
};
