// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/TOML/TOMLDocument.h"
#include "docpatch/TOML/TOMLCodec.h"
#include "docpatch/TOML/TOMLTextIndex.h"

#include "common/Console.h"

#include "fmt/format.h"

#include <algorithm>
#include <iterator>
#include <utility>

static constexpr const char* NULL_NOT_SUPPORTED = "TOML does not support null values";
static constexpr const char* ARRAY_OF_TABLES_NOT_SUPPORTED = "arrays of tables cannot be edited by path";

static std::optional<TOMLTextIndex> BuildIndex(std::string_view data, Error* error)
{
	if (!TOMLCodec::Validate(data, error))
		return std::nullopt;

	return TOMLTextIndex::Build(data, error);
}

static size_t FindFirstArrayIndex(const JsonPointer::Path& keys)
{
	for (size_t i = 0; i < keys.size(); i++)
	{
		if (JsonPointer::IsArrayIndex(keys[i]))
			return i;
	}

	return keys.size();
}

/// Key-value pair holding the value at path, either exactly or as an enclosing inline value.
static const TOMLKeyValue* FindOwningKeyValue(const TOMLTextIndex& index, const JsonPointer::Path& path)
{
	if (const TOMLKeyValue* kv = index.FindKeyValue(path))
		return kv;

	return index.FindKeyValuePrefix(path);
}

static void ReplaceValueText(std::string& data, const TOMLKeyValue& kv, std::string_view text)
{
	data.replace(kv.value_start, kv.value_end - kv.value_start, text);
}

TOMLDocument::TOMLDocument() = default;

TOMLDocument::TOMLDocument(std::string data)
	: m_data(std::move(data))
{
}

TOMLDocument::~TOMLDocument() = default;

std::unique_ptr<TOMLDocument> TOMLDocument::Parse(std::string_view data, Error* error)
{
	if (!TOMLCodec::Validate(data, error))
		return {};

	return std::make_unique<TOMLDocument>(std::string(data));
}

DocumentFormat TOMLDocument::GetFormat() const
{
	return DocumentFormat::TOML;
}

std::optional<Value::Object> TOMLDocument::Get(std::string_view data, Error* error) const
{
	return TOMLCodec::Decode(data, error);
}

std::optional<std::string> TOMLDocument::Apply(std::string_view data, const PatchSet& patches, Error* error) const
{
	const std::optional<Value::Object> decoded = TOMLCodec::Decode(data, error);
	if (!decoded.has_value())
		return std::nullopt;

	// Nulls are rejected before anything is edited.
	if (const std::optional<std::string> null_path = TOMLCodec::FindNull(decoded.value(), {}); null_path.has_value())
	{
		Error::SetUnsupportedStructure(error, null_path.value(), NULL_NOT_SUPPORTED);
		return std::nullopt;
	}

	for (const Patch& patch : patches)
	{
		if (patch.op == PatchOp::Remove)
			continue;

		if (const std::optional<std::string> null_path = TOMLCodec::FindNull(patch.value, patch.path); null_path.has_value())
		{
			Error::SetUnsupportedStructure(error, null_path.value(), NULL_NOT_SUPPORTED);
			return std::nullopt;
		}
	}

	if (patches.empty())
		return TOMLCodec::Encode(decoded.value());

	std::string buffer(data);
	for (const Patch& patch : patches)
	{
		const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(patch.path);
		if (!keys.has_value() || keys->empty())
		{
			DEV_LOG("Skipping TOML {} patch with invalid path \"{}\"", GetPatchOpName(patch.op), patch.path);
			continue;
		}

		switch (patch.op)
		{
			case PatchOp::Add:
			case PatchOp::Replace:
			{
				if (!SetKeys(buffer, keys.value(), patch.value, error))
					return std::nullopt;
			}
			break;

			case PatchOp::Remove:
			{
				if (!DeleteKeys(buffer, keys.value(), error))
					return std::nullopt;
			}
			break;

			default:
				DEV_LOG("Skipping TOML patch with unknown op at \"{}\"", patch.path);
				break;
		}
	}

	return buffer;
}

std::optional<std::string> TOMLDocument::MarshalTestData(const Value::Object& data, Error* error) const
{
	if (const std::optional<std::string> null_path = TOMLCodec::FindNull(data, {}); null_path.has_value())
	{
		Error::SetUnsupportedStructure(error, null_path.value(), NULL_NOT_SUPPORTED);
		return std::nullopt;
	}

	return TOMLCodec::Encode(data);
}

std::optional<Value> TOMLDocument::Lookup(std::string_view path, Error* error) const
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return std::nullopt;

	std::optional<Value::Object> decoded = TOMLCodec::Decode(m_data, error);
	if (!decoded.has_value())
		return std::nullopt;

	if (keys->empty())
		return Value(std::move(decoded.value()));

	const Value* found = JsonPointer::GetByKeys(decoded.value(), keys.value());
	if (!found)
	{
		Error::SetPathNotFound(error, path);
		return std::nullopt;
	}

	return *found;
}

bool TOMLDocument::Set(std::string_view path, const Value& value, Error* error)
{
	const std::optional<JsonPointer::Path> keys = ParseWritePath(path, "set", error);
	if (!keys.has_value())
		return false;

	if (const std::optional<std::string> null_path = TOMLCodec::FindNull(value, path); null_path.has_value())
	{
		Error::SetUnsupportedStructure(error, null_path.value(), NULL_NOT_SUPPORTED);
		return false;
	}

	// Only commit the buffer once every step of the edit succeeded.
	std::string buffer(m_data);
	if (!SetKeys(buffer, keys.value(), value, error))
		return false;

	m_data = std::move(buffer);
	return true;
}

bool TOMLDocument::Delete(std::string_view path, Error* error)
{
	const std::optional<JsonPointer::Path> keys = ParseWritePath(path, "delete", error);
	if (!keys.has_value())
		return false;

	std::string buffer(m_data);
	if (!DeleteKeys(buffer, keys.value(), error))
		return false;

	m_data = std::move(buffer);
	return true;
}

bool TOMLDocument::SetKeys(std::string& data, const JsonPointer::Path& keys, const Value& value, Error* error)
{
	const std::optional<TOMLTextIndex> index = BuildIndex(data, error);
	if (!index.has_value())
		return false;

	const size_t first_index = FindFirstArrayIndex(keys);
	if (first_index == keys.size())
		return SetLeaf(data, index.value(), keys, value, error);

	if (first_index == 0)
	{
		Error::SetInvalidPath(error, JsonPointer::Build(keys), "path cannot start with an array index");
		return false;
	}

	// Array elements are edited on the parsed tree, and the owning value is written back as one line.
	const JsonPointer::Path container(keys.begin(), keys.begin() + first_index);
	if (index->FindArrayOfTables(container))
	{
		Error::SetUnsupportedStructure(error, JsonPointer::Build(container), ARRAY_OF_TABLES_NOT_SUPPORTED);
		return false;
	}

	const TOMLKeyValue* owner = FindOwningKeyValue(index.value(), container);
	if (!owner && index->HasTable(container))
	{
		Error::SetTypeMismatch(error, JsonPointer::Build(container), "array", Value::GetTypeName(Value::Type::Object));
		return false;
	}

	const std::optional<std::string> text = TOMLCodec::SetInValue(data, owner ? owner->path : container, keys, value, error);
	if (!text.has_value())
		return false;

	if (!owner)
		return InsertLeaf(data, index.value(), container, text.value(), error);

	ReplaceValueText(data, *owner, text.value());
	return true;
}

bool TOMLDocument::DeleteKeys(std::string& data, const JsonPointer::Path& keys, Error* error)
{
	const std::optional<TOMLTextIndex> index = BuildIndex(data, error);
	if (!index.has_value())
		return false;

	const size_t first_index = FindFirstArrayIndex(keys);
	if (first_index == 0)
	{
		Error::SetInvalidPath(error, JsonPointer::Build(keys), "path cannot start with an array index");
		return false;
	}

	if (first_index < keys.size())
	{
		const JsonPointer::Path container(keys.begin(), keys.begin() + first_index);
		if (index->FindArrayOfTables(container))
		{
			Error::SetUnsupportedStructure(error, JsonPointer::Build(container), ARRAY_OF_TABLES_NOT_SUPPORTED);
			return false;
		}

		const TOMLKeyValue* owner = FindOwningKeyValue(index.value(), container);
		if (!owner)
		{
			if (!index->HasTable(container))
				return true;

			Error::SetTypeMismatch(error, JsonPointer::Build(container), "array", Value::GetTypeName(Value::Type::Object));
			return false;
		}

		const std::optional<std::string> text = TOMLCodec::DeleteInValue(data, owner->path, keys, error);
		if (!text.has_value())
			return false;

		if (!text->empty())
			ReplaceValueText(data, *owner, text.value());

		return true;
	}

	if (index->FindArrayOfTables(keys))
	{
		Error::SetUnsupportedStructure(error, JsonPointer::Build(keys), ARRAY_OF_TABLES_NOT_SUPPORTED);
		return false;
	}

	if (const TOMLKeyValue* kv = index->FindKeyValue(keys))
	{
		data.erase(kv->line_start, kv->line_end - kv->line_start);
		return true;
	}

	if (const TOMLKeyValue* owner = index->FindKeyValuePrefix(keys))
	{
		const std::optional<std::string> text = TOMLCodec::DeleteInValue(data, owner->path, keys, error);
		if (!text.has_value())
			return false;

		if (!text->empty())
			ReplaceValueText(data, *owner, text.value());

		return true;
	}

	if (index->HasTable(keys))
		RemoveTable(data, index.value(), keys);

	return true;
}

bool TOMLDocument::SetLeaf(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys, const Value& value,
	Error* error)
{
	if (index.FindArrayOfTables(keys))
	{
		Error::SetUnsupportedStructure(error, JsonPointer::Build(keys), ARRAY_OF_TABLES_NOT_SUPPORTED);
		return false;
	}

	if (const TOMLKeyValue* kv = index.FindKeyValue(keys))
	{
		ReplaceValueText(data, *kv, TOMLCodec::FormatValue(value));
		return true;
	}

	// The path continues inside an inline table or replaces a scalar with one.
	if (const TOMLKeyValue* owner = index.FindKeyValuePrefix(keys))
	{
		const std::optional<std::string> text = TOMLCodec::SetInValue(data, owner->path, keys, value, error);
		if (!text.has_value())
			return false;

		ReplaceValueText(data, *owner, text.value());
		return true;
	}

	return InsertLeaf(data, index, keys, TOMLCodec::FormatValue(value), error);
}

bool TOMLDocument::InsertLeaf(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys,
	std::string_view value_text, Error* error)
{
	// Replacing a whole table, drop the old headers and dotted keys first.
	std::optional<TOMLTextIndex> rebuilt;
	const TOMLTextIndex* current = &index;
	if (index.HasTable(keys))
	{
		RemoveTable(data, index, keys);
		rebuilt = TOMLTextIndex::Build(data, error);
		if (!rebuilt.has_value())
			return false;

		current = &rebuilt.value();
	}

	const JsonPointer::Path table(keys.begin(), keys.end() - 1);
	TOMLTextIndex::InsertionPoint point = current->FindInsertionPoint(table);
	if (point.needs_header)
	{
		if (!data.empty() && data.back() != '\n')
			data.push_back('\n');

		const std::string header = TOMLCodec::FormatDottedKey(table);
		DEV_LOG("Adding TOML table [{}]", header);
		fmt::format_to(std::back_inserter(data), "[{}]\n", header);
		point.offset = data.size();
	}

	std::string line = fmt::format("{}{} = {}\n", point.key_prefix, TOMLCodec::FormatKey(keys.back()), value_text);
	if (point.offset > 0 && data[point.offset - 1] != '\n')
		line.insert(line.begin(), '\n');

	data.insert(point.offset, line);
	return true;
}

void TOMLDocument::RemoveTable(std::string& data, const TOMLTextIndex& index, const JsonPointer::Path& keys)
{
	std::vector<std::pair<size_t, size_t>> ranges;
	std::vector<bool> removed_sections(index.GetSections().size(), false);

	const std::vector<TOMLSection>& sections = index.GetSections();
	for (size_t i = 0; i < sections.size(); i++)
	{
		const TOMLSection& section = sections[i];
		if (section.path.size() >= keys.size() && std::equal(keys.begin(), keys.end(), section.path.begin()))
		{
			removed_sections[i] = true;
			ranges.emplace_back(section.header_start, section.end);
		}
	}

	for (const TOMLKeyValue& kv : index.GetKeyValues())
	{
		if (kv.section >= 0 && removed_sections[static_cast<size_t>(kv.section)])
			continue;

		if (kv.path.size() > keys.size() && std::equal(keys.begin(), keys.end(), kv.path.begin()))
			ranges.emplace_back(kv.line_start, kv.line_end);
	}

	// Back to front so earlier offsets stay valid.
	std::sort(ranges.begin(), ranges.end(), [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });
	for (const auto& [start, end] : ranges)
		data.erase(start, end - start);

	DEV_LOG("Removed TOML table {} ({} ranges)", JsonPointer::Build(keys), ranges.size());
}
