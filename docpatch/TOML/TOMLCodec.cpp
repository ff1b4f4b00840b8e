// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/TOML/TOMLCodec.h"
#include "docpatch/JsonPointer.h"

#include "common/StringUtil.h"

#include "fmt/format.h"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <iterator>
#include <sstream>

static Value FromTOML(const toml::node& node);

static std::string FormatDate(const toml::date& date)
{
	return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
}

static std::string FormatTime(const toml::time& time)
{
	std::string ret = fmt::format("{:02}:{:02}:{:02}", time.hour, time.minute, time.second);
	if (time.nanosecond != 0)
	{
		std::string fraction = fmt::format("{:09}", time.nanosecond);
		while (!fraction.empty() && fraction.back() == '0')
			fraction.pop_back();

		ret.push_back('.');
		ret.append(fraction);
	}

	return ret;
}

static std::string FormatDateTime(const toml::date_time& dt)
{
	std::string ret = fmt::format("{}T{}", FormatDate(dt.date), FormatTime(dt.time));
	if (dt.offset.has_value())
	{
		const int minutes = dt.offset->minutes;
		if (minutes == 0)
			ret.push_back('Z');
		else
			fmt::format_to(std::back_inserter(ret), "{}{:02}:{:02}", (minutes < 0) ? '-' : '+', std::abs(minutes) / 60, std::abs(minutes) % 60);
	}

	return ret;
}

static Value::Object FromTOMLTable(const toml::table& table)
{
	Value::Object ret;
	for (auto&& [key, node] : table)
		ret.emplace(std::string(key.str()), FromTOML(node));

	return ret;
}

static Value FromTOML(const toml::node& node)
{
	switch (node.type())
	{
		case toml::node_type::table:
			return Value(FromTOMLTable(*node.as_table()));

		case toml::node_type::array:
		{
			Value::Array ret;
			for (const toml::node& item : *node.as_array())
				ret.push_back(FromTOML(item));

			return Value(std::move(ret));
		}

		case toml::node_type::string:
			return Value(node.as_string()->get());

		case toml::node_type::integer:
			return Value(static_cast<s64>(node.as_integer()->get()));

		case toml::node_type::floating_point:
			return Value(node.as_floating_point()->get());

		case toml::node_type::boolean:
			return Value(node.as_boolean()->get());

		case toml::node_type::date:
			return Value(FormatDate(node.as_date()->get()));

		case toml::node_type::time:
			return Value(FormatTime(node.as_time()->get()));

		case toml::node_type::date_time:
			return Value(FormatDateTime(node.as_date_time()->get()));

		case toml::node_type::none:
		default:
			return Value();
	}
}

static std::optional<toml::table> ParseTable(std::string_view data, Error* error)
{
	toml::parse_result result = toml::parse(data);
	if (!result)
	{
		const toml::parse_error& err = result.error();
		Error::SetParse(error, "TOML",
			fmt::format("{} (line {}, column {})", err.description(), err.source().begin.line, err.source().begin.column));
		return std::nullopt;
	}

	return std::move(result).table();
}

std::optional<Value::Object> TOMLCodec::Decode(std::string_view data, Error* error)
{
	if (StringUtil::StripWhitespace(data).empty())
		return Value::Object();

	const std::optional<toml::table> table = ParseTable(data, error);
	if (!table.has_value())
		return std::nullopt;

	return FromTOMLTable(table.value());
}

bool TOMLCodec::Validate(std::string_view data, Error* error)
{
	return ParseTable(data, error).has_value();
}

static void InsertValue(toml::table& table, std::string_view key, const Value& value, bool inline_tables);

static void InsertElement(toml::array& array, toml::array::const_iterator pos, const Value& value, bool inline_tables)
{
	switch (value.GetType())
	{
		case Value::Type::Bool:
			array.insert(pos, value.GetBool());
			break;

		case Value::Type::Int:
			array.insert(pos, static_cast<int64_t>(value.GetInt()));
			break;

		case Value::Type::Float:
			array.insert(pos, value.GetFloat());
			break;

		case Value::Type::String:
			array.insert(pos, value.GetString());
			break;

		case Value::Type::Array:
		{
			toml::array nested;
			for (const Value& item : value.GetArray())
				InsertElement(nested, nested.cend(), item, inline_tables);
			array.insert(pos, std::move(nested));
		}
		break;

		case Value::Type::Object:
		{
			// Tables inside arrays are written inline, or as [[array]] sections when the first one isn't.
			toml::table nested;
			nested.is_inline(inline_tables);
			for (const auto& [key, item] : value.GetObject())
				InsertValue(nested, key, item, inline_tables);
			array.insert(pos, std::move(nested));
		}
		break;

		case Value::Type::Null:
		default:
			break;
	}
}

static void InsertValue(toml::table& table, std::string_view key, const Value& value, bool inline_tables)
{
	switch (value.GetType())
	{
		case Value::Type::Bool:
			table.insert_or_assign(key, value.GetBool());
			break;

		case Value::Type::Int:
			table.insert_or_assign(key, static_cast<int64_t>(value.GetInt()));
			break;

		case Value::Type::Float:
			table.insert_or_assign(key, value.GetFloat());
			break;

		case Value::Type::String:
			table.insert_or_assign(key, value.GetString());
			break;

		case Value::Type::Array:
		{
			toml::array nested;
			for (const Value& item : value.GetArray())
				InsertElement(nested, nested.cend(), item, inline_tables);
			table.insert_or_assign(key, std::move(nested));
		}
		break;

		case Value::Type::Object:
		{
			toml::table nested;
			nested.is_inline(inline_tables);
			for (const auto& [nested_key, item] : value.GetObject())
				InsertValue(nested, nested_key, item, inline_tables);
			table.insert_or_assign(key, std::move(nested));
		}
		break;

		// TOML has no null, callers reject it first.
		case Value::Type::Null:
		default:
			break;
	}
}

std::string TOMLCodec::Encode(const Value::Object& data)
{
	toml::table table;
	for (const auto& [key, value] : data)
		InsertValue(table, key, value, false);

	std::ostringstream ss;
	ss << toml::toml_formatter(table, toml::format_flags::allow_unicode_strings);

	std::string ret = ss.str();
	if (!ret.empty() && ret.back() != '\n')
		ret.push_back('\n');

	return ret;
}

// Values are written on one line, so the formatter's own array wrapping is never used. Integers
// keep the base they were parsed with.
static constexpr toml::format_flags VALUE_FORMAT_FLAGS = toml::format_flags::allow_unicode_strings |
	toml::format_flags::allow_binary_integers | toml::format_flags::allow_octal_integers |
	toml::format_flags::allow_hexadecimal_integers;

static std::string FormatNode(const toml::node& node)
{
	switch (node.type())
	{
		case toml::node_type::table:
		{
			const toml::table& table = *node.as_table();
			if (table.empty())
				return "{}";

			std::string ret("{ ");
			bool first = true;
			for (auto&& [key, child] : table)
			{
				if (!first)
					ret.append(", ");

				first = false;
				fmt::format_to(std::back_inserter(ret), "{} = {}", TOMLCodec::FormatKey(key.str()), FormatNode(child));
			}

			ret.append(" }");
			return ret;
		}

		case toml::node_type::array:
		{
			const toml::array& array = *node.as_array();
			if (array.empty())
				return "[]";

			std::string ret("[ ");
			for (size_t i = 0; i < array.size(); i++)
			{
				if (i > 0)
					ret.append(", ");
				ret.append(FormatNode(*array.get(i)));
			}

			ret.append(" ]");
			return ret;
		}

		default:
		{
			std::ostringstream ss;
			ss << toml::toml_formatter(node, VALUE_FORMAT_FLAGS);
			return std::string(StringUtil::StripWhitespace(ss.str()));
		}
	}
}

std::string TOMLCodec::FormatValue(const Value& value)
{
	toml::table table;
	InsertValue(table, "value", value, true);

	const toml::node* node = table.get("value");
	return node ? FormatNode(*node) : std::string();
}

static const char* GetNodeTypeName(const toml::node& node)
{
	switch (node.type())
	{
		case toml::node_type::table:
			return Value::GetTypeName(Value::Type::Object);
		case toml::node_type::array:
			return Value::GetTypeName(Value::Type::Array);
		case toml::node_type::integer:
			return Value::GetTypeName(Value::Type::Int);
		case toml::node_type::floating_point:
			return Value::GetTypeName(Value::Type::Float);
		case toml::node_type::boolean:
			return Value::GetTypeName(Value::Type::Bool);

		// Dates and times read back as text.
		default:
			return Value::GetTypeName(Value::Type::String);
	}
}

static const toml::node* FindNode(const toml::table& root, const JsonPointer::Path& keys)
{
	const toml::node* node = &root;
	for (const std::string& key : keys)
	{
		const toml::table* table = node->as_table();
		node = table ? table->get(key) : nullptr;
		if (!node)
			return nullptr;
	}

	return node;
}

static void InsertEmptyContainer(toml::table& table, std::string_view key, std::string_view next_key)
{
	if (JsonPointer::IsArrayIndex(next_key))
	{
		table.insert_or_assign(key, toml::array());
	}
	else
	{
		toml::table nested;
		nested.is_inline(true);
		table.insert_or_assign(key, std::move(nested));
	}
}

static void AppendEmptyContainer(toml::array& array, std::string_view next_key)
{
	if (JsonPointer::IsArrayIndex(next_key))
	{
		array.push_back(toml::array());
	}
	else
	{
		toml::table nested;
		nested.is_inline(true);
		array.push_back(std::move(nested));
	}
}

static std::string FormatOwner(const toml::table& root, const JsonPointer::Path& owner)
{
	const toml::node* node = FindNode(root, owner);
	return node ? FormatNode(*node) : std::string();
}

std::optional<std::string> TOMLCodec::SetInValue(std::string_view data, const JsonPointer::Path& owner,
	const JsonPointer::Path& keys, const Value& value, Error* error)
{
	std::optional<toml::table> root = ParseTable(data, error);
	if (!root.has_value())
		return std::nullopt;

	toml::node* current = &root.value();
	for (size_t i = 0; i < keys.size(); i++)
	{
		const std::string& key = keys[i];
		const bool last = (i + 1 == keys.size());
		toml::node* child;

		if (toml::array* array = current->as_array())
		{
			const std::optional<size_t> index = JsonPointer::ParseArrayIndex(key);
			if (!index.has_value())
			{
				Error::SetInvalidPath(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1),
					fmt::format("invalid array index: \"{}\"", key));
				return std::nullopt;
			}

			if (index.value() > array->size())
			{
				Error::SetUnsupportedStructure(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1),
					"TOML arrays cannot be extended with gaps");
				return std::nullopt;
			}

			if (last)
			{
				if (index.value() < array->size())
					array->erase(array->cbegin() + static_cast<ptrdiff_t>(index.value()));

				InsertElement(*array, array->cbegin() + static_cast<ptrdiff_t>(index.value()), value, true);
				break;
			}

			if (index.value() == array->size())
				AppendEmptyContainer(*array, keys[i + 1]);

			child = array->get(index.value());
		}
		else
		{
			toml::table& table = *current->as_table();
			if (last)
			{
				InsertValue(table, key, value, true);
				break;
			}

			child = table.get(key);
			if (!child)
			{
				InsertEmptyContainer(table, key, keys[i + 1]);
				child = table.get(key);
			}
		}

		// The next segment decides which container the child has to be.
		const std::string& next_key = keys[i + 1];
		if (JsonPointer::IsArrayIndex(next_key))
		{
			if (!child->is_array())
			{
				Error::SetTypeMismatch(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1), "array",
					GetNodeTypeName(*child));
				return std::nullopt;
			}
		}
		else if (!child->is_table())
		{
			if (current->is_array())
			{
				Error::SetTypeMismatch(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1), "object",
					GetNodeTypeName(*child));
				return std::nullopt;
			}

			// Below a scalar, the scalar is replaced by a table.
			toml::table& table = *current->as_table();
			InsertEmptyContainer(table, key, next_key);
			child = table.get(key);
		}

		current = child;
	}

	return FormatOwner(root.value(), owner);
}

std::optional<std::string> TOMLCodec::DeleteInValue(std::string_view data, const JsonPointer::Path& owner,
	const JsonPointer::Path& keys, Error* error)
{
	std::optional<toml::table> root = ParseTable(data, error);
	if (!root.has_value())
		return std::nullopt;

	// Only the segment that first indexes an array must find one, deeper mismatches are misses.
	size_t first_index = keys.size();
	for (size_t i = 0; i < keys.size(); i++)
	{
		if (JsonPointer::IsArrayIndex(keys[i]))
		{
			first_index = i;
			break;
		}
	}

	toml::node* current = &root.value();
	for (size_t i = 0; i < keys.size(); i++)
	{
		const std::string& key = keys[i];
		const bool last = (i + 1 == keys.size());
		toml::node* child;

		if (toml::array* array = current->as_array())
		{
			const std::optional<size_t> index = JsonPointer::ParseArrayIndex(key);
			if (!index.has_value() || index.value() >= array->size())
				return std::string();

			if (last)
			{
				array->erase(array->cbegin() + static_cast<ptrdiff_t>(index.value()));
				break;
			}

			child = array->get(index.value());
		}
		else
		{
			toml::table& table = *current->as_table();
			if (last)
			{
				if (table.erase(key) == 0)
					return std::string();

				break;
			}

			child = table.get(key);
			if (!child)
				return std::string();
		}

		if (JsonPointer::IsArrayIndex(keys[i + 1]))
		{
			if (!child->is_array())
			{
				if (i + 1 != first_index)
					return std::string();

				Error::SetTypeMismatch(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1), "array",
					GetNodeTypeName(*child));
				return std::nullopt;
			}
		}
		else if (!child->is_table())
		{
			return std::string();
		}

		current = child;
	}

	return FormatOwner(root.value(), owner);
}

static bool IsBareKey(std::string_view key)
{
	if (key.empty())
		return false;

	for (const char ch : key)
	{
		if (!((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '_'))
			return false;
	}

	return true;
}

std::string TOMLCodec::FormatKey(std::string_view key)
{
	if (IsBareKey(key))
		return std::string(key);

	return FormatValue(Value(key));
}

std::string TOMLCodec::FormatDottedKey(const std::vector<std::string>& keys)
{
	std::string ret;
	for (const std::string& key : keys)
	{
		if (!ret.empty())
			ret.push_back('.');
		ret.append(FormatKey(key));
	}

	return ret;
}

std::optional<std::string> TOMLCodec::FindNull(const Value& value, std::string_view base)
{
	switch (value.GetType())
	{
		case Value::Type::Null:
			return std::string(base);

		case Value::Type::Array:
		{
			const Value::Array& array = value.GetArray();
			for (size_t i = 0; i < array.size(); i++)
			{
				if (std::optional<std::string> path = FindNull(array[i], fmt::format("{}/{}", base, i)))
					return path;
			}

			return std::nullopt;
		}

		case Value::Type::Object:
			return FindNull(value.GetObject(), base);

		default:
			return std::nullopt;
	}
}

std::optional<std::string> TOMLCodec::FindNull(const Value::Object& data, std::string_view base)
{
	for (const auto& [key, value] : data)
	{
		if (std::optional<std::string> path = FindNull(value, fmt::format("{}/{}", base, JsonPointer::Escape(key))))
			return path;
	}

	return std::nullopt;
}
