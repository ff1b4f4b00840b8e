// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/Value.h"

#include "common/Assertions.h"

#include "fmt/format.h"

#include <cmath>
#include <iterator>

Value::Value() = default;

Value::Value(std::nullptr_t)
	: m_value(nullptr)
{
}

Value::Value(bool value)
	: m_value(value)
{
}

Value::Value(double value)
	: m_value(value)
{
}

Value::Value(const char* value)
	: m_value(std::string(value))
{
}

Value::Value(std::string_view value)
	: m_value(std::string(value))
{
}

Value::Value(std::string value)
	: m_value(std::move(value))
{
}

Value::Value(Array value)
	: m_value(std::move(value))
{
}

Value::Value(Object value)
	: m_value(std::move(value))
{
}

Value::Value(const Value& v) = default;

Value::Value(Value&& v) noexcept = default;

Value::~Value() = default;

Value& Value::operator=(const Value& v) = default;

Value& Value::operator=(Value&& v) noexcept = default;

bool Value::GetBool() const
{
	pxAssert(IsBool());
	return std::get<bool>(m_value);
}

s64 Value::GetInt() const
{
	pxAssert(IsInt());
	return std::get<s64>(m_value);
}

double Value::GetFloat() const
{
	if (IsInt())
		return static_cast<double>(std::get<s64>(m_value));

	pxAssert(IsFloat());
	return std::get<double>(m_value);
}

const std::string& Value::GetString() const
{
	pxAssert(IsString());
	return std::get<std::string>(m_value);
}

const Value::Array& Value::GetArray() const
{
	pxAssert(IsArray());
	return std::get<Array>(m_value);
}

Value::Array& Value::GetArray()
{
	pxAssert(IsArray());
	return std::get<Array>(m_value);
}

const Value::Object& Value::GetObject() const
{
	pxAssert(IsObject());
	return std::get<Object>(m_value);
}

Value::Object& Value::GetObject()
{
	pxAssert(IsObject());
	return std::get<Object>(m_value);
}

const Value* Value::Find(std::string_view key) const
{
	if (!IsObject())
		return nullptr;

	const Object& obj = std::get<Object>(m_value);
	const auto it = obj.find(key);
	return (it != obj.end()) ? &it->second : nullptr;
}

Value* Value::Find(std::string_view key)
{
	if (!IsObject())
		return nullptr;

	Object& obj = std::get<Object>(m_value);
	const auto it = obj.find(key);
	return (it != obj.end()) ? &it->second : nullptr;
}

bool Value::ContainsNull() const
{
	switch (GetType())
	{
		case Type::Null:
			return true;

		case Type::Array:
		{
			for (const Value& v : std::get<Array>(m_value))
			{
				if (v.ContainsNull())
					return true;
			}
			return false;
		}

		case Type::Object:
		{
			for (const auto& [key, v] : std::get<Object>(m_value))
			{
				if (v.ContainsNull())
					return true;
			}
			return false;
		}

		default:
			return false;
	}
}

static void AppendQuotedString(fmt::memory_buffer& buf, std::string_view str)
{
	buf.push_back('"');
	for (const char ch : str)
	{
		switch (ch)
		{
			case '"':
				buf.append(std::string_view("\\\""));
				break;
			case '\\':
				buf.append(std::string_view("\\\\"));
				break;
			case '\n':
				buf.append(std::string_view("\\n"));
				break;
			case '\t':
				buf.append(std::string_view("\\t"));
				break;
			default:
				buf.push_back(ch);
				break;
		}
	}
	buf.push_back('"');
}

static void AppendValueString(fmt::memory_buffer& buf, const Value& value)
{
	switch (value.GetType())
	{
		case Value::Type::Null:
			buf.append(std::string_view("null"));
			break;

		case Value::Type::Bool:
			buf.append(std::string_view(value.GetBool() ? "true" : "false"));
			break;

		case Value::Type::Int:
			fmt::format_to(std::back_inserter(buf), "{}", value.GetInt());
			break;

		case Value::Type::Float:
			fmt::format_to(std::back_inserter(buf), "{}", value.GetFloat());
			break;

		case Value::Type::String:
			AppendQuotedString(buf, value.GetString());
			break;

		case Value::Type::Array:
		{
			buf.push_back('[');
			bool first = true;
			for (const Value& v : value.GetArray())
			{
				if (!first)
					buf.push_back(',');
				first = false;
				AppendValueString(buf, v);
			}
			buf.push_back(']');
		}
		break;

		case Value::Type::Object:
		{
			buf.push_back('{');
			bool first = true;
			for (const auto& [key, v] : value.GetObject())
			{
				if (!first)
					buf.push_back(',');
				first = false;
				AppendQuotedString(buf, key);
				buf.push_back(':');
				AppendValueString(buf, v);
			}
			buf.push_back('}');
		}
		break;
	}
}

std::string Value::ToString() const
{
	fmt::memory_buffer buf;
	AppendValueString(buf, *this);
	return fmt::to_string(buf);
}

const char* Value::GetTypeName(Type type)
{
	static constexpr const char* s_type_names[] = {
		"null",
		"bool",
		"integer",
		"float",
		"string",
		"array",
		"object",
	};

	return s_type_names[static_cast<u32>(type)];
}

bool Value::operator==(const Value& v) const
{
	if (IsNumber() && v.IsNumber())
	{
		if (IsInt() && v.IsInt())
			return (GetInt() == v.GetInt());

		const double lhs = GetFloat();
		const double rhs = v.GetFloat();
		return (lhs == rhs || (std::isnan(lhs) && std::isnan(rhs)));
	}

	return (m_value == v.m_value);
}

bool Value::operator!=(const Value& v) const
{
	return !operator==(v);
}
