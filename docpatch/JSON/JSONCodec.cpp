// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JSON/JSONCodec.h"
#include "docpatch/JsonPointer.h"

#include "common/StringUtil.h"

#include "fmt/format.h"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cmath>
#include <iterator>

static Value FromRapidJSON(const rapidjson::Value& value)
{
	switch (value.GetType())
	{
		case rapidjson::kNullType:
			return Value();

		case rapidjson::kFalseType:
			return Value(false);

		case rapidjson::kTrueType:
			return Value(true);

		case rapidjson::kStringType:
			return Value(std::string(value.GetString(), value.GetStringLength()));

		case rapidjson::kNumberType:
		{
			if (value.IsInt64())
				return Value(static_cast<s64>(value.GetInt64()));
			else
				return Value(value.GetDouble());
		}

		case rapidjson::kArrayType:
		{
			Value::Array arr;
			arr.reserve(value.Size());
			for (const rapidjson::Value& element : value.GetArray())
				arr.push_back(FromRapidJSON(element));
			return Value(std::move(arr));
		}

		case rapidjson::kObjectType:
		{
			Value::Object obj;
			for (const auto& member : value.GetObject())
			{
				// Duplicate keys: the last one wins, as with most decoders.
				obj.insert_or_assign(std::string(member.name.GetString(), member.name.GetStringLength()),
					FromRapidJSON(member.value));
			}
			return Value(std::move(obj));
		}

		default:
			return Value();
	}
}

static void GetLineAndColumn(std::string_view data, size_t offset, size_t* line, size_t* column)
{
	*line = 1;
	*column = 1;
	for (size_t i = 0; i < offset && i < data.size(); i++)
	{
		if (data[i] == '\n')
		{
			(*line)++;
			*column = 1;
		}
		else
		{
			(*column)++;
		}
	}
}

template <unsigned ParseFlags>
static std::optional<Value> DecodeWithFlags(std::string_view data, Error* error)
{
	rapidjson::Document doc;
	doc.Parse<ParseFlags>(data.data(), data.size());
	if (doc.HasParseError())
	{
		size_t line, column;
		GetLineAndColumn(data, doc.GetErrorOffset(), &line, &column);
		Error::SetStringFmt(error, "{} (line {}, column {})", rapidjson::GetParseError_En(doc.GetParseError()), line, column);
		return std::nullopt;
	}

	return FromRapidJSON(doc);
}

std::optional<Value> JSONCodec::Decode(std::string_view data, Dialect dialect, Error* error)
{
	if (dialect == Dialect::Relaxed)
	{
		return DecodeWithFlags<rapidjson::kParseFullPrecisionFlag | rapidjson::kParseCommentsFlag |
							   rapidjson::kParseTrailingCommasFlag>(data, error);
	}
	else
	{
		return DecodeWithFlags<rapidjson::kParseFullPrecisionFlag>(data, error);
	}
}

std::optional<Value::Object> JSONCodec::DecodeObject(std::string_view data, Dialect dialect, const char* format_name, Error* error)
{
	if (StringUtil::StripWhitespace(data).empty())
		return Value::Object();

	Error parse_error;
	std::optional<Value> root = Decode(data, dialect, &parse_error);
	if (!root.has_value())
	{
		Error::SetParse(error, format_name, parse_error.GetDescription());
		return std::nullopt;
	}

	if (!root->IsObject())
	{
		Error::SetUnsupportedStructure(error, "", fmt::format("{} root must be an object, got {}", format_name, root->GetTypeName()));
		return std::nullopt;
	}

	return std::move(root->GetObject());
}

template <typename Writer>
static bool WriteValue(Writer& writer, const Value& value, std::string& path, Error* error)
{
	switch (value.GetType())
	{
		case Value::Type::Null:
			return writer.Null();

		case Value::Type::Bool:
			return writer.Bool(value.GetBool());

		case Value::Type::Int:
			return writer.Int64(value.GetInt());

		case Value::Type::Float:
		{
			const double d = value.GetFloat();
			if (!std::isfinite(d))
			{
				Error::SetUnsupportedStructure(error, path, fmt::format("JSON cannot represent the float {}", d));
				return false;
			}

			return writer.Double(d);
		}

		case Value::Type::String:
		{
			const std::string& str = value.GetString();
			return writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
		}

		case Value::Type::Array:
		{
			if (!writer.StartArray())
				return false;

			const size_t path_length = path.size();
			const Value::Array& arr = value.GetArray();
			for (size_t i = 0; i < arr.size(); i++)
			{
				fmt::format_to(std::back_inserter(path), "/{}", i);
				if (!WriteValue(writer, arr[i], path, error))
					return false;
				path.resize(path_length);
			}

			return writer.EndArray(static_cast<rapidjson::SizeType>(arr.size()));
		}

		case Value::Type::Object:
		{
			if (!writer.StartObject())
				return false;

			const size_t path_length = path.size();
			const Value::Object& obj = value.GetObject();
			for (const auto& [key, member] : obj)
			{
				if (!writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size())))
					return false;

				path.push_back('/');
				path.append(JsonPointer::Escape(key));
				if (!WriteValue(writer, member, path, error))
					return false;
				path.resize(path_length);
			}

			return writer.EndObject(static_cast<rapidjson::SizeType>(obj.size()));
		}

		default:
			return false;
	}
}

std::optional<std::string> JSONCodec::Encode(const Value& value, bool pretty, Error* error)
{
	rapidjson::StringBuffer buffer;
	std::string path;
	bool result;
	Error write_error;
	if (pretty)
	{
		rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
		writer.SetIndent(' ', 2);
		result = WriteValue(writer, value, path, &write_error);
	}
	else
	{
		rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
		result = WriteValue(writer, value, path, &write_error);
	}

	if (!result)
	{
		if (write_error.IsValid() && error)
			*error = std::move(write_error);
		else if (!write_error.IsValid())
			Error::SetString(error, "failed to encode JSON");
		return std::nullopt;
	}

	return std::string(buffer.GetString(), buffer.GetSize());
}
