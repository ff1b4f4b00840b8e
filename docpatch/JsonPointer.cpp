// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JsonPointer.h"

#include "common/StringUtil.h"

std::string JsonPointer::Escape(std::string_view key)
{
	std::string ret = StringUtil::ReplaceAll(key, "~", "~0");
	StringUtil::ReplaceAll(&ret, "/", "~1");
	return ret;
}

std::string JsonPointer::Unescape(std::string_view segment)
{
	std::string ret = StringUtil::ReplaceAll(segment, "~1", "/");
	StringUtil::ReplaceAll(&ret, "~0", "~");
	return ret;
}

std::optional<JsonPointer::Path> JsonPointer::Parse(std::string_view pointer, Error* error)
{
	Path ret;
	if (pointer.empty())
		return ret;

	if (pointer.front() != '/')
	{
		Error::SetInvalidPath(error, pointer, "JSON pointer must start with '/'");
		return std::nullopt;
	}

	// Every '/' starts a segment, so "/" and "/a/" produce empty segments.
	std::string_view::size_type start = 1;
	for (;;)
	{
		const std::string_view::size_type pos = pointer.find('/', start);
		if (pos == std::string_view::npos)
		{
			ret.push_back(Unescape(pointer.substr(start)));
			break;
		}

		ret.push_back(Unescape(pointer.substr(start, pos - start)));
		start = pos + 1;
	}

	return ret;
}

std::string JsonPointer::Build(const Path& segments)
{
	return BuildRange(segments.begin(), segments.end());
}

std::string JsonPointer::BuildRange(Path::const_iterator begin, Path::const_iterator end)
{
	std::string ret;
	for (auto it = begin; it != end; ++it)
		detail::AppendSegment(ret, *it);
	return ret;
}

std::string JsonPointer::Join(std::string_view base, std::string_view relative)
{
	if (relative.empty())
		return std::string(base);

	if (relative.front() == '/')
		relative = relative.substr(1);

	std::string ret;
	ret.reserve(base.size() + relative.size() + 2);
	if (base.empty() || base.front() != '/')
		ret.push_back('/');
	ret.append(base);

	// An empty base already produced the separator.
	if (!base.empty())
		ret.push_back('/');
	ret.append(relative);
	return ret;
}

bool JsonPointer::IsArrayIndex(std::string_view segment)
{
	return StringUtil::IsAllDigits(segment);
}

std::optional<size_t> JsonPointer::ParseArrayIndex(std::string_view segment)
{
	if (!IsArrayIndex(segment))
		return std::nullopt;

	return StringUtil::FromChars<size_t>(segment);
}

const Value* JsonPointer::GetPath(const Value::Object& root, std::string_view pointer)
{
	std::optional<Path> keys = Parse(pointer);
	if (!keys.has_value())
		return nullptr;

	return GetByKeys(root, keys.value());
}

const Value* JsonPointer::GetByKeys(const Value::Object& root, const Path& keys)
{
	if (keys.empty())
		return nullptr;

	const auto it = root.find(keys.front());
	if (it == root.end())
		return nullptr;

	const Value* current = &it->second;
	for (size_t i = 1; i < keys.size(); i++)
	{
		const std::string& key = keys[i];
		if (current->IsObject())
		{
			current = current->Find(key);
			if (!current)
				return nullptr;
		}
		else if (current->IsArray())
		{
			const std::optional<size_t> index = ParseArrayIndex(key);
			const Value::Array& arr = current->GetArray();
			if (!index.has_value() || index.value() >= arr.size())
				return nullptr;

			current = &arr[index.value()];
		}
		else
		{
			return nullptr;
		}
	}

	return current;
}

JsonPointer::SetResult JsonPointer::SetPath(Value::Object& root, std::string_view pointer, Value value)
{
	std::optional<Path> keys = Parse(pointer);
	if (!keys.has_value())
		return {};

	return SetByKeys(root, keys.value(), std::move(value));
}

JsonPointer::SetResult JsonPointer::SetByKeys(Value::Object& root, const Path& keys, Value value)
{
	SetResult result;
	if (keys.empty())
		return result;

	Value::Object* current = &root;
	for (size_t i = 0; i < keys.size() - 1; i++)
	{
		Value& next = (*current)[keys[i]];
		if (!next.IsObject())
			next = Value::Object();

		current = &next.GetObject();
	}

	const auto [it, inserted] = current->insert_or_assign(keys.back(), std::move(value));
	result.success = true;
	result.created = inserted;
	result.replaced = !inserted;
	return result;
}

bool JsonPointer::DeletePath(Value::Object& root, std::string_view pointer)
{
	std::optional<Path> keys = Parse(pointer);
	if (!keys.has_value())
		return false;

	return DeleteByKeys(root, keys.value());
}

bool JsonPointer::DeleteByKeys(Value::Object& root, const Path& keys)
{
	if (keys.empty())
		return false;

	Value::Object* current = &root;
	for (size_t i = 0; i < keys.size() - 1; i++)
	{
		Value* next = nullptr;
		if (const auto it = current->find(keys[i]); it != current->end())
			next = &it->second;
		if (!next || !next->IsObject())
			return false;

		current = &next->GetObject();
	}

	return (current->erase(keys.back()) > 0);
}
