// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/JsonPointer.h"
#include "docpatch/Value.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class JSONCKind : u8
{
	Literal,
	Object,
	Array,
};

/// One value of a JSON-with-comments document. Every byte of the source, whitespace and comments
/// included, is held in one of the "extra" strings, so packing the tree reproduces the input.
struct JSONCValue
{
	JSONCKind kind = JSONCKind::Literal;

	/// Object members only: raw quoted name, its decoded form, and the extra on either side of it.
	std::string name_before;
	std::string name;
	std::string key;
	std::string name_after;

	/// Extra before the value, i.e. after '[', ',' or ':'.
	std::string before;

	/// Raw token for literals.
	std::string text;

	/// Array elements, or object members in source order.
	std::vector<JSONCValue> children;

	/// Extra between the last child (or its trailing comma) and the closing bracket.
	std::string inner_after;
	bool trailing_comma = false;

	/// Extra after the value, before the next ',' or closing bracket.
	std::string after;
};

/// Parse-preserving tree for JSON with // and /* */ comments and trailing commas.
class JSONCTree
{
public:
	/// Creates the tree for "{}".
	JSONCTree();
	~JSONCTree();

	static std::optional<JSONCTree> Parse(std::string_view data, Error* error);

	/// Serializes the tree. Untouched parts come out byte for byte.
	std::string Pack() const;

	/// Canonical value of the whole document, comments stripped.
	std::optional<Value> Decode(Error* error) const;

	/// Canonical value at a pointer.
	std::optional<Value> Find(std::string_view path, Error* error) const;

	/// RFC 6902 add: sets an object member, or inserts into an array ("-" appends).
	bool Add(std::string_view path, const Value& value, Error* error);

	/// RFC 6902 replace: the target must exist.
	bool Replace(std::string_view path, const Value& value, Error* error);

	/// RFC 6902 remove: the target must exist.
	bool Remove(std::string_view path, Error* error);

	__fi const JSONCValue& GetRoot() const { return m_root; }

private:
	static void PackValue(const JSONCValue& value, std::string& out);
	static void PackContents(const JSONCValue& value, std::string& out);
	static std::optional<JSONCValue> MakeValue(const Value& value, Error* error);

	const JSONCValue* FindNode(const JsonPointer::Path& keys) const;
	JSONCValue* FindNode(const JsonPointer::Path& keys);

	JSONCValue m_root;
};
