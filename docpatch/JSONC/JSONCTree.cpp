// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JSONC/JSONCTree.h"
#include "docpatch/JSON/JSONCodec.h"

#include "fmt/format.h"

#include <algorithm>
#include <cctype>
#include <utility>

static constexpr u32 MAX_NESTING_DEPTH = 512;

namespace
{
	class JSONCParser
	{
	public:
		explicit JSONCParser(std::string_view data);

		bool ParseDocument(JSONCValue* root, Error* error);

	private:
		bool ParseExtra(std::string* out, Error* error);
		bool ParseValue(JSONCValue* value, u32 depth, Error* error);
		bool ParseObject(JSONCValue* value, u32 depth, Error* error);
		bool ParseArray(JSONCValue* value, u32 depth, Error* error);
		bool ParseString(std::string* out, Error* error);
		bool ParseNumber(std::string* out, Error* error);

		bool Fail(Error* error, std::string_view what) const;

		__fi bool AtEnd() const { return (m_pos >= m_data.size()); }
		__fi char Peek() const { return AtEnd() ? '\0' : m_data[m_pos]; }

		std::string_view m_data;
		size_t m_pos = 0;
	};
} // namespace

JSONCParser::JSONCParser(std::string_view data)
	: m_data(data)
{
}

bool JSONCParser::Fail(Error* error, std::string_view what) const
{
	size_t line = 1;
	size_t line_start = 0;
	for (size_t i = 0; i < m_pos && i < m_data.size(); i++)
	{
		if (m_data[i] == '\n')
		{
			line++;
			line_start = i + 1;
		}
	}

	Error::SetParse(error, "JSONC", fmt::format("{} at line {}, column {}", what, line, m_pos - line_start + 1));
	return false;
}

bool JSONCParser::ParseExtra(std::string* out, Error* error)
{
	const size_t start = m_pos;
	while (!AtEnd())
	{
		const char ch = m_data[m_pos];
		if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n')
		{
			m_pos++;
		}
		else if (m_data.compare(m_pos, 2, "//") == 0)
		{
			while (!AtEnd() && m_data[m_pos] != '\n')
				m_pos++;
		}
		else if (m_data.compare(m_pos, 2, "/*") == 0)
		{
			const size_t end = m_data.find("*/", m_pos + 2);
			if (end == std::string_view::npos)
				return Fail(error, "unterminated block comment");

			m_pos = end + 2;
		}
		else
		{
			break;
		}
	}

	out->assign(m_data.substr(start, m_pos - start));
	return true;
}

bool JSONCParser::ParseString(std::string* out, Error* error)
{
	const size_t start = m_pos++;
	while (!AtEnd())
	{
		const char ch = m_data[m_pos];
		if (ch == '"')
		{
			m_pos++;
			out->assign(m_data.substr(start, m_pos - start));
			return true;
		}

		if (static_cast<unsigned char>(ch) < 0x20)
			return Fail(error, "control character in string");

		if (ch == '\\')
		{
			m_pos++;
			const char escape = Peek();
			if (escape == 'u')
			{
				for (u32 i = 1; i <= 4; i++)
				{
					if (m_pos + i >= m_data.size() || !std::isxdigit(static_cast<unsigned char>(m_data[m_pos + i])))
						return Fail(error, "invalid unicode escape");
				}

				m_pos += 4;
			}
			else if (escape != '"' && escape != '\\' && escape != '/' && escape != 'b' && escape != 'f' && escape != 'n' &&
					 escape != 'r' && escape != 't')
			{
				return Fail(error, "invalid escape");
			}
		}

		m_pos++;
	}

	return Fail(error, "unterminated string");
}

bool JSONCParser::ParseNumber(std::string* out, Error* error)
{
	const size_t start = m_pos;
	if (Peek() == '-')
		m_pos++;

	const auto skip_digits = [this]() {
		const size_t digits_start = m_pos;
		while (!AtEnd() && std::isdigit(static_cast<unsigned char>(m_data[m_pos])))
			m_pos++;
		return (m_pos - digits_start);
	};

	if (Peek() == '0')
		m_pos++;
	else if (skip_digits() == 0)
		return Fail(error, "invalid number");

	if (Peek() == '.')
	{
		m_pos++;
		if (skip_digits() == 0)
			return Fail(error, "invalid number");
	}

	if (Peek() == 'e' || Peek() == 'E')
	{
		m_pos++;
		if (Peek() == '+' || Peek() == '-')
			m_pos++;
		if (skip_digits() == 0)
			return Fail(error, "invalid number");
	}

	out->assign(m_data.substr(start, m_pos - start));
	return true;
}

bool JSONCParser::ParseObject(JSONCValue* value, u32 depth, Error* error)
{
	value->kind = JSONCKind::Object;
	m_pos++;

	std::string extra;
	if (!ParseExtra(&extra, error))
		return false;

	for (;;)
	{
		if (Peek() == '}')
		{
			// Empty object, or the extra after a trailing comma.
			value->inner_after = std::move(extra);
			value->trailing_comma = !value->children.empty();
			m_pos++;
			return true;
		}

		if (Peek() != '"')
			return Fail(error, "expected member name");

		JSONCValue& member = value->children.emplace_back();
		member.name_before = std::move(extra);
		if (!ParseString(&member.name, error))
			return false;

		const std::optional<Value> key = JSONCodec::Decode(member.name, JSONCodec::Dialect::Strict, nullptr);
		if (!key.has_value() || !key->IsString())
			return Fail(error, "invalid member name");
		member.key = key->GetString();

		if (!ParseExtra(&member.name_after, error))
			return false;
		if (Peek() != ':')
			return Fail(error, "expected ':'");
		m_pos++;

		if (!ParseExtra(&member.before, error) || !ParseValue(&member, depth + 1, error) || !ParseExtra(&member.after, error))
			return false;

		if (Peek() == '}')
		{
			m_pos++;
			return true;
		}

		if (Peek() != ',')
			return Fail(error, "expected ',' or '}'");

		m_pos++;
		if (!ParseExtra(&extra, error))
			return false;
	}
}

bool JSONCParser::ParseArray(JSONCValue* value, u32 depth, Error* error)
{
	value->kind = JSONCKind::Array;
	m_pos++;

	std::string extra;
	if (!ParseExtra(&extra, error))
		return false;

	for (;;)
	{
		if (Peek() == ']')
		{
			value->inner_after = std::move(extra);
			value->trailing_comma = !value->children.empty();
			m_pos++;
			return true;
		}

		JSONCValue& element = value->children.emplace_back();
		element.before = std::move(extra);
		if (!ParseValue(&element, depth + 1, error) || !ParseExtra(&element.after, error))
			return false;

		if (Peek() == ']')
		{
			m_pos++;
			return true;
		}

		if (Peek() != ',')
			return Fail(error, "expected ',' or ']'");

		m_pos++;
		if (!ParseExtra(&extra, error))
			return false;
	}
}

bool JSONCParser::ParseValue(JSONCValue* value, u32 depth, Error* error)
{
	if (depth > MAX_NESTING_DEPTH)
		return Fail(error, "document is nested too deeply");

	const char ch = Peek();
	if (ch == '{')
		return ParseObject(value, depth, error);
	if (ch == '[')
		return ParseArray(value, depth, error);

	value->kind = JSONCKind::Literal;
	if (ch == '"')
		return ParseString(&value->text, error);
	if (ch == '-' || (ch >= '0' && ch <= '9'))
		return ParseNumber(&value->text, error);

	for (const std::string_view word : {std::string_view("true"), std::string_view("false"), std::string_view("null")})
	{
		if (m_data.compare(m_pos, word.size(), word) == 0)
		{
			value->text = std::string(word);
			m_pos += word.size();
			return true;
		}
	}

	return AtEnd() ? Fail(error, "unexpected end of input") : Fail(error, fmt::format("unexpected character '{}'", ch));
}

bool JSONCParser::ParseDocument(JSONCValue* root, Error* error)
{
	if (!ParseExtra(&root->before, error) || !ParseValue(root, 0, error) || !ParseExtra(&root->after, error))
		return false;

	if (!AtEnd())
		return Fail(error, "unexpected data after value");

	return true;
}

/// Whitespace tail of an extra run starting at its last newline, e.g. "\n    ". Empty if the
/// extra doesn't end in a line break plus indentation.
static std::string_view GetTrailingIndent(std::string_view extra)
{
	const size_t pos = extra.rfind('\n');
	if (pos == std::string_view::npos)
		return {};

	const std::string_view tail = extra.substr(pos);
	if (tail.find_first_not_of(" \t\r\n") != std::string_view::npos)
		return {};

	return tail;
}

/// Index of the member with this key, the last one wins for duplicates.
static std::optional<size_t> FindMember(const JSONCValue& object, std::string_view key)
{
	for (size_t i = object.children.size(); i > 0; i--)
	{
		if (object.children[i - 1].key == key)
			return i - 1;
	}

	return std::nullopt;
}

/// Appends or inserts a child, laying it out like its neighbours.
static void InsertChild(JSONCValue& container, size_t index, JSONCValue child)
{
	std::string& child_extra = (container.kind == JSONCKind::Object) ? child.name_before : child.before;
	std::vector<JSONCValue>& children = container.children;

	if (children.empty())
	{
		if (container.kind == JSONCKind::Object)
			child.before = " ";
		children.push_back(std::move(child));
		return;
	}

	const JSONCValue& neighbour = children[std::min(index, children.size() - 1)];
	const std::string& neighbour_extra = (container.kind == JSONCKind::Object) ? neighbour.name_before : neighbour.before;
	const std::string_view indent = GetTrailingIndent(neighbour_extra);
	child_extra = indent.empty() ? std::string((index == 0) ? "" : " ") : std::string(indent);
	if (container.kind == JSONCKind::Object)
	{
		child.name_after = neighbour.name_after;
		child.before = neighbour.before.empty() ? std::string() : std::string(" ");
	}

	if (index < children.size())
	{
		children.insert(children.begin() + index, std::move(child));
		return;
	}

	// Appending after the last child: the closing bracket's indentation moves to the new child,
	// anything before it (a line comment) stays on the previous line after the new comma.
	JSONCValue& last = children.back();
	if (!container.trailing_comma)
	{
		const std::string_view tail = GetTrailingIndent(last.after);
		std::string moved = last.after.substr(0, last.after.size() - tail.size());
		child.after = std::string(tail);
		last.after.clear();

		if (moved.find("//") != std::string::npos && (child_extra.empty() || child_extra.front() != '\n'))
			child_extra.insert(0, "\n");
		child_extra.insert(0, moved);
	}

	children.push_back(std::move(child));
}

static void RemoveChild(JSONCValue& container, size_t index)
{
	std::vector<JSONCValue>& children = container.children;
	const bool is_last = (index + 1 == children.size());
	if (is_last && !container.trailing_comma)
	{
		// Keep the closing bracket where it was.
		if (index > 0)
			children[index - 1].after.append(children[index].after);
		else
			container.inner_after = children[index].after + container.inner_after;
	}

	children.erase(children.begin() + index);
	if (children.empty())
		container.trailing_comma = false;
}

/// Swaps the contents of a value while keeping its surrounding extra and member name.
static void ReplaceContents(JSONCValue& target, JSONCValue source)
{
	target.kind = source.kind;
	target.text = std::move(source.text);
	target.children = std::move(source.children);
	target.inner_after = std::move(source.inner_after);
	target.trailing_comma = source.trailing_comma;
}

JSONCTree::JSONCTree()
{
	m_root.kind = JSONCKind::Object;
}

JSONCTree::~JSONCTree() = default;

std::optional<JSONCTree> JSONCTree::Parse(std::string_view data, Error* error)
{
	JSONCTree tree;
	tree.m_root = JSONCValue();

	JSONCParser parser(data);
	if (!parser.ParseDocument(&tree.m_root, error))
		return std::nullopt;

	return tree;
}

void JSONCTree::PackContents(const JSONCValue& value, std::string& out)
{
	switch (value.kind)
	{
		case JSONCKind::Literal:
			out.append(value.text);
			break;

		case JSONCKind::Object:
		case JSONCKind::Array:
		{
			const bool object = (value.kind == JSONCKind::Object);
			out.push_back(object ? '{' : '[');
			for (size_t i = 0; i < value.children.size(); i++)
			{
				const JSONCValue& child = value.children[i];
				if (object)
				{
					out.append(child.name_before);
					out.append(child.name);
					out.append(child.name_after);
					out.push_back(':');
				}

				PackValue(child, out);
				if (i + 1 < value.children.size() || value.trailing_comma)
					out.push_back(',');
			}

			out.append(value.inner_after);
			out.push_back(object ? '}' : ']');
		}
		break;
	}
}

void JSONCTree::PackValue(const JSONCValue& value, std::string& out)
{
	out.append(value.before);
	PackContents(value, out);
	out.append(value.after);
}

std::string JSONCTree::Pack() const
{
	std::string ret;
	PackValue(m_root, ret);
	return ret;
}

std::optional<Value> JSONCTree::Decode(Error* error) const
{
	std::string text;
	PackContents(m_root, text);
	return JSONCodec::Decode(text, JSONCodec::Dialect::Relaxed, error);
}

std::optional<JSONCValue> JSONCTree::MakeValue(const Value& value, Error* error)
{
	const std::optional<std::string> text = JSONCodec::Encode(value, false, error);
	if (!text.has_value())
		return std::nullopt;

	JSONCValue ret;
	JSONCParser parser(text.value());
	if (!parser.ParseDocument(&ret, error))
		return std::nullopt;

	return ret;
}

const JSONCValue* JSONCTree::FindNode(const JsonPointer::Path& keys) const
{
	const JSONCValue* current = &m_root;
	for (const std::string& key : keys)
	{
		if (current->kind == JSONCKind::Object)
		{
			const std::optional<size_t> index = FindMember(*current, key);
			if (!index.has_value())
				return nullptr;

			current = &current->children[index.value()];
		}
		else if (current->kind == JSONCKind::Array)
		{
			const std::optional<size_t> index = JsonPointer::ParseArrayIndex(key);
			if (!index.has_value() || index.value() >= current->children.size())
				return nullptr;

			current = &current->children[index.value()];
		}
		else
		{
			return nullptr;
		}
	}

	return current;
}

JSONCValue* JSONCTree::FindNode(const JsonPointer::Path& keys)
{
	return const_cast<JSONCValue*>(std::as_const(*this).FindNode(keys));
}

std::optional<Value> JSONCTree::Find(std::string_view path, Error* error) const
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return std::nullopt;

	const JSONCValue* node = FindNode(keys.value());
	if (!node)
	{
		Error::SetPathNotFound(error, path);
		return std::nullopt;
	}

	std::string text;
	PackContents(*node, text);
	return JSONCodec::Decode(text, JSONCodec::Dialect::Relaxed, error);
}

bool JSONCTree::Add(std::string_view path, const Value& value, Error* error)
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return false;

	std::optional<JSONCValue> node = MakeValue(value, error);
	if (!node.has_value())
		return false;

	if (keys->empty())
	{
		ReplaceContents(m_root, std::move(node.value()));
		return true;
	}

	const JsonPointer::Path parent_keys(keys->begin(), keys->end() - 1);
	JSONCValue* parent = FindNode(parent_keys);
	if (!parent)
	{
		Error::SetPathNotFound(error, JsonPointer::Build(parent_keys));
		return false;
	}

	const std::string& key = keys->back();
	if (parent->kind == JSONCKind::Object)
	{
		if (const std::optional<size_t> index = FindMember(*parent, key); index.has_value())
		{
			ReplaceContents(parent->children[index.value()], std::move(node.value()));
			return true;
		}

		const std::optional<std::string> name = JSONCodec::Encode(Value(key), false, error);
		if (!name.has_value())
			return false;

		node->name = name.value();
		node->key = key;
		InsertChild(*parent, parent->children.size(), std::move(node.value()));
		return true;
	}

	if (parent->kind == JSONCKind::Array)
	{
		size_t index = parent->children.size();
		if (key != "-")
		{
			const std::optional<size_t> parsed = JsonPointer::ParseArrayIndex(key);
			if (!parsed.has_value() || parsed.value() > parent->children.size())
			{
				Error::SetInvalidPath(error, path, fmt::format("array index out of range [0, {}]", parent->children.size()));
				return false;
			}

			index = parsed.value();
		}

		InsertChild(*parent, index, std::move(node.value()));
		return true;
	}

	Error::SetTypeMismatch(error, JsonPointer::Build(parent_keys), "object or array", "literal");
	return false;
}

bool JSONCTree::Replace(std::string_view path, const Value& value, Error* error)
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return false;

	JSONCValue* target = FindNode(keys.value());
	if (!target)
	{
		Error::SetPathNotFound(error, path);
		return false;
	}

	std::optional<JSONCValue> node = MakeValue(value, error);
	if (!node.has_value())
		return false;

	ReplaceContents(*target, std::move(node.value()));
	return true;
}

bool JSONCTree::Remove(std::string_view path, Error* error)
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return false;

	if (keys->empty())
	{
		Error::SetInvalidPath(error, path, "cannot remove root document");
		return false;
	}

	const JsonPointer::Path parent_keys(keys->begin(), keys->end() - 1);
	JSONCValue* parent = FindNode(parent_keys);
	std::optional<size_t> index;
	if (parent && parent->kind == JSONCKind::Object)
		index = FindMember(*parent, keys->back());
	else if (parent && parent->kind == JSONCKind::Array)
		index = JsonPointer::ParseArrayIndex(keys->back());

	if (!index.has_value() || index.value() >= parent->children.size())
	{
		Error::SetPathNotFound(error, path);
		return false;
	}

	RemoveChild(*parent, index.value());
	return true;
}
