// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/YAML/YAMLNodeTree.h"

#include "common/Console.h"
#include "common/HeterogeneousContainers.h"
#include "common/StringUtil.h"
#include "common/YAML.h"

#include "fmt/format.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_map>

// Alias chains and nesting deeper than this are treated as malformed.
static constexpr u32 MAX_ALIAS_CHAIN = 64;
static constexpr u32 MAX_VALUE_DEPTH = 512;

YAMLNodeKind ContainerKindForNextSegment(std::string_view next_segment)
{
	return StringUtil::IsAllDigits(next_segment) ? YAMLNodeKind::Sequence : YAMLNodeKind::Mapping;
}

YAMLNodeTree::YAMLNodeTree()
{
	m_root = AddContainer(YAMLNodeKind::Mapping);
}

YAMLNodeTree::~YAMLNodeTree() = default;

YAMLNodeTree::YAMLNodeTree(const YAMLNodeTree&) = default;

YAMLNodeTree::YAMLNodeTree(YAMLNodeTree&&) = default;

YAMLNodeTree& YAMLNodeTree::operator=(const YAMLNodeTree&) = default;

YAMLNodeTree& YAMLNodeTree::operator=(YAMLNodeTree&&) = default;

const char* YAMLNodeTree::GetKindName(YAMLNodeKind kind)
{
	switch (kind)
	{
		case YAMLNodeKind::Scalar:
			return "scalar";
		case YAMLNodeKind::Sequence:
			return "sequence";
		case YAMLNodeKind::Mapping:
			return "mapping";
		case YAMLNodeKind::Alias:
			return "alias";
		default:
			return "unknown";
	}
}

YAMLNodeID YAMLNodeTree::AddNode(YAMLNode node)
{
	const YAMLNodeID id = static_cast<YAMLNodeID>(m_nodes.size());
	m_nodes.push_back(std::move(node));
	return id;
}

YAMLNodeID YAMLNodeTree::AddScalar(std::string value, YAMLTag tag)
{
	YAMLNode node;
	node.kind = YAMLNodeKind::Scalar;
	node.tag = tag;
	node.value = std::move(value);
	return AddNode(std::move(node));
}

YAMLNodeID YAMLNodeTree::AddContainer(YAMLNodeKind kind)
{
	YAMLNode node;
	node.kind = kind;
	return AddNode(std::move(node));
}

YAMLNodeID YAMLNodeTree::Resolve(YAMLNodeID id) const
{
	for (u32 i = 0; i < MAX_ALIAS_CHAIN; i++)
	{
		if (id >= m_nodes.size())
			return INVALID_YAML_NODE;

		if (m_nodes[id].kind != YAMLNodeKind::Alias)
			return id;

		id = m_nodes[id].alias_target;
	}

	return INVALID_YAML_NODE;
}

static bool IsMergeKey(const YAMLNode& key)
{
	return (key.kind == YAMLNodeKind::Scalar && key.style == YAMLScalarStyle::Plain && key.tag == YAMLTag::None &&
			key.value == "<<");
}

std::optional<size_t> YAMLNodeTree::FindMappingKey(YAMLNodeID mapping, std::string_view key) const
{
	const YAMLNode& node = m_nodes[mapping];
	if (node.kind != YAMLNodeKind::Mapping)
		return std::nullopt;

	for (size_t i = 0; i + 1 < node.children.size(); i += 2)
	{
		const YAMLNodeID key_id = Resolve(node.children[i]);
		if (key_id == INVALID_YAML_NODE)
			continue;

		const YAMLNode& key_node = m_nodes[key_id];
		if (key_node.kind == YAMLNodeKind::Scalar && key_node.value == key && !IsMergeKey(key_node))
			return i;
	}

	return std::nullopt;
}

YAMLNodeID YAMLNodeTree::LookupMappingValue(YAMLNodeID mapping, std::string_view key) const
{
	// Merge sources may themselves carry merge keys.
	std::vector<YAMLNodeID> pending = {mapping};
	for (u32 visited = 0; !pending.empty() && visited < MAX_ALIAS_CHAIN; visited++)
	{
		const YAMLNodeID current = Resolve(pending.front());
		pending.erase(pending.begin());
		if (current == INVALID_YAML_NODE || m_nodes[current].kind != YAMLNodeKind::Mapping)
			continue;

		if (const std::optional<size_t> index = FindMappingKey(current, key); index.has_value())
			return m_nodes[current].children[index.value() + 1];

		const YAMLNode& node = m_nodes[current];
		for (size_t i = 0; i + 1 < node.children.size(); i += 2)
		{
			const YAMLNodeID key_id = Resolve(node.children[i]);
			if (key_id == INVALID_YAML_NODE || !IsMergeKey(m_nodes[key_id]))
				continue;

			const YAMLNodeID source = Resolve(node.children[i + 1]);
			if (source == INVALID_YAML_NODE)
				continue;

			if (m_nodes[source].kind == YAMLNodeKind::Sequence)
				pending.insert(pending.end(), m_nodes[source].children.begin(), m_nodes[source].children.end());
			else
				pending.push_back(source);
		}
	}

	return INVALID_YAML_NODE;
}

//////////////////////////////////////////////////////////////////////////
// Scalar type inference
//////////////////////////////////////////////////////////////////////////

static bool IsNullText(std::string_view text)
{
	return (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL");
}

static std::optional<bool> ParseBoolText(std::string_view text)
{
	if (text == "true" || text == "True" || text == "TRUE")
		return true;
	else if (text == "false" || text == "False" || text == "FALSE")
		return false;
	else
		return std::nullopt;
}

static std::optional<s64> ParseIntText(std::string_view text)
{
	bool negative = false;
	if (!text.empty() && (text.front() == '+' || text.front() == '-'))
	{
		negative = (text.front() == '-');
		text.remove_prefix(1);
	}

	int base = 10;
	if (StringUtil::StartsWith(text, "0x"))
	{
		base = 16;
		text.remove_prefix(2);
	}
	else if (StringUtil::StartsWith(text, "0o"))
	{
		base = 8;
		text.remove_prefix(2);
	}

	if (text.empty())
		return std::nullopt;

	for (const char ch : text)
	{
		const bool valid = (base == 16) ? std::isxdigit(static_cast<unsigned char>(ch)) : (ch >= '0' && ch < ('0' + base));
		if (!valid)
			return std::nullopt;
	}

	std::string_view remaining;
	const std::optional<u64> magnitude = StringUtil::FromChars<u64>(text, base, &remaining);
	if (!magnitude.has_value() || !remaining.empty())
		return std::nullopt;

	if (negative)
	{
		if (magnitude.value() > static_cast<u64>(std::numeric_limits<s64>::max()) + 1)
			return std::nullopt;

		return static_cast<s64>(0 - magnitude.value());
	}

	if (magnitude.value() > static_cast<u64>(std::numeric_limits<s64>::max()))
		return std::nullopt;

	return static_cast<s64>(magnitude.value());
}

static std::optional<double> ParseFloatText(std::string_view text)
{
	if (text == ".nan" || text == ".NaN" || text == ".NAN")
		return std::numeric_limits<double>::quiet_NaN();

	bool negative = false;
	if (!text.empty() && (text.front() == '+' || text.front() == '-'))
	{
		negative = (text.front() == '-');
		text.remove_prefix(1);
	}

	if (text == ".inf" || text == ".Inf" || text == ".INF")
		return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();

	// [digits][.digits][(e|E)[sign]digits], with at least one mantissa digit.
	size_t pos = 0;
	size_t mantissa_digits = 0;
	while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
	{
		pos++;
		mantissa_digits++;
	}
	if (pos < text.size() && text[pos] == '.')
	{
		pos++;
		while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
		{
			pos++;
			mantissa_digits++;
		}
	}
	if (mantissa_digits == 0)
		return std::nullopt;

	if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E'))
	{
		pos++;
		if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
			pos++;

		const size_t exponent_start = pos;
		while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
			pos++;
		if (pos == exponent_start)
			return std::nullopt;
	}

	if (pos != text.size())
		return std::nullopt;

	// fast_float does not take a leading '.', so give it a zero.
	std::string normalized;
	if (text.front() == '.')
		normalized.push_back('0');
	normalized.append(text);

	const std::optional<double> value = StringUtil::FromChars<double>(normalized);
	if (!value.has_value())
		return std::nullopt;

	return negative ? -value.value() : value.value();
}

Value YAMLNodeTree::InferPlainScalar(std::string_view text)
{
	if (IsNullText(text))
		return Value();
	if (const std::optional<bool> value = ParseBoolText(text); value.has_value())
		return Value(value.value());
	if (const std::optional<s64> value = ParseIntText(text); value.has_value())
		return Value(value.value());
	if (const std::optional<double> value = ParseFloatText(text); value.has_value())
		return Value(value.value());

	return Value(text);
}

Value YAMLNodeTree::ScalarToValue(const YAMLNode& node)
{
	switch (node.tag)
	{
		case YAMLTag::Null:
			return Value();

		case YAMLTag::Str:
			return Value(node.value);

		case YAMLTag::Bool:
		{
			if (const std::optional<bool> value = ParseBoolText(node.value); value.has_value())
				return Value(value.value());

			return Value(node.value);
		}

		case YAMLTag::Int:
		{
			if (const std::optional<s64> value = ParseIntText(node.value); value.has_value())
				return Value(value.value());

			return Value(node.value);
		}

		case YAMLTag::Float:
		{
			if (const std::optional<double> value = ParseFloatText(node.value); value.has_value())
				return Value(value.value());
			if (const std::optional<s64> value = ParseIntText(node.value); value.has_value())
				return Value(static_cast<double>(value.value()));

			return Value(node.value);
		}

		case YAMLTag::None:
		case YAMLTag::Custom:
		default:
		{
			// Quoted and block scalars are always strings.
			if (node.style != YAMLScalarStyle::Plain)
				return Value(node.value);

			return InferPlainScalar(node.value);
		}
	}
}

//////////////////////////////////////////////////////////////////////////
// Conversion to and from canonical values
//////////////////////////////////////////////////////////////////////////

Value YAMLNodeTree::ToValue(YAMLNodeID id) const
{
	return ToValue(id, 0);
}

Value YAMLNodeTree::ToValue(YAMLNodeID id, u32 depth) const
{
	id = Resolve(id);
	if (id == INVALID_YAML_NODE || depth > MAX_VALUE_DEPTH)
		return Value();

	const YAMLNode& node = m_nodes[id];
	switch (node.kind)
	{
		case YAMLNodeKind::Sequence:
		{
			Value::Array ret;
			ret.reserve(node.children.size());
			for (const YAMLNodeID child : node.children)
				ret.push_back(ToValue(child, depth + 1));

			return Value(std::move(ret));
		}

		case YAMLNodeKind::Mapping:
		{
			Value::Object ret;
			std::vector<YAMLNodeID> merges;
			for (size_t i = 0; i + 1 < node.children.size(); i += 2)
			{
				const YAMLNodeID key_id = Resolve(node.children[i]);
				if (key_id == INVALID_YAML_NODE)
					continue;

				const YAMLNode& key = m_nodes[key_id];
				if (IsMergeKey(key))
				{
					merges.push_back(node.children[i + 1]);
					continue;
				}

				std::string key_text = (key.kind == YAMLNodeKind::Scalar) ? key.value : ToValue(key_id, depth + 1).ToString();
				ret.insert_or_assign(std::move(key_text), ToValue(node.children[i + 1], depth + 1));
			}

			// Explicit keys win, then earlier merge sources win over later ones.
			for (const YAMLNodeID merge : merges)
			{
				const YAMLNodeID source = Resolve(merge);
				if (source == INVALID_YAML_NODE)
					continue;

				std::vector<YAMLNodeID> sources;
				if (m_nodes[source].kind == YAMLNodeKind::Sequence)
					sources = m_nodes[source].children;
				else
					sources.push_back(source);

				for (const YAMLNodeID source_id : sources)
				{
					Value merged = ToValue(source_id, depth + 1);
					if (!merged.IsObject())
						continue;

					for (auto& [key, value] : merged.GetObject())
						ret.try_emplace(key, std::move(value));
				}
			}

			return Value(std::move(ret));
		}

		case YAMLNodeKind::Scalar:
		default:
			return ScalarToValue(node);
	}
}

static std::string FormatFloatText(double value)
{
	if (std::isnan(value))
		return ".nan";
	if (std::isinf(value))
		return (value > 0.0) ? ".inf" : "-.inf";

	// Keep a fraction or exponent so the text reads back as a float.
	std::string ret = fmt::format("{}", value);
	if (ret.find_first_of(".eE") == std::string::npos)
		ret.append(".0");

	return ret;
}

void YAMLNodeTree::SetNodeValue(YAMLNodeID id, const Value& value)
{
	// Children are created before the node is touched, AddNode() may move the arena.
	std::vector<YAMLNodeID> children;
	if (value.IsArray())
	{
		for (const Value& item : value.GetArray())
			children.push_back(CreateNode(item));
	}
	else if (value.IsObject())
	{
		for (const auto& [key, item] : value.GetObject())
		{
			const YAMLNodeID key_id = AddScalar(key, YAMLTag::Str);
			children.push_back(key_id);
			children.push_back(CreateNode(item));
		}
	}

	YAMLNode& node = m_nodes[id];
	const bool was_container = (node.kind == YAMLNodeKind::Sequence || node.kind == YAMLNodeKind::Mapping);
	const YAMLScalarStyle old_style = (node.kind == YAMLNodeKind::Scalar) ? node.style : YAMLScalarStyle::Plain;

	node.children = std::move(children);
	node.alias_target = INVALID_YAML_NODE;
	node.custom_tag.clear();
	node.explicit_tag = false;
	node.style = YAMLScalarStyle::Plain;
	node.value.clear();

	switch (value.GetType())
	{
		case Value::Type::Null:
			node.kind = YAMLNodeKind::Scalar;
			node.tag = YAMLTag::Null;
			node.value = "null";
			break;

		case Value::Type::Bool:
			node.kind = YAMLNodeKind::Scalar;
			node.tag = YAMLTag::Bool;
			node.value = value.GetBool() ? "true" : "false";
			break;

		case Value::Type::Int:
			node.kind = YAMLNodeKind::Scalar;
			node.tag = YAMLTag::Int;
			node.value = StringUtil::ToChars(value.GetInt());
			break;

		case Value::Type::Float:
			node.kind = YAMLNodeKind::Scalar;
			node.tag = YAMLTag::Float;
			node.value = FormatFloatText(value.GetFloat());
			break;

		case Value::Type::String:
		{
			node.kind = YAMLNodeKind::Scalar;
			node.tag = YAMLTag::Str;
			node.value = value.GetString();

			const bool multi_line = (node.value.find('\n') != std::string::npos);
			if (old_style == YAMLScalarStyle::DoubleQuoted)
				node.style = YAMLScalarStyle::DoubleQuoted;
			else if (old_style == YAMLScalarStyle::SingleQuoted)
				node.style = multi_line ? YAMLScalarStyle::DoubleQuoted : YAMLScalarStyle::SingleQuoted;
			else if (multi_line)
				node.style = YAMLScalarStyle::Literal;
		}
		break;

		case Value::Type::Array:
			node.flow = was_container && node.flow;
			node.kind = YAMLNodeKind::Sequence;
			node.tag = YAMLTag::None;
			break;

		case Value::Type::Object:
			node.flow = was_container && node.flow;
			node.kind = YAMLNodeKind::Mapping;
			node.tag = YAMLTag::None;
			break;
	}

	if (node.kind == YAMLNodeKind::Scalar)
		node.flow = false;
}

YAMLNodeID YAMLNodeTree::CreateNode(const Value& value)
{
	const YAMLNodeID id = AddNode(YAMLNode());
	SetNodeValue(id, value);
	return id;
}

YAMLNodeTree YAMLNodeTree::FromValue(const Value::Object& data)
{
	YAMLNodeTree tree;
	for (const auto& [key, value] : data)
	{
		const YAMLNodeID key_id = tree.AddScalar(key, YAMLTag::Str);
		const YAMLNodeID value_id = tree.CreateNode(value);
		YAMLNode& root = tree.GetNode(tree.GetRoot());
		root.children.push_back(key_id);
		root.children.push_back(value_id);
	}

	return tree;
}

//////////////////////////////////////////////////////////////////////////
// Parsing
//////////////////////////////////////////////////////////////////////////

namespace
{
	/// Converts a RapidYAML tree into the arena, then attaches comments from the source text.
	class YAMLTreeBuilder
	{
	public:
		YAMLTreeBuilder(YAMLNodeTree& tree, const ryml::Tree& source, std::string_view data);

		bool Build(Error* error);

	private:
		bool ConvertValue(ryml::id_type id, YAMLNodeID* out_id, Error* error);
		bool ConvertKey(ryml::id_type id, YAMLNodeID* out_id, Error* error);
		bool MakeAlias(std::string_view name, YAMLNode* node, Error* error);

		bool HasFlag(ryml::id_type id, u64 flags) const;
		int GetLine(ryml::csubstr str) const;
		void SetLine(YAMLNodeID id, int line);

		int ComputeContainerLines(YAMLNodeID id, u32 depth);
		void RegisterNodes(YAMLNodeID id, u32 depth);
		void AttachComments();

		YAMLNodeTree& m_tree;
		const ryml::Tree& m_source;
		std::string_view m_data;

		std::vector<size_t> m_line_starts;
		std::vector<int> m_node_lines;

		// Pre-order, so containers come before the nodes inside them.
		std::vector<std::pair<int, YAMLNodeID>> m_registered;

		UnorderedStringMap<YAMLNodeID> m_anchors;
	};
} // namespace

YAMLTreeBuilder::YAMLTreeBuilder(YAMLNodeTree& tree, const ryml::Tree& source, std::string_view data)
	: m_tree(tree)
	, m_source(source)
	, m_data(data)
{
	m_line_starts.push_back(0);
	for (size_t i = 0; i < data.size(); i++)
	{
		if (data[i] == '\n')
			m_line_starts.push_back(i + 1);
	}
}

bool YAMLTreeBuilder::HasFlag(ryml::id_type id, u64 flags) const
{
	return (static_cast<u64>(m_source.type(id).type) & flags) != 0;
}

int YAMLTreeBuilder::GetLine(ryml::csubstr str) const
{
	// The source is copied to the start of the arena, so arena offsets are source offsets.
	const ryml::csubstr arena = m_source.arena();
	if (!str.str || !arena.str || str.str < arena.str)
		return -1;

	const size_t offset = static_cast<size_t>(str.str - arena.str);
	if (offset >= m_data.size())
		return -1;

	const auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), offset);
	return static_cast<int>(std::distance(m_line_starts.begin(), it)) - 1;
}

void YAMLTreeBuilder::SetLine(YAMLNodeID id, int line)
{
	if (m_node_lines.size() <= id)
		m_node_lines.resize(id + 1, -1);

	m_node_lines[id] = line;
}

static void ApplyTag(std::string_view tag, YAMLNode* node)
{
	static constexpr std::pair<std::string_view, YAMLTag> s_standard_tags[] = {
		{"str", YAMLTag::Str},
		{"int", YAMLTag::Int},
		{"float", YAMLTag::Float},
		{"bool", YAMLTag::Bool},
		{"null", YAMLTag::Null},
	};

	std::string_view name = tag;
	if (StringUtil::StartsWith(name, "!!"))
		name.remove_prefix(2);
	else if (StringUtil::StartsWith(name, "<tag:yaml.org,2002:") && StringUtil::EndsWith(name, ">"))
		name = name.substr(19, name.size() - 20);
	else if (StringUtil::StartsWith(name, "tag:yaml.org,2002:"))
		name.remove_prefix(18);
	else
		name = {};

	node->explicit_tag = true;
	for (const auto& [standard_name, standard_tag] : s_standard_tags)
	{
		if (name == standard_name)
		{
			node->tag = standard_tag;
			node->custom_tag = fmt::format("!!{}", standard_name);
			return;
		}
	}

	node->tag = YAMLTag::Custom;
	node->custom_tag = std::string(tag);
}

bool YAMLTreeBuilder::MakeAlias(std::string_view name, YAMLNode* node, Error* error)
{
	if (!name.empty() && name.front() == '*')
		name.remove_prefix(1);

	const auto it = m_anchors.find(name);
	if (it == m_anchors.end())
	{
		Error::SetParse(error, "YAML", fmt::format("unknown anchor \"{}\" referenced", name));
		return false;
	}

	node->kind = YAMLNodeKind::Alias;
	node->alias_target = it->second;
	return true;
}

bool YAMLTreeBuilder::ConvertKey(ryml::id_type id, YAMLNodeID* out_id, Error* error)
{
	YAMLNode node;
	if (m_source.is_key_ref(id))
	{
		if (!MakeAlias(ToStringView(m_source.key_ref(id)), &node, error))
			return false;
	}
	else
	{
		node.value = std::string(ToStringView(m_source.key(id)));
		if (HasFlag(id, ryml::KEY_DQUO))
			node.style = YAMLScalarStyle::DoubleQuoted;
		else if (HasFlag(id, ryml::KEY_SQUO))
			node.style = YAMLScalarStyle::SingleQuoted;
		else if (HasFlag(id, ryml::KEY_LITERAL))
			node.style = YAMLScalarStyle::Literal;
		else if (HasFlag(id, ryml::KEY_FOLDED))
			node.style = YAMLScalarStyle::Folded;

		if (m_source.has_key_tag(id))
			ApplyTag(ToStringView(m_source.key_tag(id)), &node);
	}

	if (m_source.has_key_anchor(id))
		node.anchor = std::string(ToStringView(m_source.key_anchor(id)));

	const std::string anchor = node.anchor;
	*out_id = m_tree.AddNode(std::move(node));
	SetLine(*out_id, GetLine(m_source.key(id)));
	if (!anchor.empty())
		m_anchors[anchor] = *out_id;

	return true;
}

bool YAMLTreeBuilder::ConvertValue(ryml::id_type id, YAMLNodeID* out_id, Error* error)
{
	YAMLNode node;
	const bool is_map = m_source.is_map(id);
	const bool is_seq = m_source.is_seq(id);
	if (is_map || is_seq)
	{
		node.kind = is_map ? YAMLNodeKind::Mapping : YAMLNodeKind::Sequence;
		node.flow = HasFlag(id, static_cast<u64>(ryml::FLOW_SL) | static_cast<u64>(ryml::FLOW_ML));
	}
	else if (m_source.is_val_ref(id))
	{
		if (!MakeAlias(ToStringView(m_source.val_ref(id)), &node, error))
			return false;
	}
	else
	{
		node.kind = YAMLNodeKind::Scalar;
		if (m_source.has_val(id))
			node.value = std::string(ToStringView(m_source.val(id)));

		if (HasFlag(id, ryml::VAL_DQUO))
			node.style = YAMLScalarStyle::DoubleQuoted;
		else if (HasFlag(id, ryml::VAL_SQUO))
			node.style = YAMLScalarStyle::SingleQuoted;
		else if (HasFlag(id, ryml::VAL_LITERAL))
			node.style = YAMLScalarStyle::Literal;
		else if (HasFlag(id, ryml::VAL_FOLDED))
			node.style = YAMLScalarStyle::Folded;
	}

	if (m_source.has_val_tag(id))
		ApplyTag(ToStringView(m_source.val_tag(id)), &node);

	if (m_source.has_val_anchor(id))
		node.anchor = std::string(ToStringView(m_source.val_anchor(id)));

	const std::string anchor = node.anchor;
	const YAMLNodeID node_id = m_tree.AddNode(std::move(node));
	if (!is_map && !is_seq && m_source.has_val(id))
		SetLine(node_id, GetLine(m_source.val(id)));
	else
		SetLine(node_id, -1);

	std::vector<YAMLNodeID> children;
	for (ryml::id_type child = m_source.first_child(id); child != ryml::NONE; child = m_source.next_sibling(child))
	{
		if (is_map)
		{
			YAMLNodeID key_id;
			if (!ConvertKey(child, &key_id, error))
				return false;

			children.push_back(key_id);
		}

		YAMLNodeID value_id;
		if (!ConvertValue(child, &value_id, error))
			return false;

		children.push_back(value_id);
	}

	m_tree.GetNode(node_id).children = std::move(children);

	// Registered after the children, an anchor cannot be referenced from inside itself.
	if (!anchor.empty())
		m_anchors[anchor] = node_id;

	*out_id = node_id;
	return true;
}

int YAMLTreeBuilder::ComputeContainerLines(YAMLNodeID id, u32 depth)
{
	const YAMLNode& node = m_tree.GetNode(id);
	if (depth > MAX_VALUE_DEPTH || node.kind == YAMLNodeKind::Scalar || node.kind == YAMLNodeKind::Alias)
		return (id < m_node_lines.size()) ? m_node_lines[id] : -1;

	int first_line = -1;
	for (const YAMLNodeID child : node.children)
	{
		const int child_line = ComputeContainerLines(child, depth + 1);
		if (child_line >= 0 && (first_line < 0 || child_line < first_line))
			first_line = child_line;
	}

	SetLine(id, first_line);
	return first_line;
}

void YAMLTreeBuilder::RegisterNodes(YAMLNodeID id, u32 depth)
{
	if (depth > MAX_VALUE_DEPTH)
		return;

	if (id < m_node_lines.size() && m_node_lines[id] >= 0)
		m_registered.emplace_back(m_node_lines[id], id);

	const YAMLNode& node = m_tree.GetNode(id);
	if (node.kind == YAMLNodeKind::Mapping || node.kind == YAMLNodeKind::Sequence)
	{
		for (const YAMLNodeID child : node.children)
			RegisterNodes(child, depth + 1);
	}
}

/// Returns the offset of a trailing comment, skipping quoted scalars.
static size_t FindLineComment(std::string_view line)
{
	bool at_scalar_start = true;
	for (size_t i = 0; i < line.size(); i++)
	{
		const char ch = line[i];
		if (ch == ' ' || ch == '\t')
			continue;

		if (ch == '#')
		{
			if (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')
				return i;
		}
		else if (at_scalar_start && (ch == '"' || ch == '\''))
		{
			size_t j = i + 1;
			for (; j < line.size(); j++)
			{
				if (ch == '"' && line[j] == '\\')
				{
					j++;
					continue;
				}

				if (line[j] == ch)
				{
					if (ch == '\'' && j + 1 < line.size() && line[j + 1] == '\'')
					{
						j++;
						continue;
					}

					break;
				}
			}

			// Unterminated, the scalar continues on the next line.
			if (j >= line.size())
				return std::string_view::npos;

			i = j;
			at_scalar_start = false;
			continue;
		}
		else if (at_scalar_start && (ch == '!' || ch == '&'))
		{
			// Tag or anchor, the scalar starts after it.
			while (i + 1 < line.size() && line[i + 1] != ' ' && line[i + 1] != '\t')
				i++;
			continue;
		}

		at_scalar_start = (ch == ':' || ch == '-' || ch == '[' || ch == '{' || ch == ',' || ch == '?');
	}

	return std::string_view::npos;
}

/// Returns the indentation block scalar content must exceed, or -1 if the line does not open one.
static int GetBlockScalarIndent(std::string_view line, std::string_view content)
{
	content = StringUtil::StripWhitespace(content);
	if (content.empty())
		return -1;

	const size_t token_start = content.find_last_of(" \t") + 1;
	const std::string_view token = content.substr(token_start);
	if (token.empty() || (token.front() != '|' && token.front() != '>') || token.size() > 3 ||
		token.substr(1).find_first_not_of("+-0123456789") != std::string_view::npos)
	{
		return -1;
	}

	const std::string_view before = StringUtil::StripWhitespace(content.substr(0, token_start));
	if (!before.empty() && before.back() != ':' && before.back() != '-')
	{
		// Only a tag or anchor may sit between the indicator and the key/dash.
		const size_t prop_start = before.find_last_of(" \t") + 1;
		if (before[prop_start] != '!' && before[prop_start] != '&')
			return -1;
	}

	// Content of "- |" only has to be indented past the dash.
	if (!before.empty() && before.back() == '-')
		return static_cast<int>(before.data() + before.size() - 1 - line.data());

	// Key column, past any "- " sequence entry markers.
	size_t pos = line.find_first_not_of(' ');
	while (pos < line.size() && line[pos] == '-' && (pos + 1 == line.size() || line[pos + 1] == ' '))
	{
		pos++;
		while (pos < line.size() && line[pos] == ' ')
			pos++;
	}

	return static_cast<int>(pos);
}

void YAMLTreeBuilder::AttachComments()
{
	std::unordered_map<int, YAMLNodeID> first_on_line;
	std::unordered_map<int, YAMLNodeID> last_on_line;
	for (const auto& [line, id] : m_registered)
	{
		first_on_line.try_emplace(line, id);
		last_on_line[line] = id;
	}

	// Comment lines waiting for the next node, with their indentation (-1 for blank lines).
	std::vector<std::string> pending;
	std::vector<int> pending_indent;

	// Line index and indentation of every line that holds a node.
	std::vector<std::pair<int, int>> content_lines;

	// Leading comments indented past the next entry close the blocks before them. Each one stays
	// with the last node written at or left of its column, along with the blank lines above it.
	const auto attach_foot = [&](int next_indent) {
		size_t taken = 0;
		for (size_t i = 0; i < pending.size(); i++)
		{
			if (pending_indent[i] < 0)
				continue;
			if (pending_indent[i] <= next_indent)
				break;

			const auto line = std::find_if(content_lines.rbegin(), content_lines.rend(),
				[indent = pending_indent[i]](const std::pair<int, int>& content) { return content.second <= indent; });
			if (line == content_lines.rend())
				break;

			const auto node = first_on_line.find(line->first);
			if (node == first_on_line.end())
				break;

			std::vector<std::string>& foot = m_tree.GetNode(node->second).foot_comment;
			foot.insert(foot.end(), pending.begin() + taken, pending.begin() + i + 1);
			taken = i + 1;
		}

		pending.erase(pending.begin(), pending.begin() + taken);
		pending_indent.erase(pending_indent.begin(), pending_indent.begin() + taken);
	};

	int block_indent = -1;
	for (size_t line_index = 0; line_index < m_line_starts.size(); line_index++)
	{
		const size_t start = m_line_starts[line_index];
		if (start >= m_data.size())
			break;

		size_t end = m_data.find('\n', start);
		if (end == std::string_view::npos)
			end = m_data.size();

		std::string_view line = m_data.substr(start, end - start);
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);

		const std::string_view trimmed = StringUtil::StripWhitespace(line);
		const size_t indent = line.find_first_not_of(' ');
		if (block_indent >= 0)
		{
			if (trimmed.empty() || (indent != std::string_view::npos && static_cast<int>(indent) > block_indent))
				continue;

			block_indent = -1;
		}

		if (trimmed.empty())
		{
			pending.emplace_back();
			pending_indent.push_back(-1);
			continue;
		}

		if (trimmed.front() == '#')
		{
			pending.emplace_back(trimmed);
			pending_indent.push_back(static_cast<int>(indent));
			continue;
		}

		if (trimmed == "---" || trimmed == "..." || trimmed.front() == '%')
			continue;

		const int current = static_cast<int>(line_index);
		attach_foot(static_cast<int>(indent));
		if (const auto it = first_on_line.find(current); it != first_on_line.end())
		{
			std::vector<std::string>& head = m_tree.GetNode(it->second).head_comment;
			head.insert(head.end(), pending.begin(), pending.end());
			pending.clear();
			pending_indent.clear();
			content_lines.emplace_back(current, static_cast<int>(indent));
		}

		const size_t comment_pos = FindLineComment(line);
		if (comment_pos != std::string_view::npos)
		{
			if (const auto it = last_on_line.find(current); it != last_on_line.end())
				m_tree.GetNode(it->second).line_comment = std::string(StringUtil::StripWhitespace(line.substr(comment_pos)));
		}

		block_indent = GetBlockScalarIndent(line, line.substr(0, std::min(comment_pos, line.size())));
	}

	attach_foot(0);
	while (!pending.empty() && pending.back().empty())
		pending.pop_back();

	m_tree.GetFootComment() = std::move(pending);
}

bool YAMLTreeBuilder::Build(Error* error)
{
	ryml::id_type root = ryml::NONE;
	if (m_source.size() > 0)
	{
		root = m_source.root_id();
		if (m_source.is_stream(root))
			root = m_source.first_child(root);
	}

	if (root != ryml::NONE)
	{
		YAMLNodeID root_id;
		if (!ConvertValue(root, &root_id, error))
			return false;

		// A null document is an empty mapping.
		const YAMLNode& root_node = m_tree.GetNode(root_id);
		if (root_node.kind != YAMLNodeKind::Scalar || !YAMLNodeTree::ScalarToValue(root_node).IsNull())
			m_tree.SetRoot(root_id);
	}

	m_node_lines.resize(m_tree.GetNodeCount(), -1);
	ComputeContainerLines(m_tree.GetRoot(), 0);
	RegisterNodes(m_tree.GetRoot(), 0);
	AttachComments();
	return true;
}

std::optional<YAMLNodeTree> YAMLNodeTree::Parse(std::string_view data, Error* error)
{
	YAMLNodeTree tree;

	Error parse_error;
	std::optional<ryml::Tree> source;
	if (!StringUtil::StripWhitespace(data).empty())
	{
		source = ParseYAMLFromString(ToCSubstr(data), "document", &parse_error);
		if (!source.has_value())
		{
			Error::SetParse(error, "YAML", parse_error.GetDescription());
			return std::nullopt;
		}
	}
	else
	{
		source.emplace();
	}

	YAMLTreeBuilder builder(tree, source.value(), data);
	if (!builder.Build(error))
		return std::nullopt;

	TRACE_LOG("Parsed YAML document into {} nodes", tree.GetNodeCount());
	return tree;
}
