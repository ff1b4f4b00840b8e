// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/Value.h"

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using YAMLNodeID = u32;
static constexpr YAMLNodeID INVALID_YAML_NODE = std::numeric_limits<YAMLNodeID>::max();

enum class YAMLNodeKind : u8
{
	Scalar,
	Sequence,
	Mapping,
	Alias,
};

enum class YAMLTag : u8
{
	None,
	Str,
	Int,
	Float,
	Bool,
	Null,
	Custom,
};

enum class YAMLScalarStyle : u8
{
	Plain,
	SingleQuoted,
	DoubleQuoted,
	Literal,
	Folded,
};

struct YAMLNode
{
	YAMLNodeKind kind = YAMLNodeKind::Scalar;
	YAMLTag tag = YAMLTag::None;
	YAMLScalarStyle style = YAMLScalarStyle::Plain;

	/// Tag was written in the source, so it is written back.
	bool explicit_tag = false;

	/// Container was written in [flow] / {flow} style.
	bool flow = false;

	std::string value;
	std::string custom_tag;
	std::string anchor;

	/// Alias nodes only.
	YAMLNodeID alias_target = INVALID_YAML_NODE;

	/// Sequences hold items, mappings hold key, value, key, value...
	std::vector<YAMLNodeID> children;

	/// Comment and blank lines preceding the node, "" for a blank line.
	std::vector<std::string> head_comment;

	/// Comment following the node on its own line.
	std::string line_comment;

	/// Comment lines closing the node's nested block, written after the whole entry.
	std::vector<std::string> foot_comment;
};

/// Decides the kind of container to create for a missing intermediate path segment:
/// a sequence if the segment after it is all decimal digits, otherwise a mapping.
YAMLNodeKind ContainerKindForNextSegment(std::string_view next_segment);

/// Owned YAML node graph. Nodes live in an arena and are addressed by index, so alias edges
/// are plain indices and survive any mutation. Removed nodes stay in the arena unreferenced.
class YAMLNodeTree
{
public:
	/// Creates a tree holding a single empty mapping.
	YAMLNodeTree();
	~YAMLNodeTree();

	YAMLNodeTree(const YAMLNodeTree&);
	YAMLNodeTree(YAMLNodeTree&&);
	YAMLNodeTree& operator=(const YAMLNodeTree&);
	YAMLNodeTree& operator=(YAMLNodeTree&&);

	/// Parses YAML text. Empty, blank, comment-only and null documents become an empty mapping.
	/// Comments and blank lines are attached to the nearest node.
	static std::optional<YAMLNodeTree> Parse(std::string_view data, Error* error);

	/// Builds a tree from a canonical object.
	static YAMLNodeTree FromValue(const Value::Object& data);

	__fi YAMLNodeID GetRoot() const { return m_root; }
	__fi void SetRoot(YAMLNodeID id) { m_root = id; }
	__fi const YAMLNode& GetNode(YAMLNodeID id) const { return m_nodes[id]; }
	__fi YAMLNode& GetNode(YAMLNodeID id) { return m_nodes[id]; }
	__fi size_t GetNodeCount() const { return m_nodes.size(); }

	__fi const std::vector<std::string>& GetFootComment() const { return m_foot_comment; }
	__fi std::vector<std::string>& GetFootComment() { return m_foot_comment; }

	YAMLNodeID AddNode(YAMLNode node);
	YAMLNodeID AddScalar(std::string value, YAMLTag tag);
	YAMLNodeID AddContainer(YAMLNodeKind kind);

	/// Follows alias edges to a non-alias node. Bounded, so malformed chains still terminate.
	YAMLNodeID Resolve(YAMLNodeID id) const;

	/// Mapping value for a key, ignoring merge keys. Returns the index of the key in children.
	std::optional<size_t> FindMappingKey(YAMLNodeID mapping, std::string_view key) const;

	/// Mapping value for a key, consulting "<<" merge keys when the key is not present directly.
	YAMLNodeID LookupMappingValue(YAMLNodeID mapping, std::string_view key) const;

	/// Replaces the node's content in place with the value. Anchors and comments stay.
	void SetNodeValue(YAMLNodeID id, const Value& value);

	/// Creates a fresh node for a value.
	YAMLNodeID CreateNode(const Value& value);

	/// Converts a node to a canonical value, resolving aliases and merge keys.
	Value ToValue(YAMLNodeID id) const;

	/// Type inference for a scalar, honouring its tag.
	static Value ScalarToValue(const YAMLNode& node);

	/// Type inference for an untagged plain scalar.
	static Value InferPlainScalar(std::string_view text);

	static const char* GetKindName(YAMLNodeKind kind);

	/// Writes the tree out in block style with two-space indentation.
	std::string Emit() const;

private:
	Value ToValue(YAMLNodeID id, u32 depth) const;

	std::vector<YAMLNode> m_nodes;
	std::vector<std::string> m_foot_comment;
	YAMLNodeID m_root = INVALID_YAML_NODE;
};
