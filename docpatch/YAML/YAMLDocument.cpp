// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/YAML/YAMLDocument.h"

#include "common/Console.h"
#include "common/StringUtil.h"

#include "fmt/format.h"

YAMLDocument::YAMLDocument() = default;

YAMLDocument::YAMLDocument(YAMLNodeTree tree)
	: m_tree(std::move(tree))
{
}

YAMLDocument::~YAMLDocument() = default;

std::unique_ptr<YAMLDocument> YAMLDocument::Parse(std::string_view data, Error* error)
{
	std::optional<YAMLNodeTree> tree = YAMLNodeTree::Parse(data, error);
	if (!tree.has_value())
		return {};

	return std::make_unique<YAMLDocument>(std::move(tree.value()));
}

DocumentFormat YAMLDocument::GetFormat() const
{
	return DocumentFormat::YAML;
}

std::optional<Value::Object> YAMLDocument::Get(std::string_view data, Error* error) const
{
	const std::optional<YAMLNodeTree> tree = YAMLNodeTree::Parse(data, error);
	if (!tree.has_value())
		return std::nullopt;

	Value root = tree->ToValue(tree->GetRoot());
	if (!root.IsObject())
	{
		Error::SetUnsupportedStructure(error, {}, fmt::format("YAML root must be an object, got {}", root.GetTypeName()));
		return std::nullopt;
	}

	return std::move(root.GetObject());
}

std::optional<std::string> YAMLDocument::Apply(std::string_view data, const PatchSet& patches, Error* error) const
{
	// Without patches the document is normalized through a plain object, layout is not kept.
	if (patches.empty())
	{
		const std::optional<Value::Object> decoded = Get(data, error);
		if (!decoded.has_value())
			return std::nullopt;

		return MarshalTestData(decoded.value(), error);
	}

	Error parse_error;
	std::optional<YAMLNodeTree> tree = YAMLNodeTree::Parse(data, &parse_error);
	if (!tree.has_value())
	{
		DEV_LOG("Replacing unparsable YAML document with an empty mapping: {}", parse_error.GetDescription());
		tree.emplace();
	}

	for (const Patch& patch : patches)
	{
		const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(patch.path);
		if (!keys.has_value() || keys->empty())
		{
			DEV_LOG("Skipping YAML {} patch with invalid path \"{}\"", GetPatchOpName(patch.op), patch.path);
			continue;
		}

		switch (patch.op)
		{
			case PatchOp::Add:
			case PatchOp::Replace:
			{
				if (!SetInTree(tree.value(), keys.value(), patch.value, error))
					return std::nullopt;
			}
			break;

			case PatchOp::Remove:
				DeleteInTree(tree.value(), keys.value());
				break;

			default:
				DEV_LOG("Skipping YAML patch with unknown op at \"{}\"", patch.path);
				break;
		}
	}

	return tree->Emit();
}

std::optional<std::string> YAMLDocument::MarshalTestData(const Value::Object& data, Error* error) const
{
	return YAMLNodeTree::FromValue(data).Emit();
}

std::optional<Value> YAMLDocument::Lookup(std::string_view path, Error* error) const
{
	const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(path, error);
	if (!keys.has_value())
		return std::nullopt;

	YAMLNodeID current = m_tree.GetRoot();
	for (const std::string& key : keys.value())
	{
		current = m_tree.Resolve(current);
		if (current == INVALID_YAML_NODE)
			break;

		const YAMLNode& node = m_tree.GetNode(current);
		if (node.kind == YAMLNodeKind::Mapping)
		{
			current = m_tree.LookupMappingValue(current, key);
		}
		else if (node.kind == YAMLNodeKind::Sequence)
		{
			const std::optional<size_t> index = JsonPointer::ParseArrayIndex(key);
			current = (index.has_value() && index.value() < node.children.size()) ? node.children[index.value()] :
																					 INVALID_YAML_NODE;
		}
		else
		{
			current = INVALID_YAML_NODE;
		}

		if (current == INVALID_YAML_NODE)
			break;
	}

	if (current == INVALID_YAML_NODE || m_tree.Resolve(current) == INVALID_YAML_NODE)
	{
		Error::SetPathNotFound(error, path);
		return std::nullopt;
	}

	return m_tree.ToValue(current);
}

bool YAMLDocument::Set(std::string_view path, const Value& value, Error* error)
{
	const std::optional<JsonPointer::Path> keys = ParseWritePath(path, "set", error);
	if (!keys.has_value())
		return false;

	return SetInTree(m_tree, keys.value(), value, error);
}

bool YAMLDocument::Delete(std::string_view path, Error* error)
{
	const std::optional<JsonPointer::Path> keys = ParseWritePath(path, "delete", error);
	if (!keys.has_value())
		return false;

	DeleteInTree(m_tree, keys.value());
	return true;
}

std::string YAMLDocument::Marshal() const
{
	return m_tree.Emit();
}

bool YAMLDocument::SetInTree(YAMLNodeTree& tree, const JsonPointer::Path& keys, const Value& value, Error* error)
{
	YAMLNodeID current = tree.GetRoot();
	for (size_t i = 0; i < keys.size(); i++)
	{
		const std::string& key = keys[i];
		const bool last = (i + 1 == keys.size());

		// Writes go through aliases to the anchored node.
		const YAMLNodeID resolved = tree.Resolve(current);
		if (resolved == INVALID_YAML_NODE)
		{
			Error::SetTypeMismatch(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1),
				"mapping or sequence", YAMLNodeTree::GetKindName(YAMLNodeKind::Alias));
			return false;
		}
		current = resolved;

		YAMLNode& node = tree.GetNode(current);
		if (node.kind == YAMLNodeKind::Scalar)
		{
			if (i == 0)
			{
				Error::SetTypeMismatch(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1),
					"mapping or sequence", YAMLNodeTree::GetKindName(node.kind));
				return false;
			}

			// The path continues below a scalar, which becomes an empty mapping.
			node.kind = YAMLNodeKind::Mapping;
			node.tag = YAMLTag::None;
			node.style = YAMLScalarStyle::Plain;
			node.explicit_tag = false;
			node.custom_tag.clear();
			node.value.clear();
			node.children.clear();
			node.flow = false;
		}

		if (node.kind == YAMLNodeKind::Mapping)
		{
			if (const std::optional<size_t> index = tree.FindMappingKey(current, key); index.has_value())
			{
				const YAMLNodeID child = node.children[index.value() + 1];
				if (!last)
				{
					current = child;
					continue;
				}

				const YAMLNodeID target = tree.Resolve(child);
				tree.SetNodeValue((target != INVALID_YAML_NODE) ? target : child, value);
				return true;
			}

			const YAMLNodeID value_id = last ? tree.CreateNode(value) : tree.AddContainer(ContainerKindForNextSegment(keys[i + 1]));
			const YAMLNodeID key_id = tree.AddScalar(key, YAMLTag::Str);
			YAMLNode& parent = tree.GetNode(current);
			parent.children.push_back(key_id);
			parent.children.push_back(value_id);
			if (last)
				return true;

			current = value_id;
			continue;
		}

		// Sequence.
		const size_t length = node.children.size();
		std::string_view remaining;
		const std::optional<s64> index = StringUtil::FromChars<s64>(key, 10, &remaining);
		if (!index.has_value() || !remaining.empty())
		{
			Error::SetInvalidPath(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1), "array index must be a number");
			return false;
		}

		if (index.value() < 0 || static_cast<u64>(index.value()) > length)
		{
			Error::SetInvalidPath(error, JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1),
				fmt::format("array index {} out of range [0, {}]", index.value(), length));
			return false;
		}

		if (static_cast<size_t>(index.value()) == length)
		{
			const YAMLNodeID item_id = last ? tree.CreateNode(value) : tree.AddContainer(ContainerKindForNextSegment(keys[i + 1]));
			tree.GetNode(current).children.push_back(item_id);
			if (last)
				return true;

			current = item_id;
			continue;
		}

		const YAMLNodeID child = node.children[static_cast<size_t>(index.value())];
		if (!last)
		{
			current = child;
			continue;
		}

		const YAMLNodeID target = tree.Resolve(child);
		tree.SetNodeValue((target != INVALID_YAML_NODE) ? target : child, value);
		return true;
	}

	return true;
}

void YAMLDocument::DeleteInTree(YAMLNodeTree& tree, const JsonPointer::Path& keys)
{
	YAMLNodeID parent = tree.GetRoot();
	for (size_t i = 0; i < keys.size(); i++)
	{
		parent = tree.Resolve(parent);
		if (parent == INVALID_YAML_NODE)
			return;

		const std::string& key = keys[i];
		const bool last = (i + 1 == keys.size());
		YAMLNode& node = tree.GetNode(parent);
		if (node.kind == YAMLNodeKind::Mapping)
		{
			const std::optional<size_t> index = tree.FindMappingKey(parent, key);
			if (!index.has_value())
				return;

			if (last)
			{
				// Removes an alias entry itself, never its target.
				node.children.erase(node.children.begin() + index.value(), node.children.begin() + index.value() + 2);
				return;
			}

			parent = node.children[index.value() + 1];
		}
		else if (node.kind == YAMLNodeKind::Sequence)
		{
			const std::optional<size_t> index = JsonPointer::ParseArrayIndex(key);
			if (!index.has_value() || index.value() >= node.children.size())
				return;

			if (last)
			{
				node.children.erase(node.children.begin() + index.value());
				return;
			}

			parent = node.children[index.value()];
		}
		else
		{
			return;
		}
	}
}
