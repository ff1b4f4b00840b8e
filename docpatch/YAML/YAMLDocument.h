// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Document.h"
#include "docpatch/YAML/YAMLNodeTree.h"

#include <memory>

/// YAML document backed by an owned node graph. Edits mutate nodes in place, so comments,
/// key order, quoting, flow style and anchors written in the source survive an Apply().
class YAMLDocument final : public Document
{
public:
	YAMLDocument();
	explicit YAMLDocument(YAMLNodeTree tree);
	~YAMLDocument() override;

	/// Parses the bytes into a node tree for the path-oriented methods below.
	static std::unique_ptr<YAMLDocument> Parse(std::string_view data, Error* error);

	DocumentFormat GetFormat() const override;
	std::optional<Value::Object> Get(std::string_view data, Error* error) const override;
	std::optional<std::string> Apply(std::string_view data, const PatchSet& patches, Error* error) const override;
	std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const override;

	/// Reads a value, resolving aliases and merge keys. Misses are path not found errors.
	std::optional<Value> Lookup(std::string_view path, Error* error) const;

	/// Sets a value, creating missing containers. Existing nodes are updated in place.
	bool Set(std::string_view path, const Value& value, Error* error);

	/// Removes a mapping key or sequence element. Missing paths are not an error.
	bool Delete(std::string_view path, Error* error);

	/// Emits the current tree.
	std::string Marshal() const;

	__fi const YAMLNodeTree& GetTree() const { return m_tree; }

private:
	static bool SetInTree(YAMLNodeTree& tree, const JsonPointer::Path& keys, const Value& value, Error* error);
	static void DeleteInTree(YAMLNodeTree& tree, const JsonPointer::Path& keys);

	YAMLNodeTree m_tree;
};
