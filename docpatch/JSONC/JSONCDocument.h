// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Document.h"
#include "docpatch/JSONC/JSONCTree.h"

#include <memory>
#include <vector>

/// JSON with comments. Patches are applied to a token tree that keeps every comment and all
/// whitespace not touched by an edit.
class JSONCDocument final : public Document
{
public:
	JSONCDocument();
	~JSONCDocument() override;

	static std::unique_ptr<JSONCDocument> Parse(std::string_view data, Error* error);

	DocumentFormat GetFormat() const override;
	std::optional<Value::Object> Get(std::string_view data, Error* error) const override;
	std::optional<std::string> Apply(std::string_view data, const PatchSet& patches, Error* error) const override;
	std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const override;

	/// Applies each patch to the tree in order. Patches that fail are skipped, nothing is rolled back.
	static std::vector<PatchOutcome> ApplyToTree(JSONCTree& tree, const PatchSet& patches);

private:
	static void EnsureIntermediateObjects(JSONCTree& tree, const JsonPointer::Path& keys);
};
