// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JSONC/JSONCDocument.h"
#include "docpatch/JSON/JSONCodec.h"

#include "common/Console.h"
#include "common/StringUtil.h"

JSONCDocument::JSONCDocument() = default;

JSONCDocument::~JSONCDocument() = default;

std::unique_ptr<JSONCDocument> JSONCDocument::Parse(std::string_view data, Error* error)
{
	const std::string_view trimmed = StringUtil::StripWhitespace(data);
	if (!trimmed.empty() && !JSONCTree::Parse(trimmed, error).has_value())
		return {};

	return std::make_unique<JSONCDocument>();
}

DocumentFormat JSONCDocument::GetFormat() const
{
	return DocumentFormat::JSONC;
}

std::optional<Value::Object> JSONCDocument::Get(std::string_view data, Error* error) const
{
	return JSONCodec::DecodeObject(data, JSONCodec::Dialect::Relaxed, "JSONC", error);
}

std::optional<std::string> JSONCDocument::Apply(std::string_view data, const PatchSet& patches, Error* error) const
{
	const std::string_view trimmed = StringUtil::StripWhitespace(data);
	if (patches.empty())
	{
		if (trimmed.empty())
			return std::string("{}\n");

		const std::optional<JSONCTree> tree = JSONCTree::Parse(trimmed, error);
		if (!tree.has_value())
			return std::nullopt;

		return tree->Pack();
	}

	std::optional<JSONCTree> tree;
	if (!trimmed.empty())
	{
		Error parse_error;
		tree = JSONCTree::Parse(trimmed, &parse_error);
		if (!tree.has_value())
			DEV_LOG("Replacing unparsable JSONC document with an empty object: {}", parse_error.GetDescription());
	}
	if (!tree.has_value())
		tree.emplace();

	ApplyToTree(tree.value(), patches);
	return tree->Pack();
}

std::optional<std::string> JSONCDocument::MarshalTestData(const Value::Object& data, Error* error) const
{
	std::optional<std::string> ret = JSONCodec::Encode(Value(data), true, error);
	if (ret.has_value())
		ret->push_back('\n');

	return ret;
}

std::vector<PatchOutcome> JSONCDocument::ApplyToTree(JSONCTree& tree, const PatchSet& patches)
{
	std::vector<PatchOutcome> outcomes;
	outcomes.reserve(patches.size());

	for (const Patch& patch : patches)
	{
		const std::optional<JsonPointer::Path> keys = JsonPointer::Parse(patch.path);
		if (!keys.has_value() || keys->empty())
		{
			DEV_LOG("Skipping JSONC {} patch with invalid path \"{}\"", GetPatchOpName(patch.op), patch.path);
			outcomes.push_back(PatchOutcome::SkippedInvalidPath);
			continue;
		}

		Error error;
		bool result;
		switch (patch.op)
		{
			case PatchOp::Add:
				EnsureIntermediateObjects(tree, keys.value());
				result = tree.Add(patch.path, patch.value, &error);
				break;

			case PatchOp::Replace:
				result = tree.Replace(patch.path, patch.value, &error);
				break;

			case PatchOp::Remove:
				result = tree.Remove(patch.path, &error);
				break;

			default:
				DEV_LOG("Skipping JSONC patch with unknown op at \"{}\"", patch.path);
				outcomes.push_back(PatchOutcome::SkippedUnsupported);
				continue;
		}

		if (!result)
			DEV_LOG("JSONC {} at \"{}\" failed: {}", GetPatchOpName(patch.op), patch.path, error.GetDescription());

		outcomes.push_back(result ? PatchOutcome::Applied : PatchOutcome::Failed);
	}

	return outcomes;
}

void JSONCDocument::EnsureIntermediateObjects(JSONCTree& tree, const JsonPointer::Path& keys)
{
	if (keys.size() <= 1)
		return;

	// Work out the missing prefixes on a decoded copy, then create them root to leaf.
	const std::optional<Value> decoded = tree.Decode(nullptr);
	const Value* current = decoded.has_value() ? &decoded.value() : nullptr;

	std::vector<std::string> missing;
	for (size_t i = 0; i + 1 < keys.size(); i++)
	{
		if (current)
		{
			if (const Value* child = current->Find(keys[i]))
			{
				if (!child->IsObject())
					return;

				current = child;
				continue;
			}

			current = nullptr;
		}

		missing.push_back(JsonPointer::BuildRange(keys.begin(), keys.begin() + i + 1));
	}

	for (const std::string& prefix : missing)
	{
		Error error;
		if (!tree.Add(prefix, Value(Value::Object()), &error))
		{
			DEV_LOG("Failed to create JSONC object at \"{}\": {}", prefix, error.GetDescription());
			return;
		}
	}
}
