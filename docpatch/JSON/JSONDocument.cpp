// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/JSON/JSONDocument.h"
#include "docpatch/JSON/JSONCodec.h"

JSONDocument::JSONDocument() = default;

JSONDocument::~JSONDocument() = default;

std::unique_ptr<JSONDocument> JSONDocument::Parse(std::string_view data, Error* error)
{
	// Nothing is retained, the bytes are only checked here and decoded again by Get()/Apply().
	if (!JSONCodec::DecodeObject(data, JSONCodec::Dialect::Strict, "JSON", error).has_value())
		return {};

	return std::make_unique<JSONDocument>();
}

DocumentFormat JSONDocument::GetFormat() const
{
	return DocumentFormat::JSON;
}

std::optional<Value::Object> JSONDocument::Get(std::string_view data, Error* error) const
{
	return JSONCodec::DecodeObject(data, JSONCodec::Dialect::Strict, "JSON", error);
}

std::optional<std::string> JSONDocument::Apply(std::string_view data, const PatchSet& patches, Error* error) const
{
	std::optional<Value::Object> root = Get(data, error);
	if (!root.has_value())
		return std::nullopt;

	ApplyPatchesToMapping(root.value(), patches);

	return MarshalTestData(root.value(), error);
}

std::optional<std::string> JSONDocument::MarshalTestData(const Value::Object& data, Error* error) const
{
	// Copy into a Value for the encoder.
	std::optional<std::string> ret = JSONCodec::Encode(Value(data), true, error);
	if (ret.has_value())
		ret->push_back('\n');

	return ret;
}
