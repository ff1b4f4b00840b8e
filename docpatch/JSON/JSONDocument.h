// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Document.h"

#include <memory>

/// Plain JSON. No formatting memory: every Apply() regenerates the whole layout.
class JSONDocument final : public Document
{
public:
	JSONDocument();
	~JSONDocument() override;

	static std::unique_ptr<JSONDocument> Parse(std::string_view data, Error* error);

	DocumentFormat GetFormat() const override;
	std::optional<Value::Object> Get(std::string_view data, Error* error) const override;
	std::optional<std::string> Apply(std::string_view data, const PatchSet& patches, Error* error) const override;
	std::optional<std::string> MarshalTestData(const Value::Object& data, Error* error) const override;
};
