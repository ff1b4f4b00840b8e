// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/DocumentParser.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>

/// Runs the same set of checks against every registered parser. A document starts out empty and
/// is edited through the bytes-in, bytes-out contract only.
class DocumentTester : public ::testing::TestWithParam<DocumentFormat>
{
protected:
	void SetUp() override;

	/// True if the format can hold the given data, i.e. MarshalTestData doesn't report an
	/// unsupported structure.
	bool Supports(const Value::Object& data) const;

	bool Set(std::string_view path, const Value& value);
	bool Delete(std::string_view path);
	std::optional<Value> Get(std::string_view path) const;
	std::optional<Value::Object> GetRoot() const;

	const DocumentParser* m_parser = nullptr;
	std::unique_ptr<Document> m_document;
	std::string m_data;
};
