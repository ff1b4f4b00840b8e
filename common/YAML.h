// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "Error.h"

#include "ryml_std.hpp"
#include "ryml.hpp"

#include <optional>
#include <string_view>

/// Parse a YAML document with RapidYAML, and use setjmp/longjmp to recover from
/// parsing errors (as is recommended by the documentation for cases where
/// exceptions are disabled). The file_name parameter is only used for error
/// messages, which are returned via the error parameter along with the line
/// and column the parser stopped at.
///
/// The source is copied into the tree's arena, so scalars in the returned tree
/// point into tree.arena() rather than into the caller's buffer.
std::optional<ryml::Tree> ParseYAMLFromString(ryml::csubstr yaml, ryml::csubstr file_name, Error* error);

/// Helpers for moving between std::string_view and RapidYAML's substring type.
static inline ryml::csubstr ToCSubstr(std::string_view str)
{
	return ryml::csubstr(str.data(), str.size());
}
static inline std::string_view ToStringView(ryml::csubstr str)
{
	return std::string_view(str.str, str.len);
}
