// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "Error.h"

#include "fmt/format.h"

Error::Error() = default;

Error::Error(const Error& c) = default;

Error::Error(Error&& e) = default;

Error::~Error() = default;

void Error::Clear()
{
	m_type = Type::None;
	m_description = {};
	m_path = {};
}

void Error::SetString(std::string description)
{
	m_type = Type::User;
	m_description = std::move(description);
	m_path = {};
}

void Error::SetString(Error* errptr, std::string description)
{
	if (errptr)
		errptr->SetString(std::move(description));
}

void Error::SetParse(std::string_view format_name, std::string_view message)
{
	m_type = Type::Parse;
	m_description = fmt::format("failed to parse {}: {}", format_name, message);
	m_path = {};
}

void Error::SetParse(Error* errptr, std::string_view format_name, std::string_view message)
{
	if (errptr)
		errptr->SetParse(format_name, message);
}

void Error::SetPathNotFound(std::string_view path)
{
	m_type = Type::PathNotFound;
	m_description = fmt::format("path not found: {}", path);
	m_path = std::string(path);
}

void Error::SetPathNotFound(Error* errptr, std::string_view path)
{
	if (errptr)
		errptr->SetPathNotFound(path);
}

void Error::SetInvalidPath(std::string_view path, std::string_view reason)
{
	m_type = Type::InvalidPath;
	m_description = fmt::format("invalid path \"{}\": {}", path, reason);
	m_path = std::string(path);
}

void Error::SetInvalidPath(Error* errptr, std::string_view path, std::string_view reason)
{
	if (errptr)
		errptr->SetInvalidPath(path, reason);
}

void Error::SetTypeMismatch(std::string_view path, std::string_view expected, std::string_view actual)
{
	m_type = Type::TypeMismatch;
	m_description = fmt::format("type mismatch at \"{}\": expected {}, got {}", path, expected, actual);
	m_path = std::string(path);
}

void Error::SetTypeMismatch(Error* errptr, std::string_view path, std::string_view expected, std::string_view actual)
{
	if (errptr)
		errptr->SetTypeMismatch(path, expected, actual);
}

void Error::SetUnsupportedStructure(std::string_view path, std::string_view reason)
{
	m_type = Type::UnsupportedStructure;
	if (path.empty())
		m_description = fmt::format("unsupported structure: {}", reason);
	else
		m_description = fmt::format("unsupported structure at \"{}\": {}", path, reason);
	m_path = std::string(path);
}

void Error::SetUnsupportedStructure(Error* errptr, std::string_view path, std::string_view reason)
{
	if (errptr)
		errptr->SetUnsupportedStructure(path, reason);
}

Error& Error::operator=(const Error& e) = default;

Error& Error::operator=(Error&& e) = default;
