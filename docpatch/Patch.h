// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/Error.h"

#include "docpatch/Value.h"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class PatchOp : u8
{
	Add,
	Replace,
	Remove,
};

/// Per-patch result of a best-effort batch. Callers only ever see "skipped, no error".
enum class PatchOutcome : u8
{
	Applied,
	SkippedInvalidPath,
	SkippedUnsupported,
	Failed,
};

/// One RFC 6902 style operation: {op, path, value?}. The value is only meaningful for Add/Replace.
struct Patch
{
	PatchOp op = PatchOp::Add;
	std::string path;
	Value value;

	static Patch Add(std::string path, Value value);
	static Patch Replace(std::string path, Value value);
	static Patch Remove(std::string path);

	/// Builds a patch from its wire representation, op being "add", "replace" or "remove".
	static std::optional<Patch> FromWire(std::string_view op, std::string path, std::optional<Value> value, Error* error);

	bool operator==(const Patch& p) const;
	bool operator!=(const Patch& p) const;
};

/// Ordered batch of patches. Later patches observe the effects of earlier ones.
class PatchSet
{
public:
	using const_iterator = std::vector<Patch>::const_iterator;

	PatchSet();
	PatchSet(std::initializer_list<Patch> patches);
	~PatchSet();

	void Add(std::string path, Value value);
	void Replace(std::string path, Value value);
	void Remove(std::string path);
	void Append(Patch patch);

	__fi size_t size() const { return m_patches.size(); }
	__fi bool empty() const { return m_patches.empty(); }
	__fi const Patch& operator[](size_t index) const { return m_patches[index]; }
	__fi const_iterator begin() const { return m_patches.begin(); }
	__fi const_iterator end() const { return m_patches.end(); }

private:
	std::vector<Patch> m_patches;
};

const char* GetPatchOpName(PatchOp op);
std::optional<PatchOp> ParsePatchOpName(std::string_view name);
const char* GetPatchOutcomeName(PatchOutcome outcome);

/// Applies a batch to a plain nested object, best-effort. A patch whose path does not parse,
/// addresses the root, or whose op is unknown is skipped. Add/Replace create missing intermediate
/// objects but skip the whole patch if an existing intermediate is not an object. Remove of a
/// missing path is a no-op.
std::vector<PatchOutcome> ApplyPatchesToMapping(Value::Object& mapping, const PatchSet& patches);
