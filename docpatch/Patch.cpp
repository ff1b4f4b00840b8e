// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/Patch.h"
#include "docpatch/JsonPointer.h"

#include "common/Console.h"

Patch Patch::Add(std::string path, Value value)
{
	return Patch{PatchOp::Add, std::move(path), std::move(value)};
}

Patch Patch::Replace(std::string path, Value value)
{
	return Patch{PatchOp::Replace, std::move(path), std::move(value)};
}

Patch Patch::Remove(std::string path)
{
	return Patch{PatchOp::Remove, std::move(path), Value()};
}

std::optional<Patch> Patch::FromWire(std::string_view op, std::string path, std::optional<Value> value, Error* error)
{
	const std::optional<PatchOp> parsed_op = ParsePatchOpName(op);
	if (!parsed_op.has_value())
	{
		Error::SetStringFmt(error, "unknown patch operation \"{}\"", op);
		return std::nullopt;
	}

	if (parsed_op.value() != PatchOp::Remove && !value.has_value())
	{
		Error::SetStringFmt(error, "patch operation \"{}\" at \"{}\" requires a value", op, path);
		return std::nullopt;
	}

	Patch ret;
	ret.op = parsed_op.value();
	ret.path = std::move(path);
	if (ret.op != PatchOp::Remove)
		ret.value = std::move(value.value());

	return ret;
}

bool Patch::operator==(const Patch& p) const
{
	return (op == p.op && path == p.path && value == p.value);
}

bool Patch::operator!=(const Patch& p) const
{
	return !operator==(p);
}

PatchSet::PatchSet() = default;

PatchSet::PatchSet(std::initializer_list<Patch> patches)
	: m_patches(patches)
{
}

PatchSet::~PatchSet() = default;

void PatchSet::Add(std::string path, Value value)
{
	m_patches.push_back(Patch::Add(std::move(path), std::move(value)));
}

void PatchSet::Replace(std::string path, Value value)
{
	m_patches.push_back(Patch::Replace(std::move(path), std::move(value)));
}

void PatchSet::Remove(std::string path)
{
	m_patches.push_back(Patch::Remove(std::move(path)));
}

void PatchSet::Append(Patch patch)
{
	m_patches.push_back(std::move(patch));
}

const char* GetPatchOpName(PatchOp op)
{
	switch (op)
	{
		case PatchOp::Add:
			return "add";
		case PatchOp::Replace:
			return "replace";
		case PatchOp::Remove:
			return "remove";
		default:
			return "unknown";
	}
}

std::optional<PatchOp> ParsePatchOpName(std::string_view name)
{
	if (name == "add")
		return PatchOp::Add;
	else if (name == "replace")
		return PatchOp::Replace;
	else if (name == "remove")
		return PatchOp::Remove;
	else
		return std::nullopt;
}

const char* GetPatchOutcomeName(PatchOutcome outcome)
{
	static constexpr const char* s_outcome_names[] = {
		"Applied",
		"SkippedInvalidPath",
		"SkippedUnsupported",
		"Failed",
	};

	return s_outcome_names[static_cast<u32>(outcome)];
}

static PatchOutcome SetMappingValue(Value::Object& mapping, const JsonPointer::Path& keys, const Value& value)
{
	// Check the whole chain first so a blocked patch leaves nothing behind.
	const Value::Object* check = &mapping;
	for (size_t i = 0; i < keys.size() - 1; i++)
	{
		const auto it = check->find(keys[i]);
		if (it == check->end())
			break;
		if (!it->second.IsObject())
			return PatchOutcome::Failed;

		check = &it->second.GetObject();
	}

	Value::Object* current = &mapping;
	for (size_t i = 0; i < keys.size() - 1; i++)
	{
		Value& next = (*current)[keys[i]];
		if (!next.IsObject())
			next = Value::Object();

		current = &next.GetObject();
	}

	current->insert_or_assign(keys.back(), value);
	return PatchOutcome::Applied;
}

static PatchOutcome RemoveMappingValue(Value::Object& mapping, const JsonPointer::Path& keys)
{
	Value::Object* current = &mapping;
	for (size_t i = 0; i < keys.size() - 1; i++)
	{
		const auto it = current->find(keys[i]);
		if (it == current->end() || !it->second.IsObject())
			return PatchOutcome::Applied;

		current = &it->second.GetObject();
	}

	current->erase(keys.back());
	return PatchOutcome::Applied;
}

std::vector<PatchOutcome> ApplyPatchesToMapping(Value::Object& mapping, const PatchSet& patches)
{
	std::vector<PatchOutcome> outcomes;
	outcomes.reserve(patches.size());

	for (const Patch& patch : patches)
	{
		std::optional<JsonPointer::Path> keys = JsonPointer::Parse(patch.path);
		if (!keys.has_value() || keys->empty())
		{
			DEV_LOG("Skipping {} patch with unusable path \"{}\"", GetPatchOpName(patch.op), patch.path);
			outcomes.push_back(PatchOutcome::SkippedInvalidPath);
			continue;
		}

		PatchOutcome outcome;
		switch (patch.op)
		{
			case PatchOp::Add:
			case PatchOp::Replace:
				outcome = SetMappingValue(mapping, keys.value(), patch.value);
				break;

			case PatchOp::Remove:
				outcome = RemoveMappingValue(mapping, keys.value());
				break;

			default:
				outcome = PatchOutcome::SkippedUnsupported;
				break;
		}

		if (outcome != PatchOutcome::Applied)
			DEV_LOG("Skipping {} patch at \"{}\": {}", GetPatchOpName(patch.op), patch.path, GetPatchOutcomeName(outcome));

		outcomes.push_back(outcome);
	}

	return outcomes;
}
