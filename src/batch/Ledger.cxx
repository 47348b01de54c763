// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Ledger.hxx"

unsigned
ResourceLedger::Capacity(std::string_view name) const noexcept
{
	auto i = nodes.find(name);
	return i != nodes.end() ? i->second.capacity : 0;
}

unsigned
ResourceLedger::Committed(std::string_view name) const noexcept
{
	auto i = nodes.find(name);
	return i != nodes.end() ? i->second.committed : 0;
}

bool
ResourceLedger::SetCapacity(std::string_view name, unsigned capacity) noexcept
{
	auto i = nodes.find(name);
	if (i == nodes.end())
		i = nodes.emplace(std::string{name}, Node{}).first;
	else if (capacity < i->second.committed)
		return false;

	i->second.capacity = capacity;
	return true;
}

bool
ResourceLedger::TryReserve(std::string_view name, unsigned cpus) noexcept
{
	auto i = nodes.find(name);
	if (i == nodes.end())
		return false;

	auto &node = i->second;
	if (cpus > node.capacity || node.committed > node.capacity - cpus)
		return false;

	node.committed += cpus;
	return true;
}

void
ResourceLedger::Release(std::string_view name, unsigned cpus) noexcept
{
	auto i = nodes.find(name);
	if (i == nodes.end())
		return;

	auto &node = i->second;
	node.committed = cpus < node.committed ? node.committed - cpus : 0;
}
