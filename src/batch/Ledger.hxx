// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

/**
 * Bookkeeping of CPU units per node.  Unknown nodes have no
 * capacity and can never be reserved.
 */
class ResourceLedger {
	struct Node {
		unsigned capacity = 0, committed = 0;
	};

	std::map<std::string, Node, std::less<>> nodes;

public:
	[[gnu::pure]]
	bool HasNode(std::string_view name) const noexcept {
		return nodes.find(name) != nodes.end();
	}

	[[gnu::pure]]
	unsigned Capacity(std::string_view name) const noexcept;

	[[gnu::pure]]
	unsigned Committed(std::string_view name) const noexcept;

	[[gnu::pure]]
	unsigned Free(std::string_view name) const noexcept {
		const unsigned capacity = Capacity(name);
		const unsigned committed = Committed(name);
		return committed < capacity ? capacity - committed : 0;
	}

	/**
	 * Set the capacity of a node, adding it if it is new.
	 *
	 * @return false if the new capacity is smaller than the
	 * committed units (nothing was changed)
	 */
	bool SetCapacity(std::string_view name, unsigned capacity) noexcept;

	/**
	 * Commit the given number of units if they fit into the free
	 * capacity.
	 *
	 * @return true on success, false if there is not enough free
	 * capacity (nothing was changed)
	 */
	bool TryReserve(std::string_view name, unsigned cpus) noexcept;

	/**
	 * Give back units; the committed count does not drop below
	 * zero.
	 */
	void Release(std::string_view name, unsigned cpus) noexcept;
};
