#ifndef REVHIST_LINKED_NODE_HPP
#define REVHIST_LINKED_NODE_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace revhist {

// Position in the version history of an attribute
using Revision = int64_t;

// Handle of a node inside a NodeSlab; replaces prev/next pointers
using NodeIndex = size_t;

constexpr NodeIndex NULL_INDEX = std::numeric_limits<NodeIndex>::max();

/**
 * Doubly-linked cell. Queues store a revision in `key`; the cursor sequence
 * leaves it empty. prev/next are structural links owned by the slab, never
 * handed out to callers.
 */
template <typename V>
struct LinkedNode {
  std::optional<Revision> key;
  V value;
  NodeIndex prev = NULL_INDEX;
  NodeIndex next = NULL_INDEX;

  LinkedNode(std::optional<Revision> k, V v, NodeIndex p, NodeIndex n)
      : key(k), value(std::move(v)), prev(p), next(n) {}
};

}  // namespace revhist

#endif  // REVHIST_LINKED_NODE_HPP
