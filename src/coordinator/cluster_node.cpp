#include "cluster_node.hpp"

////////////////////////////////////////////
// ClusterNode methods
////////////////////////////////////////////

/* Param constructor */
ClusterNode::ClusterNode(const NodeInfo &info)
    : id(info.id),
      address(info.endpoint()),
      isCoordinator(info.isCoordinator),
      isUp(false),
      heardFrom(false)
{
    stats.dataBytesTotal = info.capacityBytes;
}

uint64_t ClusterNode::freeBytes() const
{
    uint64_t committed = stats.dataBytesUsed + stats.dataBytesReserved;
    return committed >= stats.dataBytesTotal ? 0 : stats.dataBytesTotal - committed;
}

std::string ClusterNode::toString() const
{
    return "node " + std::to_string(id) + " (" + address + ", " + (isUp ? "up" : "down") + ")";
}
