/**
 * node_db.h - Last known snapshot of every mesh participant
 * 
 * Keyed by node number. The local node is the entry whose number equals
 * myNodeNum.
 */

#ifndef NODE_DB_H
#define NODE_DB_H

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "mesh_types.h"

class NodeDb {
public:
    NodeDb();

    void setMyNodeNum(uint32_t nodeNum);
    bool hasMyNodeNum() const;
    uint32_t myNodeNum() const;   // 0 if unknown

    /**
     * Merge a node-info snapshot. Fields absent from the update (no user,
     * no position, no SNR) keep their previous values.
     */
    void upsert(const NodeInfo& node);

    /**
     * Record a position report from POSITION_APP
     */
    void updatePosition(uint32_t nodeNum, const PositionInfo& position, uint32_t heardAt);

    bool get(uint32_t nodeNum, NodeInfo* out) const;
    bool getSelf(NodeInfo* out) const;

    /** All nodes, most recently heard first */
    std::vector<NodeInfo> all() const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex _mutex;
    uint32_t _myNodeNum;
    std::map<uint32_t, NodeInfo> _nodes;
};

#endif // NODE_DB_H
