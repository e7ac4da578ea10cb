/**
 * node_db.cpp - Node snapshot store
 * 
 */

#include "node_db.h"

#include <algorithm>

#include "mesh_log.h"

#define TAG "NodeDb"

NodeDb::NodeDb() : _myNodeNum(0) {
}

void NodeDb::setMyNodeNum(uint32_t nodeNum) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_myNodeNum != nodeNum) {
        MESH_LOGI(TAG, "local node is %08X", nodeNum);
    }
    _myNodeNum = nodeNum;
}

bool NodeDb::hasMyNodeNum() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _myNodeNum != 0;
}

uint32_t NodeDb::myNodeNum() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _myNodeNum;
}

void NodeDb::upsert(const NodeInfo& node) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<uint32_t, NodeInfo>::iterator it = _nodes.find(node.nodeNum);
    if (it == _nodes.end()) {
        _nodes[node.nodeNum] = node;
        MESH_LOGD(TAG, "new node %08X '%s'", node.nodeNum, node.longName.c_str());
        return;
    }

    NodeInfo& cur = it->second;
    if (node.hasUser) {
        cur.hasUser = true;
        cur.userId = node.userId;
        cur.longName = node.longName;
        cur.shortName = node.shortName;
        cur.hwModel = node.hwModel;
        cur.role = node.role;
    }
    if (node.hasPosition) {
        cur.hasPosition = true;
        cur.position = node.position;
    }
    if (node.hasSnr) {
        cur.hasSnr = true;
        cur.snr = node.snr;
    }
    if (node.lastHeard > cur.lastHeard) {
        cur.lastHeard = node.lastHeard;
    }
    cur.hopsAway = node.hopsAway;
    cur.viaMqtt = node.viaMqtt;
}

void NodeDb::updatePosition(uint32_t nodeNum, const PositionInfo& position, uint32_t heardAt) {
    std::lock_guard<std::mutex> lock(_mutex);
    NodeInfo& cur = _nodes[nodeNum];
    cur.nodeNum = nodeNum;
    cur.hasPosition = true;
    cur.position = position;
    if (heardAt > cur.lastHeard) {
        cur.lastHeard = heardAt;
    }
}

bool NodeDb::get(uint32_t nodeNum, NodeInfo* out) const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<uint32_t, NodeInfo>::const_iterator it = _nodes.find(nodeNum);
    if (it == _nodes.end()) {
        return false;
    }
    if (out != nullptr) {
        *out = it->second;
    }
    return true;
}

bool NodeDb::getSelf(NodeInfo* out) const {
    uint32_t self = myNodeNum();
    return self != 0 && get(self, out);
}

static bool heardLater(const NodeInfo& a, const NodeInfo& b) {
    return a.lastHeard > b.lastHeard;
}

std::vector<NodeInfo> NodeDb::all() const {
    std::vector<NodeInfo> out;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        out.reserve(_nodes.size());
        for (std::map<uint32_t, NodeInfo>::const_iterator it = _nodes.begin(); it != _nodes.end(); ++it) {
            out.push_back(it->second);
        }
    }
    std::stable_sort(out.begin(), out.end(), heardLater);
    return out;
}

size_t NodeDb::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _nodes.size();
}

void NodeDb::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _nodes.clear();
    _myNodeNum = 0;
}
