#pragma once
#include <string>
#include "config.hpp"

/**
 * Config of one node agent: the shared cluster section plus the
 * `node` section of config.json.
 */
class NodeConfig : public Config 
{
public:
    NodeConfig(std::string configFilePath, int32_t nodeId);
    NodeConfig(json::value jsonConfig, int32_t nodeId);
    void loadVariables() override;

    /* Id of the node this process runs as */
    int32_t nodeId;

    /* store directory ('blockpool/' by default); blocks go in node_<id>/ below it */
    std::string storeDirPath;

    /* True if should remove the existing store, false otherwise */
    bool removeExistingStore;

    /* This node's entry in `nodes` */
    const NodeInfo& self() const;
};
