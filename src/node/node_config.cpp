#include <cpprest/json.h>
#include "node_config.hpp"
#include "errors.hpp"

using namespace web;

NodeConfig::NodeConfig(std::string configFilePath, int32_t nodeId)
    : Config(configFilePath),
      nodeId(nodeId)
{
    loadVariables();
}

NodeConfig::NodeConfig(json::value jsonConfig, int32_t nodeId)
    : Config(std::move(jsonConfig)),
      nodeId(nodeId)
{
    loadVariables();
}

void NodeConfig::loadVariables()
{
    loadClusterVariables();

    // throws ConfigError if the id isn't configured
    node(nodeId);

    /**
     * node-specific config
     */
    this->storeDirPath = "blockpool";
    this->removeExistingStore = false;

    try
    {
        if (this->jsonConfig.has_field(U("node")))
        {
            json::value nodeSection = this->jsonConfig.at(U("node"));

            if (nodeSection.has_field(U("storeDirPath")))
                this->storeDirPath = nodeSection.at(U("storeDirPath")).as_string();
            if (nodeSection.has_field(U("removeExistingStore")))
                this->removeExistingStore = nodeSection.at(U("removeExistingStore")).as_bool();
        }
    }
    catch (const json::json_exception &e)
    {
        throw ConfigError(std::string("Invalid node config: ") + e.what());
    }
}

const NodeInfo& NodeConfig::self() const
{
    return node(nodeId);
}
