#include <cpprest/json.h>
#include "coordinator_config.hpp"
#include "errors.hpp"

using namespace web;

CoordinatorConfig::CoordinatorConfig(std::string configFilePath)
    : Config(configFilePath)
{
    loadVariables();
}

CoordinatorConfig::CoordinatorConfig(json::value jsonConfig)
    : Config(std::move(jsonConfig))
{
    loadVariables();
}

void CoordinatorConfig::loadVariables()
{
    loadClusterVariables();

    /**
     * coordinator-specific config
     */
    this->metadataDir = "metadata";

    try
    {
        if (this->jsonConfig.has_field(U("coordinator")))
        {
            json::value coordinator = this->jsonConfig.at(U("coordinator"));
            if (coordinator.has_field(U("metadataDir")))
                this->metadataDir = coordinator.at(U("metadataDir")).as_string();
        }
    }
    catch (const json::json_exception &e)
    {
        throw ConfigError(std::string("Invalid coordinator config: ") + e.what());
    }
}

std::string CoordinatorConfig::listenAddress() const
{
    const NodeInfo &self = coordinatorNode();
    return "http://" + self.address + ":" + std::to_string(self.port);
}
