#include "client_config.hpp"

ClientConfig::ClientConfig(std::string configFilePath)
    : Config(configFilePath)
{
    loadVariables();
}

ClientConfig::ClientConfig(json::value jsonConfig)
    : Config(std::move(jsonConfig))
{
    loadVariables();
}

void ClientConfig::loadVariables()
{
    loadClusterVariables();
}

std::string ClientConfig::coordinatorAddress() const
{
    return coordinatorNode().endpoint();
}
