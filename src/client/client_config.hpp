#pragma once
#include <string>
#include "config.hpp"

/**
 * Config of the command-line client: the shared cluster section only.
 */
class ClientConfig : public Config 
{
public:
    explicit ClientConfig(std::string configFilePath);
    explicit ClientConfig(json::value jsonConfig);
    void loadVariables() override;

    /**
     * Base uri of the coordinator, e.g. "http://127.0.0.1:9001".
     */
    std::string coordinatorAddress() const;
};
