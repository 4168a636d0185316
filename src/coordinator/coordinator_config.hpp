#pragma once
#include <string>
#include "config.hpp"

class CoordinatorConfig : public Config 
{
public:
    explicit CoordinatorConfig(std::string configFilePath);
    explicit CoordinatorConfig(json::value jsonConfig);
    void loadVariables() override;

    /**
     * Directory holding the block table journal ('metadata/' by default).
     */
    std::string metadataDir;

    /**
     * Address the coordinator listens on, e.g. "http://0.0.0.0:9001".
     */
    std::string listenAddress() const;
};
