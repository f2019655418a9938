#pragma once
#include "ITool.h"

class BashManager;

/**
 * @brief `bash` tool: run a command in the persistent shell session.
 *
 * Arguments: command (string, required), restart (boolean, optional).
 */
class BashTool : public ITool {
public:
    explicit BashTool(BashManager& manager);

    std::string getName() const override { return "bash"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, CancellationToken& token) override;

private:
    BashManager& manager;
};
