#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sonarbridge {

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    nlohmann::json to_json() const;
};

const std::vector<PromptDescriptor>& prompt_descriptors();

// prompts/get result: {description, messages:[{role, content:{type,text}}]}.
// Missing recency falls back to "month"; an unknown name is a validation error.
Result<nlohmann::json> render_prompt(const std::string& name, const nlohmann::json& arguments);

} // namespace sonarbridge
