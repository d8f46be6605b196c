#pragma once

#include <yaml-cpp/yaml.h>

namespace dscv {
namespace client {

// Deep merge of a user file over the built-in defaults.
// Maps recurse; a scalar or sequence in the overlay replaces the base value.
// A null overlay value keeps the default instead of erasing it.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (!base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

} // namespace client
} // namespace dscv
