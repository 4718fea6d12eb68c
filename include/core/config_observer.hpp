#pragma once

#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Describes one applied configuration change
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Dotted keys, e.g. "transcoder.crf"
    std::string source;                    // "api", "file_load" or "file_observer"
    std::string update_id;

    bool touches(const std::string &key) const
    {
        return std::find(changed_keys.begin(), changed_keys.end(), key) != changed_keys.end();
    }

    // True when any changed key lives under the given section ("transcoder", "clip", ...)
    bool touchesSection(const std::string &section) const
    {
        const std::string prefix = section + ".";
        return std::any_of(changed_keys.begin(), changed_keys.end(), [&](const std::string &key)
                           { return key.compare(0, prefix.size(), prefix) == 0; });
    }
};

class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
