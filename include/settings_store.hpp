#pragma once

#include "config.hpp"
#include <string>
#include <utility>
#include <vector>

namespace dictate {

// Persists Config as "key = value" lines; '#' starts a comment.
// Hotkeys use encode_hotkey()/decode_hotkey().
class SettingsStore {
public:
    // Settings given on the command line as key/value pairs; they win over the file
    using Overrides = std::vector<std::pair<std::string, std::string>>;

    explicit SettingsStore(std::string path = default_settings_path());

    // Fills `config` from the file. A missing file leaves the defaults and
    // succeeds. Bad values are logged and skipped.
    bool load(Config& config) const;

    // Rebuilds `config` from defaults, the file, then `overrides`.
    // False if an override is malformed.
    bool reload(Config& config, const Overrides& overrides) const;

    // Creates the parent directory if needed
    bool save(const Config& config) const;

    const std::string& path() const { return path_; }

    // Applies one setting; false for unknown keys or malformed values
    static bool apply(Config& config, const std::string& key, const std::string& value);

private:
    std::string path_;
};

} // namespace dictate
