#pragma once
// =============================================================================
// CursorZoom - SettingsManager
// Loads, validates and saves config.json: named zoom profiles, the default
// profile, per-display scale overrides and the debug logging switch.
// Readers take an immutable snapshot; writers swap in a new one.
//
// Format 3 stores zoom_speed / follow_speed as progress per second. Older
// documents (version 2.x and below) store progress per frame; they are
// converted at kLegacyFrameRate on load and saved back as format 3.
// =============================================================================

#include "cursorzoom/display/CoordinateClassifier.h"
#include "cursorzoom/logic/ZoomProfile.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CursorZoom
{

struct Settings
{
    using ProfileMap = std::map<std::string, std::shared_ptr<const ZoomProfile>, std::less<>>;
    using OverrideMap = std::map<std::string, ScaleOverride, std::less<>>;

    static constexpr const char* kFormatVersion = "3.0.0";
    static constexpr float kLegacyFrameRate = 60.0f;

    std::string version = kFormatVersion;
    std::string defaultProfile = "standard";
    bool debugLogging = false;
    ProfileMap profiles;
    OverrideMap displayOverrides;

    // Built-in configuration: standard, presentation and quick profiles.
    static Settings defaults();

    std::shared_ptr<const ZoomProfile> findProfile(std::string_view name) const;

    // Never null: the named default, else the first profile, else a
    // built-in standard profile.
    std::shared_ptr<const ZoomProfile> resolveDefaultProfile() const;

    std::optional<ScaleOverride> displayOverride(std::string_view displayId) const;
    std::vector<std::string> profileNames() const;

    // Editing helpers for building a new snapshot before applySnapshot().
    void addProfile(const ZoomProfile& profile);
    bool removeProfile(std::string_view name);        // refuses to remove the last one
    bool setDefaultProfile(std::string_view name);    // false if unknown
};

class SettingsManager
{
public:
    SettingsManager();

    // Returns false on missing/corrupt file; the current settings stay in effect.
    bool loadFromFile(const char* path);

    // Creates parent directories if needed.
    bool saveToFile(const char* path) const;

    // Lock-free snapshot read.
    std::shared_ptr<const Settings> snapshot() const;

    // Validates, swaps, bumps the version and notifies observers.
    void applySnapshot(const Settings& settings);

    // %APPDATA%\CursorZoom\config.json, or $HOME/.cursorzoom/config.json.
    // Empty when the environment gives no home directory.
    static std::string getDefaultConfigPath();

    // Observers run synchronously on the thread calling applySnapshot()/loadFromFile().
    using ChangeCallback = void (*)(const Settings&, void* userData);
    void addObserver(ChangeCallback cb, void* userData);

    // Tick threads compare this once per frame to detect changes cheaply.
    uint64_t version() const;

    // Parses a config document. Never throws; invalid fields keep defaults.
    static std::optional<Settings> parse(std::string_view jsonText);
    static std::string serialize(const Settings& settings);

private:
    void publish(Settings settings);

    std::shared_ptr<const Settings> current_;
    std::atomic<uint64_t> version_{0};

    struct Observer { ChangeCallback cb; void* userData; };
    std::vector<Observer> observers_;
};

} // namespace CursorZoom
