// =============================================================================
// CursorZoom - SettingsManager
// Config persistence and thread-safe snapshots.
// =============================================================================

#include "cursorzoom/support/SettingsManager.h"
#include "cursorzoom/support/Log.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace CursorZoom
{

using json = nlohmann::json;

// ─── Defaults ────────────────────────────────────────────────────────────────

static ZoomProfile makeProfile(const char* name, float factor, float zoomSpeed,
                               float followSpeed, float border, Easing::Kind easing)
{
    ZoomProfile p;
    p.name = name;
    p.zoomFactor = factor;
    p.zoomSpeed = zoomSpeed;
    p.followSpeed = followSpeed;
    p.followBorder = border;
    p.easing = easing;
    p.autoFollow = true;
    return p;
}

static const std::shared_ptr<const ZoomProfile>& builtinStandard()
{
    static const std::shared_ptr<const ZoomProfile> profile =
        std::make_shared<const ZoomProfile>();
    return profile;
}

Settings Settings::defaults()
{
    Settings s;
    s.addProfile(makeProfile("standard", 2.0f, 3.6f, 6.0f, 8.0f, Easing::Kind::EaseInOut));
    s.addProfile(makeProfile("presentation", 3.0f, 6.0f, 7.2f, 15.0f, Easing::Kind::EaseInOut));
    s.addProfile(makeProfile("quick", 2.5f, 9.0f, 9.6f, 10.0f, Easing::Kind::EaseOut));
    return s;
}

// ─── Lookups ─────────────────────────────────────────────────────────────────

std::shared_ptr<const ZoomProfile> Settings::findProfile(std::string_view name) const
{
    auto it = profiles.find(name);
    return it != profiles.end() ? it->second : nullptr;
}

std::shared_ptr<const ZoomProfile> Settings::resolveDefaultProfile() const
{
    if (auto p = findProfile(defaultProfile))
        return p;
    if (!profiles.empty())
        return profiles.begin()->second;
    return builtinStandard();
}

std::optional<ScaleOverride> Settings::displayOverride(std::string_view displayId) const
{
    auto it = displayOverrides.find(displayId);
    if (it == displayOverrides.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> Settings::profileNames() const
{
    std::vector<std::string> names;
    names.reserve(profiles.size());
    for (const auto& entry : profiles)
        names.push_back(entry.first);
    return names;
}

// ─── Editing ─────────────────────────────────────────────────────────────────

void Settings::addProfile(const ZoomProfile& profile)
{
    profiles[profile.name] = std::make_shared<const ZoomProfile>(profile);
}

bool Settings::removeProfile(std::string_view name)
{
    auto it = profiles.find(name);
    if (it == profiles.end() || profiles.size() == 1)
        return false;
    const bool wasDefault = defaultProfile == name;
    profiles.erase(it);
    if (wasDefault)
        defaultProfile = profiles.begin()->first;
    return true;
}

bool Settings::setDefaultProfile(std::string_view name)
{
    if (profiles.find(name) == profiles.end())
        return false;
    defaultProfile = std::string(name);
    return true;
}

// ─── Config Path ─────────────────────────────────────────────────────────────

std::string SettingsManager::getDefaultConfigPath()
{
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (!appdata || appdata[0] == '\0')
        return {};
    return std::string(appdata) + "\\CursorZoom\\config.json";
#else
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        return {};
    return std::string(home) + "/.cursorzoom/config.json";
#endif
}

// ─── Parse ───────────────────────────────────────────────────────────────────

static void readFloat(const json& j, const char* key, float& target, float lo, float hi)
{
    if (!j.contains(key) || !j[key].is_number())
        return;
    float v = j[key].get<float>();
    if (std::isfinite(v) && v >= lo && v <= hi)
        target = v;
    else
        Log::warn("config: %s=%g out of range [%g, %g], keeping %g", key, v, lo, hi, target);
}

static void readBool(const json& j, const char* key, bool& target)
{
    if (j.contains(key) && j[key].is_boolean())
        target = j[key].get<bool>();
}

static void readString(const json& j, const char* key, std::string& target)
{
    if (j.contains(key) && j[key].is_string())
        target = j[key].get<std::string>();
}

// Speeds are stored per second. `perUnit` is how many stored units make one
// second (the frame rate for per-frame documents, else 1).
static void readSpeed(const json& j, const char* key, float& target, float perUnit)
{
    float stored = target / perUnit;
    readFloat(j, key, stored, 0.01f / perUnit, 100.0f / perUnit);
    target = stored * perUnit;
}

// Major component of a "major.minor.patch" version; 0 when unreadable.
static int majorVersion(const std::string& version)
{
    int major = 0;
    const char* end = version.data() + version.size();
    if (std::from_chars(version.data(), end, major).ec != std::errc())
        return 0;
    return major;
}

static ZoomProfile profileFromJson(const std::string& name, const json& j, float speedPerUnit)
{
    ZoomProfile p;
    p.name = name;

    readFloat(j, "zoom_factor", p.zoomFactor, 1.0f, 20.0f);
    readSpeed(j, "zoom_speed", p.zoomSpeed, speedPerUnit);
    readSpeed(j, "follow_speed", p.followSpeed, speedPerUnit);
    readFloat(j, "follow_border", p.followBorder, 0.0f, 10000.0f);
    readFloat(j, "follow_safezone_sensitivity", p.followSafezoneSensitivity, 0.0f, 10000.0f);
    readBool(j, "auto_follow", p.autoFollow);
    readBool(j, "follow_outside_bounds", p.followOutsideBounds);
    readBool(j, "auto_lock_on_reverse", p.autoLockOnReverse);

    if (j.contains("easing") && j["easing"].is_string())
    {
        const std::string easing = j["easing"].get<std::string>();
        if (auto kind = Easing::fromName(easing))
            p.easing = *kind;
        else
            Log::warn("config: profile '%s' has unknown easing '%s', using %s",
                      name.c_str(), easing.c_str(), Easing::name(p.easing));
    }
    return p;
}

std::optional<Settings> SettingsManager::parse(std::string_view jsonText)
{
    json j = json::parse(jsonText.begin(), jsonText.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    Settings settings = Settings::defaults();

    readString(j, "version", settings.version);
    readString(j, "default_profile", settings.defaultProfile);
    readBool(j, "debug_logging", settings.debugLogging);

    // Documents without a version are taken as the current format.
    float speedPerUnit = 1.0f;
    const int major = majorVersion(settings.version);
    if (major > 0 && major < 3)
    {
        speedPerUnit = Settings::kLegacyFrameRate;
        Log::info("config: version %s stores speeds per frame, converting at %.0f fps",
                  settings.version.c_str(), Settings::kLegacyFrameRate);
        settings.version = Settings::kFormatVersion;
    }

    if (j.contains("profiles") && j["profiles"].is_object())
    {
        Settings::ProfileMap loaded;
        for (auto it = j["profiles"].begin(); it != j["profiles"].end(); ++it)
        {
            if (!it.value().is_object())
            {
                Log::warn("config: profile '%s' is not an object, skipped", it.key().c_str());
                continue;
            }
            loaded[it.key()] = std::make_shared<const ZoomProfile>(profileFromJson(it.key(), it.value(), speedPerUnit));
        }
        if (loaded.empty())
        {
            Log::warn("config: no usable profiles, using built-in standard");
            loaded[builtinStandard()->name] = builtinStandard();
        }
        settings.profiles = std::move(loaded);
    }

    if (j.contains("display_overrides") && j["display_overrides"].is_object())
    {
        for (auto it = j["display_overrides"].begin(); it != j["display_overrides"].end(); ++it)
        {
            const json& entry = it.value();
            if (!entry.is_object())
                continue;

            float sx = 0.0f;
            float sy = 0.0f;
            readFloat(entry, "scale_x", sx, 0.25f, 8.0f);
            readFloat(entry, "scale_y", sy, 0.25f, 8.0f);
            if (sx <= 0.0f && sy <= 0.0f)
            {
                Log::warn("config: display override '%s' has no valid scale", it.key().c_str());
                continue;
            }
            if (sx <= 0.0f)
                sx = sy;
            if (sy <= 0.0f)
                sy = sx;
            settings.displayOverrides[it.key()] = ScaleOverride{sx, sy};
        }
    }

    if (!settings.findProfile(settings.defaultProfile))
    {
        const std::string fallback = settings.profiles.begin()->first;
        Log::warn("config: default profile '%s' not found, using '%s'",
                  settings.defaultProfile.c_str(), fallback.c_str());
        settings.defaultProfile = fallback;
    }

    return settings;
}

// ─── Serialize ───────────────────────────────────────────────────────────────

std::string SettingsManager::serialize(const Settings& settings)
{
    json j;
    j["version"] = settings.version;
    j["default_profile"] = settings.defaultProfile;
    j["debug_logging"] = settings.debugLogging;

    json profiles = json::object();
    for (const auto& entry : settings.profiles)
    {
        const ZoomProfile& p = *entry.second;
        profiles[entry.first] = {
            {"zoom_factor", p.zoomFactor},
            {"zoom_speed", p.zoomSpeed},
            {"follow_speed", p.followSpeed},
            {"follow_border", p.followBorder},
            {"follow_safezone_sensitivity", p.followSafezoneSensitivity},
            {"easing", Easing::name(p.easing)},
            {"auto_follow", p.autoFollow},
            {"follow_outside_bounds", p.followOutsideBounds},
            {"auto_lock_on_reverse", p.autoLockOnReverse},
        };
    }
    j["profiles"] = profiles;

    json overrides = json::object();
    for (const auto& entry : settings.displayOverrides)
        overrides[entry.first] = {{"scale_x", entry.second.scaleX}, {"scale_y", entry.second.scaleY}};
    j["display_overrides"] = overrides;

    return j.dump(4);
}

// ─── Construction ────────────────────────────────────────────────────────────

SettingsManager::SettingsManager()
    : current_(std::make_shared<const Settings>(Settings::defaults()))
{
}

// ─── Load ────────────────────────────────────────────────────────────────────

bool SettingsManager::loadFromFile(const char* path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        Log::info("config: %s not found, using defaults", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse(buffer.str());
    if (!parsed)
    {
        Log::error("config: %s is not valid JSON, keeping current settings", path);
        return false;
    }

    publish(std::move(*parsed));
    Log::info("config: loaded %s", path);
    return true;
}

// ─── Save ────────────────────────────────────────────────────────────────────

bool SettingsManager::saveToFile(const char* path) const
{
    std::filesystem::path p(path);
    if (p.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
        {
            Log::error("config: cannot create %s: %s",
                       p.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        Log::error("config: cannot write %s", path);
        return false;
    }

    file << serialize(*snapshot());
    return file.good();
}

// ─── Snapshot Access ─────────────────────────────────────────────────────────

std::shared_ptr<const Settings> SettingsManager::snapshot() const
{
    return std::atomic_load(&current_);
}

// ─── Apply ───────────────────────────────────────────────────────────────────

void SettingsManager::applySnapshot(const Settings& settings)
{
    Settings copy = settings;
    if (copy.profiles.empty())
        copy.profiles[builtinStandard()->name] = builtinStandard();
    if (!copy.findProfile(copy.defaultProfile))
        copy.defaultProfile = copy.profiles.begin()->first;
    publish(std::move(copy));
}

void SettingsManager::publish(Settings settings)
{
    auto snap = std::make_shared<const Settings>(std::move(settings));
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(*snap, obs.userData);
}

// ─── Version ─────────────────────────────────────────────────────────────────

uint64_t SettingsManager::version() const
{
    return version_.load(std::memory_order_acquire);
}

// ─── Observer ────────────────────────────────────────────────────────────────

void SettingsManager::addObserver(ChangeCallback cb, void* userData)
{
    observers_.push_back({cb, userData});
}

} // namespace CursorZoom
