// =============================================================================
// CursorZoom - Trace Replay
// Feeds a recorded trace (displays, cursor samples, remote commands) through
// the same RenderLoop a capture host would drive, and prints one crop
// rectangle per frame.
//
//   cursorzoom_replay <trace.json> [config.json]
//
// Trace layout:
//   {
//     "source":     {"width": 2560, "height": 1440},          optional
//     "source_crop": {"left": 0, "top": 40, "right": 0, "bottom": 0}, optional
//     "display_id": "0",                                      optional, pins
//     "displays": [ {"id": "0", "x": 0, "y": 0, "width": 1280, "height": 720,
//                    "backing_scale": 2, "origin": "top_left", "primary": true},
//                   {"id": "1", "label": "Monitor: 1920x1080 @ 1280,0"} ],
//     "frames":   [ {"dt": 0.016, "x": 640, "y": 360, "origin": "top_left",
//                    "commands": [{"type": "toggle_zoom"}, "100 200"]} ]
//   }
// =============================================================================

#include "cursorzoom/common/SharedState.h"
#include "cursorzoom/display/CoordinateClassifier.h"
#include "cursorzoom/display/DisplayRecord.h"
#include "cursorzoom/display/DisplayRegistry.h"
#include "cursorzoom/input/CursorSampler.h"
#include "cursorzoom/input/RemoteCommandCodec.h"
#include "cursorzoom/logic/RenderLoop.h"
#include "cursorzoom/output/CropSink.h"
#include "cursorzoom/support/Log.h"
#include "cursorzoom/support/SettingsManager.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using namespace CursorZoom;

namespace
{

class CountingSink : public CropSink
{
public:
    void applyCrop(const CropRect&) override { ++writes; }
    int writes = 0;
};

OriginConvention parseOrigin(const json& j, OriginConvention fallback)
{
    if (!j.contains("origin") || !j["origin"].is_string())
        return fallback;
    const std::string origin = j["origin"].get<std::string>();
    if (origin == "bottom_left")
        return OriginConvention::BottomLeftUp;
    if (origin == "top_left")
        return OriginConvention::TopLeftDown;
    Log::warn("replay: unknown origin '%s'", origin.c_str());
    return fallback;
}

float numberOr(const json& j, const char* key, float fallback)
{
    return j.contains(key) && j[key].is_number() ? j[key].get<float>() : fallback;
}

std::optional<DisplayDescriptor> parseDisplay(const json& j, size_t index)
{
    if (!j.is_object())
        return std::nullopt;

    DisplayDescriptor d;
    d.id = j.contains("id") && j["id"].is_string() ? j["id"].get<std::string>() : std::to_string(index);
    d.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : d.id;
    d.originConvention = parseOrigin(j, OriginConvention::TopLeftDown);
    d.isPrimary = j.contains("primary") && j["primary"].is_boolean() && j["primary"].get<bool>();

    // A host-style label ("Monitor: 1920x1080 @ 0,0") may stand in for the numbers.
    if (j.contains("label") && j["label"].is_string())
    {
        if (auto geometry = CoordinateClassifier::parseReportedGeometry(j["label"].get<std::string>()))
        {
            d.reportedSize = geometry->size;
            if (geometry->hasOrigin)
                d.origin = geometry->origin;
        }
    }

    d.origin.x = numberOr(j, "x", d.origin.x);
    d.origin.y = numberOr(j, "y", d.origin.y);
    d.reportedSize.width = numberOr(j, "width", d.reportedSize.width);
    d.reportedSize.height = numberOr(j, "height", d.reportedSize.height);
    if (j.contains("backing_scale") && j["backing_scale"].is_number())
        d.backingScaleHint = j["backing_scale"].get<float>();
    return d;
}

bool loadDisplays(const json& trace, const Settings& settings, DisplayRegistry& registry)
{
    if (!trace.contains("displays") || !trace["displays"].is_array())
    {
        Log::error("replay: trace has no \"displays\" array");
        return false;
    }

    std::optional<SizeF> source;
    if (trace.contains("source") && trace["source"].is_object())
        source = SizeF{numberOr(trace["source"], "width", 0.0f), numberOr(trace["source"], "height", 0.0f)};

    const std::string pinned = trace.contains("display_id") && trace["display_id"].is_string()
        ? trace["display_id"].get<std::string>() : std::string();

    std::vector<DisplayDescriptor> descriptors;
    for (size_t i = 0; i < trace["displays"].size(); ++i)
    {
        if (auto d = parseDisplay(trace["displays"][i], i))
            descriptors.push_back(std::move(*d));
    }
    if (descriptors.empty())
    {
        Log::error("replay: no usable displays in trace");
        return false;
    }

    // The capture source shows the pinned display, or the only one there is.
    auto sourceFor = [&](const DisplayDescriptor& d) -> std::optional<SizeF> {
        if (!source)
            return std::nullopt;
        if (pinned.empty() ? descriptors.size() == 1 : d.id == pinned)
            return source;
        return std::nullopt;
    };

    // Primary first: bottom-left origins of the others are flipped against it.
    float primaryHeight = 0.0f;
    for (const auto& d : descriptors)
    {
        if (!d.isPrimary)
            continue;
        if (auto record = buildDisplayRecord(d, sourceFor(d), settings.displayOverride(d.id)))
        {
            primaryHeight = record->logicalSize.height;
            registry.upsert(std::move(*record));
        }
    }
    for (const auto& d : descriptors)
    {
        if (d.isPrimary)
            continue;
        if (auto record = buildDisplayRecord(d, sourceFor(d), settings.displayOverride(d.id), primaryHeight))
            registry.upsert(std::move(*record));
    }

    for (const auto& record : *registry.records())
    {
        Log::info("replay: display '%s' %.0fx%.0f @ %.0f,%.0f -> %.0fx%.0f px (%s, %s, %.2fx%.2f)",
                  record->id.c_str(), record->logicalSize.width, record->logicalSize.height,
                  record->origin.x, record->origin.y, record->pixelSize.width, record->pixelSize.height,
                  toString(record->units), toString(record->basis), record->scaleX, record->scaleY);
    }
    return registry.size() > 0;
}

void postCommands(const json& frame, SharedState& state)
{
    if (!frame.contains("commands") || !frame["commands"].is_array())
        return;

    for (const auto& entry : frame["commands"])
    {
        const std::string message = entry.is_string() ? entry.get<std::string>() : entry.dump();
        auto decoded = RemoteCommandCodec::decode(message);
        switch (decoded.status)
        {
        case RemoteCommandCodec::Status::Command:
            state.postCommand(decoded.command);
            break;
        case RemoteCommandCodec::Status::Ping:
            std::printf("  reply %s\n", RemoteCommandCodec::encodePong().c_str());
            break;
        case RemoteCommandCodec::Status::Ignored:
        case RemoteCommandCodec::Status::Malformed:
            Log::warn("replay: %s message: %s", toString(decoded.status), message.c_str());
            break;
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::fprintf(stderr, "usage: %s <trace.json> [config.json]\n", argv[0]);
        return 2;
    }

    SettingsManager settings;
    const std::string configPath = argc > 2 ? argv[2] : SettingsManager::getDefaultConfigPath();
    if (!configPath.empty() && !settings.loadFromFile(configPath.c_str()) && argc > 2)
        return 1;
    Log::setMinLevel(settings.snapshot()->debugLogging ? Log::Level::Debug : Log::Level::Info);

    std::ifstream file(argv[1]);
    if (!file.is_open())
    {
        Log::error("replay: cannot open %s", argv[1]);
        return 1;
    }
    json trace = json::parse(file, nullptr, false);
    if (trace.is_discarded() || !trace.is_object())
    {
        Log::error("replay: %s is not a JSON object", argv[1]);
        return 1;
    }

    DisplayRegistry registry;
    if (!loadDisplays(trace, *settings.snapshot(), registry))
        return 1;

    SharedState state;
    if (trace.contains("source") && trace["source"].is_object())
        state.sourceSize.write({numberOr(trace["source"], "width", 0.0f), numberOr(trace["source"], "height", 0.0f)});

    RenderLoop::Options options;
    if (trace.contains("display_id") && trace["display_id"].is_string())
        options.displayId = trace["display_id"].get<std::string>();
    if (trace.contains("source_crop") && trace["source_crop"].is_object())
    {
        const json& crop = trace["source_crop"];
        options.sourceCrop = SourceCrop{numberOr(crop, "left", 0.0f), numberOr(crop, "top", 0.0f),
                                        numberOr(crop, "right", 0.0f), numberOr(crop, "bottom", 0.0f)};
    }

    SharedCursorSampler sampler(state);
    CountingSink sink;
    RenderLoop loop(state, settings, registry, sampler, sink, options);
    loop.setNoticeCallback(
        [](RenderLoop::Notice notice, const char* detail, void*) {
            std::printf("  notice %s: %s\n", toString(notice), detail);
        },
        nullptr);

    if (!trace.contains("frames") || !trace["frames"].is_array())
    {
        Log::error("replay: trace has no \"frames\" array");
        return 1;
    }

    int64_t timeMs = 0;
    size_t index = 0;
    for (const auto& frame : trace["frames"])
    {
        if (!frame.is_object())
            continue;

        const float dt = numberOr(frame, "dt", 1.0f / 60.0f);
        timeMs += static_cast<int64_t>(dt * 1000.0f);

        if (frame.contains("x") && frame.contains("y"))
        {
            CursorSample sample;
            sample.rawX = numberOr(frame, "x", 0.0f);
            sample.rawY = numberOr(frame, "y", 0.0f);
            sample.timestampMs = timeMs;
            sample.origin = parseOrigin(frame, OriginConvention::TopLeftDown);
            state.cursor.write(sample);
        }

        postCommands(frame, state);

        const CropRect crop = loop.tick(dt);
        std::printf("%zu %s %.2f %.2f %.2f %.2f\n", index++,
                    toString(loop.controller().mode()), crop.x, crop.y, crop.width, crop.height);
    }

    std::printf("%s\n", RemoteCommandCodec::encodeStateUpdate(loop.stateUpdate()).c_str());
    Log::info("replay: %zu frames, %d sink updates, %llu dropped commands", index, sink.writes,
              static_cast<unsigned long long>(state.droppedCommands.load()));
    return 0;
}
