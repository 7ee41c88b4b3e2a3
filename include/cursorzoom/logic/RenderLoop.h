#pragma once
// =============================================================================
// CursorZoom - RenderLoop
// Per-source tick driver: sample cursor, map, apply queued commands, advance
// the ZoomController and hand the crop rectangle to the CropSink.
// Driven either by the host's frame callback (tick) or by its own thread at a
// fixed interval (start). Never both at once.
// No heap allocation and no mutex acquisition on the hot path.
// =============================================================================

#include "cursorzoom/common/Types.h"
#include "cursorzoom/display/CoordinateMapper.h"
#include "cursorzoom/input/RemoteCommandCodec.h"
#include "cursorzoom/logic/ZoomController.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace CursorZoom
{

struct SharedState;
class SettingsManager;
class DisplayRegistry;
class CursorSampler;
class CropSink;

struct RenderLoopOptions
{
    std::string displayId;      // empty = auto-detect from the cursor
    int intervalMs = 16;        // own-thread tick period
    float maxDt = 0.1f;         // longer gaps (stalls, breakpoints) are clamped
    SourceCrop sourceCrop;      // edges the host already crops off the source
};

class RenderLoop
{
public:
    using Options = RenderLoopOptions;

    enum class Notice : uint8_t
    {
        InvalidProfile,     // SetProfile named an unknown or unusable profile
    };

    // Called on the tick thread; keep it short.
    using NoticeCallback = void (*)(Notice notice, const char* detail, void* userData);

    RenderLoop(SharedState& state, const SettingsManager& settings,
               const DisplayRegistry& registry, CursorSampler& sampler,
               CropSink& sink, Options options = Options());
    ~RenderLoop();

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    // One host-driven frame. Ignored (with a warning) while the own thread runs.
    CropRect tick(float dtSeconds);

    // Own-thread mode.
    bool start();
    void requestShutdown();   // also joins
    bool isRunning() const;

    void setNoticeCallback(NoticeCallback cb, void* userData);

    // Tick-thread views. Read only between ticks or from the tick thread.
    const ZoomController& controller() const { return controller_; }
    const CoordinateMapper& mapper() const { return mapper_; }
    const std::string& activeProfileName() const { return activeProfile_; }
    CropRect lastCrop() const { return lastCrop_; }
    RemoteStateUpdate stateUpdate() const;

private:
    CropRect frameTick(float dtSeconds);
    void threadMain();

    void syncSettings();
    void syncSourceSize(const MappedPoint& mapped);
    void applyCommand(const ZoomCommand& cmd, const MappedPoint& mapped);
    void publish();
    void notify(Notice notice, const char* detail);

    SharedState& state_;
    const SettingsManager& settings_;
    CursorSampler& sampler_;
    CropSink& sink_;
    Options options_;

    CoordinateMapper mapper_;
    ZoomController controller_;

    uint64_t cachedSettingsVersion_ = 0;
    bool settingsLoaded_ = false;
    std::string activeProfile_;

    uint32_t cachedSourceVersion_ = 0;

    CropRect lastCrop_{};
    bool sinkWritten_ = false;

    NoticeCallback noticeCb_ = nullptr;
    void* noticeUserData_ = nullptr;

    std::thread thread_;
    std::atomic<bool> shutdownRequested_{false};
    std::atomic<bool> running_{false};
};

const char* toString(RenderLoop::Notice notice);

} // namespace CursorZoom
