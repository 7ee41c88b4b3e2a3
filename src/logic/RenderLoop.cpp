// =============================================================================
// CursorZoom - RenderLoop
// Frame tick for one capture source.
//
// HOT PATH INVARIANTS:
//   1. No heap allocation in frameTick() except on settings/profile change
//   2. No mutex acquisition (atomics + SeqLock + SPSC pop only)
//   3. No blocking calls; the own thread sleeps between ticks, not inside one
// =============================================================================

#include "cursorzoom/logic/RenderLoop.h"
#include "cursorzoom/common/SharedState.h"
#include "cursorzoom/input/CursorSampler.h"
#include "cursorzoom/output/CropSink.h"
#include "cursorzoom/support/Log.h"
#include "cursorzoom/support/SettingsManager.h"

#include <algorithm>
#include <chrono>
#include <string_view>
#include <utility>

namespace CursorZoom
{

RenderLoop::RenderLoop(SharedState& state, const SettingsManager& settings,
                       const DisplayRegistry& registry, CursorSampler& sampler,
                       CropSink& sink, Options options)
    : state_(state)
    , settings_(settings)
    , sampler_(sampler)
    , sink_(sink)
    , options_(std::move(options))
    , mapper_(registry)
{
    if (!options_.displayId.empty())
        mapper_.pinDisplay(options_.displayId);
    if (!options_.sourceCrop.isEmpty() && !mapper_.setSourceCrop(options_.sourceCrop))
        options_.sourceCrop = SourceCrop();
    if (options_.intervalMs < 1)
        options_.intervalMs = 1;
    if (!(options_.maxDt > 0.0f))
        options_.maxDt = 0.1f;
}

RenderLoop::~RenderLoop()
{
    requestShutdown();
}

void RenderLoop::setNoticeCallback(NoticeCallback cb, void* userData)
{
    noticeCb_ = cb;
    noticeUserData_ = userData;
}

void RenderLoop::notify(Notice notice, const char* detail)
{
    if (noticeCb_)
        noticeCb_(notice, detail, noticeUserData_);
}

// ─── Own thread ──────────────────────────────────────────────────────────────

bool RenderLoop::start()
{
    if (running_.load(std::memory_order_acquire))
        return false;

    shutdownRequested_.store(false, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&RenderLoop::threadMain, this);
    Log::info("render loop: started (%d ms interval)", options_.intervalMs);
    return true;
}

void RenderLoop::requestShutdown()
{
    shutdownRequested_.store(true, std::memory_order_release);
    if (thread_.joinable())
    {
        thread_.join();
        Log::info("render loop: stopped");
    }
}

bool RenderLoop::isRunning() const
{
    return running_.load(std::memory_order_acquire);
}

void RenderLoop::threadMain()
{
    using clock = std::chrono::steady_clock;
    const auto interval = std::chrono::milliseconds(options_.intervalMs);

    auto last = clock::now();
    auto next = last + interval;

    while (!shutdownRequested_.load(std::memory_order_acquire))
    {
        std::this_thread::sleep_until(next);

        const auto now = clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;
        frameTick(std::min(dt, options_.maxDt));

        next += interval;
        if (next < now)
            next = now + interval; // fell behind; do not burst to catch up
    }

    running_.store(false, std::memory_order_release);
}

// ─── Host-driven tick ────────────────────────────────────────────────────────

CropRect RenderLoop::tick(float dtSeconds)
{
    if (running_.load(std::memory_order_acquire))
    {
        Log::warn("render loop: tick() ignored while the loop thread runs");
        return lastCrop_;
    }
    if (!(dtSeconds >= 0.0f))
        dtSeconds = 0.0f;
    return frameTick(std::min(dtSeconds, options_.maxDt));
}

// =============================================================================
// frameTick: the hot path.
// =============================================================================
CropRect RenderLoop::frameTick(float dtSeconds)
{
    // 0. Settings change: one atomic load per frame in the common case.
    syncSettings();

    // 1. Cursor snapshot, mapped into the source's pixel space.
    MappedPoint mapped;
    if (auto sample = sampler_.sample())
        mapped = mapper_.map(*sample);

    // 2. Source size (host-published, else the first mapped display's pixels).
    syncSourceSize(mapped);

    // 3. Commands in arrival order, before this frame's advance().
    while (auto cmd = state_.commandQueue.pop())
        applyCommand(*cmd, mapped);

    // 4. Interpolate.
    CropRect crop = controller_.advance(dtSeconds, mapped);

    // DisplayNotFound with nothing ever resolved: stay on the full frame.
    if (!mapper_.hasResolvedDisplay() && !controller_.mouseOverride())
        crop = controller_.fullFrame();

    publish();

    // 5. Output only when something changed.
    if (controller_.sourceSize().isValid() && (!sinkWritten_ || crop != lastCrop_))
    {
        sink_.applyCrop(crop);
        sinkWritten_ = true;
    }
    lastCrop_ = crop;
    return crop;
}

void RenderLoop::syncSettings()
{
    const uint64_t ver = settings_.version();
    if (settingsLoaded_ && ver == cachedSettingsVersion_)
        return;

    cachedSettingsVersion_ = ver;
    settingsLoaded_ = true;

    auto snap = settings_.snapshot();
    Log::setMinLevel(snap->debugLogging ? Log::Level::Debug : Log::Level::Info);

    // Keep the active profile across reloads when it still exists.
    std::shared_ptr<const ZoomProfile> profile;
    if (!activeProfile_.empty())
        profile = snap->findProfile(activeProfile_);
    if (!profile)
        profile = snap->resolveDefaultProfile();

    if (controller_.setProfile(profile))
    {
        activeProfile_ = profile->name;
        Log::debug("render loop: profile '%s'", activeProfile_.c_str());
    }
    else
    {
        Log::warn("render loop: profile '%s' is invalid, keeping '%s'",
                  profile->name.c_str(), controller_.profile().name.c_str());
        notify(Notice::InvalidProfile, profile->name.c_str());
    }
}

void RenderLoop::syncSourceSize(const MappedPoint& mapped)
{
    if (state_.sourceSize.hasValue())
    {
        const uint32_t ver = state_.sourceSize.version();
        if (ver != cachedSourceVersion_)
        {
            cachedSourceVersion_ = ver;
            const SizeF size = state_.sourceSize.read();
            if (size.isValid())
                controller_.setSourceSize(size);
            else
                Log::warn("render loop: ignoring source size %.0fx%.0f", size.width, size.height);
        }
        return;
    }

    // No host size yet: adopt the first resolved display's pixels, less the source crop.
    if (!controller_.sourceSize().isValid() && mapped.valid && mapped.display)
        controller_.setSourceSize(mapper_.sourceSizeFor(*mapped.display));
}

void RenderLoop::applyCommand(const ZoomCommand& cmd, const MappedPoint& mapped)
{
    Log::debug("render loop: command #%u %s", static_cast<unsigned>(cmd.sequence), toString(cmd.type));

    switch (cmd.type)
    {
    case CommandType::ToggleZoom:
        controller_.toggleZoom(mapped);
        break;
    case CommandType::ToggleFollow:
        controller_.toggleFollow();
        break;
    case CommandType::SetMouseOverride:
        controller_.setMouseOverride({cmd.x, cmd.y});
        break;
    case CommandType::ClearMouseOverride:
        controller_.clearMouseOverride();
        break;
    case CommandType::SetProfile:
    {
        const std::string_view name = cmd.profileName();
        auto profile = settings_.snapshot()->findProfile(name);
        if (!profile || !controller_.setProfile(profile))
        {
            Log::warn("render loop: unknown profile '%s'", cmd.profile.data());
            notify(Notice::InvalidProfile, cmd.profile.data());
            break;
        }
        activeProfile_ = profile->name;
        Log::info("render loop: switched to profile '%s'", activeProfile_.c_str());
        break;
    }
    case CommandType::None:
        break;
    }
}

void RenderLoop::publish()
{
    state_.zoomMode.store(static_cast<uint8_t>(controller_.mode()), std::memory_order_relaxed);
    state_.currentZoomLevel.store(controller_.effectiveZoom(), std::memory_order_relaxed);
    state_.followEnabled.store(controller_.followEnabled(), std::memory_order_relaxed);
}

RemoteStateUpdate RenderLoop::stateUpdate() const
{
    RemoteStateUpdate s;
    s.mode = controller_.mode();
    s.followEnabled = controller_.followEnabled();
    s.zoomProgress = controller_.zoomProgress();
    s.zoomFactor = controller_.effectiveZoom();
    s.crop = lastCrop_;
    s.profile = activeProfile_;
    s.mouseOverride = controller_.mouseOverride();
    return s;
}

const char* toString(RenderLoop::Notice notice)
{
    switch (notice)
    {
    case RenderLoop::Notice::InvalidProfile: return "invalid_profile";
    }
    return "unknown";
}

} // namespace CursorZoom
