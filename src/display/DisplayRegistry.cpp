// =============================================================================
// CursorZoom - DisplayRegistry
// =============================================================================

#include "cursorzoom/display/DisplayRegistry.h"
#include "cursorzoom/support/Log.h"

#include <algorithm>

namespace CursorZoom
{

bool DisplayRegistry::upsert(DisplayRecord record)
{
    if (!hasValidGeometry(record))
    {
        Log::warn("registry: refusing display '%s' with degenerate geometry", record.id.c_str());
        return false;
    }

    auto fresh = std::make_shared<const DisplayRecord>(std::move(record));

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto current = std::atomic_load(&records_);
    auto next = std::make_shared<RecordList>(*current);

    auto it = std::find_if(next->begin(), next->end(),
                           [&](const RecordPtr& r) { return r->id == fresh->id; });
    if (it != next->end())
        *it = fresh;
    else
        next->push_back(fresh);

    publish(std::move(next));
    return true;
}

bool DisplayRegistry::remove(std::string_view id)
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto current = std::atomic_load(&records_);
    auto next = std::make_shared<RecordList>(*current);

    auto it = std::find_if(next->begin(), next->end(),
                           [&](const RecordPtr& r) { return r->id == id; });
    if (it == next->end())
        return false;

    next->erase(it);
    publish(std::move(next));
    return true;
}

void DisplayRegistry::publish(std::shared_ptr<const RecordList> list)
{
    std::atomic_store(&records_, std::move(list));
    version_.fetch_add(1, std::memory_order_release);
}

DisplayRegistry::RecordPtr DisplayRegistry::findContaining(PointF globalPoint) const
{
    auto list = std::atomic_load(&records_);

    RecordPtr best;
    for (const auto& r : *list)
    {
        if (!r->contains(globalPoint))
            continue;
        if (!best || r->logicalSize.area() < best->logicalSize.area())
            best = r;
    }
    return best;
}

DisplayRegistry::RecordPtr DisplayRegistry::get(std::string_view id) const
{
    auto list = std::atomic_load(&records_);
    for (const auto& r : *list)
    {
        if (r->id == id)
            return r;
    }
    return nullptr;
}

DisplayRegistry::RecordPtr DisplayRegistry::primary() const
{
    auto list = std::atomic_load(&records_);
    for (const auto& r : *list)
    {
        if (r->isPrimary)
            return r;
    }
    return list->empty() ? nullptr : list->front();
}

std::shared_ptr<const DisplayRegistry::RecordList> DisplayRegistry::records() const
{
    return std::atomic_load(&records_);
}

size_t DisplayRegistry::size() const
{
    return std::atomic_load(&records_)->size();
}

uint64_t DisplayRegistry::version() const
{
    return version_.load(std::memory_order_acquire);
}

} // namespace CursorZoom
