#pragma once
// =============================================================================
// CursorZoom - DisplayRegistry
// Known displays, looked up by id or by point containment.
// Copy-on-write: writers build a new list and swap it in with atomic_store,
// so the tick thread sees either the old or the new set of records and
// never a record being edited. Records themselves are immutable.
// =============================================================================

#include "cursorzoom/display/DisplayRecord.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace CursorZoom
{

class DisplayRegistry
{
public:
    using RecordPtr = std::shared_ptr<const DisplayRecord>;
    using RecordList = std::vector<RecordPtr>;

    // Inserts, or replaces the record with the same id. Returns false (and
    // keeps any prior record) when the geometry is degenerate.
    bool upsert(DisplayRecord record);

    // Display unplugged. Returns false if the id was unknown.
    bool remove(std::string_view id);

    // Display whose logical rectangle contains the point; the smallest one
    // wins when mirrored or duplicated layouts overlap.
    RecordPtr findContaining(PointF globalPoint) const;

    RecordPtr get(std::string_view id) const;

    // Flagged primary display, else the first registered one.
    RecordPtr primary() const;

    std::shared_ptr<const RecordList> records() const;
    size_t size() const;

    // Bumped on every successful upsert/remove.
    uint64_t version() const;

private:
    void publish(std::shared_ptr<const RecordList> list);

    std::shared_ptr<const RecordList> records_ = std::make_shared<const RecordList>();
    std::mutex writeMutex_;   // serializes writers only; readers never lock
    std::atomic<uint64_t> version_{0};
};

} // namespace CursorZoom
