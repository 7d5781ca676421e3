#pragma once
#include "core.h"
#include <QString>
#include <cstdint>

namespace rfx {

// Flat, index-addressed effect list of one track, with host containers.
//
// Every structural edit (insert, move, remove) bumps generation() and
// invalidates every Handle handed out before it. Renaming is not structural.
// Where a container handle is expected, the invalid Handle means the track
// root. Failures are reported as an invalid Handle or false.
class FxHost {
public:
    virtual ~FxHost() = default;

    // --- Reads ---
    virtual uint64_t generation() const = 0;

    // Flat pre-order enumeration over every nesting level.
    virtual int      count() const = 0;
    virtual Handle   at(int flatIndex) const = 0;

    virtual int      childCount(Handle container) const = 0;
    virtual Handle   childAt(Handle container, int pos) const = 0;
    virtual Handle   parentOf(Handle fx) const = 0;

    virtual StableId stableId(Handle fx) const = 0;
    virtual QString  name(Handle fx) const = 0;
    virtual QString  pluginName(Handle fx) const = 0;
    virtual bool     isContainer(Handle fx) const = 0;

    // --- Writes ---
    virtual bool     setName(Handle fx, const QString& name) = 0;

    // pos < 0 appends. The returned handle is minted in the new generation.
    virtual Handle   insertFx(const QString& plugin, Handle container, int pos) = 0;
    virtual Handle   insertContainer(Handle container, int pos) = 0;

    // pos is the final position among the destination's children.
    virtual bool     moveFx(Handle fx, Handle container, int pos) = 0;

    // Cascades to the whole subtree.
    virtual bool     removeFx(Handle fx) = 0;

    // --- Optional overrides ---

    // Nested blocks collapse into the outermost one.
    virtual void beginUndoBlock() {}
    virtual void endUndoBlock(const QString& label) { Q_UNUSED(label); }

    // Human-readable label for this host.
    // Examples: "Memory", "REAPER track 3"
    virtual QString hostName() const { return QStringLiteral("Host"); }

    // --- Derived convenience (non-virtual, never override) ---

    bool isTopLevel(Handle fx) const { return fx.isValid() && !parentOf(fx).isValid(); }
};

} // namespace rfx
