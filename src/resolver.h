#pragma once
#include "core.h"
#include "settings.h"
#include <QStringList>
#include <QVector>
#include <optional>

namespace rfx {

class FxHost;

// StableId -> fresh Handle, and Handle -> views of the tree around it.
//
// Nothing here is cached: every answer is read from the host at call time.
// A Handle obtained from this class is good until the next structural edit
// on the host, after which the caller re-resolves by StableId.
class HandleResolver {
public:
    explicit HandleResolver(const FxHost* host, const RackSettings& settings = RackSettings());

    const FxHost* host() const { return m_host; }

    // Invalid Handle when the id is gone (or null). A miss is re-read up to
    // resolveRetries times before giving up.
    Handle resolve(const StableId& id, Handle searchRoot = {}) const;

    // Node first, then each enclosing container up to the top level.
    QVector<AncestorLink> ancestorPath(Handle fx) const;
    int depthOf(Handle fx) const;     // 0 = top level, -1 = invalid

    StableId parentId(Handle fx) const;
    int      positionOf(Handle fx) const;
    NodeKind kindOf(Handle fx) const;
    Node     describe(Handle fx) const;
    std::optional<Node> node(const StableId& id) const;

    // Invalid container handle = track root
    QVector<Handle>   children(Handle container) const;
    QVector<StableId> childIds(Handle container) const;
    QStringList       childNames(Handle container) const;
    QVector<Node>     childNodes(const StableId& container) const;

    // Flat pre-order listing of the whole track
    QVector<Node>     allNodes() const;
    QStringList       allNames() const;

private:
    const FxHost* m_host;
    int           m_retries;
    int           m_maxDepth;

    Handle   scan(const StableId& id, Handle searchRoot) const;
    NodeKind kindAt(Handle fx, int budget) const;
};

} // namespace rfx
