#pragma once
#include <QString>
#include <QUuid>
#include <QVector>
#include <cstdint>

namespace rfx {

// Host-assigned identity of one effect. Survives reordering and restructuring,
// dies with the effect. The null id stands for the track root.
using StableId = QUuid;

// ── Node kind enum ──

enum class NodeKind : uint8_t {
    Plain,
    Rack,
    Chain,
    Device,
    Mixer
};

// ── Unified kind metadata table (single source of truth) ──

struct KindMeta {
    NodeKind    kind;
    const char* name;        // JSON/log name: "Rack", "Chain"
    bool        container;   // must be a host container to classify as this kind
};

inline constexpr KindMeta kKindMeta[] = {
    // kind              name       container
    {NodeKind::Plain,   "Plain",   false},
    {NodeKind::Rack,    "Rack",    true},
    {NodeKind::Chain,   "Chain",   true},
    {NodeKind::Device,  "Device",  true},
    {NodeKind::Mixer,   "Mixer",   false},
};

inline constexpr const KindMeta* kindMeta(NodeKind k) {
    for (const auto& m : kKindMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline constexpr bool kindNeedsContainer(NodeKind k) { auto* m = kindMeta(k); return m ? m->container : false; }

inline const char* kindToString(NodeKind k) {
    auto* m = kindMeta(k);
    return m ? m->name : "Unknown";
}

inline NodeKind kindFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kKindMeta) {
        if (s == m.name) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return NodeKind::Plain;
}

// ── Name roles ──
// Finer than NodeKind: a device's internal parts (plugin wrapper, utility,
// modulators) carry their owner's path but classify as Plain.

enum class NameRole : uint8_t {
    None,
    Rack,
    Chain,
    Device,
    DeviceFx,
    DeviceUtil,
    Modulator,
    Mixer
};

// ── Hierarchy path ──

struct HierarchyPath {
    int rack   = 0;   // 0 = unset
    int chain  = 0;
    int device = 0;

    bool isEmpty() const { return rack == 0 && chain == 0 && device == 0; }
    bool isStandalone() const { return rack == 0 && device > 0; }

    // chain needs rack; device needs rack+chain or stands alone
    bool isWellFormed() const {
        if (rack < 0 || chain < 0 || device < 0) return false;
        if (chain > 0 && rack == 0) return false;
        if (device > 0 && rack > 0 && chain == 0) return false;
        return !isEmpty();
    }

    bool operator==(const HierarchyPath& o) const {
        return rack == o.rack && chain == o.chain && device == o.device;
    }
    bool operator!=(const HierarchyPath& o) const { return !(*this == o); }

    QString toString() const {
        QString s;
        if (rack)   s += QStringLiteral("R%1").arg(rack);
        if (chain)  s += QStringLiteral("_C%1").arg(chain);
        if (device) s += (rack ? QStringLiteral("_D%1") : QStringLiteral("D%1")).arg(device);
        return s;
    }
};

// ── Handle ──
// Transient address of an effect in the host's current flat enumeration.
// Valid only until the next structural edit; re-derive from a StableId.

struct Handle {
    int      index      = -1;
    uint64_t generation = 0;

    bool isValid() const { return index >= 0; }
    bool operator==(const Handle& o) const { return index == o.index && generation == o.generation; }
    bool operator!=(const Handle& o) const { return !(*this == o); }
};

// ── Node ──
// Short-lived view of one effect, recomputed on every query.

struct Node {
    StableId      id;
    StableId      parentId;          // null = track root
    NodeKind      kind        = NodeKind::Plain;
    QString       name;
    QString       label;
    HierarchyPath path;
    bool          isContainer = false;
    int           position    = -1;  // index in parent's child list
    int           childCount  = 0;

    bool isRoot() const { return parentId.isNull(); }
};

// One step of an ancestor walk: the node and its position in its parent.
struct AncestorLink {
    StableId id;
    int      position = -1;
};

// ── Mutation errors ──

enum class MutationError : uint8_t {
    None,
    NotFound,
    WrongKind,
    ContainerCreateFailed,
    PluginCreateFailed,
    ChildMoveFailed,
    RemoveFailed,
    CapacityExceeded,
    IntegrityViolation
};

inline const char* errorToString(MutationError e) {
    switch (e) {
    case MutationError::None:                  return "None";
    case MutationError::NotFound:              return "NotFound";
    case MutationError::WrongKind:             return "WrongKind";
    case MutationError::ContainerCreateFailed: return "ContainerCreateFailed";
    case MutationError::PluginCreateFailed:    return "PluginCreateFailed";
    case MutationError::ChildMoveFailed:       return "ChildMoveFailed";
    case MutationError::RemoveFailed:          return "RemoveFailed";
    case MutationError::CapacityExceeded:      return "CapacityExceeded";
    case MutationError::IntegrityViolation:    return "IntegrityViolation";
    }
    return "Unknown";
}

} // namespace rfx
