#pragma once
#include "hosts/host.h"
#include <QHash>
#include <QJsonObject>
#include <QSet>
#include <QStringList>
#include <QVector>

namespace rfx {

// In-process effect list. Behaves like a live host: handles are positions in
// a pre-order enumeration and go stale on every structural edit.
//
// Lenient mode (default) lets a stale handle silently address whatever now
// sits at its old index, as a real host does. Strict mode refuses stale
// handles outright, which turns a missed re-resolve into a visible failure.
class MemoryHost : public FxHost {
public:
    MemoryHost() = default;

    // FxHost
    uint64_t generation() const override { return m_generation; }
    int      count() const override;
    Handle   at(int flatIndex) const override;
    int      childCount(Handle container) const override;
    Handle   childAt(Handle container, int pos) const override;
    Handle   parentOf(Handle fx) const override;
    StableId stableId(Handle fx) const override;
    QString  name(Handle fx) const override;
    QString  pluginName(Handle fx) const override;
    bool     isContainer(Handle fx) const override;

    bool     setName(Handle fx, const QString& name) override;
    Handle   insertFx(const QString& plugin, Handle container, int pos) override;
    Handle   insertContainer(Handle container, int pos) override;
    bool     moveFx(Handle fx, Handle container, int pos) override;
    bool     removeFx(Handle fx) override;

    void beginUndoBlock() override;
    void endUndoBlock(const QString& label) override;

    QString hostName() const override { return QStringLiteral("Memory"); }

    // --- Direct access by StableId ---
    Handle   handleOf(const StableId& id) const;
    bool     contains(const StableId& id) const { return m_entries.contains(id); }
    QString  nameOf(const StableId& id) const;
    StableId parentIdOf(const StableId& id) const;
    QVector<StableId> childIdsOf(const StableId& container) const;   // null = root

    // --- Fault injection ---
    void setStrictHandles(bool strict) { m_strict = strict; }
    bool strictHandles() const { return m_strict; }
    void rejectPlugin(const QString& plugin) { m_rejected.insert(plugin); }
    void setContainersEnabled(bool enabled) { m_containersEnabled = enabled; }
    void failNextMoves(int n) { m_failMoves = n; }
    // removeFx() refuses this effect until reset()
    void refuseRemoval(const StableId& id) { m_kept.insert(id); }
    // stableId() returns a null id for the next n reads
    void dropNextReads(int n) { m_dropReads = n; }

    // Corrupt one side of a parent/child link. Used to exercise the checker.
    void forceParentLink(const StableId& child, const StableId& parent);
    void forceChildLink(const StableId& container, const StableId& child);

    // --- Undo bookkeeping ---
    const QStringList& undoLog() const { return m_undoLog; }
    int undoDepth() const { return m_undoDepth; }

    // --- Snapshot ---
    QJsonObject toJson() const;
    bool loadJson(const QJsonObject& o);
    void clear();      // tree only
    void reset();      // tree, faults, undo log and strict mode

private:
    struct Entry {
        StableId          id;
        StableId          parentId;
        QString           plugin;
        QString           name;
        bool              container = false;
        QVector<StableId> children;
    };

    QHash<StableId, Entry> m_entries;
    QVector<StableId>      m_roots;
    uint64_t               m_generation = 1;

    mutable QVector<StableId>    m_flat;
    mutable QHash<StableId, int> m_flatIndex;
    mutable bool                 m_flatDirty = true;

    bool           m_strict = false;
    bool           m_containersEnabled = true;
    QSet<QString>  m_rejected;
    QSet<StableId> m_kept;
    int            m_failMoves = 0;
    mutable int    m_dropReads = 0;

    int         m_undoDepth = 0;
    QStringList m_undoLog;

    void rebuildFlat() const;
    void touch();
    const Entry* entryFor(Handle h) const;
    Entry*       entryFor(Handle h);
    bool resolveContainer(Handle container, StableId* id) const;
    QVector<StableId>* childList(const StableId& container);
    bool isInSubtree(const StableId& node, const StableId& root) const;
    Handle insertEntry(Entry e, Handle container, int pos);
    QJsonObject entryToJson(const Entry& e, QSet<StableId>& visited) const;
    bool entryFromJson(const QJsonObject& o, const StableId& parent);
};

} // namespace rfx
