#pragma once
#include "core.h"
#include <QHash>
#include <QJsonObject>
#include <QVector>

namespace rfx {

// Per-session UI state for the rack view: which containers are open, which
// chain each rack is showing, and the breadcrumb of opened containers.
//
// Entries are keyed by StableId and never touch each other: expanding rack A
// or picking a chain in it leaves every other rack (sibling or nested) alone.
// Nothing is evicted automatically; the owner calls forget() when it learns
// an id is gone and clear() when the track goes away.
class ExpansionState {
public:
    void setExpanded(const StableId& id, bool expanded);
    bool isExpanded(const StableId& id) const { return m_expanded.contains(id); }
    bool toggleExpanded(const StableId& id);

    // Null chain clears the selection
    void     setSelectedChain(const StableId& rack, const StableId& chain);
    StableId selectedChain(const StableId& rack) const { return m_selectedChain.value(rack); }
    void     clearSelectedChain(const StableId& rack) { m_selectedChain.remove(rack); }

    // Breadcrumb of opened containers, outermost first
    const QVector<StableId>& expandedPath() const { return m_path; }
    void setExpandedPath(const QVector<StableId>& path) { m_path = path; }
    void toggleContainer(const StableId& id, int depth);
    void collapseFromDepth(int depth);

    void forget(const StableId& id);
    void clear();
    bool isEmpty() const;

    QJsonObject toJson() const;
    static ExpansionState fromJson(const QJsonObject& o);

private:
    QHash<StableId, bool>     m_expanded;
    QHash<StableId, StableId> m_selectedChain;
    QVector<StableId>         m_path;
};

} // namespace rfx
