#include "expansion.h"
#include <QJsonArray>

namespace rfx {

void ExpansionState::setExpanded(const StableId& id, bool expanded) {
    if (id.isNull())
        return;
    if (expanded)
        m_expanded.insert(id, true);
    else
        m_expanded.remove(id);
}

bool ExpansionState::toggleExpanded(const StableId& id) {
    bool now = !isExpanded(id);
    setExpanded(id, now);
    return now;
}

void ExpansionState::setSelectedChain(const StableId& rack, const StableId& chain) {
    if (rack.isNull())
        return;
    if (chain.isNull())
        m_selectedChain.remove(rack);
    else
        m_selectedChain.insert(rack, chain);
}

// Opening a container at `depth` replaces everything from that depth on.
// Clicking the container that is already open there closes it and its tail.
void ExpansionState::toggleContainer(const StableId& id, int depth) {
    if (depth < 0)
        return;
    if (depth < m_path.size() && m_path[depth] == id) {
        collapseFromDepth(depth);
        return;
    }
    collapseFromDepth(depth);
    if (depth > m_path.size()) {
        // Parent levels are not open; the breadcrumb cannot have holes
        return;
    }
    m_path.append(id);
}

void ExpansionState::collapseFromDepth(int depth) {
    if (depth < 0) depth = 0;
    if (depth < m_path.size())
        m_path.resize(depth);
}

void ExpansionState::forget(const StableId& id) {
    m_expanded.remove(id);
    m_selectedChain.remove(id);
    for (auto it = m_selectedChain.begin(); it != m_selectedChain.end();) {
        if (it.value() == id)
            it = m_selectedChain.erase(it);
        else
            ++it;
    }
    int at = m_path.indexOf(id);
    if (at >= 0)
        collapseFromDepth(at);
}

void ExpansionState::clear() {
    m_expanded.clear();
    m_selectedChain.clear();
    m_path.clear();
}

bool ExpansionState::isEmpty() const {
    return m_expanded.isEmpty() && m_selectedChain.isEmpty() && m_path.isEmpty();
}

QJsonObject ExpansionState::toJson() const {
    QJsonObject o;
    QJsonArray expanded;
    for (auto it = m_expanded.constBegin(); it != m_expanded.constEnd(); ++it)
        expanded.append(it.key().toString());
    o["expanded"] = expanded;

    QJsonObject selected;
    for (auto it = m_selectedChain.constBegin(); it != m_selectedChain.constEnd(); ++it)
        selected[it.key().toString()] = it.value().toString();
    o["selectedChain"] = selected;

    QJsonArray path;
    for (const StableId& id : m_path)
        path.append(id.toString());
    o["path"] = path;
    return o;
}

ExpansionState ExpansionState::fromJson(const QJsonObject& o) {
    ExpansionState s;
    for (const auto& v : o["expanded"].toArray())
        s.setExpanded(QUuid(v.toString()), true);

    const QJsonObject selected = o["selectedChain"].toObject();
    for (auto it = selected.constBegin(); it != selected.constEnd(); ++it)
        s.setSelectedChain(QUuid(it.key()), QUuid(it.value().toString()));

    for (const auto& v : o["path"].toArray()) {
        QUuid id(v.toString());
        if (id.isNull())
            break;
        s.m_path.append(id);
    }
    return s;
}

} // namespace rfx
