#include "hosts/memory_host.h"
#include <QDebug>
#include <QJsonArray>

namespace rfx {

// ── Flat enumeration cache ──

void MemoryHost::rebuildFlat() const {
    if (!m_flatDirty)
        return;
    m_flat.clear();
    m_flatIndex.clear();

    // Pre-order DFS with visited guard (a corrupted child list may loop)
    QVector<StableId> stack;
    for (int i = m_roots.size() - 1; i >= 0; --i)
        stack.append(m_roots[i]);
    QSet<StableId> visited;
    while (!stack.isEmpty()) {
        StableId id = stack.takeLast();
        if (visited.contains(id))
            continue;
        auto it = m_entries.constFind(id);
        if (it == m_entries.constEnd())
            continue;
        visited.insert(id);
        m_flatIndex.insert(id, m_flat.size());
        m_flat.append(id);
        const QVector<StableId>& kids = it->children;
        for (int i = kids.size() - 1; i >= 0; --i)
            stack.append(kids[i]);
    }
    m_flatDirty = false;
}

void MemoryHost::touch() {
    ++m_generation;
    m_flatDirty = true;
}

const MemoryHost::Entry* MemoryHost::entryFor(Handle h) const {
    if (!h.isValid())
        return nullptr;
    rebuildFlat();
    if (h.generation != m_generation && m_strict) {
        qWarning() << "MemoryHost: stale handle" << h.index << "from generation"
                   << h.generation << "(current" << m_generation << ")";
        return nullptr;
    }
    if (h.index >= m_flat.size())
        return nullptr;
    auto it = m_entries.constFind(m_flat[h.index]);
    return it == m_entries.constEnd() ? nullptr : &it.value();
}

MemoryHost::Entry* MemoryHost::entryFor(Handle h) {
    return const_cast<Entry*>(static_cast<const MemoryHost*>(this)->entryFor(h));
}

bool MemoryHost::resolveContainer(Handle container, StableId* id) const {
    if (!container.isValid()) {
        *id = StableId();
        return true;
    }
    const Entry* e = entryFor(container);
    if (!e || !e->container)
        return false;
    *id = e->id;
    return true;
}

QVector<StableId>* MemoryHost::childList(const StableId& container) {
    if (container.isNull())
        return &m_roots;
    auto it = m_entries.find(container);
    if (it == m_entries.end())
        return nullptr;
    return &it->children;
}

bool MemoryHost::isInSubtree(const StableId& node, const StableId& root) const {
    QSet<StableId> visited;
    StableId cur = node;
    while (!cur.isNull() && !visited.contains(cur)) {
        if (cur == root)
            return true;
        visited.insert(cur);
        cur = m_entries.value(cur).parentId;
    }
    return false;
}

Handle MemoryHost::handleOf(const StableId& id) const {
    rebuildFlat();
    int idx = m_flatIndex.value(id, -1);
    if (idx < 0)
        return {};
    return {idx, m_generation};
}

// ── Reads ──

int MemoryHost::count() const {
    rebuildFlat();
    return m_flat.size();
}

Handle MemoryHost::at(int flatIndex) const {
    rebuildFlat();
    if (flatIndex < 0 || flatIndex >= m_flat.size())
        return {};
    return {flatIndex, m_generation};
}

int MemoryHost::childCount(Handle container) const {
    StableId cid;
    if (!resolveContainer(container, &cid))
        return 0;
    if (cid.isNull())
        return m_roots.size();
    return m_entries.value(cid).children.size();
}

Handle MemoryHost::childAt(Handle container, int pos) const {
    StableId cid;
    if (!resolveContainer(container, &cid))
        return {};
    const QVector<StableId> kids = cid.isNull() ? m_roots : m_entries.value(cid).children;
    if (pos < 0 || pos >= kids.size())
        return {};
    return handleOf(kids[pos]);
}

Handle MemoryHost::parentOf(Handle fx) const {
    const Entry* e = entryFor(fx);
    if (!e || e->parentId.isNull())
        return {};
    return handleOf(e->parentId);
}

StableId MemoryHost::stableId(Handle fx) const {
    if (m_dropReads > 0) {
        --m_dropReads;
        return {};
    }
    const Entry* e = entryFor(fx);
    return e ? e->id : StableId();
}

QString MemoryHost::name(Handle fx) const {
    const Entry* e = entryFor(fx);
    return e ? e->name : QString();
}

QString MemoryHost::pluginName(Handle fx) const {
    const Entry* e = entryFor(fx);
    return e ? e->plugin : QString();
}

bool MemoryHost::isContainer(Handle fx) const {
    const Entry* e = entryFor(fx);
    return e && e->container;
}

QString MemoryHost::nameOf(const StableId& id) const {
    return m_entries.value(id).name;
}

StableId MemoryHost::parentIdOf(const StableId& id) const {
    return m_entries.value(id).parentId;
}

QVector<StableId> MemoryHost::childIdsOf(const StableId& container) const {
    if (container.isNull())
        return m_roots;
    return m_entries.value(container).children;
}

// ── Writes ──

bool MemoryHost::setName(Handle fx, const QString& name) {
    Entry* e = entryFor(fx);
    if (!e)
        return false;
    e->name = name;
    return true;
}

Handle MemoryHost::insertEntry(Entry e, Handle container, int pos) {
    StableId cid;
    if (!resolveContainer(container, &cid)) {
        qWarning() << "MemoryHost: insert target is not a live container";
        return {};
    }
    e.id = QUuid::createUuid();
    e.parentId = cid;
    StableId id = e.id;
    m_entries.insert(id, e);

    QVector<StableId>* list = childList(cid);
    if (pos < 0 || pos > list->size())
        pos = list->size();
    list->insert(pos, id);
    touch();
    return handleOf(id);
}

Handle MemoryHost::insertFx(const QString& plugin, Handle container, int pos) {
    if (plugin.isEmpty() || m_rejected.contains(plugin)) {
        qWarning() << "MemoryHost: plugin not available:" << plugin;
        return {};
    }
    Entry e;
    e.plugin = plugin;
    e.name = plugin;
    return insertEntry(e, container, pos);
}

Handle MemoryHost::insertContainer(Handle container, int pos) {
    if (!m_containersEnabled) {
        qWarning() << "MemoryHost: container creation refused";
        return {};
    }
    Entry e;
    e.plugin = QStringLiteral("Container");
    e.name = e.plugin;
    e.container = true;
    return insertEntry(e, container, pos);
}

bool MemoryHost::moveFx(Handle fx, Handle container, int pos) {
    const Entry* e = entryFor(fx);
    if (!e)
        return false;
    StableId id = e->id;
    StableId oldParent = e->parentId;

    StableId dest;
    if (!resolveContainer(container, &dest))
        return false;

    if (m_failMoves > 0) {
        --m_failMoves;
        qWarning() << "MemoryHost: move refused for" << id;
        return false;
    }
    if (!dest.isNull() && isInSubtree(dest, id)) {
        qWarning() << "MemoryHost: cannot move" << id << "into its own subtree";
        return false;
    }

    if (QVector<StableId>* from = childList(oldParent))
        from->removeAll(id);
    QVector<StableId>* to = childList(dest);
    if (pos < 0 || pos > to->size())
        pos = to->size();
    to->insert(pos, id);
    m_entries[id].parentId = dest;
    touch();
    return true;
}

bool MemoryHost::removeFx(Handle fx) {
    const Entry* e = entryFor(fx);
    if (!e)
        return false;
    StableId id = e->id;
    if (m_kept.contains(id)) {
        qWarning() << "MemoryHost: remove refused for" << id;
        return false;
    }
    if (QVector<StableId>* from = childList(e->parentId))
        from->removeAll(id);

    // Collect subtree (cycle-safe)
    QVector<StableId> doomed;
    QSet<StableId> visited;
    QVector<StableId> stack{id};
    while (!stack.isEmpty()) {
        StableId cur = stack.takeLast();
        if (visited.contains(cur))
            continue;
        visited.insert(cur);
        doomed.append(cur);
        for (const StableId& c : m_entries.value(cur).children)
            stack.append(c);
    }
    for (const StableId& d : doomed) {
        m_entries.remove(d);
        m_roots.removeAll(d);
    }
    touch();
    return true;
}

// ── Undo bracketing ──

void MemoryHost::beginUndoBlock() {
    ++m_undoDepth;
}

void MemoryHost::endUndoBlock(const QString& label) {
    if (m_undoDepth <= 0) {
        qWarning() << "MemoryHost: unbalanced undo block" << label;
        return;
    }
    if (--m_undoDepth == 0)
        m_undoLog.append(label);
}

// ── Corruption hooks ──

void MemoryHost::forceParentLink(const StableId& child, const StableId& parent) {
    auto it = m_entries.find(child);
    if (it == m_entries.end())
        return;
    it->parentId = parent;
    touch();
}

void MemoryHost::forceChildLink(const StableId& container, const StableId& child) {
    auto it = m_entries.find(container);
    if (it == m_entries.end())
        return;
    it->children.append(child);
    touch();
}

// ── Snapshot ──

QJsonObject MemoryHost::entryToJson(const Entry& e, QSet<StableId>& visited) const {
    QJsonObject o;
    o["id"]        = e.id.toString();
    o["plugin"]    = e.plugin;
    o["name"]      = e.name;
    o["container"] = e.container;
    if (e.container) {
        QJsonArray kids;
        for (const StableId& c : e.children) {
            if (visited.contains(c) || !m_entries.contains(c))
                continue;
            visited.insert(c);
            kids.append(entryToJson(m_entries[c], visited));
        }
        o["children"] = kids;
    }
    return o;
}

QJsonObject MemoryHost::toJson() const {
    QJsonObject o;
    QSet<StableId> visited;
    QJsonArray roots;
    for (const StableId& r : m_roots) {
        if (visited.contains(r) || !m_entries.contains(r))
            continue;
        visited.insert(r);
        roots.append(entryToJson(m_entries[r], visited));
    }
    o["host"]  = hostName();
    o["roots"] = roots;
    return o;
}

bool MemoryHost::entryFromJson(const QJsonObject& o, const StableId& parent) {
    Entry e;
    e.id = QUuid(o["id"].toString());
    if (e.id.isNull())
        e.id = QUuid::createUuid();
    if (m_entries.contains(e.id)) {
        qWarning() << "MemoryHost: duplicate id in snapshot:" << e.id;
        return false;
    }
    e.parentId  = parent;
    e.plugin    = o["plugin"].toString();
    e.name      = o["name"].toString(e.plugin);
    e.container = o["container"].toBool(false);
    StableId id = e.id;
    m_entries.insert(id, e);
    childList(parent)->append(id);

    const QJsonArray kids = o["children"].toArray();
    if (!kids.isEmpty() && !e.container) {
        qWarning() << "MemoryHost: non-container with children in snapshot:" << e.name;
        return false;
    }
    for (const auto& v : kids) {
        if (!entryFromJson(v.toObject(), id))
            return false;
    }
    return true;
}

bool MemoryHost::loadJson(const QJsonObject& o) {
    clear();
    const QJsonArray roots = o["roots"].toArray();
    for (const auto& v : roots) {
        if (!entryFromJson(v.toObject(), StableId())) {
            clear();
            return false;
        }
    }
    touch();
    return true;
}

void MemoryHost::clear() {
    m_entries.clear();
    m_roots.clear();
    touch();
}

void MemoryHost::reset() {
    clear();
    m_strict = false;
    m_containersEnabled = true;
    m_rejected.clear();
    m_failMoves = 0;
    m_kept.clear();
    m_dropReads = 0;
    m_undoDepth = 0;
    m_undoLog.clear();
}

} // namespace rfx
