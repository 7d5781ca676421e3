#include "resolver.h"
#include "classify.h"
#include "hosts/host.h"
#include "naming.h"
#include <QDebug>
#include <QSet>

namespace rfx {

HandleResolver::HandleResolver(const FxHost* host, const RackSettings& settings)
    : m_host(host)
    , m_retries(settings.resolveRetries)
    , m_maxDepth(settings.maxDepth) {}

Handle HandleResolver::scan(const StableId& id, Handle searchRoot) const {
    if (!searchRoot.isValid()) {
        int n = m_host->count();
        for (int i = 0; i < n; i++) {
            Handle h = m_host->at(i);
            if (m_host->stableId(h) == id)
                return h;
        }
        return {};
    }

    // Bounded DFS below searchRoot
    struct Frame { Handle container; int depth; };
    QVector<Frame> stack;
    QSet<StableId> visited;
    stack.append({searchRoot, 0});
    while (!stack.isEmpty()) {
        Frame f = stack.takeLast();
        if (f.depth >= m_maxDepth)
            continue;
        int n = m_host->childCount(f.container);
        for (int i = 0; i < n; i++) {
            Handle h = m_host->childAt(f.container, i);
            StableId cid = m_host->stableId(h);
            if (cid == id)
                return h;
            if (!cid.isNull() && !visited.contains(cid) && m_host->isContainer(h)) {
                visited.insert(cid);
                stack.append({h, f.depth + 1});
            }
        }
    }
    return {};
}

Handle HandleResolver::resolve(const StableId& id, Handle searchRoot) const {
    if (id.isNull())
        return {};
    for (int attempt = 0; attempt <= m_retries; attempt++) {
        Handle h = scan(id, searchRoot);
        if (h.isValid())
            return h;
        if (attempt < m_retries)
            qDebug() << "HandleResolver: lookup of" << id << "missed, re-reading";
    }
    return {};
}

QVector<AncestorLink> HandleResolver::ancestorPath(Handle fx) const {
    QVector<AncestorLink> path;
    QSet<StableId> visited;
    Handle cur = fx;
    while (cur.isValid()) {
        StableId id = m_host->stableId(cur);
        if (id.isNull() || visited.contains(id)) {
            qWarning() << "HandleResolver: parent walk looped at" << id;
            break;
        }
        if (path.size() >= m_maxDepth) {
            qWarning() << "HandleResolver: parent walk exceeded depth" << m_maxDepth;
            break;
        }
        visited.insert(id);
        path.append({id, positionOf(cur)});
        cur = m_host->parentOf(cur);
    }
    return path;
}

int HandleResolver::depthOf(Handle fx) const {
    return ancestorPath(fx).size() - 1;
}

StableId HandleResolver::parentId(Handle fx) const {
    Handle p = m_host->parentOf(fx);
    return p.isValid() ? m_host->stableId(p) : StableId();
}

int HandleResolver::positionOf(Handle fx) const {
    if (!fx.isValid())
        return -1;
    StableId id = m_host->stableId(fx);
    Handle parent = m_host->parentOf(fx);
    int n = m_host->childCount(parent);
    for (int i = 0; i < n; i++) {
        if (m_host->stableId(m_host->childAt(parent, i)) == id)
            return i;
    }
    return -1;
}

NodeKind HandleResolver::kindAt(Handle fx, int budget) const {
    std::optional<NodeKind> parentKind;
    Handle parent = m_host->parentOf(fx);
    if (parent.isValid())
        parentKind = budget > 0 ? kindAt(parent, budget - 1) : NodeKind::Plain;
    return classifyInContext(m_host->name(fx), m_host->isContainer(fx), parentKind);
}

NodeKind HandleResolver::kindOf(Handle fx) const {
    if (!fx.isValid())
        return NodeKind::Plain;
    return kindAt(fx, m_maxDepth);
}

Node HandleResolver::describe(Handle fx) const {
    Node n;
    if (!fx.isValid())
        return n;
    n.id          = m_host->stableId(fx);
    n.parentId    = parentId(fx);
    n.name        = m_host->name(fx);
    n.kind        = kindOf(fx);
    n.label       = naming::displayLabel(n.name);
    n.isContainer = m_host->isContainer(fx);
    n.position    = positionOf(fx);
    n.childCount  = n.isContainer ? m_host->childCount(fx) : 0;
    ParsedName parsed = naming::parse(n.name);
    if (parsed.ok())
        n.path = parsed.path;
    return n;
}

std::optional<Node> HandleResolver::node(const StableId& id) const {
    Handle h = resolve(id);
    if (!h.isValid())
        return std::nullopt;
    return describe(h);
}

QVector<Handle> HandleResolver::children(Handle container) const {
    QVector<Handle> out;
    int n = m_host->childCount(container);
    out.reserve(n);
    for (int i = 0; i < n; i++)
        out.append(m_host->childAt(container, i));
    return out;
}

QVector<StableId> HandleResolver::childIds(Handle container) const {
    QVector<StableId> out;
    for (Handle h : children(container))
        out.append(m_host->stableId(h));
    return out;
}

QStringList HandleResolver::childNames(Handle container) const {
    QStringList out;
    for (Handle h : children(container))
        out.append(m_host->name(h));
    return out;
}

QVector<Node> HandleResolver::childNodes(const StableId& container) const {
    Handle h;
    if (!container.isNull()) {
        h = resolve(container);
        if (!h.isValid())
            return {};
    }
    QVector<Node> out;
    for (Handle c : children(h))
        out.append(describe(c));
    return out;
}

QVector<Node> HandleResolver::allNodes() const {
    QVector<Node> out;
    int n = m_host->count();
    for (int i = 0; i < n; i++)
        out.append(describe(m_host->at(i)));
    return out;
}

QStringList HandleResolver::allNames() const {
    QStringList out;
    int n = m_host->count();
    for (int i = 0; i < n; i++)
        out.append(m_host->name(m_host->at(i)));
    return out;
}

} // namespace rfx
