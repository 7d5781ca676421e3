#include "classify.h"
#include "hosts/host.h"
#include "naming.h"
#include <QDebug>
#include <QSet>

namespace rfx {

NodeKind classifyInContext(const QString& name, bool isContainer,
                           std::optional<NodeKind> parentKind) {
    NodeKind byName = naming::classify(name);
    if (byName == NodeKind::Mixer)
        return NodeKind::Mixer;
    if (!isContainer)
        return NodeKind::Plain;

    bool atRoot = !parentKind.has_value();
    switch (byName) {
    case NodeKind::Rack:
        if (atRoot || *parentKind == NodeKind::Chain) return NodeKind::Rack;
        break;
    case NodeKind::Chain:
        if (atRoot || *parentKind == NodeKind::Rack) return NodeKind::Chain;
        break;
    case NodeKind::Device:
        if (atRoot || *parentKind == NodeKind::Chain) return NodeKind::Device;
        break;
    default:
        break;
    }
    return NodeKind::Plain;
}

const char* integrityErrorToString(IntegrityError e) {
    switch (e) {
    case IntegrityError::None:              return "None";
    case IntegrityError::CircularReference: return "CircularReference";
    case IntegrityError::ParentMismatch:    return "ParentMismatch";
    case IntegrityError::MaxDepthExceeded:  return "MaxDepthExceeded";
    case IntegrityError::MissingMixer:      return "MissingMixer";
    case IntegrityError::DuplicatePath:     return "DuplicatePath";
    case IntegrityError::MisplacedRack:     return "MisplacedRack";
    }
    return "Unknown";
}

static IntegrityReport failure(IntegrityError e, const StableId& offender,
                               const QString& message, int visited) {
    qWarning() << "IntegrityChecker:" << integrityErrorToString(e) << "-" << message;
    IntegrityReport r;
    r.error = e;
    r.offender = offender;
    r.message = message;
    r.nodesVisited = visited;
    return r;
}

IntegrityReport IntegrityChecker::verify(Handle root) const {
    struct Frame {
        Handle   container;
        StableId id;
        int      depth;
    };

    QSet<StableId> visited;
    StableId rootId;
    if (root.isValid()) {
        rootId = m_host->stableId(root);
        visited.insert(rootId);
    }

    QVector<Frame> stack;
    stack.append({root, rootId, 0});
    while (!stack.isEmpty()) {
        Frame f = stack.takeLast();
        int n = m_host->childCount(f.container);
        for (int i = 0; i < n; i++) {
            Handle child = m_host->childAt(f.container, i);
            if (!child.isValid()) {
                return failure(IntegrityError::ParentMismatch, f.id,
                               QStringLiteral("child %1 of %2 is unreadable")
                                   .arg(i).arg(f.id.toString()), visited.size());
            }
            StableId id = m_host->stableId(child);
            if (visited.contains(id)) {
                return failure(IntegrityError::CircularReference, id,
                               QStringLiteral("%1 reached twice (again under %2)")
                                   .arg(m_host->name(child), f.id.toString()), visited.size());
            }
            visited.insert(id);

            Handle parent = m_host->parentOf(child);
            StableId parentId = parent.isValid() ? m_host->stableId(parent) : StableId();
            if (parentId != f.id) {
                return failure(IntegrityError::ParentMismatch, id,
                               QStringLiteral("%1 listed under %2 but reports parent %3")
                                   .arg(m_host->name(child), f.id.toString(), parentId.toString()),
                               visited.size());
            }

            int depth = f.depth + 1;
            if (depth > m_maxDepth) {
                return failure(IntegrityError::MaxDepthExceeded, id,
                               QStringLiteral("%1 sits at depth %2 (limit %3)")
                                   .arg(m_host->name(child)).arg(depth).arg(m_maxDepth),
                               visited.size());
            }
            if (m_host->isContainer(child))
                stack.append({child, id, depth});
        }
    }

    IntegrityReport ok;
    ok.nodesVisited = visited.size();
    return ok;
}

IntegrityReport IntegrityChecker::verifyInvariants(Handle root) const {
    IntegrityReport links = verify(root);
    if (!links.ok())
        return links;

    std::optional<NodeKind> rootKind;
    QString rootName;
    if (root.isValid()) {
        rootName = m_host->name(root);
        Handle parent = m_host->parentOf(root);
        std::optional<NodeKind> parentKind;
        if (parent.isValid())
            parentKind = naming::classify(m_host->name(parent));
        rootKind = classifyInContext(rootName, m_host->isContainer(root), parentKind);
    }

    // Rack indices are unique across the whole walked subtree, not per level
    QSet<int> rackIndices;
    if (rootKind == NodeKind::Rack)
        rackIndices.insert(naming::rackIndexOf(rootName));

    IntegrityReport r = checkLayout(root, rootName, rootKind, rackIndices);
    if (r.ok())
        r.nodesVisited = links.nodesVisited;
    return r;
}

// Recursion is safe here: verify() already ruled out cycles and runaway depth.
IntegrityReport IntegrityChecker::checkLayout(Handle container, const QString& containerName,
                                              std::optional<NodeKind> containerKind,
                                              QSet<int>& rackIndices) const {
    StableId containerId = container.isValid() ? m_host->stableId(container) : StableId();
    int n = m_host->childCount(container);

    int rackIdx = 0;
    int mixers = 0;
    if (containerKind == NodeKind::Rack)
        rackIdx = naming::parse(containerName).path.rack;

    QSet<QString> seenPaths;
    for (int i = 0; i < n; i++) {
        Handle child = m_host->childAt(container, i);
        QString name = m_host->name(child);
        bool isContainer = m_host->isContainer(child);
        StableId id = m_host->stableId(child);

        if (isContainer && naming::isRackName(name)
            && (containerKind == NodeKind::Rack || containerKind == NodeKind::Device)) {
            return failure(IntegrityError::MisplacedRack, id,
                           QStringLiteral("%1 placed directly inside %2")
                               .arg(name, containerName), 0);
        }

        NodeKind kind = classifyInContext(name, isContainer, containerKind);
        if (kind == NodeKind::Mixer && containerKind == NodeKind::Rack) {
            if (naming::parse(name).path.rack == rackIdx)
                mixers++;
        }
        if (kind == NodeKind::Chain || kind == NodeKind::Device) {
            QString key = naming::parse(name).path.toString();
            if (seenPaths.contains(key)) {
                return failure(IntegrityError::DuplicatePath, id,
                               QStringLiteral("path %1 used twice in %2")
                                   .arg(key, containerName.isEmpty() ? QStringLiteral("<root>") : containerName), 0);
            }
            seenPaths.insert(key);
        }
        if (kind == NodeKind::Rack) {
            int idx = naming::rackIndexOf(name);
            if (rackIndices.contains(idx)) {
                return failure(IntegrityError::DuplicatePath, id,
                               QStringLiteral("rack index R%1 used twice (again by %2)").arg(idx).arg(name), 0);
            }
            rackIndices.insert(idx);
        }

        if (isContainer) {
            IntegrityReport sub = checkLayout(child, name, kind, rackIndices);
            if (!sub.ok())
                return sub;
        }
    }

    if (containerKind == NodeKind::Rack && mixers != 1) {
        return failure(IntegrityError::MissingMixer, containerId,
                       QStringLiteral("%1 has %2 matching mixers").arg(containerName).arg(mixers), 0);
    }
    return {};
}

} // namespace rfx
