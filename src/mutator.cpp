#include "mutator.h"
#include "expansion.h"
#include "hosts/host.h"
#include "naming.h"
#include <QDebug>

namespace rfx {

// ── Undo bracket ──
// One host undo block per public operation; nested brackets collapse into
// the outermost one on the host side.

class UndoBlock {
public:
    UndoBlock(FxHost* host, const char* label)
        : m_host(host), m_label(QStringLiteral("RackFX: ") + QLatin1String(label)) {
        m_host->beginUndoBlock();
    }
    ~UndoBlock() {
        m_host->endUndoBlock(m_failed ? m_label + QStringLiteral(" (failed)") : m_label);
    }
    UndoBlock(const UndoBlock&) = delete;
    UndoBlock& operator=(const UndoBlock&) = delete;

    void fail() { m_failed = true; }

private:
    FxHost* m_host;
    QString m_label;
    bool    m_failed = false;
};

static void setError(MutationError* err, MutationError e) {
    if (err) *err = e;
}

static void report(MutationError* err, MutationError e, const QString& detail) {
    qWarning() << "HierarchyMutator:" << errorToString(e) << "-" << detail;
    setError(err, e);
}

HierarchyMutator::HierarchyMutator(FxHost* host, const RackSettings& settings)
    : m_host(host)
    , m_settings(settings)
    , m_resolver(host, m_settings) {}

// ── Helpers ──

int HierarchyMutator::nextRackIndex() const {
    // Rack indices are unique across the whole track, nested racks included
    return naming::nextFreeIndex(m_resolver.allNames(), naming::rackIndexOf);
}

bool HierarchyMutator::hasParent(const StableId& id, const StableId& expectedParent) const {
    Handle h = m_resolver.resolve(id);
    return h.isValid() && m_resolver.parentId(h) == expectedParent;
}

QStringList HierarchyMutator::siblingNames(Handle container, const StableId& exclude) const {
    QStringList out;
    for (Handle h : m_resolver.children(container)) {
        if (m_host->stableId(h) != exclude)
            out.append(m_host->name(h));
    }
    return out;
}

// Devices and loose plugins in left-to-right order, descending through any
// racks (and their chains) nested in between.
void HierarchyMutator::collectFlattenable(Handle container, QVector<StableId>& out) const {
    for (Handle h : m_resolver.children(container)) {
        switch (m_resolver.kindOf(h)) {
        case NodeKind::Rack:
        case NodeKind::Chain:
            collectFlattenable(h, out);
            break;
        case NodeKind::Mixer:
            break;
        case NodeKind::Device:
        case NodeKind::Plain:
            out.append(m_host->stableId(h));
            break;
        }
    }
}

void HierarchyMutator::collectSubtree(Handle root, QVector<StableId>& out, int depth) const {
    out.append(m_host->stableId(root));
    if (depth >= m_settings.maxDepth)
        return;
    for (Handle h : m_resolver.children(root))
        collectSubtree(h, out, depth + 1);
}

void HierarchyMutator::forgetAll(const QVector<StableId>& ids) {
    if (!m_expansion)
        return;
    for (const StableId& id : ids)
        m_expansion->forget(id);
}

void HierarchyMutator::renameDevice(Handle device, const HierarchyPath& path) {
    m_host->setName(device, naming::withPath(m_host->name(device), path));
    for (Handle part : m_resolver.children(device)) {
        QString n = m_host->name(part);
        if (naming::isSubPartName(n))
            m_host->setName(part, naming::withPath(n, path));
    }
}

// ── Building blocks ──

std::optional<Node> HierarchyMutator::createRack(const StableId& parentChain, int position,
                                                 MutationError* err) {
    Handle parent;
    if (!parentChain.isNull()) {
        parent = m_resolver.resolve(parentChain);
        if (!parent.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("parent chain %1").arg(parentChain.toString()));
            return std::nullopt;
        }
        if (m_resolver.kindOf(parent) != NodeKind::Chain) {
            report(err, MutationError::WrongKind,
                   QStringLiteral("racks nest only inside chains, not in '%1'").arg(m_host->name(parent)));
            return std::nullopt;
        }
    }

    HierarchyPath path;
    path.rack = nextRackIndex();

    Handle rack = m_host->insertContainer(parent, position);
    if (!rack.isValid()) {
        report(err, MutationError::ContainerCreateFailed, QStringLiteral("rack R%1").arg(path.rack));
        return std::nullopt;
    }
    const StableId rackId = m_host->stableId(rack);
    rack = m_resolver.resolve(rackId);
    if (!rack.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("new rack R%1").arg(path.rack));
        return std::nullopt;
    }
    m_host->setName(rack, naming::encode(path, NameRole::Rack, m_settings.rackLabel));

    Handle mixer = m_host->insertFx(m_settings.mixerPlugin, rack, 0);
    if (!mixer.isValid()) {
        report(err, MutationError::PluginCreateFailed,
               QStringLiteral("mixer '%1' for R%2").arg(m_settings.mixerPlugin).arg(path.rack));
        return std::nullopt;
    }
    const StableId mixerId = m_host->stableId(mixer);
    mixer = m_resolver.resolve(mixerId);
    if (!mixer.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("mixer of R%1").arg(path.rack));
        return std::nullopt;
    }
    m_host->setName(mixer, naming::encode(path, NameRole::Mixer));

    rack = m_resolver.resolve(rackId);
    if (!rack.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("rack R%1 after adding mixer").arg(path.rack));
        return std::nullopt;
    }
    if (m_resolver.parentId(rack) != parentChain) {
        report(err, MutationError::IntegrityViolation,
               QStringLiteral("rack R%1 did not land in its parent").arg(path.rack));
        return std::nullopt;
    }
    return m_resolver.describe(rack);
}

std::optional<Node> HierarchyMutator::createChain(const StableId& rackId, MutationError* err) {
    Handle rack = m_resolver.resolve(rackId);
    if (!rack.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("rack %1").arg(rackId.toString()));
        return std::nullopt;
    }
    if (m_resolver.kindOf(rack) != NodeKind::Rack) {
        report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a rack").arg(m_host->name(rack)));
        return std::nullopt;
    }

    const QStringList names = m_resolver.childNames(rack);
    int chains = 0;
    int mixerPos = -1;
    for (int i = 0; i < names.size(); i++) {
        if (naming::isChainName(names[i])) chains++;
        else if (mixerPos < 0 && naming::isMixerName(names[i])) mixerPos = i;
    }
    if (chains >= m_settings.maxChainsPerRack) {
        report(err, MutationError::CapacityExceeded,
               QStringLiteral("'%1' already has %2 chains").arg(m_host->name(rack)).arg(chains));
        return std::nullopt;
    }

    HierarchyPath path;
    path.rack  = naming::parse(m_host->name(rack)).path.rack;
    path.chain = naming::nextFreeIndex(names, naming::chainIndexOf);
    // Gaps are not reused, so the index can run out before the count does
    if (path.chain > m_settings.maxChainsPerRack) {
        report(err, MutationError::CapacityExceeded,
               QStringLiteral("'%1' would need C%2 (limit %3); renumber it first")
                   .arg(m_host->name(rack)).arg(path.chain).arg(m_settings.maxChainsPerRack));
        return std::nullopt;
    }

    // Mixer stays last
    int pos = mixerPos >= 0 ? mixerPos : names.size();
    Handle chain = m_host->insertContainer(rack, pos);
    if (!chain.isValid()) {
        report(err, MutationError::ContainerCreateFailed, QStringLiteral("chain %1").arg(path.toString()));
        return std::nullopt;
    }
    const StableId chainId = m_host->stableId(chain);
    chain = m_resolver.resolve(chainId);
    if (!chain.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("new chain %1").arg(path.toString()));
        return std::nullopt;
    }
    m_host->setName(chain, naming::encode(path, NameRole::Chain));

    if (m_resolver.parentId(chain) != rackId) {
        report(err, MutationError::IntegrityViolation,
               QStringLiteral("chain %1 is not inside its rack").arg(path.toString()));
        return std::nullopt;
    }
    return m_resolver.describe(chain);
}

std::optional<Node> HierarchyMutator::createDevice(const StableId& chainId, const QString& plugin,
                                                   int position, MutationError* err) {
    if (plugin.isEmpty()) {
        report(err, MutationError::PluginCreateFailed, QStringLiteral("no plugin given"));
        return std::nullopt;
    }

    Handle parent;
    HierarchyPath path;
    if (!chainId.isNull()) {
        parent = m_resolver.resolve(chainId);
        if (!parent.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("chain %1").arg(chainId.toString()));
            return std::nullopt;
        }
        if (m_resolver.kindOf(parent) != NodeKind::Chain) {
            report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a chain").arg(m_host->name(parent)));
            return std::nullopt;
        }
        HierarchyPath chainPath = naming::parse(m_host->name(parent)).path;
        path.rack  = chainPath.rack;
        path.chain = chainPath.chain;
        position = m_host->childCount(parent);
    }

    const QStringList siblings = m_resolver.childNames(parent);
    path.device = naming::nextFreeIndex(siblings, naming::deviceIndexOf);
    if (position < 0 || position > siblings.size())
        position = siblings.size();
    const QString label = naming::shortPluginName(plugin);

    Handle device = m_host->insertContainer(parent, position);
    if (!device.isValid()) {
        report(err, MutationError::ContainerCreateFailed, QStringLiteral("device %1").arg(path.toString()));
        return std::nullopt;
    }
    const StableId deviceId = m_host->stableId(device);

    // The parent's handle went stale with the insert
    if (!chainId.isNull()) {
        parent = m_resolver.resolve(chainId);
        if (!parent.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("chain %1 after insert").arg(chainId.toString()));
            return std::nullopt;
        }
    }
    if (m_host->stableId(m_host->childAt(parent, position)) != deviceId) {
        report(err, MutationError::ChildMoveFailed,
               QStringLiteral("device %1 did not land at position %2").arg(path.toString()).arg(position));
        return std::nullopt;
    }

    device = m_resolver.resolve(deviceId);
    if (!device.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("new device %1").arg(path.toString()));
        return std::nullopt;
    }
    m_host->setName(device, naming::encode(path, NameRole::Device, label));

    if (!populateDevice(deviceId, path, plugin, label, err))
        return std::nullopt;

    return m_resolver.node(deviceId);
}

bool HierarchyMutator::populateDevice(const StableId& deviceId, const HierarchyPath& path,
                                      const QString& plugin, const QString& label,
                                      MutationError* err) {
    Handle device = m_resolver.resolve(deviceId);
    if (!device.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("device %1").arg(path.toString()));
        return false;
    }
    Handle fx = m_host->insertFx(plugin, device, 0);
    if (!fx.isValid()) {
        report(err, MutationError::PluginCreateFailed, QStringLiteral("'%1'").arg(plugin));
        return false;
    }
    const StableId fxId = m_host->stableId(fx);
    fx = m_resolver.resolve(fxId);
    if (!fx.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("plugin of %1").arg(path.toString()));
        return false;
    }
    m_host->setName(fx, naming::encode(path, NameRole::DeviceFx, label));
    return addUtility(deviceId, path, err);
}

bool HierarchyMutator::addUtility(const StableId& deviceId, const HierarchyPath& path,
                                  MutationError* err) {
    if (m_settings.utilityPlugin.isEmpty())
        return true;

    Handle device = m_resolver.resolve(deviceId);
    if (!device.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("device %1 after plugin").arg(path.toString()));
        return false;
    }
    Handle util = m_host->insertFx(m_settings.utilityPlugin, device, -1);
    if (!util.isValid()) {
        // The device still plays; it only lacks its gain/pan stage
        qWarning() << "HierarchyMutator: utility" << m_settings.utilityPlugin
                   << "unavailable for" << path.toString();
        return true;
    }
    const StableId utilId = m_host->stableId(util);
    util = m_resolver.resolve(utilId);
    if (util.isValid())
        m_host->setName(util, naming::encode(path, NameRole::DeviceUtil));
    return true;
}

// ── Public operations ──

std::optional<Node> HierarchyMutator::addRack(const StableId& parentChain, int position,
                                              MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Rack");
    auto rack = createRack(parentChain, position, err);
    if (!rack) {
        undo.fail();
        return std::nullopt;
    }
    qDebug() << "HierarchyMutator: added" << rack->name;
    return rack;
}

std::optional<Node> HierarchyMutator::addChainToRack(const StableId& rack, const QString& plugin,
                                                     MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Chain to Rack");
    auto chain = createChain(rack, err);
    if (!chain) {
        undo.fail();
        return std::nullopt;
    }
    if (!plugin.isEmpty() && !createDevice(chain->id, plugin, -1, err))
        undo.fail();

    auto fresh = m_resolver.node(chain->id);
    if (!fresh) {
        report(err, MutationError::NotFound, QStringLiteral("chain %1 after adding device").arg(chain->name));
        undo.fail();
        return std::nullopt;
    }
    qDebug() << "HierarchyMutator: added" << fresh->name << "with" << fresh->childCount << "device(s)";
    return fresh;
}

std::optional<Node> HierarchyMutator::addDeviceToChain(const StableId& chain, const QString& plugin,
                                                       MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Device to Chain");
    if (chain.isNull()) {
        report(err, MutationError::WrongKind, QStringLiteral("track root is not a chain"));
        undo.fail();
        return std::nullopt;
    }
    auto device = createDevice(chain, plugin, -1, err);
    if (!device)
        undo.fail();
    return device;
}

std::optional<Node> HierarchyMutator::addDevice(const QString& plugin, int position,
                                                MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Device");
    auto device = createDevice({}, plugin, position, err);
    if (!device)
        undo.fail();
    return device;
}

std::optional<Node> HierarchyMutator::addNestedRackToRack(const StableId& parentRack,
                                                          MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Nested Rack");

    Handle outer = m_resolver.resolve(parentRack);
    if (!outer.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("rack %1").arg(parentRack.toString()));
        undo.fail();
        return std::nullopt;
    }
    if (m_resolver.kindOf(outer) != NodeKind::Rack) {
        report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a rack").arg(m_host->name(outer)));
        undo.fail();
        return std::nullopt;
    }
    const StableId outerParent = m_resolver.parentId(outer);

    auto chain = createChain(parentRack, err);
    if (!chain) {
        undo.fail();
        return std::nullopt;
    }
    auto inner = createRack(chain->id, -1, err);
    if (!inner) {
        undo.fail();
        return std::nullopt;
    }

    // Every level must still sit where it was put
    if (!hasParent(parentRack, outerParent) || !hasParent(chain->id, parentRack)
        || !hasParent(inner->id, chain->id)) {
        report(err, MutationError::IntegrityViolation,
               QStringLiteral("%1 popped out of %2").arg(inner->name, chain->name));
        undo.fail();
        return std::nullopt;
    }
    qDebug() << "HierarchyMutator: nested" << inner->name << "in" << chain->name;
    return m_resolver.node(inner->id);
}

std::optional<Node> HierarchyMutator::addRackToChain(const StableId& chain, MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Rack to Chain");

    Handle ch = m_resolver.resolve(chain);
    if (!ch.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("chain %1").arg(chain.toString()));
        undo.fail();
        return std::nullopt;
    }
    if (m_resolver.kindOf(ch) != NodeKind::Chain) {
        report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a chain").arg(m_host->name(ch)));
        undo.fail();
        return std::nullopt;
    }
    const StableId chainParent = m_resolver.parentId(ch);
    const QVector<StableId> before = m_resolver.childIds(ch);

    auto inner = createRack(chain, -1, err);
    if (!inner) {
        undo.fail();
        return std::nullopt;
    }

    ch = m_resolver.resolve(chain);
    if (!ch.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("chain %1 after adding rack").arg(chain.toString()));
        undo.fail();
        return std::nullopt;
    }
    QVector<StableId> after = m_resolver.childIds(ch);
    after.removeAll(inner->id);
    if (after != before || m_resolver.parentId(ch) != chainParent || !hasParent(inner->id, chain)) {
        report(err, MutationError::IntegrityViolation,
               QStringLiteral("'%1' lost its layout while adding %2").arg(m_host->name(ch), inner->name));
        undo.fail();
        return std::nullopt;
    }
    qDebug() << "HierarchyMutator: added" << inner->name << "to" << m_host->name(ch);
    return m_resolver.node(inner->id);
}

QVector<Node> HierarchyMutator::convertChainToDevices(const StableId& chain, MutationError* err) {
    setError(err, MutationError::None);

    Handle ch = m_resolver.resolve(chain);
    if (!ch.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("chain %1").arg(chain.toString()));
        return {};
    }
    if (m_resolver.kindOf(ch) != NodeKind::Chain) {
        report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a chain").arg(m_host->name(ch)));
        return {};
    }

    UndoBlock undo(m_host, "Convert Chain to Devices");

    // Contents land beside the rack, or where the chain was if top level
    const StableId rackId = m_resolver.parentId(ch);
    StableId targetId;
    int insertPos = 0;
    if (rackId.isNull()) {
        insertPos = m_resolver.positionOf(ch);
    } else {
        Handle rack = m_resolver.resolve(rackId);
        targetId  = m_resolver.parentId(rack);
        insertPos = m_resolver.positionOf(rack) + 1;
    }
    HierarchyPath targetPath;
    if (!targetId.isNull())
        targetPath = naming::parse(m_host->name(m_resolver.resolve(targetId))).path;

    QVector<StableId> moving;
    collectFlattenable(ch, moving);

    QVector<Node> extracted;
    for (const StableId& id : moving) {
        Handle h = m_resolver.resolve(id);
        if (!h.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("child %1 of chain").arg(id.toString()));
            undo.fail();
            return extracted;
        }
        const bool isDevice = m_resolver.kindOf(h) == NodeKind::Device;

        Handle target;
        if (!targetId.isNull()) {
            target = m_resolver.resolve(targetId);
            if (!target.isValid()) {
                report(err, MutationError::NotFound, QStringLiteral("destination %1").arg(targetId.toString()));
                undo.fail();
                return extracted;
            }
        }
        if (!m_host->moveFx(h, target, insertPos)) {
            report(err, MutationError::ChildMoveFailed,
                   QStringLiteral("'%1' out of its chain").arg(m_host->name(h)));
            undo.fail();
            return extracted;
        }
        insertPos++;

        if (!isDevice)
            continue;

        Handle moved = m_resolver.resolve(id);
        Handle container = targetId.isNull() ? Handle() : m_resolver.resolve(targetId);
        if (!moved.isValid() || (!targetId.isNull() && !container.isValid())) {
            report(err, MutationError::NotFound, QStringLiteral("device %1 after move").arg(id.toString()));
            undo.fail();
            return extracted;
        }
        HierarchyPath path = targetPath;
        path.device = naming::nextFreeIndex(siblingNames(container, id), naming::deviceIndexOf);
        renameDevice(moved, path);
        extracted.append(m_resolver.describe(moved));
    }

    ch = m_resolver.resolve(chain);
    if (!ch.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("emptied chain %1").arg(chain.toString()));
        undo.fail();
        return extracted;
    }
    QVector<StableId> gone;
    collectSubtree(ch, gone);
    if (!m_host->removeFx(ch)) {
        report(err, MutationError::RemoveFailed,
               QStringLiteral("host kept emptied chain '%1'").arg(m_host->name(ch)));
        undo.fail();
        return extracted;
    }
    forgetAll(gone);

    // A rack holding nothing but its mixer goes too
    if (!rackId.isNull()) {
        Handle rack = m_resolver.resolve(rackId);
        if (rack.isValid()) {
            const QStringList left = m_resolver.childNames(rack);
            bool onlyMixer = true;
            for (const QString& n : left)
                if (!naming::isMixerName(n)) onlyMixer = false;
            if (onlyMixer) {
                const QString rackName = m_host->name(rack);
                gone.clear();
                collectSubtree(rack, gone);
                qDebug() << "HierarchyMutator: removing empty" << rackName;
                if (!m_host->removeFx(rack)) {
                    report(err, MutationError::RemoveFailed, QStringLiteral("host kept empty '%1'").arg(rackName));
                    undo.fail();
                    return extracted;
                }
                forgetAll(gone);
            }
        }
    }

    qDebug() << "HierarchyMutator: flattened chain into" << extracted.size() << "device(s)";
    return extracted;
}

std::optional<Node> HierarchyMutator::convertDeviceToRack(const StableId& device, MutationError* err) {
    setError(err, MutationError::None);

    Handle dev = m_resolver.resolve(device);
    if (!dev.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("device %1").arg(device.toString()));
        return std::nullopt;
    }
    if (m_resolver.kindOf(dev) != NodeKind::Device || !m_resolver.parentId(dev).isNull()) {
        report(err, MutationError::WrongKind,
               QStringLiteral("'%1' is not a standalone device").arg(m_host->name(dev)));
        return std::nullopt;
    }
    const int position = m_resolver.positionOf(dev);

    UndoBlock undo(m_host, "Convert Device to Rack");

    auto rack = createRack({}, position, err);
    if (!rack) {
        undo.fail();
        return std::nullopt;
    }
    auto chain = createChain(rack->id, err);
    if (!chain) {
        undo.fail();
        return std::nullopt;
    }

    dev = m_resolver.resolve(device);
    Handle ch = m_resolver.resolve(chain->id);
    if (!dev.isValid() || !ch.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("device or chain before wrapping"));
        undo.fail();
        return std::nullopt;
    }
    if (!m_host->moveFx(dev, ch, 0)) {
        report(err, MutationError::ChildMoveFailed,
               QStringLiteral("'%1' into %2").arg(m_host->name(dev), chain->name));
        undo.fail();
        return std::nullopt;
    }

    dev = m_resolver.resolve(device);
    if (!dev.isValid() || !hasParent(device, chain->id)) {
        report(err, MutationError::IntegrityViolation, QStringLiteral("device did not land in %1").arg(chain->name));
        undo.fail();
        return std::nullopt;
    }
    HierarchyPath path = chain->path;
    path.device = 1;
    renameDevice(dev, path);

    if (m_expansion) {
        m_expansion->setExpanded(rack->id, true);
        m_expansion->setSelectedChain(rack->id, chain->id);
    }
    qDebug() << "HierarchyMutator: wrapped device into" << rack->name;
    return m_resolver.node(rack->id);
}

std::optional<Node> HierarchyMutator::addModulatorToDevice(const StableId& device, const QString& plugin,
                                                           MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Add Modulator to Device");

    if (device.isNull()) {
        report(err, MutationError::WrongKind, QStringLiteral("track root is not a device"));
        undo.fail();
        return std::nullopt;
    }
    Handle dev = m_resolver.resolve(device);
    if (!dev.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("device %1").arg(device.toString()));
        undo.fail();
        return std::nullopt;
    }
    if (m_resolver.kindOf(dev) != NodeKind::Device) {
        report(err, MutationError::WrongKind, QStringLiteral("'%1' is not a device").arg(m_host->name(dev)));
        undo.fail();
        return std::nullopt;
    }
    const QString modPlugin = plugin.isEmpty() ? m_settings.modulatorPlugin : plugin;
    const HierarchyPath path = naming::parse(m_host->name(dev)).path;
    const int j = naming::nextFreeIndex(m_resolver.childNames(dev), naming::modulatorIndexOf);

    // Modulators go after the plugin and its utility
    Handle mod = m_host->insertFx(modPlugin, dev, m_host->childCount(dev));
    if (!mod.isValid()) {
        report(err, MutationError::PluginCreateFailed, QStringLiteral("modulator '%1'").arg(modPlugin));
        undo.fail();
        return std::nullopt;
    }
    const StableId modId = m_host->stableId(mod);
    mod = m_resolver.resolve(modId);
    if (!mod.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("new modulator of %1").arg(path.toString()));
        undo.fail();
        return std::nullopt;
    }
    if (!hasParent(modId, device)) {
        report(err, MutationError::IntegrityViolation,
               QStringLiteral("modulator did not land in %1").arg(path.toString()));
        undo.fail();
        return std::nullopt;
    }
    m_host->setName(mod, naming::encode(path, NameRole::Modulator, naming::shortPluginName(modPlugin), j));

    qDebug() << "HierarchyMutator: added modulator" << j << "to" << path.toString();
    return m_resolver.node(modId);
}

QVector<Node> HierarchyMutator::convertTrackToDevices(MutationError* err) {
    setError(err, MutationError::None);

    // Loose plugins at track level; RackFX-named nodes and helper plugins stay put
    QVector<StableId> loose;
    for (Handle h : m_resolver.children({})) {
        const QString name = m_host->name(h);
        if (naming::roleOf(name) != NameRole::None)
            continue;
        if (m_host->isContainer(h)) {
            if (m_host->childCount(h) > 0) {
                report(err, MutationError::WrongKind,
                       QStringLiteral("unnamed container '%1' holds effects").arg(name));
                return {};
            }
            continue;
        }
        const QString plugin = m_host->pluginName(h);
        if (plugin == m_settings.mixerPlugin || plugin == m_settings.utilityPlugin
            || plugin == m_settings.modulatorPlugin)
            continue;
        loose.append(m_host->stableId(h));
    }
    if (loose.isEmpty()) {
        qDebug() << "HierarchyMutator: no loose plugins to convert";
        return {};
    }

    UndoBlock undo(m_host, "Convert Track to Devices");

    int next = naming::nextFreeIndex(m_resolver.childNames({}), naming::deviceIndexOf);
    QVector<Node> converted;
    for (const StableId& id : loose) {
        Handle fx = m_resolver.resolve(id);
        if (!fx.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("plugin %1").arg(id.toString()));
            undo.fail();
            return converted;
        }
        const int position = m_resolver.positionOf(fx);
        const QString label = naming::shortPluginName(m_host->pluginName(fx));
        HierarchyPath path;
        path.device = next;

        Handle box = m_host->insertContainer({}, position);
        if (!box.isValid()) {
            report(err, MutationError::ContainerCreateFailed, QStringLiteral("device %1").arg(path.toString()));
            undo.fail();
            return converted;
        }
        const StableId boxId = m_host->stableId(box);
        box = m_resolver.resolve(boxId);
        fx  = m_resolver.resolve(id);
        if (!box.isValid() || !fx.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("device %1 or its plugin").arg(path.toString()));
            undo.fail();
            return converted;
        }
        m_host->setName(box, naming::encode(path, NameRole::Device, label));

        if (!m_host->moveFx(fx, box, 0)) {
            report(err, MutationError::ChildMoveFailed,
                   QStringLiteral("'%1' into %2").arg(m_host->name(fx), path.toString()));
            box = m_resolver.resolve(boxId);
            if (!box.isValid() || !m_host->removeFx(box))
                qWarning() << "HierarchyMutator: empty" << path.toString() << "left on the track";
            undo.fail();
            return converted;
        }
        if (!hasParent(id, boxId) || !hasParent(boxId, StableId())) {
            report(err, MutationError::IntegrityViolation,
                   QStringLiteral("plugin did not land in %1").arg(path.toString()));
            undo.fail();
            return converted;
        }
        fx = m_resolver.resolve(id);
        m_host->setName(fx, naming::encode(path, NameRole::DeviceFx, label));

        if (!addUtility(boxId, path, err)) {
            undo.fail();
            return converted;
        }
        next++;
        if (auto node = m_resolver.node(boxId))
            converted.append(*node);
    }

    qDebug() << "HierarchyMutator: wrapped" << converted.size() << "track plugin(s) into devices";
    return converted;
}

bool HierarchyMutator::reorderChain(const StableId& rack, const StableId& chain, const StableId& before,
                                    MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Reorder Chain");

    Handle r = m_resolver.resolve(rack);
    Handle c = m_resolver.resolve(chain);
    if (!r.isValid() || !c.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("rack or chain to reorder"));
        undo.fail();
        return false;
    }
    if (m_resolver.kindOf(r) != NodeKind::Rack || m_resolver.kindOf(c) != NodeKind::Chain
        || m_resolver.parentId(c) != rack) {
        report(err, MutationError::WrongKind,
               QStringLiteral("'%1' is not a chain of '%2'").arg(m_host->name(c), m_host->name(r)));
        undo.fail();
        return false;
    }

    const int from = m_resolver.positionOf(c);
    int dest = -1;
    if (!before.isNull()) {
        Handle b = m_resolver.resolve(before);
        if (!b.isValid() || m_resolver.parentId(b) != rack) {
            report(err, MutationError::NotFound, QStringLiteral("reorder target is not in the rack"));
            undo.fail();
            return false;
        }
        dest = m_resolver.positionOf(b);
    } else {
        const QStringList names = m_resolver.childNames(r);
        dest = names.size();
        for (int i = 0; i < names.size(); i++) {
            if (naming::isMixerName(names[i])) {
                dest = i;
                break;
            }
        }
    }
    // Final position once the chain is out of the list
    if (dest > from)
        dest--;

    if (dest != from) {
        if (!m_host->moveFx(c, r, dest)) {
            report(err, MutationError::ChildMoveFailed, QStringLiteral("'%1'").arg(m_host->name(c)));
            undo.fail();
            return false;
        }
        r = m_resolver.resolve(rack);
        if (!r.isValid()) {
            report(err, MutationError::NotFound, QStringLiteral("rack after reorder"));
            undo.fail();
            return false;
        }
    }
    renumberChains(r);
    return true;
}

bool HierarchyMutator::removeNode(const StableId& id, MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Remove");

    Handle h = m_resolver.resolve(id);
    if (!h.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("node %1").arg(id.toString()));
        undo.fail();
        return false;
    }
    const QString name = m_host->name(h);
    QVector<StableId> gone;
    collectSubtree(h, gone);
    if (!m_host->removeFx(h)) {
        report(err, MutationError::RemoveFailed, QStringLiteral("host refused to remove '%1'").arg(name));
        undo.fail();
        return false;
    }
    forgetAll(gone);
    qDebug() << "HierarchyMutator: removed" << name;
    return true;
}

// ── Renumbering ──

void HierarchyMutator::renumberDevices(Handle container, const HierarchyPath& base) {
    int next = 1;
    for (Handle h : m_resolver.children(container)) {
        const QString n = m_host->name(h);
        if (naming::isRackName(n))
            continue;
        if (!m_host->isContainer(h) || naming::roleOf(n) != NameRole::Device)
            continue;
        HierarchyPath path = base;
        path.device = next++;
        renameDevice(h, path);
    }
}

void HierarchyMutator::renumberChains(Handle rack) {
    const int rackIdx = naming::parse(m_host->name(rack)).path.rack;
    int next = 1;
    for (Handle h : m_resolver.children(rack)) {
        const QString n = m_host->name(h);
        if (naming::isRackName(n) || naming::roleOf(n) != NameRole::Chain)
            continue;
        HierarchyPath path;
        path.rack  = rackIdx;
        path.chain = next++;
        m_host->setName(h, naming::withPath(n, path));

        // Devices keep their own index and take the new chain prefix
        for (Handle d : m_resolver.children(h)) {
            const QString dn = m_host->name(d);
            if (naming::roleOf(dn) != NameRole::Device)
                continue;
            HierarchyPath devPath = path;
            devPath.device = naming::parse(dn).path.device;
            renameDevice(d, devPath);
        }
    }
}

bool HierarchyMutator::renumber(const StableId& level, MutationError* err) {
    setError(err, MutationError::None);
    UndoBlock undo(m_host, "Renumber");

    if (level.isNull()) {
        renumberDevices({}, HierarchyPath());
        return true;
    }

    Handle h = m_resolver.resolve(level);
    if (!h.isValid()) {
        report(err, MutationError::NotFound, QStringLiteral("level %1").arg(level.toString()));
        undo.fail();
        return false;
    }
    switch (m_resolver.kindOf(h)) {
    case NodeKind::Rack:
        renumberChains(h);
        return true;
    case NodeKind::Chain: {
        HierarchyPath base = naming::parse(m_host->name(h)).path;
        renumberDevices(h, base);
        return true;
    }
    default:
        report(err, MutationError::WrongKind,
               QStringLiteral("'%1' has no numbered children").arg(m_host->name(h)));
        undo.fail();
        return false;
    }
}

} // namespace rfx
