#pragma once
#include "core.h"
#include "resolver.h"
#include "settings.h"
#include <QVector>
#include <optional>

namespace rfx {

class ExpansionState;
class FxHost;

// Structural edits on the rack/chain/device tree.
//
// Every public call runs inside one host undo block and follows the same
// discipline: capture StableIds, make one host edit, re-resolve every id
// still needed, check where things landed, repeat. No Handle survives a host
// edit. Failures stop the remaining steps and are reported through `err`;
// whatever the host already committed stays committed.
class HierarchyMutator {
public:
    explicit HierarchyMutator(FxHost* host, const RackSettings& settings = RackSettings());

    // Convert-to-rack expands the new rack and selects its chain here;
    // removals drop whatever view state pointed at the deleted nodes.
    void setExpansionState(ExpansionState* state) { m_expansion = state; }

    const HandleResolver& resolver() const { return m_resolver; }
    const RackSettings&   settings() const { return m_settings; }

    // parentChain null = track root; position < 0 appends
    std::optional<Node> addRack(const StableId& parentChain = {}, int position = -1,
                                MutationError* err = nullptr);

    // With a plugin the chain gets it as its first device. If only that
    // device step fails, the chain is still returned and `err` is set.
    std::optional<Node> addChainToRack(const StableId& rack, const QString& plugin = {},
                                       MutationError* err = nullptr);

    std::optional<Node> addDeviceToChain(const StableId& chain, const QString& plugin,
                                         MutationError* err = nullptr);

    // Standalone device at track level
    std::optional<Node> addDevice(const QString& plugin, int position = -1,
                                  MutationError* err = nullptr);

    // New chain in parentRack holding a new rack; returns the inner rack
    std::optional<Node> addNestedRackToRack(const StableId& parentRack,
                                            MutationError* err = nullptr);

    // Appends a rack to the chain, after whatever it already holds
    std::optional<Node> addRackToChain(const StableId& chain, MutationError* err = nullptr);

    // Appends a modulator after the device's other parts; empty plugin
    // means the configured modulatorPlugin.
    std::optional<Node> addModulatorToDevice(const StableId& device, const QString& plugin = {},
                                             MutationError* err = nullptr);

    QVector<Node> convertChainToDevices(const StableId& chain, MutationError* err = nullptr);
    std::optional<Node> convertDeviceToRack(const StableId& device, MutationError* err = nullptr);

    // Wraps every loose track-level plugin into a standalone device, in
    // place. Refused while an unnamed container holds effects.
    QVector<Node> convertTrackToDevices(MutationError* err = nullptr);

    // before null = last chain (just ahead of the mixer)
    bool reorderChain(const StableId& rack, const StableId& chain, const StableId& before = {},
                      MutationError* err = nullptr);

    bool removeNode(const StableId& id, MutationError* err = nullptr);

    // Contiguous 1..n at one level, in current order:
    //   root  -> standalone devices
    //   Rack  -> its chains, carrying the new prefix into their devices
    //   Chain -> its devices
    // Rack-named containers are never renamed here.
    bool renumber(const StableId& level = {}, MutationError* err = nullptr);

private:
    FxHost*         m_host;
    RackSettings    m_settings;
    HandleResolver  m_resolver;
    ExpansionState* m_expansion = nullptr;

    // Unbracketed steps shared by the public operations
    std::optional<Node> createRack(const StableId& parentChain, int position, MutationError* err);
    std::optional<Node> createChain(const StableId& rack, MutationError* err);
    std::optional<Node> createDevice(const StableId& chain, const QString& plugin, int position,
                                     MutationError* err);
    bool populateDevice(const StableId& device, const HierarchyPath& path,
                        const QString& plugin, const QString& label, MutationError* err);
    bool addUtility(const StableId& device, const HierarchyPath& path, MutationError* err);

    int  nextRackIndex() const;
    bool hasParent(const StableId& id, const StableId& expectedParent) const;
    QStringList siblingNames(Handle container, const StableId& exclude) const;
    void collectFlattenable(Handle container, QVector<StableId>& out) const;
    void collectSubtree(Handle root, QVector<StableId>& out, int depth = 0) const;
    void forgetAll(const QVector<StableId>& ids);

    void renameDevice(Handle device, const HierarchyPath& path);
    void renumberDevices(Handle container, const HierarchyPath& base);
    void renumberChains(Handle rack);
};

} // namespace rfx
