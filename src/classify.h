#pragma once
#include "core.h"
#include "settings.h"
#include <QSet>
#include <QString>
#include <optional>

namespace rfx {

class FxHost;

// Kind of one effect from its name, its container flag and its parent's kind
// (nullopt = track root). Mixers are recognised by name alone; every other
// kind needs a container whose placement fits:
//   Rack   under root or Chain
//   Chain  under root or Rack
//   Device under root or Chain
// Anything else is Plain.
NodeKind classifyInContext(const QString& name, bool isContainer,
                           std::optional<NodeKind> parentKind);

enum class IntegrityError : uint8_t {
    None,
    CircularReference,
    ParentMismatch,
    MaxDepthExceeded,
    MissingMixer,
    DuplicatePath,
    MisplacedRack
};

const char* integrityErrorToString(IntegrityError e);

struct IntegrityReport {
    IntegrityError error = IntegrityError::None;
    StableId       offender;
    QString        message;
    int            nodesVisited = 0;

    bool ok() const { return error == IntegrityError::None; }
};

// Read-only walks over a host subtree. Never mutates and never repairs.
class IntegrityChecker {
public:
    explicit IntegrityChecker(const FxHost* host, int maxDepth = RackSettings().maxDepth)
        : m_host(host), m_maxDepth(maxDepth) {}

    // Link structure only: revisits, parent/child disagreement, depth ceiling.
    IntegrityReport verify(Handle root = {}) const;

    // verify() plus the rack/chain/device layout rules.
    IntegrityReport verifyInvariants(Handle root = {}) const;

private:
    const FxHost* m_host;
    int           m_maxDepth;

    IntegrityReport checkLayout(Handle container, const QString& containerName,
                                std::optional<NodeKind> containerKind,
                                QSet<int>& rackIndices) const;
};

} // namespace rfx
