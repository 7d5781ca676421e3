#pragma once
#include "core.h"
#include <QStringList>
#include <functional>
#include <optional>

namespace rfx {

struct ParsedName {
    NameRole      role      = NameRole::None;
    HierarchyPath path;
    int           modulator = 0;     // j of a _M<j> sub-part
    QString       label;
    bool          hasLabel  = false;

    bool ok() const { return role != NameRole::None; }
};

namespace naming {

ParsedName parse(const QString& name);

// Empty string when the path does not fit the role.
QString encode(const HierarchyPath& path, NameRole role,
               const QString& label = {}, int modulator = 0);
QString encode(const HierarchyPath& path, NodeKind kind, const QString& label = {});

std::optional<HierarchyPath> decode(const QString& name);

NameRole roleOf(const QString& name);
NodeKind classify(const QString& name);

bool isRackName(const QString& name);
bool isChainName(const QString& name);
bool isDeviceName(const QString& name);
bool isMixerName(const QString& name);
bool isSubPartName(const QString& name);

// 0 when the name is not of the matching role
int rackIndexOf(const QString& name);
int chainIndexOf(const QString& name);
int deviceIndexOf(const QString& name);
int modulatorIndexOf(const QString& name);   // j of R1_C1_D1_M<j>

// max+1 over extracted indices, 1 when none
int nextFreeIndex(const QStringList& names,
                  const std::function<int(const QString&)>& extractor);

// "VST3: Pro-Q 3 (FabFilter)" -> "Pro-Q 3", "JS: utility/volume" -> "volume"
QString shortPluginName(const QString& fullName);

QString displayLabel(const QString& name);

// Re-encode at another path keeping role, label and modulator index.
// Returns the input unchanged when it does not parse or does not fit.
QString withPath(const QString& name, const HierarchyPath& path);

} // namespace naming
} // namespace rfx
