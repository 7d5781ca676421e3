#include "settings.h"
#include <QDebug>
#include <QSettings>

namespace rfx {

static int boundedInt(const QSettings& s, const char* key, int fallback, int lo, int hi) {
    bool ok = false;
    int v = s.value(QLatin1String(key), fallback).toInt(&ok);
    if (!ok || v < lo || v > hi) {
        qWarning() << "RackSettings: ignoring out-of-range" << key << "=" << s.value(QLatin1String(key));
        return fallback;
    }
    return v;
}

RackSettings RackSettings::load() {
    QSettings s("RackFX", "RackFX");
    return load(s);
}

void RackSettings::save() const {
    QSettings s("RackFX", "RackFX");
    save(s);
}

RackSettings RackSettings::load(const QSettings& s) {
    RackSettings r;
    r.mixerPlugin      = s.value("mixerPlugin", r.mixerPlugin).toString();
    r.utilityPlugin    = s.value("utilityPlugin", r.utilityPlugin).toString();
    r.modulatorPlugin  = s.value("modulatorPlugin", r.modulatorPlugin).toString();
    r.rackLabel        = s.value("rackLabel", r.rackLabel).toString();
    r.maxChainsPerRack = boundedInt(s, "maxChainsPerRack", r.maxChainsPerRack, 1, 31);
    r.maxDepth         = boundedInt(s, "maxDepth", r.maxDepth, 4, 1024);
    r.resolveRetries   = boundedInt(s, "resolveRetries", r.resolveRetries, 0, 16);
    if (r.mixerPlugin.isEmpty()) r.mixerPlugin = RackSettings().mixerPlugin;
    if (r.rackLabel.isEmpty())   r.rackLabel = RackSettings().rackLabel;
    if (r.modulatorPlugin.isEmpty()) r.modulatorPlugin = RackSettings().modulatorPlugin;
    return r;
}

void RackSettings::save(QSettings& s) const {
    s.setValue("mixerPlugin", mixerPlugin);
    s.setValue("utilityPlugin", utilityPlugin);
    s.setValue("modulatorPlugin", modulatorPlugin);
    s.setValue("rackLabel", rackLabel);
    s.setValue("maxChainsPerRack", maxChainsPerRack);
    s.setValue("maxDepth", maxDepth);
    s.setValue("resolveRetries", resolveRetries);
}

} // namespace rfx
