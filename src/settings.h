#pragma once
#include <QString>

class QSettings;

namespace rfx {

struct RackSettings {
    QString mixerPlugin      = QStringLiteral("JS: RackFX/RackFX_Mixer");
    QString utilityPlugin    = QStringLiteral("JS: RackFX/Utils/RackFX_Utility");
    QString modulatorPlugin  = QStringLiteral("JS: RackFX/RackFX_Modulator");
    QString rackLabel        = QStringLiteral("Rack");
    int     maxChainsPerRack = 31;    // mixer has 32 input pairs, one is the main bus
    int     maxDepth         = 32;    // ancestor walks and integrity checks stop here
    int     resolveRetries   = 2;

    // QSettings("RackFX", "RackFX")
    static RackSettings load();
    void save() const;

    // Out-of-range or missing keys keep their defaults.
    static RackSettings load(const QSettings& s);
    void save(QSettings& s) const;
};

} // namespace rfx
