#include <QtTest/QTest>
#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>
#include "settings.h"

using namespace rfx;

class TestSettings : public QObject {
    Q_OBJECT
private:
    QTemporaryDir m_dir;

    QString iniPath(const char* name) const { return m_dir.filePath(QLatin1String(name)); }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    void testDefaults() {
        RackSettings s;
        QCOMPARE(s.mixerPlugin, QString("JS: RackFX/RackFX_Mixer"));
        QCOMPARE(s.utilityPlugin, QString("JS: RackFX/Utils/RackFX_Utility"));
        QCOMPARE(s.modulatorPlugin, QString("JS: RackFX/RackFX_Modulator"));
        QCOMPARE(s.rackLabel, QString("Rack"));
        QCOMPARE(s.maxChainsPerRack, 31);
        QCOMPARE(s.maxDepth, 32);
        QCOMPARE(s.resolveRetries, 2);
    }

    void testMissingKeysKeepDefaults() {
        QSettings ini(iniPath("empty.ini"), QSettings::IniFormat);
        RackSettings s = RackSettings::load(ini);
        QCOMPARE(s.mixerPlugin, RackSettings().mixerPlugin);
        QCOMPARE(s.maxChainsPerRack, 31);
    }

    void testSaveThenLoad() {
        RackSettings out;
        out.mixerPlugin = "JS: studio/mixer";
        out.utilityPlugin = "";
        out.modulatorPlugin = "JS: studio/lfo";
        out.rackLabel = "Split";
        out.maxChainsPerRack = 8;
        out.maxDepth = 64;
        out.resolveRetries = 0;
        {
            QSettings ini(iniPath("saved.ini"), QSettings::IniFormat);
            out.save(ini);
        }
        QSettings ini(iniPath("saved.ini"), QSettings::IniFormat);
        RackSettings in = RackSettings::load(ini);
        QCOMPARE(in.mixerPlugin, QString("JS: studio/mixer"));
        QVERIFY(in.utilityPlugin.isEmpty());
        QCOMPARE(in.modulatorPlugin, QString("JS: studio/lfo"));
        QCOMPARE(in.rackLabel, QString("Split"));
        QCOMPARE(in.maxChainsPerRack, 8);
        QCOMPARE(in.maxDepth, 64);
        QCOMPARE(in.resolveRetries, 0);
    }

    void testOutOfRangeFallsBack() {
        QSettings ini(iniPath("bad.ini"), QSettings::IniFormat);
        ini.setValue("maxChainsPerRack", 32);
        ini.setValue("maxDepth", 2);
        ini.setValue("resolveRetries", "lots");
        ini.setValue("mixerPlugin", "");
        ini.setValue("rackLabel", "");
        ini.setValue("modulatorPlugin", "");

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("maxChainsPerRack"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("maxDepth"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("resolveRetries"));
        RackSettings s = RackSettings::load(ini);
        QCOMPARE(s.maxChainsPerRack, 31);
        QCOMPARE(s.maxDepth, 32);
        QCOMPARE(s.resolveRetries, 2);
        QCOMPARE(s.mixerPlugin, RackSettings().mixerPlugin);
        QCOMPARE(s.rackLabel, QString("Rack"));
        QCOMPARE(s.modulatorPlugin, RackSettings().modulatorPlugin);
    }

    void testBoundsAreInclusive() {
        QSettings ini(iniPath("edges.ini"), QSettings::IniFormat);
        ini.setValue("maxChainsPerRack", 1);
        ini.setValue("maxDepth", 1024);
        ini.setValue("resolveRetries", 16);
        RackSettings s = RackSettings::load(ini);
        QCOMPARE(s.maxChainsPerRack, 1);
        QCOMPARE(s.maxDepth, 1024);
        QCOMPARE(s.resolveRetries, 16);
    }
};

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
