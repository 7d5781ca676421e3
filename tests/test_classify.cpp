#include <QtTest/QTest>
#include "classify.h"
#include "hosts/memory_host.h"

using namespace rfx;

static StableId add(MemoryHost& host, const StableId& parent, const QString& name, bool container) {
    Handle p = parent.isNull() ? Handle() : host.handleOf(parent);
    Handle h = container ? host.insertContainer(p, -1) : host.insertFx("JS: " + name, p, -1);
    StableId id = host.stableId(h);
    host.setName(host.handleOf(id), name);
    return id;
}

class TestClassify : public QObject {
    Q_OBJECT
private:
    MemoryHost m_host;
    StableId m_rack, m_chain, m_device, m_mixer;

    void buildHealthyRack() {
        m_rack   = add(m_host, {}, "R1: Rack", true);
        m_chain  = add(m_host, m_rack, "R1_C1", true);
        m_device = add(m_host, m_chain, "R1_C1_D1: ReaComp", true);
        add(m_host, m_device, "R1_C1_D1_FX: ReaComp", false);
        add(m_host, m_device, "R1_C1_D1_Util", false);
        m_mixer  = add(m_host, m_rack, "_R1_M", false);
    }

private slots:
    void init() {
        m_host.reset();
    }

    // -- Contextual classification --

    void testMixerByNameAlone() {
        QCOMPARE(classifyInContext("_R1_M", false, NodeKind::Rack), NodeKind::Mixer);
        QCOMPARE(classifyInContext("_R1_M", true, std::nullopt), NodeKind::Mixer);
        QCOMPARE(classifyInContext("_R1_M", false, NodeKind::Device), NodeKind::Mixer);
    }

    void testNonContainersArePlain() {
        QCOMPARE(classifyInContext("R1: Rack", false, std::nullopt), NodeKind::Plain);
        QCOMPARE(classifyInContext("R1_C1", false, NodeKind::Rack), NodeKind::Plain);
        QCOMPARE(classifyInContext("D1: x", false, std::nullopt), NodeKind::Plain);
    }

    void testPlacementRules() {
        const std::optional<NodeKind> root;
        QCOMPARE(classifyInContext("R1: Rack", true, root), NodeKind::Rack);
        QCOMPARE(classifyInContext("R2: Rack", true, NodeKind::Chain), NodeKind::Rack);
        QCOMPARE(classifyInContext("R2: Rack", true, NodeKind::Rack), NodeKind::Plain);
        QCOMPARE(classifyInContext("R2: Rack", true, NodeKind::Device), NodeKind::Plain);

        QCOMPARE(classifyInContext("R1_C1", true, NodeKind::Rack), NodeKind::Chain);
        QCOMPARE(classifyInContext("R1_C1", true, root), NodeKind::Chain);
        QCOMPARE(classifyInContext("R1_C1", true, NodeKind::Chain), NodeKind::Plain);

        QCOMPARE(classifyInContext("D1: x", true, root), NodeKind::Device);
        QCOMPARE(classifyInContext("R1_C1_D1: x", true, NodeKind::Chain), NodeKind::Device);
        QCOMPARE(classifyInContext("R1_C1_D1: x", true, NodeKind::Rack), NodeKind::Plain);
    }

    void testBareContainerIsPlainAnywhere() {
        QCOMPARE(classifyInContext("Container", true, std::nullopt), NodeKind::Plain);
        QCOMPARE(classifyInContext("Container", true, NodeKind::Chain), NodeKind::Plain);
        QCOMPARE(classifyInContext("Container", true, NodeKind::Plain), NodeKind::Plain);
        QCOMPARE(classifyInContext("", true, NodeKind::Rack), NodeKind::Plain);
    }

    // -- Link integrity --

    void testHealthyTreePasses() {
        buildHealthyRack();
        add(m_host, {}, "D1: ReaEQ", true);
        IntegrityChecker checker(&m_host);
        IntegrityReport r = checker.verify();
        QVERIFY(r.ok());
        QCOMPARE(r.nodesVisited, 7);
        QVERIFY(checker.verifyInvariants().ok());
    }

    void testEmptyTrackPasses() {
        IntegrityChecker checker(&m_host);
        QVERIFY(checker.verify().ok());
        QVERIFY(checker.verifyInvariants().ok());
    }

    void testCircularReference() {
        StableId a = add(m_host, {}, "Container", true);
        StableId b = add(m_host, a, "Container", true);
        m_host.forceChildLink(b, a);
        IntegrityReport r = IntegrityChecker(&m_host).verify();
        QCOMPARE(r.error, IntegrityError::CircularReference);
        QCOMPARE(r.offender, a);
    }

    void testParentMismatch() {
        buildHealthyRack();
        m_host.forceParentLink(m_device, m_rack);
        IntegrityReport r = IntegrityChecker(&m_host).verify();
        QCOMPARE(r.error, IntegrityError::ParentMismatch);
        QCOMPARE(r.offender, m_device);
        QVERIFY(!r.message.isEmpty());
    }

    void testMaxDepthExceeded() {
        StableId parent;
        for (int i = 0; i < 6; i++)
            parent = add(m_host, parent, "Container", true);
        QVERIFY(IntegrityChecker(&m_host, 6).verify().ok());
        IntegrityReport r = IntegrityChecker(&m_host, 5).verify();
        QCOMPARE(r.error, IntegrityError::MaxDepthExceeded);
        QCOMPARE(r.offender, parent);
    }

    void testVerifySubtreeOnly() {
        buildHealthyRack();
        StableId a = add(m_host, {}, "Container", true);
        StableId b = add(m_host, a, "Container", true);
        m_host.forceChildLink(b, a);
        IntegrityChecker checker(&m_host);
        QVERIFY(checker.verify(m_host.handleOf(m_rack)).ok());
        QVERIFY(!checker.verify().ok());
    }

    void testVerifyDoesNotMutate() {
        buildHealthyRack();
        uint64_t gen = m_host.generation();
        QJsonObject before = m_host.toJson();
        IntegrityChecker(&m_host).verifyInvariants();
        QCOMPARE(m_host.generation(), gen);
        QVERIFY(m_host.toJson() == before);
    }

    // -- Layout invariants --

    void testMissingMixer() {
        buildHealthyRack();
        m_host.removeFx(m_host.handleOf(m_mixer));
        IntegrityChecker checker(&m_host);
        QVERIFY(checker.verify().ok());
        IntegrityReport r = checker.verifyInvariants();
        QCOMPARE(r.error, IntegrityError::MissingMixer);
        QCOMPARE(r.offender, m_rack);
    }

    void testMixerOfAnotherRackDoesNotCount() {
        buildHealthyRack();
        m_host.setName(m_host.handleOf(m_mixer), "_R7_M");
        QCOMPARE(IntegrityChecker(&m_host).verifyInvariants().error, IntegrityError::MissingMixer);
    }

    void testDuplicatePath() {
        buildHealthyRack();
        StableId twin = add(m_host, m_chain, "R1_C1_D1: ReaEQ", true);
        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QCOMPARE(r.error, IntegrityError::DuplicatePath);
        QCOMPARE(r.offender, twin);
    }

    void testDuplicateRackIndexAtTrackLevel() {
        buildHealthyRack();
        StableId twin = add(m_host, {}, "R1: Rack", true);
        add(m_host, twin, "_R1_M", false);
        // Each rack is sound on its own
        QVERIFY(IntegrityChecker(&m_host).verifyInvariants(m_host.handleOf(twin)).ok());

        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QCOMPARE(r.error, IntegrityError::DuplicatePath);
        QCOMPARE(r.offender, twin);
        QVERIFY(r.message.contains("R1"));
    }

    void testDuplicateRackIndexAcrossNesting() {
        buildHealthyRack();
        StableId inner = add(m_host, m_chain, "R1: Rack", true);
        add(m_host, inner, "_R1_M", false);
        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QCOMPARE(r.error, IntegrityError::DuplicatePath);
        QCOMPARE(r.offender, inner);

        m_host.setName(m_host.handleOf(inner), "R2: Rack");
        m_host.setName(m_host.childAt(m_host.handleOf(inner), 0), "_R2_M");
        QVERIFY(IntegrityChecker(&m_host).verifyInvariants().ok());
    }

    void testMisplacedRack() {
        buildHealthyRack();
        StableId bad = add(m_host, m_rack, "R2: Rack", true);
        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QCOMPARE(r.error, IntegrityError::MisplacedRack);
        QCOMPARE(r.offender, bad);
    }

    void testErrorNames() {
        QCOMPARE(QString(integrityErrorToString(IntegrityError::CircularReference)), QString("CircularReference"));
        QCOMPARE(QString(integrityErrorToString(IntegrityError::None)), QString("None"));
    }
};

QTEST_GUILESS_MAIN(TestClassify)
#include "test_classify.moc"
