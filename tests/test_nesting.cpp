#include <QtTest/QTest>
#include "classify.h"
#include "hosts/memory_host.h"
#include "mutator.h"

using namespace rfx;

class TestNesting : public QObject {
    Q_OBJECT
private:
    MemoryHost m_host;

    QVector<StableId> ancestorIds(const HierarchyMutator& mut, const StableId& id) const {
        QVector<StableId> out;
        for (const AncestorLink& link : mut.resolver().ancestorPath(mut.resolver().resolve(id)))
            out.append(link.id);
        return out;
    }

private slots:
    void init() {
        m_host.reset();
    }

    void testNestedRackToRack() {
        HierarchyMutator mut(&m_host);
        auto outer = mut.addRack();
        MutationError err = MutationError::NotFound;
        auto inner = mut.addNestedRackToRack(outer->id, &err);
        QVERIFY(inner.has_value());
        QCOMPARE(err, MutationError::None);
        QCOMPARE(inner->name, QString("R2: Rack"));
        QCOMPARE(inner->kind, NodeKind::Rack);

        QVector<StableId> outerKids = m_host.childIdsOf(outer->id);
        QCOMPARE(outerKids.size(), 2);
        QCOMPARE(m_host.nameOf(outerKids[0]), QString("R1_C1"));
        QCOMPARE(m_host.nameOf(outerKids[1]), QString("_R1_M"));
        QCOMPARE(inner->parentId, outerKids[0]);
        QCOMPARE(m_host.undoLog(), (QStringList{"RackFX: Add Rack", "RackFX: Add Nested Rack"}));

        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QVERIFY2(r.ok(), qPrintable(r.message));
    }

    void testNestedRackRefusals() {
        HierarchyMutator mut(&m_host);
        auto rack = mut.addRack();
        auto chain = mut.addChainToRack(rack->id);
        MutationError err;
        QVERIFY(!mut.addNestedRackToRack(chain->id, &err).has_value());
        QCOMPARE(err, MutationError::WrongKind);
        QVERIFY(!mut.addNestedRackToRack(QUuid::createUuid(), &err).has_value());
        QCOMPARE(err, MutationError::NotFound);
        QCOMPARE(m_host.undoLog().last(), QString("RackFX: Add Nested Rack (failed)"));

        m_host.setContainersEnabled(false);
        QVERIFY(!mut.addNestedRackToRack(rack->id, &err).has_value());
        QCOMPARE(err, MutationError::ContainerCreateFailed);
    }

    void testRackToChainKeepsChainContents() {
        HierarchyMutator mut(&m_host);
        auto rack = mut.addRack();
        auto chain = mut.addChainToRack(rack->id, "VST: ReaComp (Cockos)");
        mut.addDeviceToChain(chain->id, "VST: ReaEQ (Cockos)");
        const QVector<StableId> before = m_host.childIdsOf(chain->id);

        auto inner = mut.addRackToChain(chain->id);
        QVERIFY(inner.has_value());
        QVector<StableId> after = m_host.childIdsOf(chain->id);
        QCOMPARE(after.size(), 3);
        QCOMPARE(after.mid(0, 2), before);
        QCOMPARE(after.last(), inner->id);
        QCOMPARE(inner->position, 2);
        QCOMPARE(mut.resolver().parentId(mut.resolver().resolve(chain->id)), rack->id);
    }

    void testRackToChainRefusesNonChain() {
        HierarchyMutator mut(&m_host);
        auto rack = mut.addRack();
        MutationError err;
        QVERIFY(!mut.addRackToChain(rack->id, &err).has_value());
        QCOMPARE(err, MutationError::WrongKind);
        auto dev = mut.addDevice("VST: ReaEQ (Cockos)");
        QVERIFY(!mut.addRackToChain(dev->id, &err).has_value());
        QCOMPARE(err, MutationError::WrongKind);
    }

    void testRackIndicesAreTrackWide() {
        HierarchyMutator mut(&m_host);
        auto r1 = mut.addRack();
        auto r2 = mut.addNestedRackToRack(r1->id);
        QCOMPARE(r2->path.rack, 2);
        QCOMPARE(mut.addRack()->path.rack, 3);
        auto chain = mut.addChainToRack(r2->id);
        QCOMPARE(chain->name, QString("R2_C1"));
        QCOMPARE(mut.addRackToChain(chain->id)->path.rack, 4);
    }

    void testNestedKindsInContext() {
        HierarchyMutator mut(&m_host);
        auto r1 = mut.addRack();
        auto r2 = mut.addNestedRackToRack(r1->id);
        auto chain = mut.addChainToRack(r2->id, "VST: ReaComp (Cockos)");
        StableId device = m_host.childIdsOf(chain->id).first();

        const HandleResolver& res = mut.resolver();
        QCOMPARE(res.kindOf(res.resolve(r2->id)), NodeKind::Rack);
        QCOMPARE(res.kindOf(res.resolve(chain->id)), NodeKind::Chain);
        QCOMPARE(res.kindOf(res.resolve(device)), NodeKind::Device);
        QCOMPARE(res.node(device)->path.toString(), QString("R2_C1_D1"));
        QCOMPARE(res.depthOf(res.resolve(device)), 4);
    }

    // A five-level stack must keep every ancestor through edits anywhere
    // else on the track, whatever the host does with stale handles.
    void testAncestorsSurviveEdits_data() {
        QTest::addColumn<bool>("strict");
        QTest::newRow("lenient") << false;
        QTest::newRow("strict") << true;
    }

    void testAncestorsSurviveEdits() {
        QFETCH(bool, strict);
        m_host.setStrictHandles(strict);
        HierarchyMutator mut(&m_host);

        auto r1 = mut.addRack();
        auto r2 = mut.addNestedRackToRack(r1->id);
        auto r3 = mut.addNestedRackToRack(r2->id);
        QVERIFY(r3.has_value());
        const StableId c1 = r2->parentId;
        const StableId c2 = r3->parentId;

        const QVector<StableId> expected{r3->id, c2, r2->id, c1, r1->id};
        QCOMPARE(ancestorIds(mut, r3->id), expected);

        // Edits above, beside and below the stack
        mut.addDevice("VST: ReaXcomp (Cockos)", 0);
        mut.addRack({}, 0);
        auto extra = mut.addChainToRack(r1->id, "VST: ReaComp (Cockos)");
        QVERIFY(mut.reorderChain(r1->id, extra->id, c1));
        mut.addDeviceToChain(c1, "VST: ReaEQ (Cockos)");
        mut.addRackToChain(c2);
        mut.addChainToRack(r3->id, "VST: ReaDelay (Cockos)");
        auto loose = mut.addDevice("VST: ReaVerb (Cockos)");
        mut.convertDeviceToRack(loose->id);
        mut.convertChainToDevices(extra->id);
        QVERIFY(mut.renumber(r1->id));

        QCOMPARE(ancestorIds(mut, r3->id), expected);
        QCOMPARE(m_host.nameOf(r3->id), QString("R3: Rack"));
        QCOMPARE(m_host.nameOf(r2->id), QString("R2: Rack"));
        // c1 was pushed back by the reorder and renumbered back once extra left
        QCOMPARE(m_host.nameOf(c1), QString("R1_C1"));

        IntegrityReport r = IntegrityChecker(&m_host).verifyInvariants();
        QVERIFY2(r.ok(), qPrintable(r.message));
    }

    void testDepthLimitFromSettings() {
        RackSettings s;
        s.maxDepth = 4;
        HierarchyMutator mut(&m_host, s);
        auto r1 = mut.addRack();
        auto r2 = mut.addNestedRackToRack(r1->id);
        auto r3 = mut.addNestedRackToRack(r2->id);

        // Five links exist; the walk stops at the configured four
        QCOMPARE(mut.resolver().ancestorPath(mut.resolver().resolve(r3->id)).size(), 4);

        // R3's mixer is the deepest node, six levels down
        QVERIFY(IntegrityChecker(&m_host, 6).verify().ok());
        IntegrityReport r = IntegrityChecker(&m_host, 5).verify();
        QCOMPARE(r.error, IntegrityError::MaxDepthExceeded);
        QCOMPARE(r.offender, m_host.childIdsOf(r3->id).first());
    }
};

QTEST_GUILESS_MAIN(TestNesting)
#include "test_nesting.moc"
