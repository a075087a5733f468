#include <QTest>
#include "proxy/connection_pool.h"

class TestConnectionPool : public QObject {
    Q_OBJECT

private slots:
    void testLeaseReturnsManager() {
        ConnectionPool pool(2);
        QNetworkAccessManager* first = nullptr;
        {
            auto lease = pool.lease();
            QVERIFY(lease);
            first = lease.get();
            QCOMPARE(pool.activeCount(), 1);
        }
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);

        auto again = pool.lease();
        QCOMPARE(again.get(), first);
    }

    void testOverflowManagersAreNotKept() {
        ConnectionPool pool(1);
        auto a = pool.lease();
        auto b = pool.lease();
        QCOMPARE(pool.activeCount(), 2);

        a.reset();
        b.reset();
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testMovedLeaseReleasesOnce() {
        ConnectionPool pool(4);
        auto a = pool.lease();
        ConnectionPool::Lease b = std::move(a);
        QVERIFY(!a);
        QVERIFY(b);
        b.reset();
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testTakeDetachesManager() {
        ConnectionPool pool(4);
        QNetworkAccessManager* nam = nullptr;
        {
            auto lease = pool.lease();
            nam = lease.take();
        }
        QCOMPARE(pool.activeCount(), 1);
        pool.release(nam);
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testDisabledPoolKeepsNothing() {
        ConnectionPool pool(4);
        pool.setEnabled(false);
        QVERIFY(!pool.isEnabled());
        {
            auto lease = pool.lease();
            QVERIFY(lease);
        }
        QCOMPARE(pool.idleCount(), 0);
    }

    void testResizeTrimsIdle() {
        ConnectionPool pool(3);
        {
            auto a = pool.lease();
            auto b = pool.lease();
            auto c = pool.lease();
        }
        QCOMPARE(pool.idleCount(), 3);
        pool.resize(1);
        QCOMPARE(pool.maxSize(), 1);
        QCOMPARE(pool.idleCount(), 1);
    }
};

QTEST_MAIN(TestConnectionPool)
#include "tst_connection_pool.moc"
