#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QThread>

#include "daemon/ticker.hpp"

using namespace std::chrono_literals;

class TickerTests : public QObject
{
    Q_OBJECT
private slots:
    void testWaitForTickElapses();
    void testCancelWakesWaiter();
    void testCancelledReturnsImmediately();
};

void TickerTests::testWaitForTickElapses()
{
    ccmonitor::Ticker ticker(50ms);
    QElapsedTimer timer;
    timer.start();
    QVERIFY(ticker.waitForTick());
    QVERIFY(timer.elapsed() >= 45);
    QVERIFY(!ticker.isCancelled());
}

void TickerTests::testCancelWakesWaiter()
{
    ccmonitor::Ticker ticker(10s);
    bool result = true;
    QElapsedTimer timer;
    timer.start();

    std::unique_ptr<QThread> waiter(QThread::create([&] { result = ticker.waitForTick(); }));
    waiter->start();
    QThread::msleep(50);
    ticker.cancel();

    QVERIFY(waiter->wait(2000));
    QVERIFY(!result);
    QVERIFY(timer.elapsed() < 2000);
}

void TickerTests::testCancelledReturnsImmediately()
{
    ccmonitor::Ticker ticker(10s);
    ticker.cancel();
    ticker.cancel();

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!ticker.waitFor(5s));
    QVERIFY(timer.elapsed() < 1000);
    QVERIFY(ticker.isCancelled());
    QVERIFY(ticker.period() == 10s);
}

QTEST_MAIN(TickerTests)
#include "test_ticker.moc"
