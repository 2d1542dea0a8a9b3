#include <QtTest/QtTest>

#include "daemon/alert_rules.hpp"

using namespace std::chrono_literals;
using ccmonitor::AlertRules;

class AlertRulesTests : public QObject
{
    Q_OBJECT
private slots:
    void testMinuteArithmetic();
    void testTimeWarning_data();
    void testTimeWarning();
    void testInactivityAlert_data();
    void testInactivityAlert();
    void testErrorThreshold();
};

void AlertRulesTests::testMinuteArithmetic()
{
    const auto now = std::chrono::system_clock::now();
    QCOMPARE(AlertRules::minutesUntil(now + 25min + 59s, now), 25);
    QCOMPARE(AlertRules::minutesUntil(now - 2min, now), -2);
    QCOMPARE(AlertRules::minutesSince(now - 90min - 30s, now), 90);
    QCOMPARE(AlertRules::inactivityMinutes(120), 60);
}

void AlertRulesTests::testTimeWarning_data()
{
    QTest::addColumn<int>("minutesRemaining");
    QTest::addColumn<bool>("expected");

    QTest::newRow("expired") << 0 << false;
    QTest::newRow("negative") << -5 << false;
    QTest::newRow("one minute") << 1 << true;
    QTest::newRow("at threshold") << 30 << true;
    QTest::newRow("above threshold") << 31 << false;
}

void AlertRulesTests::testTimeWarning()
{
    QFETCH(int, minutesRemaining);
    QFETCH(bool, expected);
    QCOMPARE(AlertRules::shouldSendTimeWarning(minutesRemaining, 30), expected);
}

void AlertRulesTests::testInactivityAlert_data()
{
    QTest::addColumn<int>("minutesSinceStart");
    QTest::addColumn<int>("interval");
    QTest::addColumn<bool>("expected");

    QTest::newRow("young session") << 50 << 10 << false;
    QTest::newRow("hour mark") << 60 << 10 << true;
    QTest::newRow("between intervals") << 65 << 10 << false;
    QTest::newRow("next interval") << 70 << 10 << true;
    QTest::newRow("gate not reached") << 75 << 15 << false;
    QTest::newRow("gate reached") << 90 << 15 << true;
    QTest::newRow("zero interval") << 120 << 0 << false;
}

void AlertRulesTests::testInactivityAlert()
{
    QFETCH(int, minutesSinceStart);
    QFETCH(int, interval);
    QFETCH(bool, expected);
    QCOMPARE(AlertRules::shouldSendInactivityAlert(minutesSinceStart, interval), expected);
}

void AlertRulesTests::testErrorThreshold()
{
    QVERIFY(!AlertRules::shouldSendErrorNotification(0));
    QVERIFY(!AlertRules::shouldSendErrorNotification(5));
    QVERIFY(AlertRules::shouldSendErrorNotification(6));
    QVERIFY(AlertRules::shouldSendErrorNotification(50));
}

QTEST_MAIN(AlertRulesTests)
#include "test_alert_rules.moc"
