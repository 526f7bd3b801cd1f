#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/errors.hpp"
#include "tracker/export_filter.hpp"
#include "tracker/record_editor.hpp"
#include "tracker/record_store.hpp"

namespace {

worklog::Record makeRecord(const std::string &start,
                           const std::string &end,
                           double elapsed,
                           const std::string &comment)
{
    worklog::Record record;
    record.startTime = start;
    record.endTime = end;
    record.elapsedSeconds = elapsed;
    record.comment = comment;
    return record;
}

std::vector<worklog::Record> scenarioRecords()
{
    return {makeRecord("2025-01-01T09:00:00", "2025-01-01T10:30:00", 5400.0, "A"),
            makeRecord("2025-01-02T09:00:00", "2025-01-02T09:15:00", 900.0, "B")};
}

// Captures the table instead of writing a file.
class RecordingWriter : public worklog::TableWriter {
public:
    void write(const worklog::TabularData &table, const QString &path) override
    {
        tables.push_back(table);
        paths.push_back(path);
    }

    std::vector<worklog::TabularData> tables;
    QStringList paths;
};

template <typename Fn>
worklog::ErrorCode expectError(Fn fn)
{
    try {
        fn();
    } catch (const worklog::WorklogError &error) {
        return error.code();
    }
    QTest::qFail("expected WorklogError", __FILE__, __LINE__);
    return worklog::ErrorCode::CorruptStorage;
}

QString cellText(const worklog::TableCell &cell)
{
    return QString::fromStdString(std::get<std::string>(cell));
}

double cellNumber(const worklog::TableCell &cell)
{
    return std::get<double>(cell);
}

} // namespace

class ExportFilterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testSingleDaySelection();
    void testInclusiveRangeIgnoresTimeOfDay();
    void testInvalidDateRange();
    void testMalformedStartSkipped();
    void testLegacyMicrosecondStartSelected();
    void testStartInsideDstGapSelected();
    void testEmptySelectionIsNotAnError();
    void testAggregateScenario();
    void testFormatHoursRounds();
    void testBuildExportTable();
    void testParseDate();
    void testExportRange();
    void testExportRangeNoRecords();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ExportFilterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ExportFilterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ExportFilterTests::testSingleDaySelection()
{
    const auto records = scenarioRecords();
    const auto selected = worklog::selectRange(records, QDate(2025, 1, 1), QDate(2025, 1, 1));

    QCOMPARE(selected.size(), static_cast<size_t>(1));
    QVERIFY(selected[0] == records[0]);
}

void ExportFilterTests::testInclusiveRangeIgnoresTimeOfDay()
{
    const std::vector<worklog::Record> records = {
        makeRecord("2025-01-03T23:59:59", "2025-01-04T00:30:00", 1801.0, "late"),
        makeRecord("2025-01-01T00:00:00", "2025-01-01T01:00:00", 3600.0, "early"),
        makeRecord("2025-01-05T00:00:00", "2025-01-05T01:00:00", 3600.0, "after"),
        makeRecord("2024-12-31T23:59:59.999", "2025-01-01T00:10:00", 600.0, "before")
    };

    const auto selected = worklog::selectRange(records, QDate(2025, 1, 1), QDate(2025, 1, 4));
    QCOMPARE(selected.size(), static_cast<size_t>(2));
    // Stored order is kept, not re-sorted by time.
    QCOMPARE(QString::fromStdString(selected[0].comment), QStringLiteral("late"));
    QCOMPARE(QString::fromStdString(selected[1].comment), QStringLiteral("early"));
}

void ExportFilterTests::testInvalidDateRange()
{
    const auto records = scenarioRecords();
    QCOMPARE(expectError([&] {
                 (void)worklog::selectRange(records, QDate(2025, 1, 2), QDate(2025, 1, 1));
             }),
             worklog::ErrorCode::InvalidDateRange);
}

void ExportFilterTests::testMalformedStartSkipped()
{
    auto records = scenarioRecords();
    records.insert(records.begin(), makeRecord("not-a-date", "2025-01-01T10:00:00", 100.0, "bad"));
    records.push_back(makeRecord("", "", 50.0, "empty"));

    const auto selected = worklog::selectRange(records, QDate(2024, 1, 1), QDate(2026, 1, 1));
    QCOMPARE(selected.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(selected[0].comment), QStringLiteral("A"));
    QCOMPARE(QString::fromStdString(selected[1].comment), QStringLiteral("B"));
}

void ExportFilterTests::testLegacyMicrosecondStartSelected()
{
    std::vector<worklog::Record> records{
        makeRecord("2025-01-04T23:59:59.999999", "2025-01-05T00:30:00.000001", 1800.0, "before"),
        makeRecord("2025-01-05T14:30:00.123456", "2025-01-05T15:30:00.654321", 3600.530865, "legacy"),
    };

    const auto selected = worklog::selectRange(records, QDate(2025, 1, 5), QDate(2025, 1, 5));
    QCOMPARE(selected.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(selected[0].comment), QStringLiteral("legacy"));
    QCOMPARE(QString::fromStdString(worklog::toDisplay(selected[0].startTime)),
             QStringLiteral("2025-01-05 14:30:00"));
    QCOMPARE(QString::fromStdString(worklog::toDisplay(selected[0].endTime)),
             QStringLiteral("2025-01-05 15:30:00"));
}

void ExportFilterTests::testStartInsideDstGapSelected()
{
    std::vector<worklog::Record> records{
        makeRecord("2025-03-30T02:30:00", "2025-03-30T03:30:00", 3600.0, "gap"),
    };

    const auto selected = worklog::selectRange(records, QDate(2025, 3, 30), QDate(2025, 3, 30));
    QCOMPARE(selected.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(worklog::toDisplay(selected[0].startTime)),
             QStringLiteral("2025-03-30 02:30:00"));
}

void ExportFilterTests::testEmptySelectionIsNotAnError()
{
    const auto selected = worklog::selectRange(scenarioRecords(), QDate(2030, 1, 1), QDate(2030, 12, 31));
    QVERIFY(selected.empty());
}

void ExportFilterTests::testAggregateScenario()
{
    const auto totals = worklog::aggregate(scenarioRecords());
    QCOMPARE(totals.totalSeconds, 6300.0);
    QCOMPARE(totals.totalHours, 1.75);
    QCOMPARE(QString::fromStdString(worklog::formatHours(totals.totalHours)), QStringLiteral("1.75"));

    const auto empty = worklog::aggregate({});
    QCOMPARE(empty.totalSeconds, 0.0);
    QCOMPARE(empty.totalHours, 0.0);
}

void ExportFilterTests::testFormatHoursRounds()
{
    QCOMPARE(QString::fromStdString(worklog::formatHours(1.0)), QStringLiteral("1.00"));
    QCOMPARE(QString::fromStdString(worklog::formatHours(2.0 / 3.0)), QStringLiteral("0.67"));
    QCOMPARE(QString::fromStdString(worklog::formatHours(0.004)), QStringLiteral("0.00"));
    QCOMPARE(QString::fromStdString(worklog::formatHours(0.006)), QStringLiteral("0.01"));
}

void ExportFilterTests::testBuildExportTable()
{
    const auto records = scenarioRecords();
    const auto totals = worklog::aggregate(records);
    const auto table = worklog::buildExportTable(records, totals);

    QCOMPARE(table.size(), static_cast<size_t>(6));
    for (const auto &row : table) {
        QCOMPARE(row.size(), static_cast<size_t>(4));
    }

    QCOMPARE(cellText(table[0][0]), QStringLiteral("Start Time"));
    QCOMPARE(cellText(table[0][1]), QStringLiteral("End Time"));
    QCOMPARE(cellText(table[0][2]), QStringLiteral("Elapsed (seconds)"));
    QCOMPARE(cellText(table[0][3]), QStringLiteral("Comment"));

    QCOMPARE(cellText(table[1][0]), QStringLiteral("2025-01-01T09:00:00"));
    QCOMPARE(cellText(table[1][1]), QStringLiteral("2025-01-01T10:30:00"));
    QCOMPARE(cellNumber(table[1][2]), 5400.0);
    QCOMPARE(cellText(table[1][3]), QStringLiteral("A"));
    QCOMPARE(cellText(table[2][3]), QStringLiteral("B"));

    for (const auto &cell : table[3]) {
        QCOMPARE(cellText(cell), QString());
    }

    QCOMPARE(cellText(table[4][0]), QString());
    QCOMPARE(cellText(table[4][1]), QString());
    QCOMPARE(cellNumber(table[4][2]), 6300.0);
    QCOMPARE(cellText(table[4][3]), QStringLiteral("TOTAL SECONDS"));

    QCOMPARE(cellText(table[5][2]), QStringLiteral("1.75"));
    QCOMPARE(cellText(table[5][3]), QStringLiteral("TOTAL HOURS"));
}

void ExportFilterTests::testParseDate()
{
    QCOMPARE(worklog::parseDate("2025-02-28"), QDate(2025, 2, 28));
    QCOMPARE(expectError([] { (void)worklog::parseDate("2025-02-30"); }),
             worklog::ErrorCode::InvalidFormat);
    QCOMPARE(expectError([] { (void)worklog::parseDate("02/28/2025"); }),
             worklog::ErrorCode::InvalidFormat);
    QCOMPARE(expectError([] { (void)worklog::parseDate(""); }),
             worklog::ErrorCode::InvalidFormat);
}

void ExportFilterTests::testExportRange()
{
    const QString path = m_tempDir.path() + "/export-range.json";
    QFile::remove(path);
    worklog::RecordStore store(path);
    store.save(scenarioRecords());

    RecordingWriter writer;
    const auto summary = worklog::exportRange(store, "2025-01-01", "2025-01-02",
                                              writer, QStringLiteral("/tmp/out.csv"));

    QCOMPARE(summary.rows, static_cast<size_t>(2));
    QCOMPARE(summary.totals.totalSeconds, 6300.0);
    QCOMPARE(writer.tables.size(), static_cast<size_t>(1));
    QCOMPARE(writer.paths, QStringList({"/tmp/out.csv"}));
    QCOMPARE(writer.tables[0].size(), static_cast<size_t>(6));
}

void ExportFilterTests::testExportRangeNoRecords()
{
    const QString path = m_tempDir.path() + "/export-empty.json";
    QFile::remove(path);
    worklog::RecordStore store(path);
    store.save(scenarioRecords());

    RecordingWriter writer;
    QCOMPARE(expectError([&] {
                 (void)worklog::exportRange(store, "2025-02-01", "2025-02-28",
                                            writer, QStringLiteral("/tmp/none.csv"));
             }),
             worklog::ErrorCode::NoRecordsInRange);
    QCOMPARE(expectError([&] {
                 (void)worklog::exportRange(store, "2025-01-02", "2025-01-01",
                                            writer, QStringLiteral("/tmp/none.csv"));
             }),
             worklog::ErrorCode::InvalidDateRange);
    QCOMPARE(expectError([&] {
                 (void)worklog::exportRange(store, "January", "2025-01-01",
                                            writer, QStringLiteral("/tmp/none.csv"));
             }),
             worklog::ErrorCode::InvalidFormat);
    QVERIFY(writer.tables.empty());
}

QTEST_MAIN(ExportFilterTests)
#include "test_export_filter.moc"
