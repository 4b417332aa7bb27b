#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "core/Config.hpp"

using namespace mc;

class TestConfigLoader : public QObject {
    Q_OBJECT

private slots:
    void init() {
        CONFIG.reset();
    }

    void cleanupTestCase() {
        CONFIG.reset();
    }

    void testMissingFile() {
        auto result = CONFIG.load("/nonexistent/meetcap/config.toml");
        QVERIFY(result.isErr());
        QVERIFY(result.error().message.find("not found") != std::string::npos);
    }

    void testParseErrorNamesLocation() {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        fs::path path = tmp.filePath("config.toml").toStdString();
        std::ofstream(path) << "[recording]\nfinalize_timeout_ms = = 5\n";

        auto result = CONFIG.load(path);
        QVERIFY(result.isErr());
        QVERIFY(result.error().message.find("config.toml:2:") != std::string::npos);
    }

    void testSaveThenLoad() {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        fs::path path = tmp.filePath("config.toml").toStdString();

        CONFIG.recording().finalizeTimeoutMs = 42000;
        CONFIG.naming().ownDomain = "example.com";
        CONFIG.setDebug(true);
        QVERIFY(CONFIG.isDirty());
        QVERIFY(CONFIG.save(path).isOk());
        QVERIFY(!fs::exists(path.string() + ".tmp"));

        CONFIG.reset();
        QVERIFY(CONFIG.load(path).isOk());
        const Config& config = CONFIG;
        QCOMPARE(config.recording().finalizeTimeoutMs, 42000u);
        QCOMPARE(config.naming().ownDomain, std::string("example.com"));
        QVERIFY(config.debug());
        QVERIFY(!config.isDirty());
    }
};

int runTestConfigLoader(int argc, char** argv) {
    TestConfigLoader tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigLoader.moc"
