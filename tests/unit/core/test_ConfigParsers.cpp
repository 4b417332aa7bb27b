#include <toml++/toml.h>
#include <QtTest>
#include "core/ConfigParsers.hpp"

using namespace mc;

class TestConfigParsers : public QObject {
    Q_OBJECT

private slots:
    void testParseEncoder() {
        auto tbl = toml::parse(R"(
            [encoder]
            path = "/opt/ffmpeg/bin/ffmpeg"
            search_paths = ["/usr/bin/ffmpeg", "/snap/bin/ffmpeg"]
            probe_timeout_ms = 2500
        )");

        EncoderConfig cfg;
        ConfigParsers::parseEncoder(tbl, cfg);

        QCOMPARE(cfg.path.string(), std::string("/opt/ffmpeg/bin/ffmpeg"));
        QVERIFY(cfg.bundledDir.empty());
        QCOMPARE(cfg.searchPaths.size(), size_t(2));
        QCOMPARE(cfg.searchPaths[1].string(), std::string("/snap/bin/ffmpeg"));
        QCOMPARE(cfg.probeTimeoutMs, 2500u);
    }

    void testParseRecording() {
        auto tbl = toml::parse(R"(
            [recording]
            directory = "/tmp/recordings"
            finalize_timeout_ms = 30000
            write_high_water_bytes = 262144
            stderr_tail_lines = 50
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.directory.string(), std::string("/tmp/recordings"));
        QCOMPARE(cfg.finalizeTimeoutMs, 30000u);
        QCOMPARE(cfg.writeHighWaterBytes, u64(262144));
        QCOMPARE(cfg.stderrTailLines, 50u);
        QCOMPARE(cfg.chunkSize, 65536u);
    }

    void testClampsOutOfRangeValues() {
        auto tbl = toml::parse(R"(
            [recording]
            finalize_timeout_ms = 10
            write_high_water_bytes = 1
            stderr_tail_lines = 100000

            [playback]
            transcode_timeout_ms = 99999999

            [naming]
            max_title_length = 2
        )");

        RecordingConfig rec;
        PlaybackConfig pb;
        NamingConfig naming;
        ConfigParsers::parseRecording(tbl, rec);
        ConfigParsers::parsePlayback(tbl, pb);
        ConfigParsers::parseNaming(tbl, naming);

        QCOMPARE(rec.finalizeTimeoutMs, 1000u);
        QCOMPARE(rec.writeHighWaterBytes, u64(64 * 1024));
        QCOMPARE(rec.stderrTailLines, 200u);
        QCOMPARE(pb.transcodeTimeoutMs, 3600000u);
        QCOMPARE(naming.maxTitleLength, 8u);
    }

    void testNegativeValueKeepsDefault() {
        auto tbl = toml::parse(R"(
            [recording]
            finalize_timeout_ms = -5
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);
        QCOMPARE(cfg.finalizeTimeoutMs, 20000u);
    }

    void testParseNamingLowercasesDomain() {
        auto tbl = toml::parse(R"(
            [naming]
            own_domain = "Example.COM"
        )");

        NamingConfig cfg;
        ConfigParsers::parseNaming(tbl, cfg);
        QCOMPARE(cfg.ownDomain, std::string("example.com"));
        QCOMPARE(cfg.maxTitleLength, 60u);
    }

    void testMissingSectionsLeaveDefaults() {
        auto tbl = toml::parse("");

        EncoderConfig enc;
        PlaybackConfig pb;
        ConfigParsers::parseEncoder(tbl, enc);
        ConfigParsers::parsePlayback(tbl, pb);

        QVERIFY(enc.path.empty());
        QCOMPARE(enc.probeTimeoutMs, 5000u);
        QCOMPARE(pb.transcodeTimeoutMs, 600000u);
    }

    void testSerialize() {
        EncoderConfig encoder;
        encoder.path = "/usr/local/bin/ffmpeg";
        RecordingConfig recording;
        recording.finalizeTimeoutMs = 45000;
        PlaybackConfig playback;
        NamingConfig naming;
        naming.ownDomain = "example.com";

        auto tbl = ConfigParsers::serialize(
                encoder, recording, playback, naming, true);

        auto encTbl = tbl["encoder"].as_table();
        QVERIFY(encTbl != nullptr);
        QCOMPARE((*encTbl)["path"].as_string()->get(),
                 std::string("/usr/local/bin/ffmpeg"));
        QCOMPARE(tbl["recording"]["finalize_timeout_ms"].value<i64>().value_or(0),
                 i64(45000));
        QCOMPARE(tbl["naming"]["own_domain"].value<std::string>().value_or(""),
                 std::string("example.com"));
        QCOMPARE(tbl["general"]["debug"].value<bool>().value_or(false), true);

        // What we write must read back the same way
        EncoderConfig reread;
        ConfigParsers::parseEncoder(tbl, reread);
        QCOMPARE(reread.path, encoder.path);
    }
};

int runTestConfigParsers(int argc, char** argv) {
    TestConfigParsers tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigParsers.moc"
