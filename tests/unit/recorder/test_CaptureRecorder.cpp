#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include <iterator>
#include <memory>
#include "core/Errors.hpp"
#include "recorder/CaptureRecorder.hpp"
#include "recorder/RecordingSession.hpp"
#include "support/FakeEncoder.hpp"

using namespace mc;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

QByteArray patternChunk(int index, int size) {
    QByteArray chunk(size, '\0');
    for (int i = 0; i < size; ++i)
        chunk[i] = static_cast<char>((index * 31 + i) % 251);
    return chunk;
}

// Encoder stdin that refuses every write while the process keeps running
class RejectingSession : public RecordingSession {
public:
    using RecordingSession::RecordingSession;

protected:
    qint64 writeChunk(const QByteArray&) override {
        return -1;
    }
};

} // namespace

class TestCaptureRecorder : public QObject {
    Q_OBJECT

private slots:
    void init() {
        qunsetenv(EncoderSettings::kOverrideEnv);
        EncoderLocator::clearCache();
        tmp_ = std::make_unique<QTemporaryDir>();
        QVERIFY(tmp_->isValid());
        dir_ = fs::path(tmp_->path().toStdString()) / "recordings";
    }

    void cleanup() {
        tmp_.reset();
    }

    void testRecordsChunksInOrder() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("meeting-1").isOk());
        QCOMPARE(recorder->activeMeeting(), std::optional<std::string>("meeting-1"));

        recorder->append("meeting-1", "first|");
        recorder->append("meeting-1", "second|");
        recorder->append("meeting-1", "third");
        QCOMPARE(recorder->bytesWritten(), u64(18));

        auto future = recorder->stop("meeting-1", "Weekly sync.mp4");
        QVERIFY(!recorder->isRecording());
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY2(result.isOk(), result.isOk() ? "" : result.error().message.c_str());
        QCOMPARE(*result, std::string("Weekly sync.mp4"));
        QCOMPARE(readFile(dir_ / "Weekly sync.mp4"), std::string("first|second|third"));
        QVERIFY(!fs::exists(dir_ / "meeting-1.mp4.tmp"));
        QTRY_COMPARE(recorder->finalizingCount(), usize(0));
    }

    void testBackPressurePreservesOrder() {
        auto settings = defaultSettings();
        settings.writeHighWater = 4096;
        auto recorder = makeRecorder(settings);
        QVERIFY(recorder->start("m-bp").isOk());

        QByteArray expected;
        for (int i = 0; i < 64; ++i) {
            auto chunk = patternChunk(i, 16 * 1024 + i);
            expected += chunk;
            recorder->append("m-bp", chunk);
        }
        QCOMPARE(recorder->bytesWritten(), u64(expected.size()));

        auto future = recorder->stop("m-bp", "m-bp.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);
        QVERIFY(future.result().isOk());
        QCOMPARE(readFile(dir_ / "m-bp.mp4"), expected.toStdString());
    }

    void testEmptyRecording() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-empty").isOk());

        auto future = recorder->stop("m-empty", "m-empty.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::EmptyRecording));
        QVERIFY(!fs::exists(dir_ / "m-empty.mp4"));
        QVERIFY(!fs::exists(dir_ / "m-empty.mp4.tmp"));
    }

    void testStartDiscardsPreviousSession() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("meeting-a").isOk());
        recorder->append("meeting-a", "aaaa");
        QTRY_VERIFY_WITH_TIMEOUT(fs::exists(dir_ / "meeting-a.mp4.tmp"), 5000);

        QVERIFY(recorder->start("meeting-b").isOk());
        QCOMPARE(recorder->activeMeeting(), std::optional<std::string>("meeting-b"));
        QVERIFY(!fs::exists(dir_ / "meeting-a.mp4.tmp"));

        auto stale = recorder->stop("meeting-a", "a.mp4");
        QVERIFY(stale.isFinished());
        QVERIFY(stale.result().error().is(RecorderError::NoActiveSession));
        recorder->discardActive();
    }

    void testNonZeroExitKeepsStderrTail() {
        test::FakeEncoderOptions opts;
        opts.exitCode = 3;
        opts.stderrLines = 25;
        auto recorder = makeRecorder(defaultSettings(), opts);
        QVERIFY(recorder->start("m-fail").isOk());
        recorder->append("m-fail", "data");

        auto future = recorder->stop("m-fail", "m-fail.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::EncoderNonZeroExit));
        const auto& message = result.error().message;
        QVERIFY(message.find("code 3") != std::string::npos);
        QVERIFY(message.find("encoder warning 25") != std::string::npos);
        QVERIFY(message.find("encoder warning 6") != std::string::npos);
        QVERIFY(message.find("encoder warning 5\n") == std::string::npos);
        QVERIFY(!fs::exists(dir_ / "m-fail.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-fail.mp4"));
    }

    void testFinalizeTimeout() {
        test::FakeEncoderOptions opts;
        opts.hang = true;
        auto settings = defaultSettings();
        settings.finalizeTimeout = Duration(300);
        auto recorder = makeRecorder(settings, opts);
        QVERIFY(recorder->start("m-hang").isOk());
        recorder->append("m-hang", "data");

        auto future = recorder->stop("m-hang", "m-hang.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::FinalizeTimeout));
        QVERIFY(!fs::exists(dir_ / "m-hang.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-hang.mp4"));
    }

    void testStopWithoutSession() {
        auto recorder = makeRecorder();
        auto future = recorder->stop("nobody", "nobody.mp4");
        QVERIFY(future.isFinished());
        QVERIFY(future.result().error().is(RecorderError::NoActiveSession));
    }

    void testStopOtherMeetingKeepsSession() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-1").isOk());

        auto future = recorder->stop("m-2", "m-2.mp4");
        QVERIFY(future.isFinished());
        QVERIFY(future.result().error().is(RecorderError::NoActiveSession));
        QCOMPARE(recorder->activeMeeting(), std::optional<std::string>("m-1"));
        recorder->discardActive();
    }

    void testAppendsForOtherMeetingsAreDropped() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-live").isOk());

        recorder->append("m-live", "keep");
        recorder->append("m-old", "drop");
        QCOMPARE(recorder->droppedChunks(), u64(1));

        auto future = recorder->stop("m-live", "m-live.mp4");
        recorder->append("m-live", "late");
        QCOMPARE(recorder->droppedChunks(), u64(2));

        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);
        QVERIFY(future.result().isOk());
        QCOMPARE(readFile(dir_ / "m-live.mp4"), std::string("keep"));
    }

    void testInvalidFinalFilename() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-name").isOk());

        for (const char* bad : {"../escape.mp4", "sub/dir.mp4", "", "m-name.mp4.tmp"}) {
            auto future = recorder->stop("m-name", bad);
            QVERIFY(future.isFinished());
            QVERIFY(future.result().error().is(RecorderError::InvalidFilename));
            QVERIFY(recorder->isRecording());
        }
        recorder->discard("m-name");
        QVERIFY(!recorder->isRecording());
    }

    void testStartFailsWithoutEncoder() {
        auto settings = defaultSettings();
        EncoderSettings encoder;
        encoder.overridePath = "/nonexistent/ffmpeg";
        CaptureRecorder recorder(settings, EncoderLocator(encoder));

        auto result = recorder.start("m-none");
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::EncoderUnavailable));
        QVERIFY(!recorder.isRecording());
        QVERIFY(!fs::exists(dir_ / "m-none.mp4.tmp"));
    }

    void testDiscardRemovesTemp() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-discard").isOk());
        recorder->append("m-discard", "bytes");
        QTRY_VERIFY_WITH_TIMEOUT(fs::exists(dir_ / "m-discard.mp4.tmp"), 5000);

        recorder->discard("m-discard");
        QVERIFY(!recorder->isRecording());
        QVERIFY(!fs::exists(dir_ / "m-discard.mp4.tmp"));
    }

    void testFinalizeSurvivesNextStart() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-first").isOk());
        recorder->append("m-first", "first meeting");

        auto future = recorder->stop("m-first", "first.mp4");
        QVERIFY(recorder->start("m-second").isOk());
        QCOMPARE(recorder->finalizingCount(), usize(1));

        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);
        QVERIFY(future.result().isOk());
        QCOMPARE(readFile(dir_ / "first.mp4"), std::string("first meeting"));
        QTRY_COMPARE(recorder->finalizingCount(), usize(0));
        QCOMPARE(recorder->activeMeeting(), std::optional<std::string>("m-second"));
        recorder->discardActive();
    }

    void testRestartSameMeetingWhileFinalizing() {
        auto recorder = makeRecorder();
        QVERIFY(recorder->start("m-again").isOk());
        recorder->append("m-again", "first take");

        auto first = recorder->stop("m-again", "first take.mp4");
        QVERIFY(recorder->start("m-again").isOk());
        QCOMPARE(recorder->finalizingCount(), usize(1));
        recorder->append("m-again", "second take");
        QTRY_VERIFY_WITH_TIMEOUT(fs::exists(dir_ / "m-again.1.mp4.tmp"), 5000);

        auto second = recorder->stop("m-again", "second take.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(first.isFinished() && second.isFinished(), 10000);

        QVERIFY(first.result().isOk());
        QVERIFY(second.result().isOk());
        QCOMPARE(readFile(dir_ / "first take.mp4"), std::string("first take"));
        QCOMPARE(readFile(dir_ / "second take.mp4"), std::string("second take"));
        QVERIFY(!fs::exists(dir_ / "m-again.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-again.1.mp4.tmp"));
    }

    void testFinalizeTimeoutWhileInputBlocked() {
        test::FakeEncoderOptions opts;
        opts.stallInput = true;
        auto settings = defaultSettings();
        settings.writeHighWater = 4096;
        settings.finalizeTimeout = Duration(500);
        auto recorder = makeRecorder(settings, opts);
        QVERIFY(recorder->start("m-stall").isOk());

        for (int i = 0; i < 64; ++i)
            recorder->append("m-stall", patternChunk(i, 64 * 1024));

        auto future = recorder->stop("m-stall", "m-stall.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::FinalizeTimeout));
        QVERIFY(!fs::exists(dir_ / "m-stall.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-stall.mp4"));
        QTRY_COMPARE(recorder->finalizingCount(), usize(0));
    }

    void testEncoderExitMidRecording() {
        test::FakeEncoderOptions opts;
        opts.exitAfterBytes = 16;
        opts.exitCode = 5;
        auto recorder = makeRecorder(defaultSettings(), opts);
        QVERIFY(recorder->start("m-pipe").isOk());

        recorder->append("m-pipe", "0123456789abcdef");
        QTRY_VERIFY_WITH_TIMEOUT(fs::exists(dir_ / "m-pipe.mp4.tmp") &&
                                         fs::file_size(dir_ / "m-pipe.mp4.tmp") == 16,
                                 5000);
        QTest::qWait(200);

        for (int i = 0; i < 32; ++i)
            recorder->append("m-pipe", patternChunk(i, 32 * 1024));
        QVERIFY(recorder->isRecording());
        QCOMPARE(recorder->bytesWritten(), u64(16 + 32 * 32 * 1024));

        auto future = recorder->stop("m-pipe", "m-pipe.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY2(result.error().is(RecorderError::EncoderNonZeroExit),
                 result.error().message.c_str());
        QVERIFY(result.error().message.find("code 5") != std::string::npos);
        QVERIFY(!fs::exists(dir_ / "m-pipe.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-pipe.mp4"));
    }

    void testWriteFailureIsTerminal() {
        test::FakeEncoder fake(fs::path(tmp_->path().toStdString()));
        fs::create_directories(dir_);
        auto settings = defaultSettings();
        RejectingSession session("m-write",
                                 settings.tempPathFor("m-write"),
                                 fake.path(),
                                 EncoderCapabilities{"libx264", std::string("aac")},
                                 settings);
        QVERIFY(session.spawn().isOk());

        session.append("data");
        QVERIFY(session.hasTerminalError());
        session.append("more");
        QCOMPARE(session.pendingChunks(), usize(0));
        QCOMPARE(session.bytesWritten(), u64(4));

        auto future = session.finalize(dir_ / "m-write.mp4");
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 10000);

        auto result = future.result();
        QVERIFY(result.isErr());
        QVERIFY(result.error().is(RecorderError::WriteFailed));
        QVERIFY(result.error().message.find("Failed to write to encoder") !=
                std::string::npos);
        QVERIFY(!fs::exists(dir_ / "m-write.mp4.tmp"));
        QVERIFY(!fs::exists(dir_ / "m-write.mp4"));
    }

private:
    RecorderSettings defaultSettings() const {
        RecorderSettings settings;
        settings.directory = dir_;
        return settings;
    }

    std::unique_ptr<CaptureRecorder> makeRecorder(
            const RecorderSettings& settings,
            test::FakeEncoderOptions opts = {}) {
        fake_ = std::make_unique<test::FakeEncoder>(
                fs::path(tmp_->path().toStdString()), opts);
        EncoderSettings encoder;
        encoder.overridePath = fake_->path();
        return std::make_unique<CaptureRecorder>(settings, EncoderLocator(encoder));
    }

    std::unique_ptr<CaptureRecorder> makeRecorder() {
        return makeRecorder(defaultSettings());
    }

    std::unique_ptr<QTemporaryDir> tmp_;
    std::unique_ptr<test::FakeEncoder> fake_;
    fs::path dir_;
};

int runTestCaptureRecorder(int argc, char** argv) {
    TestCaptureRecorder tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CaptureRecorder.moc"
