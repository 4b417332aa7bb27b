#include <QtTest>
#include "recorder/StderrTail.hpp"

using namespace mc;

class TestStderrTail : public QObject {
    Q_OBJECT

private slots:
    void testKeepsLastLines() {
        StderrTail tail(3);
        tail.append("one\ntwo\nthree\nfour\nfive\n");
        QCOMPARE(tail.lines(), (std::vector<std::string>{"three", "four", "five"}));
        QCOMPARE(tail.joined(), std::string("three\nfour\nfive"));
    }

    void testJoinsFragments() {
        StderrTail tail;
        tail.append("[mp4 @ 0x1] moov ");
        tail.append("atom not found\r\nframe=  10");
        QCOMPARE(tail.lines().size(), size_t(1));

        tail.flush();
        QCOMPARE(tail.lines(),
                 (std::vector<std::string>{"[mp4 @ 0x1] moov atom not found",
                                           "frame=  10"}));
    }

    void testUnterminatedLineIsBounded() {
        StderrTail tail;
        for (int i = 0; i < 1000; ++i)
            tail.append(QByteArray(1024, 'x'));
        tail.append("END");
        tail.flush();

        auto lines = tail.lines();
        QCOMPARE(lines.size(), size_t(1));
        QCOMPARE(lines.front().size(), StderrTail::kMaxLineBytes);
        QVERIFY(lines.front().ends_with("xxxEND"));
    }

    void testEmpty() {
        StderrTail tail;
        QVERIFY(tail.empty());
        tail.append("\n\n");
        QVERIFY(tail.empty());
        tail.append("partial");
        QVERIFY(!tail.empty());
    }
};

int runTestStderrTail(int argc, char** argv) {
    TestStderrTail tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_StderrTail.moc"
