#include <QTest>
#include <QBuffer>
#include "proxy/stream_writer.h"

class TestStreamWriter : public QObject {
    Q_OBJECT

private slots:
    void testStreamHeader() {
        QBuffer buffer;
        QVERIFY(buffer.open(QIODevice::WriteOnly));
        QVERIFY(StreamWriter::writeStreamHeader(&buffer));

        const QByteArray out = buffer.data();
        QVERIFY(out.startsWith("HTTP/1.1 200 OK\r\n"));
        QVERIFY(out.contains("Content-Type: text/event-stream\r\n"));
        QVERIFY(out.contains("Transfer-Encoding: chunked\r\n"));
        QVERIFY(out.contains("Access-Control-Allow-Origin: *\r\n"));
        QVERIFY(out.contains("Connection: keep-alive\r\n"));
        QVERIFY(out.endsWith("\r\n\r\n"));
    }

    void testStreamHeaderForClosingConnection() {
        QBuffer buffer;
        QVERIFY(buffer.open(QIODevice::WriteOnly));
        QVERIFY(StreamWriter::writeStreamHeader(&buffer, false));

        const QByteArray out = buffer.data();
        QVERIFY(out.contains("Connection: close\r\n"));
        QVERIFY(!out.contains("keep-alive"));
        QVERIFY(out.contains("Transfer-Encoding: chunked\r\n"));
        QVERIFY(out.endsWith("\r\n\r\n"));
    }

    void testWrapChunkedUsesHexLength() {
        const QByteArray chunk = StreamWriter::wrapChunked(QByteArray(26, 'x'));
        QVERIFY(chunk.startsWith("1a\r\n"));
        QVERIFY(chunk.endsWith("x\r\n"));
    }

    void testToSseFrame() {
        QCOMPARE(StreamWriter::toSseFrame("{\"a\":1}"), QByteArray("data: {\"a\":1}\n\n"));
        QCOMPARE(StreamWriter::toSseFrame("data: x\n"), QByteArray("data: x\n\n"));
        QCOMPARE(StreamWriter::toSseFrame("event: ping\ndata: 1\n\n"),
                 QByteArray("event: ping\ndata: 1\n\n"));
    }

    void testToSseFrameMultiLinePayload() {
        QCOMPARE(StreamWriter::toSseFrame("line one\nline two"),
                 QByteArray("data: line one\ndata: line two\n\n"));
        QCOMPARE(StreamWriter::toSseFrame("{\n  \"a\": 1\n}\n"),
                 QByteArray("data: {\ndata:   \"a\": 1\ndata: }\n\n"));
    }

    void testEventThenTerminator() {
        QBuffer buffer;
        QVERIFY(buffer.open(QIODevice::WriteOnly));

        QVERIFY(StreamWriter::sendEvent(&buffer, "data: hello\n\n"));
        QVERIFY(StreamWriter::sendDone(&buffer));
        QVERIFY(StreamWriter::sendTerminator(&buffer));

        QCOMPARE(buffer.data(),
                 QByteArray("d\r\ndata: hello\n\n\r\n"
                            "e\r\ndata: [DONE]\n\n\r\n"
                            "0\r\n\r\n"));
    }

    void testEmptyEventIsSkipped() {
        QBuffer buffer;
        QVERIFY(buffer.open(QIODevice::WriteOnly));
        QVERIFY(StreamWriter::sendEvent(&buffer, QByteArray()));
        QVERIFY(buffer.data().isEmpty());
    }

    void testClosedDeviceRejectsWrites() {
        QBuffer buffer;
        QVERIFY(!StreamWriter::writeStreamHeader(&buffer));
        QVERIFY(!StreamWriter::sendEvent(&buffer, "data: x\n\n"));
        QVERIFY(!StreamWriter::sendTerminator(&buffer));
    }
};

QTEST_MAIN(TestStreamWriter)
#include "tst_stream_writer.moc"
