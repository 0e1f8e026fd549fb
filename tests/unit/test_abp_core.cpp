// Tests for ABP (Audio Buffer Platform): errors, sample buffers, FFmpeg decode, URL/file loaders
// Coverage: decode success and resampling, undecodable input, missing files, failed transfers,
// exactly-once asynchronous completion

#include <QtTest>
#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QUrl>

#include <cmath>
#include <optional>

#include <audio_buffer_platform/abp_buffer.h>
#include <audio_buffer_platform/abp_decoder.h>
#include <audio_buffer_platform/abp_errors.h>
#include <audio_buffer_platform/abp_loader.h>

class TestABPCore : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    static void appendLE(QByteArray& bytes, uint32_t value, int width) {
        for (int i = 0; i < width; ++i) {
            bytes.append(static_cast<char>((value >> (8 * i)) & 0xff));
        }
    }

    // PCM16 WAV with a 440 Hz tone at half scale on every channel
    static QByteArray makeWav(int sampleRate, int channels, int frames) {
        const uint32_t dataBytes = static_cast<uint32_t>(frames * channels * 2);
        QByteArray bytes;
        bytes.append("RIFF");
        appendLE(bytes, 36 + dataBytes, 4);
        bytes.append("WAVE");
        bytes.append("fmt ");
        appendLE(bytes, 16, 4);
        appendLE(bytes, 1, 2);  // PCM
        appendLE(bytes, static_cast<uint32_t>(channels), 2);
        appendLE(bytes, static_cast<uint32_t>(sampleRate), 4);
        appendLE(bytes, static_cast<uint32_t>(sampleRate * channels * 2), 4);
        appendLE(bytes, static_cast<uint32_t>(channels * 2), 2);
        appendLE(bytes, 16, 2);
        bytes.append("data");
        appendLE(bytes, dataBytes, 4);
        for (int i = 0; i < frames; ++i) {
            const double v = 0.5 * std::sin(2.0 * M_PI * 440.0 * i / sampleRate);
            const auto s = static_cast<int16_t>(std::lround(v * 32767.0));
            for (int c = 0; c < channels; ++c) {
                appendLE(bytes, static_cast<uint16_t>(s), 2);
            }
        }
        return bytes;
    }

    static abp::BufferResult decode(const QByteArray& bytes, int32_t sampleRate = 0) {
        abp::DecodeOptions options;
        options.sample_rate = sampleRate;
        return abp::DecodeAudio(reinterpret_cast<const uint8_t*>(bytes.constData()),
                                static_cast<size_t>(bytes.size()), options);
    }

    QString writeFile(const QString& name, const QByteArray& bytes) {
        const QString path = m_dir.filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) return QString();
        file.write(bytes);
        return path;
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    // ========================================================================
    // ERROR TYPE TESTS
    // ========================================================================

    void test_error_code_to_string_all_codes() {
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::FileNotFound)), QString("FileNotFound"));
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::TransferFailed)), QString("TransferFailed"));
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::Unsupported)), QString("Unsupported"));
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::DecodeFailed)), QString("DecodeFailed"));
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::InvalidArg)), QString("InvalidArg"));
        QCOMPARE(QString(abp::error_code_to_string(abp::ErrorCode::Internal)), QString("Internal"));
    }

    void test_error_factories() {
        abp::Error err = abp::Error::file_not_found("/missing.wav");
        QCOMPARE(err.code, abp::ErrorCode::FileNotFound);
        QVERIFY(QString::fromStdString(err.message).contains("/missing.wav"));

        QCOMPARE(abp::Error::transfer_failed("x").code, abp::ErrorCode::TransferFailed);
        QCOMPARE(abp::Error::decode_failed("x").code, abp::ErrorCode::DecodeFailed);
    }

    void test_error_describe_names_code() {
        abp::Error err = abp::Error::unsupported("No decoder for codec ID 0");
        QCOMPARE(QString::fromStdString(err.describe()), QString("Unsupported: No decoder for codec ID 0"));
    }

    // ========================================================================
    // SAMPLE BUFFER
    // ========================================================================

    void test_buffer_from_interleaved() {
        auto buffer = abp::SampleBuffer::FromInterleaved(4, 2, {0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f, 0.7f});
        QCOMPARE(buffer->sample_rate(), 4);
        QCOMPARE(buffer->channels(), 2);
        // Trailing half frame dropped
        QCOMPARE(buffer->frames(), int64_t(3));
        QCOMPARE(buffer->duration_seconds(), 0.75);
        QCOMPARE(buffer->sample(1, 1), 0.4f);
        QCOMPARE(buffer->sample(3, 0), 0.0f);
        QCOMPARE(buffer->sample(0, 2), 0.0f);
        QCOMPARE(buffer->sample(-1, 0), 0.0f);
    }

    void test_empty_buffer_has_zero_duration() {
        auto buffer = abp::SampleBuffer::FromInterleaved(48000, 1, {});
        QCOMPARE(buffer->frames(), int64_t(0));
        QCOMPARE(buffer->duration_seconds(), 0.0);
    }

    // ========================================================================
    // DECODE
    // ========================================================================

    void test_decode_wav_keeps_source_format() {
        auto result = decode(makeWav(8000, 1, 800));
        QVERIFY2(result.is_ok(), result.is_error() ? result.error().message.c_str() : "");
        auto buffer = result.value();
        QCOMPARE(buffer->sample_rate(), 8000);
        QCOMPARE(buffer->channels(), 1);
        QVERIFY(std::llabs(buffer->frames() - 800) <= 32);

        // 440 Hz at 8 kHz: frame 5 is a quarter period in (approximately)
        const float expected = static_cast<float>(0.5 * std::sin(2.0 * M_PI * 440.0 * 5 / 8000.0));
        QVERIFY(std::fabs(buffer->sample(5, 0) - expected) < 0.01f);
        for (int64_t i = 0; i < buffer->frames(); ++i) {
            QVERIFY(std::fabs(buffer->sample(i, 0)) <= 0.51f);
        }
    }

    void test_decode_stereo_wav() {
        auto result = decode(makeWav(22050, 2, 2205));
        QVERIFY(result.is_ok());
        QCOMPARE(result.value()->channels(), 2);
        QVERIFY(std::fabs(result.value()->duration_seconds() - 0.1) < 0.005);
    }

    void test_decode_resamples_to_requested_rate() {
        auto result = decode(makeWav(8000, 1, 800), 16000);
        QVERIFY(result.is_ok());
        auto buffer = result.value();
        QCOMPARE(buffer->sample_rate(), 16000);
        QVERIFY(std::llabs(buffer->frames() - 1600) <= 64);
        QVERIFY(std::fabs(buffer->duration_seconds() - 0.1) < 0.005);
    }

    void test_decode_garbage_fails() {
        const QByteArray garbage = QByteArray("plain text, definitely not an audio container\n").repeated(100);
        auto result = decode(garbage);
        QVERIFY(result.is_error());
        QVERIFY(result.error().code == abp::ErrorCode::DecodeFailed ||
                result.error().code == abp::ErrorCode::Unsupported);
    }

    void test_decode_empty_fails() {
        auto result = decode(QByteArray());
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, abp::ErrorCode::DecodeFailed);
    }

    void test_decode_negative_rate_rejected() {
        auto result = decode(makeWav(8000, 1, 80), -1);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, abp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // LOCAL FILE LOADER
    // ========================================================================

    void test_local_file_loads_asynchronously() {
        const QString path = writeFile("tone.wav", makeWav(8000, 1, 800));
        QVERIFY(!path.isEmpty());

        int calls = 0;
        std::optional<abp::BufferResult> outcome;
        abp::LocalLoadOptions options;
        options.sample_rate = 16000;
        abp::LoadFromLocalFile(path, options, [&](abp::BufferResult result) {
            ++calls;
            outcome.emplace(std::move(result));
        });

        QCOMPARE(calls, 0);
        QTRY_COMPARE(calls, 1);
        QVERIFY(outcome->is_ok());
        QCOMPARE(outcome->value()->sample_rate(), 16000);
    }

    void test_local_missing_file() {
        std::optional<abp::BufferResult> outcome;
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("No such file"));
        abp::LoadFromLocalFile(m_dir.filePath("absent.wav"), abp::LocalLoadOptions{},
                               [&](abp::BufferResult result) { outcome.emplace(std::move(result)); });
        QTRY_VERIFY(outcome.has_value());
        QVERIFY(outcome->is_error());
        QCOMPARE(outcome->error().code, abp::ErrorCode::FileNotFound);
    }

    void test_local_undecodable_file() {
        const QString path = writeFile("notes.txt", QByteArray("these are not audio samples\n").repeated(64));
        std::optional<abp::BufferResult> outcome;
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Decode failed"));
        abp::LoadFromLocalFile(path, abp::LocalLoadOptions{},
                               [&](abp::BufferResult result) { outcome.emplace(std::move(result)); });
        QTRY_VERIFY(outcome.has_value());
        QVERIFY(outcome->is_error());
    }

    // ========================================================================
    // URL LOADER
    // ========================================================================

    void test_url_loads_file_scheme() {
        const QString path = writeFile("remote.wav", makeWav(8000, 2, 400));
        QNetworkAccessManager network;

        int started = 0;
        int calls = 0;
        int64_t lastLoaded = -1;
        int64_t lastTotal = -1;
        std::optional<abp::BufferResult> outcome;
        abp::UrlLoadOptions options;
        options.url = QUrl::fromLocalFile(path);
        options.on_start = [&]() { ++started; };
        options.on_progress = [&](int64_t loaded, int64_t total) {
            lastLoaded = loaded;
            lastTotal = total;
        };
        abp::LoadFromUrl(&network, options, [&](abp::BufferResult result) {
            ++calls;
            outcome.emplace(std::move(result));
        });

        QCOMPARE(started, 1);
        QTRY_COMPARE(calls, 1);
        QVERIFY(outcome->is_ok());
        QCOMPARE(outcome->value()->channels(), 2);

        // file:// replies report the whole file before finishing
        const int64_t fileSize = QFileInfo(path).size();
        QCOMPARE(lastLoaded, fileSize);
        QCOMPARE(lastTotal, fileSize);
    }

    void test_url_undecodable_payload_fails() {
        const QString path = writeFile("page.html", QByteArray("<html><body>not audio</body></html>\n").repeated(64));
        QNetworkAccessManager network;
        int calls = 0;
        std::optional<abp::BufferResult> outcome;
        abp::UrlLoadOptions options;
        options.url = QUrl::fromLocalFile(path);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Decode failed"));
        abp::LoadFromUrl(&network, options, [&](abp::BufferResult result) {
            ++calls;
            outcome.emplace(std::move(result));
        });
        QTRY_COMPARE(calls, 1);
        QVERIFY(outcome->is_error());
        QVERIFY(outcome->error().code == abp::ErrorCode::DecodeFailed ||
                outcome->error().code == abp::ErrorCode::Unsupported);

        // Completion is never repeated
        QTest::qWait(50);
        QCOMPARE(calls, 1);
    }

    void test_url_missing_resource() {
        QNetworkAccessManager network;
        std::optional<abp::BufferResult> outcome;
        abp::UrlLoadOptions options;
        options.url = QUrl::fromLocalFile(m_dir.filePath("nonexistent.wav"));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Transfer failed"));
        abp::LoadFromUrl(&network, options,
                         [&](abp::BufferResult result) { outcome.emplace(std::move(result)); });
        QTRY_VERIFY(outcome.has_value());
        QVERIFY(outcome->is_error());
        QCOMPARE(outcome->error().code, abp::ErrorCode::TransferFailed);
    }

    void test_url_without_network_manager() {
        std::optional<abp::BufferResult> outcome;
        abp::UrlLoadOptions options;
        options.url = QUrl("http://localhost/tone.wav");
        abp::LoadFromUrl(nullptr, options,
                         [&](abp::BufferResult result) { outcome.emplace(std::move(result)); });
        QVERIFY(!outcome.has_value());
        QTRY_VERIFY(outcome.has_value());
        QCOMPARE(outcome->error().code, abp::ErrorCode::InvalidArg);
    }
};

QTEST_GUILESS_MAIN(TestABPCore)
#include "test_abp_core.moc"
