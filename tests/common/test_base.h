#pragma once

#include <QTest>
#include <QElapsedTimer>
#include <QLoggingCategory>

#include <audio_buffer_platform/abp_buffer.h>

#include <memory>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(cueTests)

/**
 * Base class for cue tests providing common setup and a buffer builder
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    QElapsedTimer m_timer;

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    virtual void initTestCase() {
        QLoggingCategory::setFilterRules("cue.tests=true");
        qCInfo(cueTests, "Initializing test case: %s", metaObject()->className());
    }

    virtual void cleanupTestCase() {
        qCInfo(cueTests, "Cleaning up test case: %s", metaObject()->className());
    }

    virtual void init() {
        m_timer.start();
    }

    virtual void cleanup() {
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > 1000) { // Log slow tests
            qCWarning(cueTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    /**
     * Silent buffer of the given length; 1 kHz keeps long buffers small
     */
    static std::shared_ptr<const abp::SampleBuffer> makeSilentBuffer(double seconds, int32_t channels = 1) {
        const int32_t sampleRate = 1000;
        const auto frames = static_cast<size_t>(seconds * sampleRate);
        return abp::SampleBuffer::FromInterleaved(
            sampleRate, channels, std::vector<float>(frames * static_cast<size_t>(channels), 0.0f));
    }
};
