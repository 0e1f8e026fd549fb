#include <audio_buffer_platform/abp_loader.h>
#include <audio_buffer_platform/abp_decoder.h>

#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

Q_LOGGING_CATEGORY(cueLoader, "cue.abp.loader")

namespace abp {

static BufferResult decode_bytes(const QByteArray& bytes, int32_t sample_rate) {
    DecodeOptions options;
    options.sample_rate = sample_rate;
    return DecodeAudio(reinterpret_cast<const uint8_t*>(bytes.constData()),
                       static_cast<size_t>(bytes.size()), options);
}

void LoadFromUrl(QNetworkAccessManager* network, const UrlLoadOptions& options, LoadCallback done) {
    if (!network || !options.url.isValid()) {
        Error error = !network ? Error::invalid_arg("LoadFromUrl: network manager is null")
                               : Error::invalid_arg("LoadFromUrl: invalid url");
        // Complete asynchronously like every other outcome
        QTimer::singleShot(0, [done, error]() { done(error); });
        return;
    }

    QNetworkRequest request(options.url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    qCDebug(cueLoader) << "GET" << options.url.toString();
    QNetworkReply* reply = network->get(request);

    if (options.on_start) {
        options.on_start();
    }

    if (options.on_progress) {
        auto on_progress = options.on_progress;
        QObject::connect(reply, &QNetworkReply::downloadProgress, reply,
                         [on_progress](qint64 received, qint64 total) {
                             on_progress(static_cast<int64_t>(received), static_cast<int64_t>(total));
                         });
    }

    const int32_t sample_rate = options.sample_rate;
    const QString url_text = options.url.toString();
    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, done, sample_rate, url_text]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            qCWarning(cueLoader, "Transfer failed for %s: %s",
                      qPrintable(url_text), qPrintable(reply->errorString()));
            done(Error::transfer_failed(url_text.toStdString() + ": " +
                                        reply->errorString().toStdString()));
            return;
        }

        const QByteArray bytes = reply->readAll();
        BufferResult result = decode_bytes(bytes, sample_rate);
        if (result.is_error()) {
            qCWarning(cueLoader, "Decode failed for %s: %s",
                      qPrintable(url_text), result.error().describe().c_str());
        }
        done(std::move(result));
    });
}

void LoadFromLocalFile(const QString& path, const LocalLoadOptions& options, LoadCallback done) {
    const int32_t sample_rate = options.sample_rate;
    QTimer::singleShot(0, [path, sample_rate, done]() {
        QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            qCWarning(cueLoader, "No such file: %s", qPrintable(path));
            done(Error::file_not_found(path.toStdString()));
            return;
        }

        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            qCWarning(cueLoader, "Cannot read %s: %s", qPrintable(path), qPrintable(file.errorString()));
            done(Error::transfer_failed(path.toStdString() + ": " + file.errorString().toStdString()));
            return;
        }

        const QByteArray bytes = file.readAll();
        BufferResult result = decode_bytes(bytes, sample_rate);
        if (result.is_error()) {
            qCWarning(cueLoader, "Decode failed for %s: %s",
                      qPrintable(path), result.error().describe().c_str());
        }
        done(std::move(result));
    });
}

} // namespace abp
