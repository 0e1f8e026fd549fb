#pragma once

#include "abp_buffer.h"
#include "abp_errors.h"

#include <QString>
#include <QUrl>

#include <cstdint>
#include <functional>
#include <memory>

class QNetworkAccessManager;

namespace abp {

using BufferResult = Result<std::shared_ptr<const SampleBuffer>>;

// Invoked exactly once per load, on the thread that started it
using LoadCallback = std::function<void(BufferResult)>;

struct UrlLoadOptions {
    QUrl url;

    // Decode sample rate; 0 keeps the source rate
    int32_t sample_rate = 0;

    // Transfer has begun
    std::function<void()> on_start;

    // Bytes received so far and expected total (-1 when the server sends no length)
    std::function<void(int64_t loaded, int64_t total)> on_progress;
};

struct LocalLoadOptions {
    int32_t sample_rate = 0;
};

// Fetch and decode a remote (or file://) resource.
// Transfer errors and HTTP error statuses complete with TransferFailed,
// undecodable payloads with DecodeFailed/Unsupported.
void LoadFromUrl(QNetworkAccessManager* network, const UrlLoadOptions& options, LoadCallback done);

// Read and decode a local file on the next event-loop turn.
// Missing files complete with FileNotFound, unreadable ones with TransferFailed.
void LoadFromLocalFile(const QString& path, const LocalLoadOptions& options, LoadCallback done);

} // namespace abp
