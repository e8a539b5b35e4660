/**
 * Noos - Feed Fetcher Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FeedFetcher.hpp"
#include "FeedParser.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QtConcurrent>

#include <spdlog/spdlog.h>

namespace noos {

std::optional<QByteArray> downloadFeed(const std::string& feedUrl, int timeoutMs) {
    spdlog::info("Fetching feed from: {}", feedUrl);
    
    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(feedUrl)));
    request.setHeader(QNetworkRequest::UserAgentHeader, "noos/0.1");
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    
    QEventLoop loop;
    QNetworkReply* reply = manager.get(request);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    
    loop.exec();
    
    if (!timer.isActive()) {
        spdlog::warn("Feed request timed out: {}", feedUrl);
        reply->abort();
        reply->deleteLater();
        return std::nullopt;
    }
    timer.stop();
    
    if (reply->error() != QNetworkReply::NoError) {
        spdlog::warn("Feed request failed for {}: {}",
                     feedUrl, reply->errorString().toStdString());
        reply->deleteLater();
        return std::nullopt;
    }
    
    QByteArray body = reply->readAll();
    reply->deleteLater();
    
    spdlog::debug("Fetched {} bytes from {}", body.size(), feedUrl);
    return body;
}

QFuture<std::optional<ParsedFeed>> fetchFeed(const std::string& feedUrl, int timeoutMs, int maxItems) {
    return QtConcurrent::run([feedUrl, timeoutMs, maxItems]() -> std::optional<ParsedFeed> {
        try {
            auto body = downloadFeed(feedUrl, timeoutMs);
            if (!body) {
                return std::nullopt;
            }
            
            return parseFeed(QString::fromUtf8(*body), feedUrl, maxItems);
            
        } catch (const std::exception& e) {
            spdlog::error("Error fetching feed {}: {}", feedUrl, e.what());
            return std::nullopt;
        }
    });
}

} // namespace noos
