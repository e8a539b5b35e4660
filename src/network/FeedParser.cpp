/**
 * Noos - Feed Parser Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FeedParser.hpp"

#include <QDateTime>
#include <QXmlStreamReader>

#include <spdlog/spdlog.h>

namespace noos {

namespace {

constexpr const char* ATOM_NAMESPACE = "http://www.w3.org/2005/Atom";
constexpr const char* RSS1_NAMESPACE = "http://purl.org/rss/1.0/";

// Elements of extensions (itunes:, media:, dc:, ...) are not feed fields
bool isFeedNamespace(QStringView uri) {
    return uri.isEmpty() || uri == QLatin1String(ATOM_NAMESPACE) || uri == QLatin1String(RSS1_NAMESPACE);
}

std::string readText(QXmlStreamReader& reader) {
    return reader.readElementText(QXmlStreamReader::IncludeChildElements).toStdString();
}

} // anonymous namespace

std::optional<std::int64_t> parsePublishedDate(const QString& text) {
    QString trimmed = text.trimmed();
    
    // RFC 2822 (RSS)
    QDateTime dt = QDateTime::fromString(trimmed, Qt::RFC2822Date);
    if (dt.isValid()) {
        return dt.toSecsSinceEpoch();
    }
    
    // ISO 8601 (Atom)
    dt = QDateTime::fromString(trimmed, Qt::ISODate);
    if (dt.isValid()) {
        return dt.toSecsSinceEpoch();
    }
    
    return std::nullopt;
}

std::optional<ParsedFeed> parseFeed(const QString& content, const std::string& feedUrl, int maxItems) {
    ParsedFeed feed;
    feed.url = feedUrl;
    
    QXmlStreamReader reader(content);
    
    FeedItem current;
    bool inItem = false;
    bool isAtom = false;
    
    while (!reader.atEnd()) {
        reader.readNext();
        
        if (reader.isStartElement()) {
            if (!isFeedNamespace(reader.namespaceUri())) {
                if (inItem) {
                    reader.skipCurrentElement();
                }
                continue;
            }
            
            QString name = reader.name().toString().toLower();
            
            // Detect feed type
            if (name == "feed") {
                isAtom = true;
                continue;
            }
            
            // Item/entry start
            if (name == "item" || name == "entry") {
                inItem = true;
                current = FeedItem();
                continue;
            }
            
            if (inItem) {
                if (name == "title") {
                    current.title = readText(reader);
                } else if (name == "description" || name == "summary" || name == "content") {
                    // Prefer the summary when an Atom entry has both
                    std::string text = readText(reader);
                    if (!current.description || name != "content") {
                        current.description = text;
                    }
                } else if (name == "link") {
                    if (isAtom) {
                        // Atom uses href attribute; keep the first alternate link
                        QString rel = reader.attributes().value("rel").toString();
                        QString href = reader.attributes().value("href").toString();
                        reader.skipCurrentElement();
                        if (!current.link && (rel.isEmpty() || rel == "alternate")) {
                            current.link = href.toStdString();
                        }
                    } else {
                        current.link = readText(reader);
                    }
                } else if (name == "pubdate" || name == "published" || name == "updated") {
                    // Atom's published wins over updated
                    QString text = reader.readElementText();
                    if (!current.pubDate || name != "updated") {
                        current.pubDate = text.toStdString();
                        current.publishedAt = parsePublishedDate(text);
                    }
                }
            } else {
                // Channel-level metadata
                if (name == "title" && !feed.title) {
                    feed.title = readText(reader);
                } else if (name == "link" && feed.link.empty()) {
                    if (isAtom) {
                        QString rel = reader.attributes().value("rel").toString();
                        QString href = reader.attributes().value("href").toString();
                        reader.skipCurrentElement();
                        if (rel.isEmpty() || rel == "alternate") {
                            feed.link = href.toStdString();
                        }
                    } else {
                        feed.link = readText(reader);
                    }
                }
            }
        } else if (reader.isEndElement()) {
            QString name = reader.name().toString().toLower();
            if (inItem && (name == "item" || name == "entry")) {
                feed.items.push_back(current);
                inItem = false;
                if (maxItems > 0 && static_cast<int>(feed.items.size()) >= maxItems) {
                    break;
                }
            }
        }
    }
    
    if (reader.hasError()) {
        spdlog::warn("XML parsing error in feed {}: {}",
                     feedUrl, reader.errorString().toStdString());
        return std::nullopt;
    }
    
    spdlog::debug("Parsed {} items from {}", feed.items.size(), feedUrl);
    return feed;
}

} // namespace noos
