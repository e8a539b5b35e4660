/**
 * Noos - OPML Import/Export Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "OpmlFile.hpp"

#include <QFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <spdlog/spdlog.h>

namespace noos {

std::optional<std::vector<std::string>> OpmlFile::importUrls(const std::filesystem::path& path) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        spdlog::error("Failed to open OPML file: {}", path.string());
        return std::nullopt;
    }
    
    QString content = QString::fromUtf8(file.readAll());
    return parseContent(content);
}

std::optional<std::vector<std::string>> OpmlFile::parseContent(const QString& content) {
    std::vector<std::string> urls;
    QXmlStreamReader reader(content);
    
    while (!reader.atEnd()) {
        reader.readNext();
        
        if (reader.isStartElement() && reader.name().toString() == "outline") {
            QString url = reader.attributes().value("xmlUrl").toString().trimmed();
            if (!url.isEmpty()) {
                urls.push_back(url.toStdString());
            }
        }
    }
    
    if (reader.hasError()) {
        spdlog::error("XML parsing error in OPML file: {}", reader.errorString().toStdString());
        return std::nullopt;
    }
    
    return urls;
}

bool OpmlFile::exportUrls(const std::filesystem::path& path, const std::vector<std::string>& urls) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        spdlog::error("Failed to open OPML file for writing: {}", path.string());
        return false;
    }
    
    QXmlStreamWriter writer(&file);
    writer.setAutoFormatting(true);
    
    writer.writeStartDocument();
    writer.writeStartElement("opml");
    writer.writeAttribute("version", "2.0");
    
    writer.writeStartElement("head");
    writer.writeTextElement("title", "noos subscriptions");
    writer.writeEndElement(); // head
    
    writer.writeStartElement("body");
    for (const auto& url : urls) {
        QString qurl = QString::fromStdString(url);
        writer.writeEmptyElement("outline");
        writer.writeAttribute("type", "rss");
        writer.writeAttribute("text", qurl);
        writer.writeAttribute("xmlUrl", qurl);
    }
    writer.writeEndElement(); // body
    
    writer.writeEndElement(); // opml
    writer.writeEndDocument();
    
    if (writer.hasError()) {
        spdlog::error("Failed to write OPML file: {}", path.string());
        return false;
    }
    
    spdlog::info("Exported {} feeds to {}", urls.size(), path.string());
    return true;
}

} // namespace noos
