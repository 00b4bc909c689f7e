/**
 * =============================================================================
 * DatasetReader.cpp - Tab-Separated Tags File Reader Implementation
 * =============================================================================
 *
 * @file DatasetReader.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "DatasetReader.hpp"
#include "Errors.hpp"

#include <filesystem>  // std::filesystem::path for joining folder and file name

namespace {

/**
 * Splits a line on '\t'.
 * "a\tb\t" yields {"a", "b", ""} - empty fields are kept.
 */
std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;

    while (true) {
        std::size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }

    return fields;
}

} // namespace

DatasetReader::DatasetReader(const std::string& tsvPath,
                             const std::string& imagesFolder,
                             bool requireLabel)
    : path(tsvPath)
    , folder(imagesFolder)
    , labelRequired(requireLabel)
    , file(tsvPath)
{
    if (!file.is_open()) {
        throw IoError("Could not open tags file: " + tsvPath);
    }
}

bool DatasetReader::next(ImageData& record) {
    std::string line;

    while (std::getline(file, line)) {
        ++currentLine;

        // Files written on Windows end every line with "\r\n"
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            continue;
        }

        std::vector<std::string> fields = splitTabs(line);
        const std::size_t expected = labelRequired ? 2 : 1;

        if (fields.size() < expected) {
            throw MalformedInputError(path, currentLine,
                "expected " + std::to_string(expected) + " tab-separated fields, found "
                + std::to_string(fields.size()));
        }
        if (fields[0].empty()) {
            throw MalformedInputError(path, currentLine, "empty image file name");
        }
        if (labelRequired && fields[1].empty()) {
            throw MalformedInputError(path, currentLine, "empty label");
        }

        record.imagePath = (std::filesystem::path(folder) / fields[0]).string();
        record.label = fields.size() > 1 ? fields[1] : std::string();
        return true;
    }

    // getline() stops on EOF or on a read error; only EOF is a normal end
    if (file.bad()) {
        throw IoError("Error while reading tags file: " + path);
    }

    return false;
}

std::vector<ImageData> readFromTsv(const std::string& tsvPath,
                                   const std::string& imagesFolder,
                                   bool requireLabel) {
    DatasetReader reader(tsvPath, imagesFolder, requireLabel);

    std::vector<ImageData> records;
    ImageData record;
    while (reader.next(record)) {
        records.push_back(record);
    }

    return records;
}
