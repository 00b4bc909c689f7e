/**
 * =============================================================================
 * DatasetReader.hpp - Tab-Separated Tags File Reader
 * =============================================================================
 *
 * A tags file pairs image file names with labels, one record per line, no
 * header:
 *
 *   broccoli.jpg<TAB>food
 *   toaster.jpg<TAB>appliance
 *
 * The reader joins each file name with the images folder, so downstream code
 * only ever sees full paths.
 *
 * LAZY vs EAGER:
 * - DatasetReader::next() pulls one record at a time from the open file.
 *   Nothing is buffered beyond the current line.
 * - readFromTsv() drains a reader into a std::vector for callers that need
 *   the whole dataset (the trainer needs every record anyway).
 *
 * @file DatasetReader.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef DATASET_READER_HPP
#define DATASET_READER_HPP

#include "ImageData.hpp"

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

class DatasetReader {
public:
    /**
     * Opens the tags file.
     *
     * @param tsvPath      Path to the tab-separated file
     * @param imagesFolder Folder the file names are relative to
     * @param requireLabel true: every line needs "<name>\t<label>"
     *                     false: the label column is optional
     *
     * @throws IoError if the file cannot be opened
     */
    DatasetReader(const std::string& tsvPath,
                  const std::string& imagesFolder,
                  bool requireLabel = true);

    /**
     * Reads the next record.
     *
     * Empty lines are skipped. A trailing '\r' (Windows line ending) is
     * dropped before splitting. Fields after the second are ignored.
     *
     * @param[out] record Filled with the next record on success
     * @return false once the end of the file is reached
     *
     * @throws MalformedInputError if a line lacks the expected fields
     */
    bool next(ImageData& record);

    /** 1-based number of the last line read (0 before the first call) */
    std::size_t lineNumber() const { return currentLine; }

private:
    std::string path;
    std::string folder;
    bool labelRequired;
    std::ifstream file;
    std::size_t currentLine = 0;
};

/**
 * Reads every record of a tags file.
 *
 * @example
 * auto training = readFromTsv("assets/images/tags.tsv", "assets/images");
 * // training[0].imagePath == "assets/images/broccoli.jpg"
 */
std::vector<ImageData> readFromTsv(const std::string& tsvPath,
                                   const std::string& imagesFolder,
                                   bool requireLabel = true);

#endif // DATASET_READER_HPP
