#pragma once

#include <dftracer/utils/core/common/filesystem.h>
#include <dftracer/utils/utilities/filesystem/directory_scanner.h>
#include <dftracer/utils/utilities/io/file_reader.h>

#include <exception>
#include <string>

#include "keylog_error.hpp"

using namespace dftracer::utils;

/**
 * @brief Load a whole text file through FileReaderUtility.
 * @throws KeylogError(Io) if the file is missing or cannot be read.
 */
inline std::string read_text_file(const std::string& file_path) {
    if (!fs::is_regular_file(file_path)) {
        throw KeylogError(ErrorKind::Io, "File not found: " + file_path);
    }

    try {
        utilities::io::FileReaderUtility file_reader;
        utilities::filesystem::FileEntry file_entry{file_path};
        utilities::text::Text text = file_reader.process(file_entry);
        return text.content;
    } catch (const std::exception& e) {
        throw KeylogError(ErrorKind::Io,
                          "Failed to read " + file_path + ": " + e.what());
    }
}
