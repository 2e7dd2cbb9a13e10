#ifndef JSON_FILE_HPP
#define JSON_FILE_HPP

#include <nlohmann/json.hpp>

#include "common.hpp"

/// \brief Parse JSON document stored in \arg path. Throws
/// `std::system_error` if the file cannot be opened and
/// `nlohmann::json::exception` on malformed content.
nlohmann::json read_json_file(CR<Path> path);

/// \brief Replace \arg path with \arg data. Content is written to the
/// temporary file next to the target and renamed over it, so readers
/// never observe a partially written document.
void write_json_file(CR<Path> path, CR<nlohmann::json> data);

#endif // JSON_FILE_HPP
