#include "json_file.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

nlohmann::json read_json_file(CR<Path> path) {
    std::ifstream in{path};
    if (!in) {
        throw std::system_error{
            std::error_code{errno, std::generic_category()},
            fmt::format("Error opening {}", path)};
    }

    return nlohmann::json::parse(in);
}

void write_json_file(CR<Path> path, CR<nlohmann::json> data) {
    Path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out{tmp, std::ios::trunc};
        if (!out) {
            throw std::system_error{
                std::error_code{errno, std::generic_category()},
                fmt::format("Error opening {}", tmp)};
        }

        out << data.dump(4);
        out.flush();
        if (!out) {
            throw std::system_error{
                std::error_code{errno, std::generic_category()},
                fmt::format("Error writing {}", tmp)};
        }
    }

    // Rename is atomic on the same filesystem
    fs::rename(tmp, path);
}
