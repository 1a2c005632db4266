//
// Created by Andrea on 18/10/2025.
//

#include "core/print/RemoteFilename.hpp"

#include <algorithm>
#include <cctype>

namespace core::print {
    namespace {
        bool endsWith(const std::string &value, const std::string &suffix) {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    std::string remoteFilenameFor(const std::string &filename) {
        std::string base = filename;
        for (const char *suffix: {".gcode.3mf", ".3mf", ".gcode"}) {
            if (endsWith(base, suffix)) {
                base.resize(base.size() - std::char_traits<char>::length(suffix));
                break;
            }
        }
        return base + ".3mf";
    }

    std::string remotePathFor(const std::string &remoteFilename) {
        return "/" + remoteFilename;
    }

    std::string displayNameFor(const std::string &filename) {
        for (const char *suffix: {".gcode.3mf", ".3mf"}) {
            if (endsWith(filename, suffix)) {
                return filename.substr(0, filename.size() - std::char_traits<char>::length(suffix));
            }
        }
        return filename;
    }

    bool isSlicedFile(const std::string &filename) {
        const std::string lower = toLower(filename);
        return endsWith(lower, ".gcode") || endsWith(lower, ".gcode.3mf");
    }
}
