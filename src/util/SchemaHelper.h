#ifndef SCHEMAHELPER_20200930_H
#define SCHEMAHELPER_20200930_H

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace redist {

class ParentPathExists {
public:
    bool operator()(std::string const& path) {
        auto p = std::filesystem::path(path);
        if (!p.has_parent_path()) {
            return true;
        }
        return std::filesystem::exists(p.parent_path());
    }
};

inline bool iEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

} // namespace redist

#endif // SCHEMAHELPER_20200930_H
