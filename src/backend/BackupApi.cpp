#include "backend/BackupApi.hpp"

#include <cctype>
#include <string_view>

namespace bk::backend {

std::string normalizeBackupName(const std::string& basename) {
    constexpr std::string_view ext = ".zip";

    std::string stem = basename;
    if (stem.size() >= ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0)
        stem.resize(stem.size() - ext.size());

    for (auto& c : stem) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) c = static_cast<char>(std::tolower(uc));
        else if (c != '-' && c != '_') c = '_';
    }

    return stem + std::string(ext);
}

}
