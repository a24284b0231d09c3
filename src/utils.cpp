#include "utils.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <system_error>

double file_mtime(const std::filesystem::path& path){
    struct stat st{};
    if(::stat(path.c_str(), &st) != 0){
        throw std::filesystem::filesystem_error("stat failed", path,
                                                std::error_code(errno, std::generic_category()));
    }
    return static_cast<double>(st.st_mtim.tv_sec) +
           static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
}

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate){
    if(candidate.empty() || candidate.is_absolute()) return false;
    for(const auto& part : candidate){
        if(part == "..") return false;
    }
    auto base = root.lexically_normal();
    if(!base.empty() && base.filename().empty()) base = base.parent_path();
    auto rel = candidate.lexically_normal().lexically_relative(base);
    if(rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}
