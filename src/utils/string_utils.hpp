#ifndef GEMINI_WEB_STRING_UTILS_HPP
#define GEMINI_WEB_STRING_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

    std::string trim(std::string s);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);

    std::vector<std::string_view> split_lines(std::string_view sv);

    bool contains(std::string_view haystack, std::string_view needle);
}  // namespace string_utils

#endif
