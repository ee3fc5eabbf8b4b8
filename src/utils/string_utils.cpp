#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    // Header lines arrive as "Name: value\r\n". `key` includes the trailing colon.
    bool extract_header_value(const char *buffer, size_t bytes, const char *key, std::string &out_property) {
        const size_t key_len = std::strlen(key);
        if (bytes < key_len || !ieq_prefix(buffer, bytes, key)) {
            return false;
        }

        out_property = trim(std::string(buffer + key_len, bytes - key_len));
        return true;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::filesystem::path append_to_path(const std::filesystem::path &path, const std::string &str) { return {path.string() + str}; }

    std::vector<std::string_view> split_lines(std::string_view sv) {
        std::vector<std::string_view> out;
        size_t start = 0;
        while (start <= sv.size()) {
            size_t pos = sv.find('\n', start);
            if (pos == std::string_view::npos) {
                pos = sv.size();
            }

            std::string_view line = sv.substr(start, pos - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            out.push_back(line);
            start = pos + 1;
        }
        return out;
    }

    bool contains(std::string_view haystack, std::string_view needle) { return haystack.find(needle) != std::string_view::npos; }
}  // namespace string_utils
