#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <sstream>

static std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

std::string now_iso() {
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_log_stamp() {
    return format_now("%Y-%m-%d %H:%M:%S");
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}
