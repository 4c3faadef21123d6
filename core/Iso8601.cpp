#include "Iso8601.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace routesim {

namespace {

std::time_t toUtcTimeT(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

int parseDigits(const std::string& text, size_t& pos, size_t count) {
    int value = 0;
    for (size_t i = 0; i < count; ++i, ++pos) {
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            throw std::invalid_argument("Malformed timestamp: " + text);
        }
        value = value * 10 + (text[pos] - '0');
    }
    return value;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 1 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) {
        return 29;
    }
    return days[month];
}

void expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    ++pos;
}

} // namespace

std::string formatIso8601(Timestamp ts) {
    auto sysTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts);
    auto time_t = std::chrono::system_clock::to_time_t(sysTime);
    auto ms = ts.time_since_epoch().count() % 1000;
    if (ms < 0) {
        // to_time_t truncates toward zero; pre-epoch instants need the floor
        ms += 1000;
        time_t -= 1;
    }

    std::stringstream ss;

#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

Timestamp parseIso8601(const std::string& text) {
    std::tm tm{};
    size_t pos = 0;

    tm.tm_year = parseDigits(text, pos, 4) - 1900;
    expect(text, pos, '-');
    tm.tm_mon = parseDigits(text, pos, 2) - 1;
    expect(text, pos, '-');
    tm.tm_mday = parseDigits(text, pos, 2);

    long long millis = 0;
    long offsetSeconds = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        tm.tm_hour = parseDigits(text, pos, 2);
        expect(text, pos, ':');
        tm.tm_min = parseDigits(text, pos, 2);
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            tm.tm_sec = parseDigits(text, pos, 2);
        }

        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            ++pos;
            int scale = 100;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (scale > 0) {
                    millis += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++pos;
                ++digits;
            }
            if (digits == 0) {
                throw std::invalid_argument("Malformed timestamp: " + text);
            }
        }

        if (pos < text.size()) {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                ++pos;
                int hours = parseDigits(text, pos, 2);
                if (pos < text.size() && text[pos] == ':') {
                    ++pos;
                }
                int minutes = parseDigits(text, pos, 2);
                offsetSeconds = (hours * 3600L + minutes * 60L) * (zone == '+' ? 1 : -1);
            }
        }
    }

    if (pos != text.size()) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 ||
        tm.tm_mday > daysInMonth(tm.tm_year + 1900, tm.tm_mon) ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        throw std::invalid_argument("Timestamp field out of range: " + text);
    }

    std::time_t seconds = toUtcTimeT(tm) - offsetSeconds;
    return Timestamp(std::chrono::milliseconds(static_cast<long long>(seconds) * 1000 + millis));
}

} // namespace routesim
