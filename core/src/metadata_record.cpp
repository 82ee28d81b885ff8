#include "mpkit/metadata_record.hpp"
#include "mpkit/errors.hpp"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace mpkit {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

bool readDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

double FieldValue::asReal() const {
    if (const auto* v = std::get_if<double>(&data)) return *v;
    if (const auto* v = std::get_if<std::int64_t>(&data)) return static_cast<double>(*v);
    throw std::bad_variant_access();
}

std::string FieldValue::toText() const {
    std::ostringstream out;
    if (const auto* s = std::get_if<std::string>(&data)) {
        out << *s;
    } else if (const auto* r = std::get_if<double>(&data)) {
        out << std::setprecision(std::numeric_limits<double>::max_digits10) << *r;
    } else if (const auto* i = std::get_if<std::int64_t>(&data)) {
        out << *i;
    } else {
        out << formatTimestamp(std::get<Timestamp>(data));
    }
    return out.str();
}

const FieldValue& MetadataRecord::field(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        throw MissingKeyError(name, "no such canonical field");
    }
    return it->second;
}

std::vector<std::string> MetadataRecord::defaultedFields() const {
    std::vector<std::string> result;
    for (const auto& [name, value] : fields_) {
        if (value.isDefaulted()) result.push_back(name);
    }
    return result;
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }

    std::size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    std::int64_t micros = 0;
    std::int64_t offset_seconds = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') return std::nullopt;
        ++pos;
        if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        if (expect(text, pos, '.')) {
            std::int64_t scale = 100000;
            std::size_t digits = 0;
            while (pos < text.size() &&
                   std::isdigit(static_cast<unsigned char>(text[pos]))) {
                micros += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
                ++digits;
            }
            if (digits == 0) return std::nullopt;
        }

        if (expect(text, pos, 'Z')) {
            // UTC
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int off_h = 0, off_m = 0;
            if (!readDigits(text, pos, 2, off_h)) return std::nullopt;
            expect(text, pos, ':');
            if (!readDigits(text, pos, 2, off_m)) return std::nullopt;
            offset_seconds = sign * (off_h * 3600 + off_m * 60);
        }
    }
    if (pos != text.size()) return std::nullopt;

    std::int64_t seconds = daysFromCivil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day)) * 86400 +
                           hour * 3600 + minute * 60 + second - offset_seconds;
    return Timestamp(std::chrono::microseconds(seconds * 1000000 + micros));
}

std::string formatTimestamp(Timestamp ts) {
    std::int64_t micros = ts.time_since_epoch().count();
    std::int64_t seconds = micros / 1000000;
    std::int64_t frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        --seconds;
    }
    std::int64_t days = seconds / 86400;
    std::int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0, day = 0;
    civilFromDays(days, year, month, day);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60), static_cast<long long>(frac));
    return buffer;
}

} // namespace mpkit
