//
// Created by Andrea on 16/10/2025.
//

#include "transport/ListingParser.hpp"

#include <array>
#include <ctime>
#include <sstream>

namespace transport {
    namespace {
        constexpr std::array<const char *, 12> MONTHS{
            "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
        };

        std::vector<std::string> splitFields(const std::string &line) {
            std::vector<std::string> fields;
            std::istringstream ss(line);
            std::string field;
            while (ss >> field) {
                fields.push_back(field);
            }
            return fields;
        }

        int monthIndex(const std::string &name) {
            for (size_t i = 0; i < MONTHS.size(); ++i) {
                if (name == MONTHS[i]) return static_cast<int>(i);
            }
            return -1;
        }

        bool parseInt(const std::string &text, int &out) {
            if (text.empty()) return false;
            for (char c: text) {
                if (c < '0' || c > '9') return false;
            }
            try {
                out = std::stoi(text);
            } catch (const std::exception &) {
                return false;
            }
            return true;
        }

        constexpr std::array<int, 12> DAYS_IN_MONTH{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

        bool isLeapYear(int year) {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int daysInMonth(int year, int month) {
            if (month == 1 && isLeapYear(year)) return 29;
            return DAYS_IN_MONTH[month];
        }

        // timegm would roll an impossible date such as Feb 31 into the next month
        std::optional<core::utils::Timestamp> makeUtc(int year, int month, int day, int hour, int minute) {
            if (day < 1 || day > daysInMonth(year, month) || hour < 0 || hour > 23 || minute < 0 || minute > 59) {
                return std::nullopt;
            }
            std::tm tm{};
            tm.tm_year = year - 1900;
            tm.tm_mon = month;
            tm.tm_mday = day;
            tm.tm_hour = hour;
            tm.tm_min = minute;
            return std::chrono::system_clock::from_time_t(timegm(&tm));
        }

        std::optional<core::utils::Timestamp> parseModified(const std::string &monthText, const std::string &dayText,
                                                            const std::string &timeOrYear,
                                                            core::utils::Timestamp now) {
            const int month = monthIndex(monthText);
            int day = 0;
            if (month < 0 || !parseInt(dayText, day)) {
                return std::nullopt;
            }

            const auto colon = timeOrYear.find(':');
            if (colon != std::string::npos) {
                // "Mon DD HH:MM": current year, unless that lands in the future
                int hour = 0;
                int minute = 0;
                if (!parseInt(timeOrYear.substr(0, colon), hour) || !parseInt(timeOrYear.substr(colon + 1), minute)) {
                    return std::nullopt;
                }

                const std::time_t nowRaw = std::chrono::system_clock::to_time_t(now);
                std::tm nowUtc{};
                gmtime_r(&nowRaw, &nowUtc);
                const int year = nowUtc.tm_year + 1900;

                auto parsed = makeUtc(year, month, day, hour, minute);
                // Feb 29 may only exist in the previous year
                if (!parsed || *parsed > now) {
                    parsed = makeUtc(year - 1, month, day, hour, minute);
                }
                return parsed;
            }

            int year = 0;
            if (!parseInt(timeOrYear, year)) {
                return std::nullopt;
            }
            return makeUtc(year, month, day, 0, 0);
        }
    }

    std::optional<FileEntry> parseListingLine(const std::string &line, const std::string &basePath,
                                              core::utils::Timestamp now) {
        const auto fields = splitFields(line);
        if (fields.size() < 9) {
            return std::nullopt;
        }

        FileEntry entry;
        for (size_t i = 8; i < fields.size(); ++i) {
            if (i > 8) entry.name += " ";
            entry.name += fields[i];
        }

        entry.isDirectory = line.front() == 'd';
        if (!entry.isDirectory) {
            try {
                entry.size = std::stoull(fields[4]);
            } catch (const std::exception &) {
                entry.size = 0;
            }
        }

        std::string base = basePath;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        entry.path = base + "/" + entry.name;
        entry.modified = parseModified(fields[5], fields[6], fields[7], now);
        return entry;
    }

    std::vector<FileEntry> parseListing(const std::string &listing, const std::string &basePath,
                                        core::utils::Timestamp now) {
        std::vector<FileEntry> entries;
        std::istringstream ss(listing);
        std::string line;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) continue;

            if (auto entry = parseListingLine(line, basePath, now)) {
                entries.push_back(std::move(*entry));
            }
        }
        return entries;
    }

    std::optional<uint64_t> listingLineFileSize(const std::string &line) {
        const auto fields = splitFields(line);
        if (fields.size() < 5 || line.front() == 'd') {
            return std::nullopt;
        }
        try {
            return std::stoull(fields[4]);
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
}
